#include <iostream>
#include <sstream>
#include <fstream>
#include <dirent.h>
#include <unistd.h>
#include "time.h"
#include <syslog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>
#include <limits.h>
#include <string.h>
#include <math.h>
#include <vector>
#include <list>
#include <map>
#include <tuple>

#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"

using namespace pcrepp;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string cppgetenv(string variable) {
    char* c;

    c = getenv(variable.c_str());
    if (c == NULL)
        return "";
    else
        return c;
}


string perlJoin(string delimiter, vector<string> items) {
    string result;

    for (auto &item: items)
        result += (result.length() ? delimiter : "") + item;

    return result;
}

// the RE given matches the delimiter and tokens are found in between
vector<string> perlSplit(string regex, string haystack) {
    Pcre theRE("(" + regex + ")", "g");
    vector<string> result;

    size_t pos = 0;
    size_t dataStart = 0;

    while (pos <= haystack.length() && theRE.search(haystack, (int)pos)) {
        size_t delimStart = theRE.get_match_start(0);
        size_t delimEnd = theRE.get_match_end(0);

        result.insert(result.end(), string(haystack, dataStart, delimStart - dataStart));

        dataStart = delimEnd + 1;
        pos = dataStart;
    }

    result.insert(result.end(), dataStart <= haystack.length() ? string(haystack, dataStart, string::npos) : "");

    return result;
}


string log(string message) {
    syslog(LOG_CRIT, "%s", commafy(message).c_str());
    return message;
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1[str1.length() - 1] == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    return (str3.length() ? slashConcat(str1 + "/" + str2, str3) : str1 + "/" + str2);
}


s_pathSplit pathSplit(string path) {
    s_pathSplit s;
    s.dir = s.file = s.file_ext = s.file_base = "";

    if (path.length() > 1) {
        auto pos = path.rfind("/");
        s.file = path.substr(pos + 1);
        s.dir = path.substr(0, pos);

        if (!pos)
            s.dir = "/";

        if (pos == string::npos) {
            if (s.file == "..") {
                s.dir = "..";
                s.file = ".";
            }
            else
                s.dir = ".";
        }

        pos = s.file.rfind(".");

        if (pos == string::npos)
            s.file_base = s.file;
        else {
            s.file_base = s.file.substr(0, pos);
            s.file_ext = s.file.substr(pos + 1);
        }
    }
    else {
        if (path.length()) {
            if (path[0] == '/')
                s.dir = "/";
            else {
                s.dir = ".";
                s.file = path;

                if (path[0] != '.')
                    s.file_base = path;
            }
        }
    }

    return s;
}


string MD5file(string filename) {
    FILE *inputFile;

    if ((inputFile = fopen(filename.c_str(), "rb")) != NULL) {
        unsigned char data[65536];
        unsigned long bytesRead;
        EVP_MD_CTX *md5Context;
        unsigned char md5Digest[EVP_MAX_MD_SIZE];
        unsigned int md5DigestLen = 0;

        md5Context = EVP_MD_CTX_new();
        EVP_DigestInit_ex(md5Context, EVP_md5(), NULL);

        while ((bytesRead = fread(data, 1, sizeof(data), inputFile)) != 0)
            EVP_DigestUpdate(md5Context, data, bytesRead);

        fclose(inputFile);
        EVP_DigestFinal_ex(md5Context, md5Digest, &md5DigestLen);
        EVP_MD_CTX_free(md5Context);

        char tempStr[EVP_MAX_MD_SIZE * 2 + 1];
        for (unsigned int i = 0; i < md5DigestLen; i++)
            snprintf(tempStr+(2*i), 3, "%02x", md5Digest[i]);
        tempStr[md5DigestLen * 2] = 0;

        return(tempStr);
    }

    return "";
}


string approximate(size_t size, int maxUnits) {
    unsigned int index = 0;
    long double decimalSize = size;
    char unit[] = {'B', 'K', 'M', 'G', 'T', 'P', 'E'};

    while ((decimalSize >= 1024) &&
           (maxUnits < 0 || (int)index < maxUnits) &&
           index + 1 < sizeof(unit)) {
        decimalSize /= 1024.0;
        ++index;
    }

    char buffer[150];
    snprintf(buffer, sizeof(buffer), index > 1 ? "%.01Lf" : "%.0Lf", index > 1 ? decimalSize : floorl(decimalSize));

    return(string(buffer) + (index ? string(1, unit[index]) : ""));
}


string timeDiffSingle(struct timeval duration, int maxUnits, int precision) {
    auto secs = duration.tv_sec;
    auto us = duration.tv_usec;
    auto offset = secs;
    int unitsUsed = 0;
    string result;
    map<unsigned long, string> units {
        { 86400, "day" },
        { 3600, "hour" },
        { 60, "minute" },
        { 1, "second" } };

    for (auto unit_it = units.rbegin(); unit_it != units.rend(); ++unit_it) {
        if ((unsigned long)offset >= unit_it->first) {
            unsigned long value = offset / unit_it->first;
            unsigned long leftover = offset % unit_it->first;

            result += (result.length() ? ", " : "") + to_string(value) + " " + unit_it->second + (value == 1 ? "" : "s");
            offset = leftover;

            if (++unitsUsed == maxUnits)
                break;
        }
    }

    // under a minute, include the fractional seconds too
    if (secs < 60 && us) {
        char decimalSecs[50];
        snprintf(decimalSecs, sizeof(decimalSecs), string(string("%.") + to_string(precision) + "f").c_str(), secs + 1.0 * us / MILLION);
        result = string(decimalSecs) + " seconds";
    }

    return(result.length() ? result : "0 seconds");
}


int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;
    int result = 0;

    if (!dir.length())
        return -1;

    if (mystat(dir, &statBuf) == -1) {
        char data[PATH_MAX + 1];
        strncpy(data, dir.c_str(), PATH_MAX);
        data[PATH_MAX] = 0;
        char *p = strtok(data, "/");
        string path = dir[0] == '/' ? "" : ".";

        while (p) {
            path += string("/") + p;

            if (mystat(path, &statBuf) == -1)
                result = mkdir(path.c_str(), mode);

            if (result)
                return(result);

            p = strtok(NULL, "/");
        }
    }

    return 0;
}


int mkbasedirs(string path) {
    auto pos = path.find_last_of("/");

    if (pos == string::npos)
        return 0;

    if (!pos)
        return 0;

    return mkdirp(path.substr(0, pos));
}


string trimSpace(const string &s) {
    auto start = s.begin();
    while (start != s.end() && isspace(*start))
        start++;

    if (start == s.end())
        return "";

    auto end = s.end();
    do {
        end--;
    } while (distance(start, end) > 0 && isspace(*end));

    return string(start, end + 1);
}


string trimQuotes(string s, bool unEscape) {
    Pcre regA("^([\'\"]+)");
    string result = s;

    if (regA.search(s) && regA.matches()) {
        string openQuotes = regA.get_match(0);
        string closeQuotes = openQuotes;
        reverse(closeQuotes.begin(), closeQuotes.end());

        Pcre regB("^" + openQuotes + "(.*)" + closeQuotes + "$");
        if (regB.search(s) && regB.matches())
            result = regB.get_match(0);
    }

    if (unEscape) {
        size_t altpos;  // remove any remaining backslashes
        while ((altpos = result.find("\\")) != string::npos)
            result.erase(altpos, 1);
    }

    return result;
}


string safeFilename(string filename) {
    Pcre search1("[\\s#;\\/\\\\:]+", "g");   // these characters get converted to underscores
    Pcre search2("[\\?\\!\\*]+", "g");       // these characters get removed

    string tempStr = search1.replace(filename, "_");
    return search2.replace(tempStr, "");
}


string locateBinary(string app) {
    string tempStr;
    string path = cppgetenv("PATH");
    vector<string> parts;

    // if a path is specified try it
    if (app.find("/") != string::npos) {
        if (!access(app.c_str(), X_OK))
            return(app);
    }

    // grab the binary name as the last delimited element given
    auto appBinary = pathSplit(app).file;

    // parse the PATH
    stringstream pathTokenizer(path);
    while (getline(pathTokenizer, tempStr, ':'))
        parts.push_back(tempStr);

    // try to find the binary in each component of the path
    for (auto piece: parts) {
        string binary = string(piece) + "/" + appBinary;
        if (!access(binary.c_str(), X_OK))
            return binary;
    }

    // give up
    log("unable to locate/execute '" + app + "' command");
    return "";
}


string nowString(string format, time_t when) {
    char text[100];

    if (!when)
        when = time(NULL);

    struct tm *t = localtime(&when);
    strftime(text, sizeof(text)-1, format.c_str(), t);
    return(text);
}


string blockp(string data, int width) {
    char cstr[2000];
    snprintf(cstr, sizeof(cstr), string(string("%") + to_string(width) + "s").c_str(), data.c_str());
    return(cstr);
}


string readFile(string filename) {
    ifstream aFile;
    string result;

    aFile.open(filename);
    if (aFile.is_open()) {
        string data;

        while (getline(aFile, data))
            result += data + "\n";

        aFile.close();
    }

    while (result.length() && (result.back() == '\n' || result.back() == '\r'))
        result.pop_back();

    return result;
}


bool rmrfCallback(pdCallbackData &file) {
    return (S_ISDIR(file.statData.st_mode) ? !rmdir(file.filename.c_str()) : !unlink(file.filename.c_str()));
}


// delete an absolute directory (rm -rf).
bool rmrf(string directory, bool includeTopDir) {
    if (!exists(directory))
        return true;

    return (processDirectory(directory, "", false, false, rmrfCallback, NULL, -1, includeTopDir) == "");
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (mylstat(name, &statBuffer) == 0);
}


bool isDirectory(const std::string& name) {
    struct stat statBuffer;
    return (mystat(name, &statBuffer) == 0 && S_ISDIR(statBuffer.st_mode));
}


string realpathcpp(string origPath) {
    char tmpBuf[PATH_MAX+1];
    return (realpath(origPath.c_str(), tmpBuf) == NULL ? "" : tmpBuf);
}


/*
 processDirectory() walks a directory tree calling the callback on each file as it's found
 and on each directory after its contents.  pattern (if given) filters files, and directories
 too when filterDirs is set;  exclude flips the filter to skip matches instead of keeping them.
 symlinks are never followed.  processDirectory() returns a blank string on success.  on error,
 the error is logged and returned to the calling function.
 */
string processDirectory(string directory, string pattern, bool exclude, bool filterDirs, bool (*callback)(pdCallbackData&), void *passData, int maxDepth, bool includeTopDir) {
    DIR *dirPtr;
    size_t dirEntries;
    struct dirent *dirEntry;
    list<tuple<string, unsigned int>> dirsToRead; // filename and depth in heirarchy
    list<pdCallbackData> dirsToCallback;          // dirs to calback
    Pcre patternRE(pattern);
    struct stat dirStat;
    pdCallbackData file;
    file.dataPtr = passData;
    file.topLevelDir = directory;

    // directories get their callback after everything inside them (depth-first), which
    // is what lets rmrf() remove a directory once its contents are gone.
    dirsToRead.push_back({directory, 0});

    try {
        while (!dirsToRead.empty()) {
            auto [baseDir, depth] = dirsToRead.front();
            dirsToRead.pop_front();
            dirEntries = 0;

            if (!mylstat(baseDir, &dirStat)) {

                if (S_ISDIR(dirStat.st_mode)) {

                    if ((dirPtr = opendir(baseDir.c_str())) != NULL) {
                        while ((dirEntry = readdir(dirPtr)) != NULL) {

                            if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
                                continue;

                            ++dirEntries;
                            file.filename = slashConcat(baseDir, dirEntry->d_name);

                            if (!mylstat(file.filename, &file.statData)) {

                                if (S_ISDIR(file.statData.st_mode)) {

                                    if (filterDirs)
                                        if (pattern.length()) {
                                            bool found = patternRE.search(file.filename);

                                            if ((exclude && found) || (!exclude && !found))
                                                continue;
                                        }

                                    if (maxDepth < 1 || (int)depth < maxDepth)
                                        dirsToRead.push_back({file.filename, depth+1});
                                }
                                else {
                                    if (pattern.length()) {
                                        bool found = patternRE.search(file.filename);

                                        if ((exclude && found) || (!exclude && !found))
                                            continue;
                                    }

                                    file.dirEntries = 0;
                                    file.depth = depth;
                                    if (!callback(file)) {
                                        dirsToRead.clear();
                                        break;
                                    }
                                }
                            }
                        }
                        closedir(dirPtr);

                        if (includeTopDir || baseDir != directory) {
                            file.filename = baseDir;
                            file.statData = dirStat;
                            file.dirEntries = dirEntries;
                            file.depth = depth ? depth - 1 : 0;
                            dirsToCallback.push_front(file);
                        }
                    }
                    else {
                        string err = "error: unable to open " + baseDir + errtext();
                        log(err);
                        return err;
                    }
                }
                else {
                    // in case we're given an initial file instead of directory
                    file.filename = baseDir;
                    file.statData = dirStat;
                    file.depth = depth;
                    callback(file);
                }
            }
            else
                return "error: stat failed for " + baseDir + errtext();
        }

        while (!dirsToCallback.empty()) {
            file = dirsToCallback.front();
            dirsToCallback.pop_front();

            if (!callback(file))
                break;
        }
    }
    catch (SBException &e) {
        log("error: " + e.detail());
        return e.detail();
    }

    return "";
}


int mylstat(string filename, struct stat *buf) {
    return (lstat(filename.c_str(), buf));
}


int mystat(string filename, struct stat *buf) {
    return (stat(filename.c_str(), buf));
}


string errtext(bool format) {
    return((format ? " - " : "") + string(strerror(errno)));
}


// replace carriage-returns with commas
string commafy(string data) {
    if (data.length() && data.back() == '\n')
        data.pop_back();

    size_t pos = 0;
    while((pos = data.find("\n", pos)) != std::string::npos) {
        data.replace(pos, 1, ", ");
        pos += 2;
    }
    return data;
}

