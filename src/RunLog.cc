
#include <fstream>
#include <iostream>
#include "RunLog.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"


#define SEPARATOR "---"


RunLog::RunLog(string logFile) {
    filename = logFile;
    errors = 0;
    fileWarned = false;
}


void RunLog::append(string line) {
    if (!filename.length())
        return;

    ofstream logFile;
    logFile.open(filename, ios::app);

    if (logFile.is_open()) {
        logFile << line << endl;
        logFile.close();
    }
    else if (!fileWarned) {
        // only say so once per run rather than once per entry
        fileWarned = true;
        SCREENERR(log("warning: unable to write to run log " + filename + errtext()));
    }
}


void RunLog::record(LogLevel level, string text) {
    entries.push_back({ level, text });

    switch (level) {
        case lHeading:
            append("- ### " + text);
            NOTQUIET && cout << BOLDBLUE << "=== " << text << " ===" << RESET << endl;
            break;

        case lError:
            ++errors;
            append("- *ERROR*: " + text);
            SCREENERR("ERROR: " << log(text));
            break;

        case lWarning:
            append("- *WARNING*: " + text);
            NOTQUIET && cout << YELLOW << "WARNING: " << text << RESET << endl;
            break;

        case lSuccess:
            append("- " + text);
            NOTQUIET && cout << GREEN << text << RESET << endl;
            break;

        case lProgress:
            append("- " + text);
            NOTQUIET && cout << CYAN << text << RESET << endl;
            break;

        default:
            append("- " + text);
            NOTQUIET && cout << text << endl;
    }
}


void RunLog::startBackup(time_t when) {
    string stamp = nowString("%Y-%m-%d %H:%M:%S", when);

    append("");
    append(SEPARATOR);
    append("**Backup started:** " + stamp);
    append("");

    log("backup run started");
    NOTQUIET && cout << BOLDYELLOW << "Backup started: " << stamp << RESET << endl;
}


void RunLog::startRestore(const SiteSpec& site, string target, string reference, time_t when) {
    string stamp = nowString("%Y-%m-%d %H:%M:%S", when);

    append("");
    append(SEPARATOR);
    append("**Restore started:** " + stamp);
    append("- Site: " + site.label);
    append("- Path: " + target);
    append("- Commit: " + (reference.length() ? reference : string("latest")));
    append("- Database: " + site.database);
    append("");

    log("restore of " + site.label + " started");
    NOTQUIET && cout << BOLDYELLOW << "Restore started: " << stamp << RESET << endl;
}


void RunLog::finish(bool success, string elapsed) {
    string text = string(success ? "Completed successfully" : "Completed with " + plural(errors, "error")) + " in " + elapsed;

    append("");
    append("**" + text + "**");

    log(text);
    NOTQUIET && cout << (success ? BOLDGREEN : LIGHTRED) << text << RESET << endl;
}


bool RunLog::contains(LogLevel level, string fragment) {
    for (auto &entry: entries)
        if (entry.level == level && entry.text.find(fragment) != string::npos)
            return true;

    return false;
}

