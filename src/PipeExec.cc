
#include <string>
#include <iostream>
#include <fstream>
#include <unistd.h>
#include <sys/stat.h>
#include <dirent.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <signal.h>
#include <vector>
#include "pcre++.h"
#include "util_generic.h"
#include "colors.h"
#include "globals.h"
#include "PipeExec.h"
#include "debug.h"


#define READ_END 0
#define WRITE_END 1

using namespace std;
using namespace pcrepp;


string firstAvailIDForDir(string dir);


PipeExec::PipeExec(vector<string> argv) {
    args = argv;
    exitStatus = -1;
}


PipeExec::~PipeExec() {
    flushErrors();
}


void PipeExec::setEnv(string name, string value) {
    for (auto &var: environment)
        if (var.first == name) {
            var.second = value;
            return;
        }

    environment.push_back({name, value});
}


void PipeExec::flushErrors() {
    if (errorFile.length()) {
        unlink(errorFile.c_str());
        rmdir(errorDir.c_str());   // only succeeds once nothing else is in there
        errorFile = "";
    }
}


string PipeExec::commandLine() {
    string result;

    for (auto &arg: args)
        result += (result.length() ? " " : "") + (arg.find(" ") != string::npos ? "\"" + arg + "\"" : arg);

    return result;
}


int PipeExec::launch(int stdinFd, int stdoutFd, bool captureOutput, string procName) {
    outputBuffer = "";

    if (!args.size())
        return(exitStatus = -1);

    errorDir = string(TMP_OUTPUT_DIR) + "/" + (procName.length() ? safeFilename(procName) : "pid_" + to_string(getpid())) + "/";
    mkdirp(errorDir, 0700);
    errorFile = errorDir + firstAvailIDForDir(errorDir) + ":" + safeFilename(pathSplit(args[0]).file) + ".stderr";

    DEBUG(D_exec) DFMT("executing [" << commandLine() << "]");

    int outPipe[2] = { -1, -1 };
    if (captureOutput && pipe(outPipe)) {
        log("error: unable to create pipe for " + args[0] + errtext());
        return(exitStatus = -1);
    }

    // build the exec argument list before forking
    vector<char*> argv;
    for (auto &arg: args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(NULL);

    pid_t childPID = fork();

    if (childPID < 0) {
        log("error: unable to fork for " + args[0] + errtext());

        if (captureOutput) {
            close(outPipe[READ_END]);
            close(outPipe[WRITE_END]);
        }

        return(exitStatus = -1);
    }

    if (!childPID) {
        // CHILD
        for (auto &var: environment)
            setenv(var.first.c_str(), var.second.c_str(), 1);

        if (stdinFd > -1)
            DUP2(stdinFd, STDIN_FILENO);

        if (captureOutput) {
            close(outPipe[READ_END]);
            DUP2(outPipe[WRITE_END], STDOUT_FILENO);
            close(outPipe[WRITE_END]);
        }
        else if (stdoutFd > -1)
            DUP2(stdoutFd, STDOUT_FILENO);

        // redirect stderr to a file
        int errorFd = open(errorFile.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
        if (errorFd > -1)
            DUP2(errorFd, STDERR_FILENO);

        execvp(argv[0], argv.data());

        cerr << "unable to execute " << args[0] << errtext() << endl;
        _exit(127);
    }

    // PARENT
    if (captureOutput) {
        close(outPipe[WRITE_END]);

        char buffer[1024 * 64];
        ssize_t bytesRead;
        while ((bytesRead = read(outPipe[READ_END], buffer, sizeof(buffer))) != 0) {
            if (bytesRead < 0) {
                if (errno == EINTR)
                    continue;
                break;
            }

            outputBuffer.append(buffer, bytesRead);
        }

        close(outPipe[READ_END]);
    }

    int wstatus = 0;
    while (waitpid(childPID, &wstatus, 0) < 0)
        if (errno != EINTR) {
            log("error: lost track of child " + to_string(childPID) + " (" + args[0] + ")" + errtext());
            return(exitStatus = -1);
        }

    if (WIFEXITED(wstatus))
        exitStatus = WEXITSTATUS(wstatus);
    else if (WIFSIGNALED(wstatus))
        exitStatus = 128 + WTERMSIG(wstatus);
    else
        exitStatus = -1;

    DEBUG(D_exec) DFMT("[" << args[0] << "] exited with " << exitStatus);
    return exitStatus;
}


int PipeExec::execute(string procName, bool leaveFinalOutput) {
    return launch(-1, -1, !leaveFinalOutput, procName);
}


int PipeExec::execute2file(string toFile, string procName) {
    int fd = open(toFile.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP);

    if (fd < 0) {
        log("error: unable to write to " + toFile + errtext());
        return(exitStatus = -1);
    }

    launch(-1, fd, false, procName);
    close(fd);

    return exitStatus;
}


int PipeExec::executeFromFile(string fromFile, string procName) {
    int fd = open(fromFile.c_str(), O_RDONLY);

    if (fd < 0) {
        log("error: unable to read " + fromFile + errtext());
        return(exitStatus = -1);
    }

    launch(fd, -1, true, procName);
    close(fd);

    return exitStatus;
}


bool PipeExec::readAndMatch(string matchStr) {
    return (outputBuffer.find(matchStr) != string::npos);
}


string PipeExec::errorOutput() {
    return (errorFile.length() ? commafy(readFile(errorFile)) : "");
}


string firstAvailIDForDir(string dir) {
    DIR *c_dir;
    struct dirent *c_dirEntry;
    string lastID = "";

    if ((c_dir = opendir(dir.c_str())) != NULL) {
        while ((c_dirEntry = readdir(c_dir)) != NULL) {
            if (!strcmp(c_dirEntry->d_name, ".") || !strcmp(c_dirEntry->d_name, ".."))
                continue;

            auto filename = string(c_dirEntry->d_name);
            auto delimit = filename.find(":");

            if (delimit != string::npos) {
                auto id = filename.substr(0, delimit);

                if (lastID.length() < id.length() || (lastID.length() == id.length() && lastID < id))
                    lastID = id;
            }
        }

        closedir(c_dir);
    }

    if (!lastID.length())
        return "A";

    char lastLetter = lastID.back();
    if (lastLetter == 'Z')
        return(lastID + "A");

    lastID.back() = (char)(lastLetter + 1);
    return(lastID);
}

