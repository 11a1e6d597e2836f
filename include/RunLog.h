
#ifndef RUNLOG_H
#define RUNLOG_H

#include <string>
#include <vector>
#include <time.h>
#include "RunConfig.h"

using namespace std;


enum LogLevel { lInfo, lProgress, lSuccess, lWarning, lError, lHeading };

struct LogEntry {
    LogLevel level;
    string text;
};


/*
 RunLog is the operator-facing record of a run.  Each entry goes three places:
 the Markdown run log file (if one is configured), the console (colored,
 errors to stderr, quiet honored) and, for errors, syslog via log().  The
 entries are also kept in memory so the caller can inspect what happened.
 */
class RunLog {
    string filename;
    vector<LogEntry> entries;
    unsigned int errors;
    bool fileWarned;

    void append(string line);
    void record(LogLevel level, string text);

public:
    RunLog(string logFile = "");

    void startBackup(time_t when = 0);
    void startRestore(const SiteSpec& site, string target, string reference, time_t when = 0);
    void finish(bool success, string elapsed);

    void heading(string text) { record(lHeading, text); }
    void info(string text) { record(lInfo, text); }
    void progress(string text) { record(lProgress, text); }
    void success(string text) { record(lSuccess, text); }
    void warning(string text) { record(lWarning, text); }
    void error(string text) { record(lError, text); }

    unsigned int errorCount() { return errors; }
    const vector<LogEntry>& getEntries() { return entries; }
    bool contains(LogLevel level, string fragment);
};

#endif

