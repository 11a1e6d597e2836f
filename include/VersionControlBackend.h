
#ifndef VERSIONCONTROLBACKEND_H
#define VERSIONCONTROLBACKEND_H

#include <string>
#include <vector>
#include <time.h>

using namespace std;


enum StagedState { STAGED_CLEAN, STAGED_CHANGES, STAGED_ERROR };

// whether HEAD points at a commit yet;  an error says nothing about the history
enum HistoryState { HISTORY_NONE, HISTORY_PRESENT, HISTORY_ERROR };


struct CommitEntry {
    string id;
    string shortId;
    time_t timestamp;
    string subject;
    string age;

    // "abbrev - subject (age)"
    string display() const { return shortId + " - " + subject + (age.length() ? " (" + age + ")" : ""); }
};


/*
 Everything the engine needs from the version control tool, per repository
 path.  Operations return false (or STAGED_ERROR, or "") on failure and leave
 the tool's error text in lastError();  deciding what's fatal is up to the
 caller.
 */
class VersionControlBackend {
public:
    virtual ~VersionControlBackend() {}

    virtual bool isRepository(string repo) = 0;
    virtual bool init(string repo, string historyLine) = 0;
    virtual bool setConfig(string repo, string key, string value) = 0;
    virtual bool setIgnorePatterns(string repo, const vector<string>& patterns) = 0;
    virtual bool commit(string repo, string message, bool allowEmpty = false) = 0;
    virtual bool stageAll(string repo) = 0;
    virtual bool stageOne(string repo, string relativePath) = 0;
    virtual StagedState stagedState(string repo) = 0;

    // most recent first
    virtual bool log(string repo, vector<CommitEntry>& entries) = 0;

    virtual bool verify(string repo) = 0;
    virtual string head(string repo) = 0;
    virtual HistoryState historyState(string repo) = 0;
    virtual bool isValidReference(string repo, string reference) = 0;
    virtual bool checkout(string repo, string reference) = 0;
    virtual bool gc(string repo) = 0;

    virtual string lastError() = 0;
};

#endif

