
#ifndef GITBACKEND_H
#define GITBACKEND_H

#include <string>
#include <vector>
#include "VersionControlBackend.h"

using namespace std;


class GitBackend : public VersionControlBackend {
    string gitBinary;
    string identityName;
    string identityEmail;
    string errorText;

    int git(string repo, vector<string> arguments, string *output = NULL);

public:
    GitBackend(string binary = "git");

    bool isRepository(string repo);
    bool init(string repo, string historyLine);
    bool setConfig(string repo, string key, string value);
    bool setIgnorePatterns(string repo, const vector<string>& patterns);
    bool commit(string repo, string message, bool allowEmpty = false);
    bool stageAll(string repo);
    bool stageOne(string repo, string relativePath);
    StagedState stagedState(string repo);
    bool log(string repo, vector<CommitEntry>& entries);
    bool verify(string repo);
    string head(string repo);
    HistoryState historyState(string repo);
    bool isValidReference(string repo, string reference);
    bool checkout(string repo, string reference);
    bool gc(string repo);

    string lastError() { return errorText; }
};

#endif

