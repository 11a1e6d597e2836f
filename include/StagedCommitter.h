
#ifndef STAGEDCOMMITTER_H
#define STAGEDCOMMITTER_H

#include <string>
#include <vector>
#include <time.h>
#include "VersionControlBackend.h"
#include "SnapshotRepository.h"
#include "RetryPolicy.h"
#include "RunLog.h"

using namespace std;


enum CommitOutcome { COMMIT_NOOP, COMMIT_DONE };


struct StageResult {
    bool bulk;              // the single "stage everything" worked
    size_t filesTotal;      // files attempted one at a time (0 when bulk worked)
    size_t filesFailed;     // files that never staged

    bool complete() const { return filesFailed == 0; }
};


class StagedCommitter {
    VersionControlBackend& vcs;
    SnapshotRepository& repository;
    RunLog& runLog;
    RetryPolicy filePolicy;
    RetryPolicy commitPolicy;

    StageResult stageEachFile(string repo, const vector<string>& excludes);

public:
    StagedCommitter(VersionControlBackend& backend, SnapshotRepository& snapshots, RunLog& log, RetryPolicy stageFile, RetryPolicy commit);

    // every file under repo that isn't metadata or excluded, relative to repo, sorted
    static vector<string> enumerateFiles(string repo, const vector<string>& excludes);

    static string backupMessage(time_t when = 0);

    // never throws;  a partial result is logged as an error and returned
    StageResult stageAll(string repo, const vector<string>& excludes);

    // throws CommitError
    CommitOutcome commitIfChanged(string repo, string message);
};

#endif

