
#ifndef SNAPSHOTREPOSITORY_H
#define SNAPSHOTREPOSITORY_H

#include <string>
#include <vector>
#include <utility>
#include "VersionControlBackend.h"
#include "RetryPolicy.h"
#include "RunLog.h"

using namespace std;


/*
 Lifecycle of one site's repository:  Uninitialized -> Initialized (no history)
 -> Ready.  ensureRepository() gets it to Ready from either of the earlier
 states and proves it's still Ready if it already was.
 */
class SnapshotRepository {
    VersionControlBackend& vcs;
    RunLog& runLog;
    RetryPolicy initPolicy;
    unsigned int settleSecs;

    void initialize(string path);

public:
    SnapshotRepository(VersionControlBackend& backend, RunLog& log, RetryPolicy init, unsigned int settle = 0);

    // the settings that keep git's memory and cpu use down on a shared host
    static const vector<pair<string, string>>& resourceProfile();

    // throws RepositoryError
    void ensureRepository(string path, const vector<string>& ignorePatterns);

    // failures are logged as warnings;  returns false if any setting didn't take
    bool applyResourceProfile(string path);

    // best effort, never throws
    bool compact(string path);
};

#endif

