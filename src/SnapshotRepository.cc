
#include "SnapshotRepository.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


SnapshotRepository::SnapshotRepository(VersionControlBackend& backend, RunLog& log, RetryPolicy init, unsigned int settle) :
    vcs(backend), runLog(log), initPolicy(init), settleSecs(settle) {
}


const vector<pair<string, string>>& SnapshotRepository::resourceProfile() {
    static const vector<pair<string, string>> profile = {
        { "core.compression", "0" },
        { "gc.auto", "0" },
        { "pack.threads", "1" },
        { "pack.window", "0" },
        { "pack.depth", "0" },
        { "core.preloadIndex", "false" },
        { "core.fsmonitor", "false" },
        { "core.untrackedCache", "false" } };

    return profile;
}


void SnapshotRepository::initialize(string path) {
    runLog.progress("Initializing new repository in " + path);

    if (mkdirp(path))
        throw RepositoryError("unable to create " + path + errtext(), path);

    auto succeeded = initPolicy.run([&](unsigned int) {
        return vcs.init(path, HISTORY_LINE);
    }, [&](unsigned int attempt, unsigned int wait) {
        runLog.warning("repository initialization failed (attempt " + to_string(attempt) + " of " +
            to_string(initPolicy.maxAttempts) + "), retrying in " + plural(wait, "second") + ": " + vcs.lastError());
    });

    if (!succeeded)
        throw RepositoryError("unable to initialize a repository in " + path + " after " +
            plural(initPolicy.maxAttempts, "attempt") + ": " + vcs.lastError(), path);

    if (settleSecs)
        initPolicy.sleeper(settleSecs);

    DEBUG(D_repo) DFMT("initialized " << path);
}


void SnapshotRepository::ensureRepository(string path, const vector<string>& ignorePatterns) {
    if (!vcs.isRepository(path))
        initialize(path);

    if (!vcs.verify(path))
        throw RepositoryError("repository " + path + " failed verification: " + vcs.lastError(), path);

    auto history = vcs.historyState(path);

    // never guess:  a second root commit on an existing history can't be taken back
    if (history == HISTORY_ERROR)
        throw RepositoryError("unable to read the history of " + path + ": " + vcs.lastError(), path);

    // a valid repository without history is one whose first run died part way;  finish the job
    if (history == HISTORY_NONE) {
        applyResourceProfile(path);

        if (!vcs.commit(path, ROOT_COMMIT_MESSAGE, true))
            throw RepositoryError("unable to create the initial commit in " + path + ": " + vcs.lastError(), path);

        DEBUG(D_repo) DFMT("root commit created in " << path);
    }

    // rewritten every time so a change to the exclusions takes effect on the next backup
    if (!vcs.setIgnorePatterns(path, ignorePatterns))
        throw RepositoryError("unable to write the ignore rules for " + path + ": " + vcs.lastError(), path);
}


bool SnapshotRepository::applyResourceProfile(string path) {
    bool allApplied = true;

    for (auto &setting: resourceProfile())
        if (!vcs.setConfig(path, setting.first, setting.second)) {
            runLog.warning("unable to set " + setting.first + " in " + path + ": " + vcs.lastError());
            allApplied = false;
        }

    return allApplied;
}


bool SnapshotRepository::compact(string path) {
    if (vcs.gc(path))
        return true;

    runLog.warning("repository maintenance failed for " + path + " (not fatal): " + vcs.lastError());
    return false;
}

