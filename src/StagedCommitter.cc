
#include <algorithm>
#include "StagedCommitter.h"
#include "MirrorStager.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


#define PROGRESS_EVERY 1000
#define RETRY_NOTICE_EVERY 100


StagedCommitter::StagedCommitter(VersionControlBackend& backend, SnapshotRepository& snapshots, RunLog& log, RetryPolicy stageFile, RetryPolicy commit) :
    vcs(backend), repository(snapshots), runLog(log), filePolicy(stageFile), commitPolicy(commit) {
}


string StagedCommitter::backupMessage(time_t when) {
    return "Backup from " + nowString("%Y-%m-%d %H:%M:%S", when);
}


struct enumerateData {
    string top;
    const vector<string> *excludes;
    vector<string> files;
};


bool enumerateCallback(pdCallbackData &file) {
    if (S_ISDIR(file.statData.st_mode))
        return true;

    auto data = (enumerateData*)file.dataPtr;
    string relative = file.filename.substr(data->top.length() + 1);

    if (!matchesExclusion(*data->excludes, relative, false))
        data->files.push_back(relative);

    return true;
}


vector<string> StagedCommitter::enumerateFiles(string repo, const vector<string>& excludes) {
    auto allExcludes = MirrorStager::exclusionsFor(excludes);
    enumerateData data;
    data.top = repo.length() > 1 && repo.back() == '/' ? repo.substr(0, repo.length() - 1) : repo;
    data.excludes = &allExcludes;

    // the metadata directory is pruned outright rather than walked and filtered
    string error = processDirectory(data.top, "/\\.git$", true, true, enumerateCallback, &data);
    if (error.length())
        DEBUG(D_stage) DFMT("enumeration of " << repo << " incomplete: " << error);

    sort(data.files.begin(), data.files.end());
    return data.files;
}


StageResult StagedCommitter::stageEachFile(string repo, const vector<string>& excludes) {
    StageResult result = { false, 0, 0 };
    size_t filesRetried = 0;
    size_t done = 0;

    auto files = enumerateFiles(repo, excludes);
    result.filesTotal = files.size();
    runLog.progress("Staging " + plural(files.size(), "file") + " individually");

    for (auto &file: files) {
        bool retried = false;

        auto succeeded = filePolicy.run([&](unsigned int) {
            return vcs.stageOne(repo, file);
        }, [&](unsigned int, unsigned int) {
            if (!retried && !(filesRetried++ % RETRY_NOTICE_EVERY))
                runLog.warning("retrying files that failed to stage (" + plural(filesRetried, "file") + " so far, latest " + file + ")");
            retried = true;
        });

        if (!succeeded) {
            ++result.filesFailed;
            DEBUG(D_stage) DFMT("gave up on " << file << ": " << vcs.lastError());
        }

        if (!(++done % PROGRESS_EVERY))
            runLog.progress("Staged " + to_string(done) + " of " + plural(files.size(), "file"));
    }

    return result;
}


StageResult StagedCommitter::stageAll(string repo, const vector<string>& excludes) {
    if (vcs.stageAll(repo)) {
        DEBUG(D_stage) DFMT("bulk staging of " << repo << " succeeded");
        return { true, 0, 0 };
    }

    runLog.warning("staging everything at once failed (" + vcs.lastError() + "); falling back to one file at a time");
    auto result = stageEachFile(repo, excludes);

    if (!result.complete())
        runLog.error(plural(result.filesFailed, "file") + " of " + to_string(result.filesTotal) + " could not be staged in " + repo +
            "; committing what was staged");
    else
        runLog.success("All " + plural(result.filesTotal, "file") + " staged individually");

    return result;
}


CommitOutcome StagedCommitter::commitIfChanged(string repo, string message) {
    auto state = vcs.stagedState(repo);

    if (state == STAGED_CLEAN) {
        runLog.info("No changes to commit");
        return COMMIT_NOOP;
    }

    // an error here just means we can't tell;  let the commit decide
    if (state == STAGED_ERROR)
        DEBUG(D_commit) DFMT("unable to compare staged changes in " << repo << ": " << vcs.lastError());

    auto succeeded = commitPolicy.run([&](unsigned int attempt) {
        DEBUG(D_commit) DFMT("commit attempt " << attempt << " in " << repo);
        return vcs.commit(repo, message);
    }, [&](unsigned int attempt, unsigned int wait) {
        runLog.warning("commit failed (attempt " + to_string(attempt) + " of " + to_string(commitPolicy.maxAttempts) +
            "), retrying in " + plural(wait, "second") + ": " + vcs.lastError());

        // the first failure is usually git running out of memory;  make sure the lean settings are in place
        if (attempt == 1)
            repository.applyResourceProfile(repo);
    });

    if (!succeeded)
        throw CommitError("commit failed after " + plural(commitPolicy.maxAttempts, "attempt") + " in " + repo + ": " + vcs.lastError(), repo);

    runLog.success("Changes committed: " + message);
    repository.compact(repo);

    return COMMIT_DONE;
}

