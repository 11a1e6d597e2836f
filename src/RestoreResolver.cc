
#include "RestoreResolver.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


RestoreResolver::RestoreResolver(VersionControlBackend& backend, MirrorStager& mirrorStager, RunLog& log) :
    vcs(backend), stager(mirrorStager), runLog(log) {
}


void RestoreResolver::requireRepository(string repo) {
    if (!vcs.isRepository(repo))
        throw RepositoryError("no backup repository found at " + repo, repo);

    if (!vcs.verify(repo))
        throw RepositoryError("backup repository " + repo + " is invalid: " + vcs.lastError(), repo);
}


string RestoreResolver::resolveReference(string repo, string requested) {
    requireRepository(repo);
    requested = trimSpace(requested);

    if (!requested.length()) {
        string current = vcs.head(repo);

        if (!current.length())
            throw ReferenceNotFoundError("unable to determine the latest backup in " + repo + ": " + vcs.lastError(), "HEAD");

        DEBUG(D_restore) DFMT("latest backup in " << repo << " is " << current);
        return current;
    }

    vector<CommitEntry> history;
    if (!vcs.log(repo, history))
        throw RepositoryError("unable to read the history of " + repo + ": " + vcs.lastError(), repo);

    // newest first, so the first match is the most recent
    for (auto &entry: history)
        if (entry.shortId.rfind(requested, 0) == 0 || entry.id.rfind(requested, 0) == 0) {
            DEBUG(D_restore) DFMT(requested << " resolved to " << entry.shortId << " (" << entry.subject << ")");
            return entry.shortId;
        }

    throw ReferenceNotFoundError("no backup matching '" + requested + "' in " + repo, requested);
}


void RestoreResolver::checkoutSnapshot(string repo, string reference) {
    if (!vcs.isValidReference(repo, reference))
        throw ReferenceNotFoundError("'" + reference + "' is not a backup in " + repo, reference);

    if (!vcs.checkout(repo, reference))
        throw RestoreFileError("unable to check out " + reference + " in " + repo + ": " + vcs.lastError(), reference);

    runLog.success("Checked out backup " + reference);
}


void RestoreResolver::materialize(string repo, string reference, string target, const vector<string>& excludePatterns) {
    checkoutSnapshot(repo, reference);

    runLog.progress("Copying files from " + repo + " to " + target);

    try {
        stager.mirror(repo, target, excludePatterns, true);
    }
    catch (StagingError &e) {
        throw RestoreFileError("file restore failed: " + e.detail(), target);
    }

    runLog.success("Files restored to " + target);
}


vector<string> RestoreResolver::listBackups(string repo) {
    requireRepository(repo);

    vector<CommitEntry> history;
    if (!vcs.log(repo, history))
        throw RepositoryError("unable to read the history of " + repo + ": " + vcs.lastError(), repo);

    vector<string> result;
    for (auto &entry: history)
        result.push_back(entry.display());

    return result;
}

