
#ifndef RESTORERESOLVER_H
#define RESTORERESOLVER_H

#include <string>
#include <vector>
#include "VersionControlBackend.h"
#include "MirrorStager.h"
#include "RunLog.h"

using namespace std;


class RestoreResolver {
    VersionControlBackend& vcs;
    MirrorStager& stager;
    RunLog& runLog;

    void requireRepository(string repo);

public:
    RestoreResolver(VersionControlBackend& backend, MirrorStager& mirrorStager, RunLog& log);

    /* An empty request means the current head.  Otherwise the most recent commit whose
     * abbreviated or full id starts with the request.  Returns an abbreviated id.
     * Throws RepositoryError or ReferenceNotFoundError. */
    string resolveReference(string repo, string requested);

    // throws ReferenceNotFoundError or RestoreFileError
    void checkoutSnapshot(string repo, string reference);

    // checkoutSnapshot() and then an exact mirror of the working area onto target;  throws RestoreFileError
    void materialize(string repo, string reference, string target, const vector<string>& excludePatterns);

    // "abbrev - subject (age)", most recent first;  throws RepositoryError
    vector<string> listBackups(string repo);
};

#endif

