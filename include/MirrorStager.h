
#ifndef MIRRORSTAGER_H
#define MIRRORSTAGER_H

#include <string>
#include <vector>
#include "MirrorBackend.h"

using namespace std;


/*
 One-way copy of a file tree with exclusions, used in both directions:
 site -> repository working area for a backup (nothing deleted) and
 repository working area -> site for a restore (exact mirror).
 */
class MirrorStager {
    MirrorBackend& backend;

public:
    MirrorStager(MirrorBackend& mirrorBackend);

    // the repository metadata and the dump artifact, always, followed by the configured patterns
    static vector<string> exclusionsFor(const vector<string>& configured);

    // throws StagingError
    void mirror(string source, string destination, const vector<string>& excludePatterns, bool deleteExtraneous);
};


/*
 An exclude pattern applied to a path relative to the top of the tree:  a
 trailing '/' matches directories only;  a pattern with no other '/' matches
 the last component at any depth;  otherwise it's matched against the whole
 relative path from the top, the way git reads its ignore file.  RsyncMirror
 anchors such patterns with a leading '/' so rsync reads them the same way.
 A path is also excluded when any directory above it is.
 */
bool matchesExclusion(const vector<string>& patterns, string relativePath, bool isDirectory);

#endif

