
#include <algorithm>
#include <fnmatch.h>
#include "MirrorStager.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


MirrorStager::MirrorStager(MirrorBackend& mirrorBackend) : backend(mirrorBackend) {
}


vector<string> MirrorStager::exclusionsFor(const vector<string>& configured) {
    vector<string> result = { METADATA_DIR, DUMP_PATTERN };

    for (auto &pattern: configured)
        if (find(result.begin(), result.end(), pattern) == result.end())
            result.push_back(pattern);

    return result;
}


void MirrorStager::mirror(string source, string destination, const vector<string>& excludePatterns, bool deleteExtraneous) {
    if (!isDirectory(source))
        throw StagingError("source directory " + source + " doesn't exist", source);

    if (mkdirp(destination))
        throw StagingError("unable to create " + destination + errtext(), destination);

    auto excludes = exclusionsFor(excludePatterns);
    DEBUG(D_mirror) DFMT(source << " -> " << destination << (deleteExtraneous ? " (exact)" : "") << " excluding " << perlJoin(" ", excludes));

    if (!backend.mirror(source, destination, excludes, deleteExtraneous))
        throw StagingError("copy from " + source + " to " + destination + " failed: " + backend.lastError(), source);
}


bool matchesExclusion(const vector<string>& patterns, string relativePath, bool isDirectory) {
    while (relativePath.length() > 1 && relativePath.find("./") == 0)
        relativePath.erase(0, 2);

    auto components = perlSplit("/", relativePath);
    string prefix;

    for (size_t index = 0; index < components.size(); ++index) {
        bool componentIsDir = index + 1 < components.size() || isDirectory;
        prefix += (prefix.length() ? "/" : "") + components[index];

        for (auto pattern: patterns) {
            bool dirOnly = false;

            if (pattern.length() > 1 && pattern.back() == '/') {
                dirOnly = true;
                pattern.pop_back();
            }

            if (dirOnly && !componentIsDir)
                continue;

            bool anchored = pattern.length() && pattern[0] == '/';
            if (anchored)
                pattern.erase(0, 1);

            if (anchored || pattern.find("/") != string::npos) {
                if (!fnmatch(pattern.c_str(), prefix.c_str(), FNM_PATHNAME))
                    return true;
            }
            else if (!fnmatch(pattern.c_str(), components[index].c_str(), 0))
                return true;
        }
    }

    return false;
}

