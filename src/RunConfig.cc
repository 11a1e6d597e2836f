
#include <algorithm>
#include "RunConfig.h"
#include "util_generic.h"
#include "globals.h"


RunConfig::RunConfig() {
    excludes = defaultExcludes();
    settleSecs = 2;
    showProgress = false;
}


vector<string> RunConfig::defaultExcludes() {
    return { "*.log", "cache/", "tmp/", "node_modules/" };
}


const SiteSpec* RunConfig::findSite(string label) const {
    for (auto &site: sites)
        if (site.label == label)
            return &site;

    return NULL;
}


string RunConfig::repositoryFor(const SiteSpec& site) const {
    return slashConcat(backupRoot, site.label);
}


string RunConfig::sourceFor(const SiteSpec& site) const {
    if (site.source.length() && site.source[0] == '/')
        return site.source;

    return slashConcat(sitesRoot.length() ? sitesRoot : ".", site.source);
}


string RunConfig::dumpFileFor(const SiteSpec& site) const {
    return slashConcat(repositoryFor(site), site.database + DUMP_SUFFIX);
}


// the run-wide set followed by the site's own, without repeats
vector<string> RunConfig::excludesFor(const SiteSpec& site) const {
    vector<string> result = excludes;

    for (auto &pattern: site.excludes)
        if (find(result.begin(), result.end(), pattern) == result.end())
            result.push_back(pattern);

    return result;
}

