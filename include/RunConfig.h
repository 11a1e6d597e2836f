
#ifndef RUNCONFIG_H
#define RUNCONFIG_H

#include <string>
#include <vector>

using namespace std;


struct SiteSpec {
    string label;               // output label, unique across the registry
    string source;              // absolute, or relative to RunConfig::sitesRoot
    string database;
    string dbUser;
    string dbPassword;
    vector<string> excludes;    // extra patterns for this site only
    string profileFile;         // where it was defined, for error messages
};


/*
 Everything that changes what a run backs up or restores.  It's built once in
 main() from the CLI, the environment and the site profiles and then handed
 (const) to the orchestrator, which passes the relevant pieces down.
 */
struct RunConfig {
    string backupRoot;
    string sitesRoot;
    string runLogFile;
    string mysqlBinDir;
    vector<string> excludes;
    unsigned int settleSecs;
    bool showProgress;
    vector<SiteSpec> sites;

    RunConfig();

    static vector<string> defaultExcludes();

    const SiteSpec* findSite(string label) const;
    string repositoryFor(const SiteSpec& site) const;
    string sourceFor(const SiteSpec& site) const;
    string dumpFileFor(const SiteSpec& site) const;
    vector<string> excludesFor(const SiteSpec& site) const;
};

#endif

