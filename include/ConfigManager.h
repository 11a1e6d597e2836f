
#ifndef CONFIGMANAGER
#define CONFIGMANAGER

#include <vector>
#include <string>
#include "SiteConfig.h"
#include "RunConfig.h"

using namespace std;


/*
 The site registry:  every *.conf file in the profile directory defines one
 site.  Loading is all-or-nothing;  the first malformed or duplicate profile
 throws ConfigurationError and no sites are returned.
 */
class ConfigManager {
public:
    string confDir;
    vector<SiteConfig> configs;

    ConfigManager(string directory);

    void loadProfile(string filename);
    vector<SiteSpec> sites();
};

#endif

