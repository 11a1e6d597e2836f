#include <fstream>
#include <dirent.h>
#include "pcre++.h"
#include <algorithm>
#include "ConfigManager.h"
#include "exception.h"
#include "globals.h"
#include "util_generic.h"
#include "debug.h"

using namespace pcrepp;


bool configMgrCallback(pdCallbackData &file) {
    if (!S_ISDIR(file.statData.st_mode))
        ((vector<string>*)file.dataPtr)->push_back(file.filename);

    return true;
}


void ConfigManager::loadProfile(string filename) {
    SiteConfig siteConfig;
    siteConfig.loadConfig(filename);

    // validate now so the error names the file
    siteConfig.toSiteSpec();

    auto foundConfig = find(configs.begin(), configs.end(), siteConfig);

    if (foundConfig != configs.end())
        throw ConfigurationError("duplicate site label (" + foundConfig->settings[sSite].value + ") defined in " +
            filename + " and " + foundConfig->config_filename, filename);

    DEBUG(D_config) DFMT("loaded site " << siteConfig.settings[sSite].value << " from " << filename);
    configs.push_back(siteConfig);
}


ConfigManager::ConfigManager(string directory) {
    confDir = directory;

    if (!isDirectory(confDir))
        throw ConfigurationError("site profile directory " + confDir + " doesn't exist (see --confdir)", confDir);

    // subdirectories are skipped (filterDirs) unless they're themselves named *.conf
    vector<string> profiles;
    string error = processDirectory(confDir, "\\.conf$", false, true, configMgrCallback, &profiles);
    if (error.length())
        throw ConfigurationError(error, confDir);

    // load in a stable order so "defined in A and B" always names the same pair
    sort(profiles.begin(), profiles.end());
    for (auto &profile: profiles)
        loadProfile(profile);

    sort(configs.begin(), configs.end());
}


vector<SiteSpec> ConfigManager::sites() {
    vector<SiteSpec> result;

    for (auto &config: configs)
        result.push_back(config.toSiteSpec());

    return result;
}
