
#ifndef SITECONFIG_H
#define SITECONFIG_H

#include <vector>
#include <string>
#include <pcre++.h>
#include "Setting.h"
#include "RunConfig.h"


using namespace std;
using namespace pcrepp;


class SiteConfig {

public:
    string config_filename;
    vector<Setting> settings;

    SiteConfig();

    // throws ConfigurationError naming the file and line on anything it can't parse
    void loadConfig(string filename);

    // throws ConfigurationError if a required directive is missing or the label is invalid
    SiteSpec toSiteSpec();

    string sampleConfig();

    friend bool operator<(const SiteConfig &s1, const SiteConfig &s2);
    friend bool operator==(const SiteConfig &s1, const SiteConfig &s2);
};

#endif

