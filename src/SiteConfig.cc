#include <fstream>
#include <sys/stat.h>
#include <stdio.h>
#include <unistd.h>
#include <pcre++.h>

#include "SiteConfig.h"
#include "Setting.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"

using namespace pcrepp;


bool operator<(const SiteConfig& s1, const SiteConfig& s2) {
    return (s1.settings[sSite].value < s2.settings[sSite].value);
}


bool operator==(const SiteConfig& s1, const SiteConfig& s2) {
    return (s1.settings[sSite].value == s2.settings[sSite].value);
}


SiteConfig::SiteConfig() {
    config_filename = "";

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting("site", RE_SITE, STRING, ""));
    settings.insert(settings.end(), Setting("source", RE_SOURCE, STRING, ""));
    settings.insert(settings.end(), Setting("database", RE_DATABASE, STRING, ""));
    settings.insert(settings.end(), Setting("db_user", RE_DBUSER, STRING, ""));
    settings.insert(settings.end(), Setting("db_password", RE_DBPASSWORD, SECRET, ""));
    settings.insert(settings.end(), Setting("exclude", RE_EXCLUDE, LIST, ""));
}


void SiteConfig::loadConfig(string filename) {
    ifstream configFile;

    configFile.open(filename);
    if (!configFile.is_open())
        throw ConfigurationError("unable to read " + filename + errtext(), filename);

    string dataLine;
    Pcre reBlank(RE_BLANK);
    config_filename = filename;

    unsigned int line = 0;
    while (getline(configFile, dataLine)) {
        ++line;

        // tolerate profiles edited on windows
        if (dataLine.length() && dataLine.back() == '\r')
            dataLine.pop_back();

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.parse(dataLine)) {
                DEBUG(D_config) DFMT(filename << ":" << line << " " << setting.display_name << " = " << (setting.data_type == SECRET ? "********" : setting.value));
                identified = true;
                break;
            }
        }

        if (!identified) {
            configFile.close();
            throw ConfigurationError("unknown directive on line " + to_string(line) + " of " + filename + ": " + trimSpace(dataLine), filename);
        }
    }

    configFile.close();
}


SiteSpec SiteConfig::toSiteSpec() {
    SiteSpec site;
    string where = config_filename.length() ? " in " + config_filename : "";

    for (auto required: { sSite, sSource, sDatabase, sDbUser })
        if (!settings[required].value.length())
            throw ConfigurationError("missing required directive '" + settings[required].display_name + "'" + where, config_filename);

    Pcre validLabel("^[A-Za-z0-9_][A-Za-z0-9._-]*$");
    if (!validLabel.search(settings[sSite].value))
        throw ConfigurationError("invalid site label '" + settings[sSite].value + "'" + where + " (letters, digits, '.', '_' and '-' only)", config_filename);

    site.label = settings[sSite].value;
    site.source = settings[sSource].value;
    site.database = settings[sDatabase].value;
    site.dbUser = settings[sDbUser].value;
    site.dbPassword = settings[sDbPassword].value;
    site.excludes = settings[sExclude].values;
    site.profileFile = config_filename;

    return site;
}


string SiteConfig::sampleConfig() {
    string result;
    vector<string> samples = { "example.com", "example.com/public_html", "example_db", "example_user", "secret", "uploads/tmp/ *.bak" };

    auto sample_it = samples.begin();
    for (auto &setting: settings)
        result += setting.confPrint(sample_it != samples.end() ? *sample_it++ : "");

    return result;
}
