
#ifndef SETTING_H
#define SETTING_H

#include <string>
#include <vector>
#include <pcre++.h>
#include "util_generic.h"

using namespace std;
using namespace pcrepp;

// STRING settings keep the last value seen;  LIST settings accumulate every
// line they match, each line split on whitespace and commas.
enum SetType { STRING, LIST, SECRET };
enum SetSpecifier { sSite, sSource, sDatabase, sDbUser, sDbPassword, sExclude };


class Setting {
    public:
        string display_name;
        enum SetType data_type;
        string value;
        vector<string> values;
        string defaultValue;
        Pcre regex;
        bool seen;

        bool parse(string dataLine);
        string confPrint(string sample = "");
        Setting(string name, string pattern, enum SetType setType, string defaultVal);
};

#endif

