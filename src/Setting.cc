
#include "Setting.h"
#include "globals.h"


Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal) {
    regex = Pcre("^\\s*" + pattern + CAPTURE_VALUE + RE_COMMENT, "i");
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    seen = false;
}


// match groups: 0 = directive name, 1 = delimiter, 2 = value, 3 = trailing comment
bool Setting::parse(string dataLine) {
    if (!(regex.search(dataLine) && regex.matches() > 2))
        return false;

    string newValue = trimQuotes(trimSpace(regex.get_match(2)));

    if (data_type == LIST) {
        for (auto &item: perlSplit("[\\s,]+", newValue))
            if (item.length())
                values.push_back(trimQuotes(item));

        value = perlJoin(" ", values);
    }
    else
        value = newValue;

    seen = true;
    return true;
}


string Setting::confPrint(string sample) {
    bool isDef = value == defaultValue;
    string shown = data_type == SECRET && !isDef ? "********" : value;

    return(blockp((isDef ? "#" : "") + display_name + ":", -17) +
        (isDef && sample.length() ? blockp(sample, -25) + "  # example" :
         (blockp(shown, -25) + (isDef ? "  # default" : ""))) + "\n");
}

