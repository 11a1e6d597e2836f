
#ifndef RSYNCMIRROR_H
#define RSYNCMIRROR_H

#include <string>
#include <vector>
#include "MirrorBackend.h"

using namespace std;


class RsyncMirror : public MirrorBackend {
    string rsyncBinary;
    bool showProgress;
    int progressSupported;      // -1 until rsync has been asked
    string errorText;

    bool supportsProgress();

public:
    RsyncMirror(bool progress = false, string binary = "rsync");

    vector<string> buildArgs(string source, string destination, const vector<string>& excludes, bool deleteExtraneous, bool progress);

    bool mirror(string source, string destination, const vector<string>& excludes, bool deleteExtraneous);

    string lastError() { return errorText; }
};

#endif

