
#include "RsyncMirror.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


RsyncMirror::RsyncMirror(bool progress, string binary) {
    rsyncBinary = binary;
    showProgress = progress;
    progressSupported = -1;
}


// --info=progress2 arrived in rsync 3.1;  older ones just get no progress display
bool RsyncMirror::supportsProgress() {
    if (progressSupported < 0) {
        PipeExec help({ rsyncBinary, "--help" });
        help.execute();
        progressSupported = help.readAndMatch("--info");
    }

    return progressSupported > 0;
}


vector<string> RsyncMirror::buildArgs(string source, string destination, const vector<string>& excludes, bool deleteExtraneous, bool progress) {
    vector<string> argv = { rsyncBinary, "-a" };

    if (deleteExtraneous)
        argv.push_back("--delete");

    if (progress)
        argv.push_back("--info=progress2");

    // rsync lets "a/b" match at any depth;  anchor it so it only matches from the top, like git does
    for (auto &pattern: excludes) {
        size_t slash = pattern.find("/");
        bool innerSlash = slash != string::npos && slash + 1 < pattern.length();

        argv.push_back("--exclude=" + string(innerSlash && slash > 0 ? "/" : "") + pattern);
    }

    // trailing slashes:  copy the contents of source, not source itself
    argv.push_back(source.length() && source.back() == '/' ? source : source + "/");
    argv.push_back(destination.length() && destination.back() == '/' ? destination : destination + "/");

    return argv;
}


bool RsyncMirror::mirror(string source, string destination, const vector<string>& excludes, bool deleteExtraneous) {
    bool progress = showProgress && NOTQUIET && supportsProgress();
    PipeExec rsync(buildArgs(source, destination, excludes, deleteExtraneous, progress));

    DEBUG(D_mirror) DFMT(rsync.commandLine());

    int result = rsync.execute("", progress);
    errorText = result ? rsync.errorOutput() : "";

    if (result && !errorText.length())
        errorText = "rsync exited with " + to_string(result);

    return !result;
}

