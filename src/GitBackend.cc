
#include <fstream>
#include <unistd.h>
#include <string.h>
#include "pcre++.h"
#include "GitBackend.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"

using namespace pcrepp;

// fields of one log line, unit-separator delimited:  full id, short id, commit time, subject, relative age
#define LOG_FORMAT "--pretty=format:%H%x1f%h%x1f%ct%x1f%s%x1f%cr"


GitBackend::GitBackend(string binary) {
    gitBinary = binary;

    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)))
        strcpy(hostname, "localhost");
    hostname[sizeof(hostname) - 1] = 0;

    identityName = "sitebackups";
    identityEmail = string("sitebackups@") + hostname;
}


int GitBackend::git(string repo, vector<string> arguments, string *output) {
    vector<string> argv = { gitBinary, "-C", repo };
    argv.insert(argv.end(), arguments.begin(), arguments.end());

    PipeExec proc(argv);
    proc.setEnv("GIT_DISCOVERY_ACROSS_FILESYSTEM", "1");
    proc.setEnv("GIT_TERMINAL_PROMPT", "0");

    // commits need an identity;  shared hosts frequently have none configured
    if (!cppgetenv("GIT_AUTHOR_NAME").length())
        proc.setEnv("GIT_AUTHOR_NAME", identityName);
    if (!cppgetenv("GIT_AUTHOR_EMAIL").length())
        proc.setEnv("GIT_AUTHOR_EMAIL", identityEmail);
    if (!cppgetenv("GIT_COMMITTER_NAME").length())
        proc.setEnv("GIT_COMMITTER_NAME", identityName);
    if (!cppgetenv("GIT_COMMITTER_EMAIL").length())
        proc.setEnv("GIT_COMMITTER_EMAIL", identityEmail);

    int result = proc.execute();
    errorText = result ? proc.errorOutput() : "";

    if (result && !errorText.length())
        errorText = "git " + (arguments.size() ? arguments[0] : string("")) + " exited with " + to_string(result);

    if (output != NULL)
        *output = proc.output();

    DEBUG(D_exec) DFMT("git " << perlJoin(" ", arguments) << " in " << repo << " -> " << result);
    return result;
}


bool GitBackend::isRepository(string repo) {
    return exists(slashConcat(repo, METADATA_DIR));
}


bool GitBackend::init(string repo, string historyLine) {
    // set the history line through HEAD rather than --initial-branch so older gits work too
    return (!git(repo, { "init", "--quiet" }) &&
            !git(repo, { "symbolic-ref", "HEAD", "refs/heads/" + historyLine }));
}


bool GitBackend::setConfig(string repo, string key, string value) {
    return !git(repo, { "config", key, value });
}


bool GitBackend::setIgnorePatterns(string repo, const vector<string>& patterns) {
    string infoDir = slashConcat(repo, METADATA_DIR, "info");
    string excludeFile = slashConcat(infoDir, "exclude");

    if (mkdirp(infoDir)) {
        errorText = "unable to create " + infoDir + errtext();
        return false;
    }

    ofstream ignoreFile;
    ignoreFile.open(excludeFile, ios::trunc);
    if (!ignoreFile.is_open()) {
        errorText = "unable to write " + excludeFile + errtext();
        return false;
    }

    ignoreFile << "# maintained by sitebackups;  rewritten on every backup" << endl;
    for (auto &pattern: patterns)
        ignoreFile << pattern << endl;

    ignoreFile.close();
    return !ignoreFile.fail();
}


bool GitBackend::commit(string repo, string message, bool allowEmpty) {
    vector<string> arguments = { "commit", "--quiet", "--no-verify" };

    if (allowEmpty)
        arguments.push_back("--allow-empty");

    arguments.push_back("-m");
    arguments.push_back(message);

    return !git(repo, arguments);
}


bool GitBackend::stageAll(string repo) {
    return !git(repo, { "add", "--all", "." });
}


bool GitBackend::stageOne(string repo, string relativePath) {
    return !git(repo, { "add", "--", relativePath });
}


StagedState GitBackend::stagedState(string repo) {
    switch (git(repo, { "diff", "--cached", "--quiet" })) {
        case 0:  return STAGED_CLEAN;
        case 1:  return STAGED_CHANGES;
        default: return STAGED_ERROR;
    }
}


bool GitBackend::log(string repo, vector<CommitEntry>& entries) {
    string output;
    entries.clear();

    if (git(repo, { "log", LOG_FORMAT }, &output))
        return false;

    Pcre lineRE("^([0-9a-f]+)\\x1f([0-9a-f]+)\\x1f(\\d+)\\x1f(.*)\\x1f(.*)$");
    for (auto &line: perlSplit("\\n", output)) {
        if (!line.length())
            continue;

        if (lineRE.search(line) && lineRE.matches() > 4) {
            CommitEntry entry;
            entry.id = lineRE.get_match(0);
            entry.shortId = lineRE.get_match(1);
            entry.timestamp = stol(lineRE.get_match(2));
            entry.subject = lineRE.get_match(3);
            entry.age = lineRE.get_match(4);
            entries.push_back(entry);
        }
        else
            DEBUG(D_repo) DFMT("unparsable log line in " << repo << ": " << line);
    }

    return true;
}


bool GitBackend::verify(string repo) {
    string output;

    // -C puts us in the repository's top level, so anything other than ".git" means
    // git found some other repository further up the tree
    if (git(repo, { "rev-parse", "--git-dir" }, &output))
        return false;

    if (trimSpace(output) != METADATA_DIR) {
        errorText = repo + " is not the top level of its repository (found " + trimSpace(output) + ")";
        return false;
    }

    return true;
}


string GitBackend::head(string repo) {
    string output;

    if (git(repo, { "rev-parse", "--short", "HEAD" }, &output))
        return "";

    return trimSpace(output);
}


// rev-parse exits 1 (quietly) for an unborn HEAD and 128 for everything that's actually wrong
HistoryState GitBackend::historyState(string repo) {
    switch (git(repo, { "rev-parse", "--verify", "--quiet", "HEAD" })) {
        case 0:  return HISTORY_PRESENT;
        case 1:  return HISTORY_NONE;
        default: return HISTORY_ERROR;
    }
}


bool GitBackend::isValidReference(string repo, string reference) {
    return !git(repo, { "rev-parse", "--verify", "--quiet", reference + "^{commit}" });
}


bool GitBackend::checkout(string repo, string reference) {
    return !git(repo, { "checkout", "--no-overlay", reference, "--", "." });
}


bool GitBackend::gc(string repo) {
    // a leftover gc.log from an earlier failure makes every later "gc --auto" refuse to run
    string gcLog = slashConcat(repo, METADATA_DIR, "gc.log");
    unlink(gcLog.c_str());

    return !git(repo, { "gc", "--auto", "--quiet" });
}

