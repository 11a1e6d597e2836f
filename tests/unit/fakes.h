
#ifndef TESTS_FAKES_H
#define TESTS_FAKES_H

/*
 In-memory stand-ins for the three backends plus a sleeper that records
 instead of waiting.  FakeVcs keeps real snapshots of the files under each
 repository path so staging, committing and checking out behave like the
 real thing as far as the engine can tell.
 */

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "VersionControlBackend.h"
#include "DatabaseBackend.h"
#include "MirrorBackend.h"
#include "MirrorStager.h"
#include "RetryPolicy.h"
#include "util_generic.h"
#include "globals.h"

using namespace std;

typedef map<string, string> Tree;   // relative path -> content


inline string makeTempDir(string name) {
    string templ = "/tmp/sitebackups_test_" + name + "_XXXXXX";
    vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back(0);

    if (mkdtemp(buffer.data()) == NULL)
        return "";

    return string(buffer.data());
}


inline void writeFile(string path, string content) {
    mkbasedirs(path);
    ofstream out(path, ios::trunc);
    out << content;
}


struct treeWalk {
    string top;
    const vector<string> *ignore;
    Tree tree;
};


inline bool treeWalkCallback(pdCallbackData &file) {
    if (S_ISDIR(file.statData.st_mode))
        return true;

    auto walk = (treeWalk*)file.dataPtr;
    string relative = file.filename.substr(walk->top.length() + 1);

    if (!walk->ignore || !matchesExclusion(*walk->ignore, relative, false))
        walk->tree[relative] = readFile(file.filename);

    return true;
}


// every file under dir (the .git directory pruned), optionally filtered by exclusion patterns
inline Tree readTree(string dir, const vector<string>* ignore = NULL) {
    treeWalk walk;
    walk.top = dir;
    walk.ignore = ignore;

    if (exists(dir))
        processDirectory(dir, "/\\.git$", true, true, treeWalkCallback, &walk);

    return walk.tree;
}


struct RecordingSleeper {
    vector<unsigned int> waits;

    Sleeper sleeper() {
        return [this](unsigned int seconds) { waits.push_back(seconds); };
    }
};


struct FakeRepo {
    vector<CommitEntry> history;    // newest first
    vector<Tree> trees;             // parallel to history
    Tree index;
    vector<string> ignore;
    map<string, string> config;
};


class FakeVcs : public VersionControlBackend {
    unsigned int counter;
    string error;

    Tree headTree(FakeRepo& repo) { return repo.trees.size() ? repo.trees.front() : Tree(); }

public:
    map<string, FakeRepo> repos;

    unsigned int initFailures;      // fail this many init() calls first
    int commitFailures;             // fail this many commit() calls first;  -1 fails them all
    bool bulkStageFails;
    set<string> unstageable;        // stageOne() never works on these
    bool verifyFails;
    bool headFails;                 // HEAD can't be read at all (not the same as no commits)
    bool gcFails;
    bool checkoutFails;

    unsigned int initAttempts;
    unsigned int commitAttempts;
    unsigned int configCalls;
    unsigned int gcCalls;
    vector<string> stagedOne;

    FakeVcs() : counter(0), initFailures(0), commitFailures(0), bulkStageFails(false), verifyFails(false), headFails(false), gcFails(false),
        checkoutFails(false), initAttempts(0), commitAttempts(0), configCalls(0), gcCalls(0) {}

    // put a commit with a chosen id on top of a repository's history
    void addCommit(string repo, string id, string subject, Tree tree = Tree()) {
        CommitEntry entry = { id, id.substr(0, 7), (time_t)(1700000000 + counter++), subject, "moments ago" };
        repos[repo].history.insert(repos[repo].history.begin(), entry);
        repos[repo].trees.insert(repos[repo].trees.begin(), tree);
        repos[repo].index = tree;
    }

    size_t commitCount(string repo) { return repos.count(repo) ? repos[repo].history.size() : 0; }

    bool isRepository(string repo) { return repos.count(repo) > 0; }

    bool init(string repo, string historyLine) {
        ++initAttempts;

        if (initFailures) {
            --initFailures;
            error = "init failed";
            return false;
        }

        repos[repo].config["init.branch"] = historyLine;
        return true;
    }

    bool setConfig(string repo, string key, string value) {
        ++configCalls;
        repos[repo].config[key] = value;
        return true;
    }

    bool setIgnorePatterns(string repo, const vector<string>& patterns) {
        repos[repo].ignore = patterns;
        return true;
    }

    bool commit(string repo, string message, bool allowEmpty) {
        ++commitAttempts;

        if (commitFailures) {
            if (commitFailures > 0)
                --commitFailures;
            error = "fatal: unable to write new index file";
            return false;
        }

        auto &r = repos[repo];
        if (!allowEmpty && r.index == headTree(r)) {
            error = "nothing to commit";
            return false;
        }

        char id[41];
        snprintf(id, sizeof(id), "%07x%033d", 0xa000000 + ++counter * 0x111, 0);
        addCommit(repo, id, message, r.index);
        return true;
    }

    bool stageAll(string repo) {
        if (bulkStageFails) {
            error = "fatal: out of memory";
            return false;
        }

        repos[repo].index = readTree(repo, &repos[repo].ignore);
        return true;
    }

    bool stageOne(string repo, string relativePath) {
        if (unstageable.count(relativePath)) {
            error = "unable to index " + relativePath;
            return false;
        }

        stagedOne.push_back(relativePath);
        repos[repo].index[relativePath] = readFile(slashConcat(repo, relativePath));
        return true;
    }

    StagedState stagedState(string repo) {
        auto &r = repos[repo];
        return (r.index == headTree(r) ? STAGED_CLEAN : STAGED_CHANGES);
    }

    bool log(string repo, vector<CommitEntry>& entries) {
        if (!repos.count(repo))
            return false;

        entries = repos[repo].history;
        return true;
    }

    bool verify(string repo) {
        if (verifyFails) {
            error = "not a git repository";
            return false;
        }

        return repos.count(repo) > 0;
    }

    string head(string repo) {
        if (headFails)
            return "";

        return (repos.count(repo) && repos[repo].history.size() ? repos[repo].history.front().shortId : "");
    }

    HistoryState historyState(string repo) {
        if (headFails) {
            error = "fatal: unable to read HEAD";
            return HISTORY_ERROR;
        }

        return (repos.count(repo) && repos[repo].history.size() ? HISTORY_PRESENT : HISTORY_NONE);
    }

    bool isValidReference(string repo, string reference) {
        for (auto &entry: repos[repo].history)
            if (entry.id == reference || entry.shortId == reference)
                return true;

        return false;
    }

    bool checkout(string repo, string reference) {
        if (checkoutFails) {
            error = "checkout failed";
            return false;
        }

        auto &r = repos[repo];
        for (size_t index = 0; index < r.history.size(); ++index)
            if (r.history[index].id == reference || r.history[index].shortId == reference) {
                auto &tree = r.trees[index];

                // tracked files absent from the snapshot go away
                for (auto &file: r.index)
                    if (!tree.count(file.first))
                        unlink(slashConcat(repo, file.first).c_str());

                for (auto &file: tree)
                    writeFile(slashConcat(repo, file.first), file.second);

                r.index = tree;
                return true;
            }

        error = "pathspec did not match";
        return false;
    }

    bool gc(string repo) {
        ++gcCalls;

        if (gcFails) {
            error = "gc failed";
            return false;
        }

        return true;
    }

    string lastError() { return error; }
};


struct MirrorCall {
    string source;
    string destination;
    vector<string> excludes;
    bool deleteExtraneous;
};


// copies regular files for real, honoring the exclusions the way rsync would
class FakeMirror : public MirrorBackend {
public:
    vector<MirrorCall> calls;
    bool fails;

    FakeMirror() : fails(false) {}

    bool mirror(string source, string destination, const vector<string>& excludes, bool deleteExtraneous) {
        calls.push_back({ source, destination, excludes, deleteExtraneous });

        if (fails)
            return false;

        Tree sourceTree = readTree(source, &excludes);

        if (deleteExtraneous)
            for (auto &file: readTree(destination, &excludes))
                if (!sourceTree.count(file.first))
                    unlink(slashConcat(destination, file.first).c_str());

        for (auto &file: sourceTree)
            writeFile(slashConcat(destination, file.first), file.second);

        return true;
    }

    string lastError() { return fails ? "rsync error: some files could not be transferred (code 23)" : ""; }
};


class FakeDatabase : public DatabaseBackend {
public:
    bool isAvailable;
    int exportFailures;          // -1 fails every attempt
    bool importFails;
    unsigned int exportAttempts;
    vector<string> imports;      // input files, in order
    string lastCredential;

    FakeDatabase() : isAvailable(true), exportFailures(0), importFails(false), exportAttempts(0) {}

    bool available() { return isAvailable; }

    bool exportTo(string database, string user, string credential, string outputFile) {
        ++exportAttempts;
        lastCredential = credential;

        if (exportFailures) {
            if (exportFailures > 0)
                --exportFailures;

            // a failed dump still leaves a truncated file behind
            writeFile(outputFile, "-- partial dump of " + database);
            return false;
        }

        writeFile(outputFile, "-- dump of " + database + " by " + user + "\nCREATE TABLE posts (id int);\n");
        return true;
    }

    bool importFrom(string database, string user, string credential, string inputFile) {
        imports.push_back(inputFile);
        lastCredential = credential;
        return !importFails;
    }

    string lastError() { return isAvailable ? "mysqldump: Got error: 2002: Can't connect" : "mysqldump: command not found"; }
};

#endif

