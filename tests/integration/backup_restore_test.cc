#include "Orchestrator.h"
#include "GitBackend.h"
#include "RsyncMirror.h"
#include "PipeExec.h"
#include "../unit/fakes.h"

#include <cassert>
#include <iostream>

// git and rsync for real;  the database side stays faked since there's no server to talk to

namespace {

const string INDEX = "<?php\n// front controller\nrequire 'wp-blog-header.php';\n\n";
const string BINARY = string("GIF89a\0\x01\x02\xff\n\n", 12);

string rawFile(string path) {
    ifstream in(path, ios::binary);
    return string(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
}

void writeRaw(string path, string content) {
    mkbasedirs(path);
    ofstream out(path, ios::binary | ios::trunc);
    out << content;
}

void TestBackupAndRestoreRoundTrip() {
    string dir = makeTempDir("integration");
    RunConfig config;
    config.sitesRoot = slashConcat(dir, "www");
    config.backupRoot = slashConcat(dir, "backups");
    config.settleSecs = 0;
    config.sites = { { "blog", "blog", "blog_db", "blog_user", "", { "drafts/" }, "" } };

    string site = slashConcat(config.sitesRoot, "blog");
    string repo = slashConcat(config.backupRoot, "blog");
    writeRaw(slashConcat(site, "index.php"), INDEX);
    writeRaw(slashConcat(site, "wp-content/uploads/spacer.gif"), BINARY);
    writeRaw(slashConcat(site, "has space/file name.txt"), "spaces\n");
    writeRaw(slashConcat(site, "debug.log"), "noise\n");
    writeRaw(slashConcat(site, "drafts/idea.txt"), "unpublished\n");

    GitBackend git;
    RsyncMirror rsync;
    FakeDatabase db;
    RunLog runLog;
    RecordingSleeper recorder;
    Orchestrator orchestrator(config, git, db, rsync, runLog, RetryPolicies(recorder.sleeper()));

    // first run:  root commit plus the snapshot
    assert(orchestrator.runBackup());
    vector<CommitEntry> history;
    assert(git.log(repo, history));
    assert(history.size() == 2);
    assert(history[1].subject == "Initial commit");
    assert(history[0].subject.find("Backup from ") == 0);
    string first = history[0].shortId;

    // what's tracked never includes the exclusions or the dump
    PipeExec files({ "git", "-C", repo, "ls-files" });
    assert(files.execute() == 0);
    assert(files.readAndMatch("index.php"));
    assert(files.readAndMatch("has space/file name.txt"));
    assert(!files.readAndMatch("debug.log"));
    assert(!files.readAndMatch("drafts/"));
    assert(!files.readAndMatch("_backup.sql"));
    assert(exists(slashConcat(repo, "blog_db_backup.sql")));

    // unchanged site:  no new commit
    assert(orchestrator.runBackup());
    assert(git.log(repo, history) && history.size() == 2);
    assert(runLog.contains(lInfo, "No changes to commit"));

    writeRaw(slashConcat(site, "index.php"), "<?php echo 'changed';\n");
    writeRaw(slashConcat(site, "added.php"), "new\n");
    assert(orchestrator.runBackup());
    assert(git.log(repo, history) && history.size() == 3);

    writeRaw(slashConcat(site, "scratch.php"), "live only\n");
    assert(orchestrator.runRestore("blog", first.substr(0, 5), [](const SiteSpec&, string, string) { return true; }));

    assert(rawFile(slashConcat(site, "index.php")) == INDEX);
    assert(rawFile(slashConcat(site, "wp-content/uploads/spacer.gif")) == BINARY);
    assert(rawFile(slashConcat(site, "has space/file name.txt")) == "spaces\n");
    assert(!exists(slashConcat(site, "added.php")));
    assert(!exists(slashConcat(site, "scratch.php")));
    assert(rawFile(slashConcat(site, "debug.log")) == "noise\n");
    assert(rawFile(slashConcat(site, "drafts/idea.txt")) == "unpublished\n");
    assert(!exists(slashConcat(site, ".git")));
    assert(!exists(slashConcat(site, "blog_db_backup.sql")));
    assert(db.imports.size() == 1);

    // a restore changes what's checked out, never the history
    assert(git.log(repo, history) && history.size() == 3);
    assert(git.isValidReference(repo, first));
    assert(!git.isValidReference(repo, "0123456789"));

    rmrf(dir);
}

}  // namespace

int main() {
    GLOBALS.quiet = true;

    if (!locateBinary("git").length() || !locateBinary("rsync").length()) {
        std::cout << "sitebackups_integration_backup_restore: skipped (git or rsync not installed)\n";
        return 0;
    }

    TestBackupAndRestoreRoundTrip();

    std::cout << "sitebackups_integration_backup_restore: pass\n";
    return 0;
}
