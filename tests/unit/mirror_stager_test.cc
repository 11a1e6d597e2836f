#include "MirrorStager.h"
#include "RsyncMirror.h"
#include "exception.h"
#include "fakes.h"

#include <cassert>
#include <iostream>

namespace {

void TestComponentPatternsMatchAtAnyDepth() {
    vector<string> patterns = { "*.log", ".git" };

    assert(matchesExclusion(patterns, "error.log", false));
    assert(matchesExclusion(patterns, "wp-content/debug.log", false));
    assert(matchesExclusion(patterns, ".git", true));
    assert(matchesExclusion(patterns, ".git/HEAD", false));
    assert(!matchesExclusion(patterns, "logs/index.php", false));
    assert(!matchesExclusion(patterns, "error.log.php", false));
}

void TestDirectoryOnlyPatterns() {
    vector<string> patterns = { "cache/" };

    assert(matchesExclusion(patterns, "cache", true));
    assert(matchesExclusion(patterns, "cache/page.html", false));
    assert(matchesExclusion(patterns, "wp-content/cache/a/b.css", false));

    // a plain file called cache isn't a directory
    assert(!matchesExclusion(patterns, "cache", false));
}

void TestAnchoredPatterns() {
    vector<string> patterns = { "/tmp", "uploads/private/*.pdf" };

    assert(matchesExclusion(patterns, "tmp/session", false));
    assert(!matchesExclusion(patterns, "app/tmp/session", false));
    assert(matchesExclusion(patterns, "uploads/private/invoice.pdf", false));
    assert(!matchesExclusion(patterns, "uploads/private/sub/invoice.pdf", false));
    assert(!matchesExclusion(patterns, "other/uploads/private/invoice.pdf", false));
}

void TestMandatoryExclusionsComeFirst() {
    auto excludes = MirrorStager::exclusionsFor({ "*.log", ".git", "cache/" });

    assert((excludes == vector<string>{ ".git", "*_backup.sql", "*.log", "cache/" }));
    assert(matchesExclusion(excludes, "blog_db_backup.sql", false));
}

void TestRsyncArguments() {
    RsyncMirror rsync;
    auto argv = rsync.buildArgs("/var/www/blog", "/srv/backups/blog/", { ".git", "*.log" }, true, false);

    assert((argv == vector<string>{ "rsync", "-a", "--delete", "--exclude=.git", "--exclude=*.log",
                                    "/var/www/blog/", "/srv/backups/blog/" }));

    argv = rsync.buildArgs("/a", "/b", {}, false, true);
    assert((argv == vector<string>{ "rsync", "-a", "--info=progress2", "/a/", "/b/" }));

    // a pattern with an inner '/' only matches from the top of the tree
    argv = rsync.buildArgs("/a", "/b", { "uploads/private/*.pdf", "cache/", "/tmp" }, false, false);
    assert((argv == vector<string>{ "rsync", "-a", "--exclude=/uploads/private/*.pdf", "--exclude=cache/",
                                    "--exclude=/tmp", "/a/", "/b/" }));
    assert(matchesExclusion({ "uploads/private/*.pdf" }, "uploads/private/a.pdf", false));
    assert(!matchesExclusion({ "uploads/private/*.pdf" }, "blog/uploads/private/a.pdf", false));
}

void TestMirrorAddsMandatoryExclusions() {
    string dir = makeTempDir("stager");
    string source = slashConcat(dir, "site");
    string destination = slashConcat(dir, "repo/nested");
    writeFile(slashConcat(source, "index.php"), "<?php\n");
    writeFile(slashConcat(source, "debug.log"), "noise\n");
    writeFile(slashConcat(source, "site_db_backup.sql"), "-- stray dump\n");

    FakeMirror backend;
    MirrorStager stager(backend);
    stager.mirror(source, destination, { "*.log" }, false);

    assert(backend.calls.size() == 1);
    assert(!backend.calls[0].deleteExtraneous);
    assert((backend.calls[0].excludes == vector<string>{ ".git", "*_backup.sql", "*.log" }));
    assert(exists(slashConcat(destination, "index.php")));
    assert(!exists(slashConcat(destination, "debug.log")));
    assert(!exists(slashConcat(destination, "site_db_backup.sql")));

    rmrf(dir);
}

void TestMirrorFailures() {
    FakeMirror backend;
    MirrorStager stager(backend);

    bool thrown = false;
    try {
        stager.mirror("/nonexistent/site", "/tmp/unused", {}, false);
    }
    catch (StagingError &e) {
        thrown = true;
        assert(e.getData() == "/nonexistent/site");
    }
    assert(thrown);
    assert(backend.calls.empty());

    string dir = makeTempDir("stager");
    backend.fails = true;
    thrown = false;
    try {
        stager.mirror(dir, slashConcat(dir, "out"), {}, true);
    }
    catch (StagingError &e) {
        thrown = true;
        assert(e.detail().find("code 23") != string::npos);
    }
    assert(thrown);

    rmrf(dir);
}

}  // namespace

int main() {
    GLOBALS.quiet = true;

    TestComponentPatternsMatchAtAnyDepth();
    TestDirectoryOnlyPatterns();
    TestAnchoredPatterns();
    TestMandatoryExclusionsComeFirst();
    TestRsyncArguments();
    TestMirrorAddsMandatoryExclusions();
    TestMirrorFailures();

    std::cout << "sitebackups_unit_mirror_stager: pass\n";
    return 0;
}
