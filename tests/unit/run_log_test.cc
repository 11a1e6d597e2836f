#include "RunLog.h"
#include "fakes.h"

#include <cassert>
#include <iostream>

namespace {

void TestMarkdownEntries() {
    string dir = makeTempDir("runlog");
    string file = slashConcat(dir, "backup_log.md");
    RunLog runLog(file);

    runLog.startBackup();
    runLog.heading("Processing site: blog");
    runLog.progress("Copying files");
    runLog.warning("retrying");
    runLog.error("blog file backup failed: disk full");
    runLog.finish(false, "3 seconds");

    string markdown = readFile(file);
    assert(markdown.find("---\n**Backup started:** ") != string::npos);
    assert(markdown.find("- ### Processing site: blog\n") != string::npos);
    assert(markdown.find("- Copying files\n") != string::npos);
    assert(markdown.find("- *WARNING*: retrying\n") != string::npos);
    assert(markdown.find("- *ERROR*: blog file backup failed: disk full\n") != string::npos);
    assert(markdown.find("**Completed with 1 error in 3 seconds**") != string::npos);

    assert(runLog.errorCount() == 1);
    assert(runLog.getEntries().size() == 4);
    assert(runLog.contains(lWarning, "retry"));
    assert(!runLog.contains(lError, "retry"));

    rmrf(dir);
}

void TestRunsAppendToTheSameFile() {
    string dir = makeTempDir("runlog");
    string file = slashConcat(dir, "backup_log.md");

    {
        RunLog first(file);
        first.startBackup();
        first.finish(true, "1 second");
    }

    RunLog second(file);
    SiteSpec site = { "blog", "/var/www/blog", "blog_db", "u", "", {}, "" };
    second.startRestore(site, "/var/www/blog", "abc1234");
    second.finish(true, "2 seconds");

    string markdown = readFile(file);
    assert(markdown.find("**Backup started:**") < markdown.find("**Restore started:**"));
    assert(markdown.find("- Site: blog\n- Path: /var/www/blog\n- Commit: abc1234\n- Database: blog_db\n") != string::npos);
    assert(markdown.find("**Completed successfully in 2 seconds**") != string::npos);

    rmrf(dir);
}

void TestUnwritableFileDoesNotStopTheRun() {
    RunLog runLog("/nonexistent/dir/backup_log.md");

    runLog.info("still recorded");
    runLog.info("and again");

    assert(runLog.getEntries().size() == 2);
    assert(runLog.errorCount() == 0);
}

}  // namespace

int main() {
    GLOBALS.quiet = true;

    TestMarkdownEntries();
    TestRunsAppendToTheSameFile();
    TestUnwritableFileDoesNotStopTheRun();

    std::cout << "sitebackups_unit_run_log: pass\n";
    return 0;
}
