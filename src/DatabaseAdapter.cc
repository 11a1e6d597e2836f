
#include <unistd.h>
#include <sys/stat.h>
#include "DatabaseAdapter.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


DatabaseAdapter::DatabaseAdapter(DatabaseBackend& backend, RunLog& log, RetryPolicy dump) :
    database(backend), runLog(log), dumpPolicy(dump) {
}


void DatabaseAdapter::dump(const SiteSpec& site, string outputPath) {
    runLog.progress("Starting database backup for " + site.database);

    if (!database.available())
        throw DumpError("database backup of " + site.database + " can't run: " + database.lastError(), site.database);

    if (mkbasedirs(outputPath))
        throw DumpError("unable to create the directory for " + outputPath + errtext(), outputPath);

    timer dumpTime;
    dumpTime.start();

    auto succeeded = dumpPolicy.run([&](unsigned int attempt) {
        DEBUG(D_db) DFMT("dump attempt " << attempt << " of " << site.database);
        return database.exportTo(site.database, site.dbUser, site.dbPassword, outputPath);
    }, [&](unsigned int attempt, unsigned int wait) {
        runLog.warning("database backup failed (attempt " + to_string(attempt) + " of " + to_string(dumpPolicy.maxAttempts) +
            "), retrying in " + plural(wait, "second") + ": " + database.lastError());
    });

    dumpTime.stop();

    if (!succeeded) {
        // a partial dump is worse than none;  it would look restorable
        if (exists(outputPath) && unlink(outputPath.c_str()))
            runLog.warning("unable to remove partial dump " + outputPath + errtext());

        throw DumpError("database backup of " + site.database + " failed after " + plural(dumpPolicy.maxAttempts, "attempt") +
            ": " + database.lastError(), site.database);
    }

    struct stat statData;
    string size = mystat(outputPath, &statData) ? "unknown size" : approximate(statData.st_size);
    runLog.success("Database backup completed successfully (" + size + ", md5 " + MD5file(outputPath) + ", " + dumpTime.elapsed() + ")");
}


void DatabaseAdapter::restore(const SiteSpec& site, string inputPath) {
    if (!exists(inputPath))
        throw RestoreDatabaseError("no database backup found at " + inputPath, inputPath);

    runLog.progress("Restoring database " + site.database + " from " + inputPath);

    if (!database.importFrom(site.database, site.dbUser, site.dbPassword, inputPath))
        throw RestoreDatabaseError("database restore of " + site.database + " failed: " + database.lastError(), site.database);

    runLog.success("Database " + site.database + " restored");
}

