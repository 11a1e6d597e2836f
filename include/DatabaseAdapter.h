
#ifndef DATABASEADAPTER_H
#define DATABASEADAPTER_H

#include <string>
#include "DatabaseBackend.h"
#include "RetryPolicy.h"
#include "RunConfig.h"
#include "RunLog.h"

using namespace std;


class DatabaseAdapter {
    DatabaseBackend& database;
    RunLog& runLog;
    RetryPolicy dumpPolicy;

public:
    DatabaseAdapter(DatabaseBackend& backend, RunLog& log, RetryPolicy dump);

    /* Export the site's database to outputPath, retrying per the dump policy.  A missing
     * dump tool fails at once.  On final failure the partial file is removed.
     * Throws DumpError. */
    void dump(const SiteSpec& site, string outputPath);

    // single attempt;  throws RestoreDatabaseError
    void restore(const SiteSpec& site, string inputPath);
};

#endif

