
#ifndef DATABASEBACKEND_H
#define DATABASEBACKEND_H

#include <string>

using namespace std;


class DatabaseBackend {
public:
    virtual ~DatabaseBackend() {}

    // can the export/import tools be run at all
    virtual bool available() = 0;

    virtual bool exportTo(string database, string user, string credential, string outputFile) = 0;
    virtual bool importFrom(string database, string user, string credential, string inputFile) = 0;

    virtual string lastError() = 0;
};

#endif

