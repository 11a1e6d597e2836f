
#ifndef MYSQLBACKEND_H
#define MYSQLBACKEND_H

#include <string>
#include "DatabaseBackend.h"

using namespace std;


class MysqlBackend : public DatabaseBackend {
    string dumpBinary;
    string clientBinary;
    string errorText;

    string locate(string binary);

public:
    // binDir, if given, is where mysqldump and mysql live;  otherwise they're looked up on the PATH
    MysqlBackend(string binDir = "");

    bool available();
    bool exportTo(string database, string user, string credential, string outputFile);
    bool importFrom(string database, string user, string credential, string inputFile);

    string lastError() { return errorText; }
};

#endif

