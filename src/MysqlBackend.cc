
#include <unistd.h>
#include "MysqlBackend.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


MysqlBackend::MysqlBackend(string binDir) {
    dumpBinary = binDir.length() ? slashConcat(binDir, "mysqldump") : "mysqldump";
    clientBinary = binDir.length() ? slashConcat(binDir, "mysql") : "mysql";
}


string MysqlBackend::locate(string binary) {
    string found = locateBinary(binary);

    if (!found.length())
        errorText = binary + ": command not found (set its directory with --" + CLI_MYSQLBIN + ")";

    return found;
}


bool MysqlBackend::available() {
    return locate(dumpBinary).length() > 0;
}


bool MysqlBackend::exportTo(string database, string user, string credential, string outputFile) {
    string binary = locate(dumpBinary);
    if (!binary.length())
        return false;

    PipeExec dump({ binary, "-u", user, database });

    // never on the command line where ps can see it
    if (credential.length())
        dump.setEnv("MYSQL_PWD", credential);

    DEBUG(D_db) DFMT("exporting " << database << " as " << user << " to " << outputFile);

    int result = dump.execute2file(outputFile);
    errorText = result ? dump.errorOutput() : "";

    if (result && !errorText.length())
        errorText = "mysqldump exited with " + to_string(result);

    return !result;
}


bool MysqlBackend::importFrom(string database, string user, string credential, string inputFile) {
    string binary = locate(clientBinary);
    if (!binary.length())
        return false;

    PipeExec import({ binary, "-u", user, database });

    if (credential.length())
        import.setEnv("MYSQL_PWD", credential);

    DEBUG(D_db) DFMT("importing " << inputFile << " into " << database << " as " << user);

    int result = import.executeFromFile(inputFile);
    errorText = result ? import.errorOutput() : "";

    if (result && !errorText.length())
        errorText = "mysql exited with " + to_string(result);

    return !result;
}

