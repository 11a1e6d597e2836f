#ifndef PIPE_EXEC_H
#define PIPE_EXEC_H

#include <string>
#include <vector>
#include <utility>

/****************************************************************
 * PipeExec
 *
 * Execute an external command (git, rsync, mysqldump, mysql) as
 * a child process.  The command is given as an argument vector so
 * nothing passes through a shell and nothing needs quoting.  The
 * child's STDOUT can be captured, written to a file, or left on
 * the terminal;  its STDIN can be fed from a file.  STDERR always
 * goes to a file under TMP_OUTPUT_DIR so it can be reported on
 * failure without spilling onto the screen.
 *
 * Examples:
 *
 * PipeExec p({"git", "-C", repo, "rev-parse", "--short", "HEAD"});
 * if (!p.execute())
 *     cout << p.output() << endl;
 *
 * PipeExec dump({"mysqldump", "-u", user, db});
 * dump.setEnv("MYSQL_PWD", password);
 * if (dump.execute2file("/backups/site/db_backup.sql"))
 *     cerr << dump.errorOutput() << endl;
 *
 */

using namespace std;


class PipeExec {
    vector<string> args;
    vector<pair<string, string>> environment;
    string errorDir;
    string errorFile;
    string outputBuffer;
    int exitStatus;

    int launch(int stdinFd, int stdoutFd, bool captureOutput, string procName);

    public:
        PipeExec(vector<string> argv);
        ~PipeExec();

        // add (or override) an environment variable for the child only
        void setEnv(string name, string value);

        /* execute(procName, leaveFinalOutput)
         * Runs the command and waits for it.  Returns the child's exit status: 0 for success,
         * 127 if the binary couldn't be executed, 128 + signal number if it was killed, -1 if
         * the fork itself failed.  STDOUT is collected into output() unless leaveFinalOutput
         * is set, in which case it goes straight to our own STDOUT (e.g. for progress bars).
         * procName is used to make a unique subdir under TMP_OUTPUT_DIR for STDERR output.
         */
        int execute(string procName = "", bool leaveFinalOutput = false);

        // same as execute() but the child's STDOUT is written to toFile (created/truncated)
        int execute2file(string toFile, string procName = "");

        // same as execute() but the child's STDIN is read from fromFile
        int executeFromFile(string fromFile, string procName = "");

        string output() { return outputBuffer; }
        bool readAndMatch(string matchStr);
        int status() { return exitStatus; }

        string commandLine();
        string errorOutput();
        void flushErrors();
};


#endif

