#include <iostream>
#include <string>
#include "help.h"
#include "SiteConfig.h"
#include "RunConfig.h"
#include "globals.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind) {
    switch (kind) {
        case hProfile: {
            SiteConfig config;
            cout << "# one site per file, " << CONF_DIR << "/<name>.conf" << endl;
            cout << config.sampleConfig();
            break;
        }

        case hOptions: {
            string helpText = "sitebackups [options] <command> [site] [reference]\n\n"
            + string(BOLDBLUE) + "COMMANDS" + string(RESET) + "\n"
            + "   backup [site]           Back up every configured site, or just the one named.  Each site gets a\n"
            + "                           database dump and a new commit in its repository if any files changed.\n"
            + "   restore <site> [ref]    Restore the site's files and database from a backup.  ref can be an\n"
            + "                           abbreviated commit id or any prefix of one;  it defaults to the latest.\n"
            + "   list-backups <site>     List the backups (commits) of a site, most recent first.\n"
            + "   list-sites              List the configured sites.\n"
            + "   help                    Show this help;  'help profile' shows a sample site profile.\n"
            + "\n" + string(BOLDBLUE) + "LOCATIONS" + string(RESET) + "\n"
            + "   --confdir [dir]         Directory of site profiles (*.conf);  defaults to " + CONF_DIR + " or $SB_CONFDIR.\n"
            + "   --sites [dir]           Root that relative site source paths are relative to;  defaults to the\n"
            + "                           current directory or $SB_SITESROOT.\n"
            + "   --root [dir]            Where the per-site repositories live;  defaults to <sites>/" + DEFAULT_BACKUPDIR + " or $SB_BACKUPROOT.\n"
            + "   --log [file]            Markdown run log;  defaults to <sites>/" + DEFAULT_LOGNAME + ".\n"
            + "   --mysqlbin [dir]        Directory holding mysqldump and mysql if they're not on the PATH.\n"
            + "\n" + string(BOLDBLUE) + "BEHAVIOR" + string(RESET) + "\n"
            + "   --exclude [pattern]     Exclude matching files from backups and restores (rsync syntax);  can be\n"
            + "                           repeated.  Replaces the default set: " + perlJoin(" ", RunConfig::defaultExcludes()) + "\n"
            + "   --settle [secs]         Pause between heavy steps to let the filesystem catch up (default 2).\n"
            + "   -y, --yes               Don't ask before overwriting a site during a restore.\n"
            + "\n" + string(BOLDBLUE) + "GENERAL" + string(RESET) + "\n"
            + "   -q, --quiet             No output except errors.\n"
            + "   --nocolor               Disable color output.\n"
            + "   -v                      Debug output;  -v=+sel-sel picks selectors (commit config db exec mirror\n"
            + "                           repo restore stage), --vv enables all of them.\n"
            + "   -V, --version           Show the version.\n"
            + "   -h, --help              Show this help.\n";

            cout << helpText;
        }

        break;

        case hSyntax:
        default:
            cout << R"END(sitebackups keeps versioned backups of websites:  each site's files are committed
to a git repository of their own and its MySQL database is dumped alongside.  Any
backup can be restored onto the live site, files and database together.

    • Use "sitebackups --help" for options.

    • Use "sitebackups help profile" for a sample site profile.)END" << endl;
        break;
    }
}

