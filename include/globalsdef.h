
#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.2.0"

#include <string>
#include <time.h>
#include "colors.h"

/*
 Adding a commandline option vs adding a site profile setting.

 (A) To add a CLI option:
    (1) add a defined constant for its name #define CLI_xxxx in globalsdef.h
    (2) add the constant along with its type to options.add_options() in sitebackups.cc
    (3) carry its value into RunConfig (never into GLOBALS unless it's purely presentation)

 (B) To add a site profile setting:
    (1) add a defined constant for its regex #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add it to the settings vector in SiteConfig::SiteConfig() in SiteConfig.cc
    (4) copy it into SiteSpec in SiteConfig::toSiteSpec()

 Settings are accessed as config.settings[ENUM].value.
 */


#define CONF_DIR "/etc/sitebackups"
#define TMP_OUTPUT_DIR "/tmp/sitebackups_output"
#define DEFAULT_LOGNAME "backup_log.md"
#define DEFAULT_BACKUPDIR "backups"

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl
#define DFMTNOENDL(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET

#define NOTQUIET (!GLOBALS.quiet)
#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

// repository layout
#define METADATA_DIR ".git"
#define HISTORY_LINE "main"
#define DUMP_SUFFIX "_backup.sql"
#define DUMP_PATTERN "*_backup.sql"
#define ROOT_COMMIT_MESSAGE "Initial commit"

// define commandline options
#define CLI_COMMAND "command"
#define CLI_SITE "site"
#define CLI_REFERENCE "reference"
#define CLI_CONFDIR "confdir"
#define CLI_ROOT "root"
#define CLI_SITES "sites"
#define CLI_LOGFILE "log"
#define CLI_EXCLUDE "exclude"
#define CLI_MYSQLBIN "mysqlbin"
#define CLI_SETTLE "settle"
#define CLI_YES "yes"
#define CLI_QUIET "quiet"
#define CLI_NOCOLOR "nocolor"
#define CLI_VERSION "version"
#define CLI_HELP "help"

// commands
#define CMD_BACKUP "backup"
#define CMD_RESTORE "restore"
#define CMD_LISTBACKUPS "list-backups"
#define CMD_LISTSITES "list-sites"
#define CMD_HELP "help"

// site profile regexes
#define CAPTURE_VALUE std::string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s+#).*)*$"
#define RE_BLANK "^\\s*(#.*)*$"
#define RE_SITE "(site|label|output)"
#define RE_SOURCE "(source|path|dir)"
#define RE_DATABASE "(database|db)"
#define RE_DBUSER "(db_user|user)"
#define RE_DBPASSWORD "(db_password|password|pass)"
#define RE_EXCLUDE "(exclude|excludes)"


struct global_vars {
    unsigned int debugSelector;
    bool color;
    bool quiet;
};

#endif

