/*
 * Copyright (C) 2026 The sitebackups authors
 * This file is part of sitebackups.
 *
 * sitebackups is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * sitebackups is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with sitebackups.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  sitebackups
 *
 *  sitebackups keeps point-in-time backups of websites, each one a file tree
 *  plus a MySQL database:
 *
 *  1. Backups
 *
 *     The site's files are mirrored into a git repository of its own and committed
 *     whenever they've changed, so every backup is a commit and unchanged sites
 *     cost nothing.  The database is dumped next to the files on every run.
 *
 *  2. Restores
 *
 *     Any commit (named by any unique prefix of its id, or the latest by default)
 *     is checked out and mirrored back onto the live site, then the database dump
 *     is loaded.
 */

#include <pcre++.h>
#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <syslog.h>
#include <time.h>

#include <iostream>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "globals.h"
#include "debug.h"
#include "exception.h"
#include "util_generic.h"
#include "help.h"
#include "ConfigManager.h"
#include "RunConfig.h"
#include "RunLog.h"
#include "GitBackend.h"
#include "MysqlBackend.h"
#include "RsyncMirror.h"
#include "Orchestrator.h"

using namespace pcrepp;


void sigTermHandler(int sig) {
    log("terminated by signal " + to_string(sig));
    _exit(1);
}


// first of:  the option, the environment variable, the default
string optionOrEnv(cxxopts::ParseResult& cli, string option, string envVar, string defaultValue) {
    if (cli.count(option))
        return cli[option].as<string>();

    string temp = cppgetenv(envVar);
    return temp.length() ? temp : defaultValue;
}


bool confirmRestore(const SiteSpec& site, string target, string reference) {
    cout << YELLOW << "WARNING: This will overwrite all files at " << target << " and overwrite the existing " << site.database << " database." << RESET << endl;
    cout << "Restoring " << site.label << " from " << (reference.length() ? "backup " + reference : string("the latest backup")) << "." << endl;
    cout << "Are you sure you want to continue? (y/N) " << flush;

    string answer;
    if (!getline(cin, answer))
        return false;

    answer = trimSpace(answer);
    return (answer == "y" || answer == "Y");
}


RunConfig buildRunConfig(cxxopts::ParseResult& cli) {
    RunConfig config;

    config.sitesRoot = optionOrEnv(cli, CLI_SITES, "SB_SITESROOT", "");
    if (!config.sitesRoot.length()) {
        config.sitesRoot = realpathcpp(".");
        if (!config.sitesRoot.length())
            throw ConfigurationError("unable to determine the current directory" + errtext());
    }

    config.backupRoot = optionOrEnv(cli, CLI_ROOT, "SB_BACKUPROOT", slashConcat(config.sitesRoot, DEFAULT_BACKUPDIR));
    config.runLogFile = cli.count(CLI_LOGFILE) ? cli[CLI_LOGFILE].as<string>() : slashConcat(config.sitesRoot, DEFAULT_LOGNAME);

    if (cli.count(CLI_MYSQLBIN))
        config.mysqlBinDir = cli[CLI_MYSQLBIN].as<string>();

    if (cli.count(CLI_EXCLUDE))
        config.excludes = cli[CLI_EXCLUDE].as<vector<string>>();

    if (cli.count(CLI_SETTLE)) {
        int settle = cli[CLI_SETTLE].as<int>();

        if (settle < 0)
            throw ConfigurationError("--" + string(CLI_SETTLE) + " can't be negative");

        config.settleSecs = settle;
    }

    config.showProgress = NOTQUIET;

    string confDir = optionOrEnv(cli, CLI_CONFDIR, "SB_CONFDIR", CONF_DIR);
    DEBUG(D_config) DFMT("loading site profiles from " << confDir);
    config.sites = ConfigManager(confDir).sites();

    return config;
}


string requiredPositional(cxxopts::ParseResult& cli, string name, string command) {
    if (!cli.count(name))
        throw ConfigurationError(command + " requires a " + name + " name (see list-sites)");

    return cli[name].as<string>();
}


/*******************************************************************************
 * main(argc, argv)
 *
 * Parse the options, build the RunConfig and hand the command to the Orchestrator.
 *******************************************************************************/
int main(int argc, char *argv[]) {
    signal(SIGTERM, sigTermHandler);
    signal(SIGINT, sigTermHandler);

    GLOBALS.color = true;
    GLOBALS.quiet = false;
    GLOBALS.debugSelector = 0;

    openlog("sitebackups", LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("sitebackups", "Versioned backups of websites and their databases");

    options.add_options()(CLI_COMMAND, "Command", cxxopts::value<std::string>())(
        CLI_SITE, "Site", cxxopts::value<std::string>())(
        CLI_REFERENCE, "Backup reference", cxxopts::value<std::string>())(
        CLI_CONFDIR, "Site profile directory", cxxopts::value<std::string>())(
        CLI_ROOT, "Backup root", cxxopts::value<std::string>())(
        CLI_SITES, "Sites root", cxxopts::value<std::string>())(
        CLI_LOGFILE, "Run log", cxxopts::value<std::string>())(
        CLI_EXCLUDE, "Exclude pattern", cxxopts::value<std::vector<std::string>>())(
        CLI_MYSQLBIN, "MySQL binary directory", cxxopts::value<std::string>())(
        CLI_SETTLE, "Settle seconds", cxxopts::value<int>())(
        string("y,") + CLI_YES, "Don't ask before restoring", cxxopts::value<bool>()->default_value("false"))(
        string("q,") + CLI_QUIET, "No output", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"));

    options.parse_positional({ CLI_COMMAND, CLI_SITE, CLI_REFERENCE });

    cxxopts::ParseResult cli;
    try {
        options.allow_unrecognised_options();  // to support -v...
        cli = options.parse(argc, argv);
        GLOBALS.quiet = cli[CLI_QUIET].as<bool>();
        GLOBALS.color = !(GLOBALS.quiet || cli[CLI_NOCOLOR].as<bool>() || !isatty(STDOUT_FILENO));

        /* Enable selective debugging
         * (code taken from Exim MTA - Philip Hazel)
         */
        for (auto uarg : cli.unmatched()) {
            if (uarg == "--vv") {
                GLOBALS.debugSelector = D_all;
                continue;
            }
            else if (uarg.length() > 2) {
                string op = uarg.substr(2, 1);

                if (uarg.substr(0, 2) == "-v" && (op == "=" || op == "-" || op == "+")) {
                    unsigned int selector = D_default;
                    string remainder = uarg.substr(2, string::npos);
                    uschar *usc = (uschar *)remainder.c_str();
                    decode_bits(&selector, 1, debug_notall, usc, debug_options, ndebug_options);
                    GLOBALS.debugSelector = selector;
                    continue;
                }
            }
            else if (uarg == "-v") {
                GLOBALS.debugSelector = D_default;
                continue;
            }

            SCREENERR("error: unrecognized parameter " << uarg
                      << "\nUse --help for a list of options.");
            exit(1);
        }
    }
    catch (std::exception &e) {
        cerr << "sitebackups: " << e.what() << endl;
        exit(1);
    }

    if (cli.count(CLI_HELP) && cli[CLI_HELP].as<bool>()) {
        showHelp(hOptions);
        exit(0);
    }

    if (cli.count(CLI_VERSION) && cli[CLI_VERSION].as<bool>()) {
        cout << "sitebackups " << VERSION << "\n";
        cout << "(c) 2026 released under GPLv3." << endl;
        exit(0);
    }

    string command = cli.count(CLI_COMMAND) ? cli[CLI_COMMAND].as<string>() : "";

    if (!command.length()) {
        showHelp(hSyntax);
        exit(0);
    }

    if (command == CMD_HELP) {
        showHelp(cli.count(CLI_SITE) && cli[CLI_SITE].as<string>() == "profile" ? hProfile : hOptions);
        exit(0);
    }

    if (command != CMD_BACKUP && command != CMD_RESTORE && command != CMD_LISTBACKUPS && command != CMD_LISTSITES) {
        SCREENERR("error: unknown command '" << command << "'\nUse --help for a list of commands.");
        exit(1);
    }

    bool success = false;
    try {
        RunConfig config = buildRunConfig(cli);

        RunLog runLog((command == CMD_BACKUP || command == CMD_RESTORE) ? config.runLogFile : "");
        GitBackend git;
        MysqlBackend mysql(config.mysqlBinDir);
        RsyncMirror rsync(config.showProgress);
        Orchestrator orchestrator(config, git, mysql, rsync, runLog);

        if (command == CMD_LISTSITES) {
            orchestrator.listSites(cout);
            success = true;
        }
        else if (command == CMD_LISTBACKUPS) {
            orchestrator.listBackups(requiredPositional(cli, CLI_SITE, command), cout);
            success = true;
        }
        else if (command == CMD_BACKUP)
            success = orchestrator.runBackup(cli.count(CLI_SITE) ? cli[CLI_SITE].as<string>() : "");
        else {
            bool preConfirmed = cli[CLI_YES].as<bool>();
            string reference = cli.count(CLI_REFERENCE) ? cli[CLI_REFERENCE].as<string>() : "";

            success = orchestrator.runRestore(requiredPositional(cli, CLI_SITE, command), reference,
                [preConfirmed](const SiteSpec& site, string target, string ref) {
                    return preConfirmed || confirmRestore(site, target, ref);
                });
        }
    }
    catch (SBException &e) {
        SCREENERR("error: " << log(e.detail()));
        exit(1);
    }

    DEBUG(D_any) DFMT(command << " finished " << (success ? "successfully" : "with errors"));
    return (success ? 0 : 1);
}

