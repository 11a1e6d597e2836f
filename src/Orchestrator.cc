
#include "Orchestrator.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"


Orchestrator::Orchestrator(const RunConfig& runConfig, VersionControlBackend& vcsBackend, DatabaseBackend& dbBackend,
                           MirrorBackend& mirrorBackend, RunLog& log, RetryPolicies retries) :
    config(runConfig),
    runLog(log),
    policies(retries),
    vcs(vcsBackend),
    repository(vcsBackend, log, retries.init, runConfig.settleSecs),
    stager(mirrorBackend),
    committer(vcsBackend, repository, log, retries.stageFile, retries.commit),
    resolver(vcsBackend, stager, log),
    dbAdapter(dbBackend, log, retries.dump) {
}


const SiteSpec& Orchestrator::requireSite(string label) {
    auto site = config.findSite(label);

    if (site == NULL)
        throw ConfigurationError("unknown site '" + label + "' (see list-sites)", label);

    return *site;
}


// give a slow shared filesystem a moment to catch up between heavy steps
void Orchestrator::settle() {
    if (config.settleSecs && policies.sleeper)
        policies.sleeper(config.settleSecs);
}


vector<StepResult> Orchestrator::runSteps(string site, vector<Step> steps, FailurePolicy policy) {
    vector<StepResult> stepResults;

    for (auto &step: steps) {
        StepResult result = { site, step.name, true, "" };

        try {
            step.action();
        }
        catch (SBException &e) {
            result.success = false;
            result.detail = e.detail();
        }
        catch (std::exception &e) {
            result.success = false;
            result.detail = string("unexpected error: ") + e.what();
        }

        if (!result.success)
            runLog.error(site + " " + step.name + " failed: " + result.detail);

        stepResults.push_back(result);
        results.push_back(result);

        if (!result.success && policy == ABORT_ON_FIRST_FAILURE)
            break;
    }

    return stepResults;
}


void Orchestrator::backupFiles(const SiteSpec& site) {
    string repo = config.repositoryFor(site);
    auto excludes = config.excludesFor(site);

    runLog.progress("Starting file backup for " + site.label);
    repository.ensureRepository(repo, MirrorStager::exclusionsFor(excludes));

    runLog.progress("Copying files to " + repo);
    stager.mirror(config.sourceFor(site), repo, excludes, false);
    settle();

    auto staged = committer.stageAll(repo, excludes);
    settle();

    committer.commitIfChanged(repo, StagedCommitter::backupMessage());
    settle();

    // the commit above still went ahead with whatever did stage
    if (!staged.complete())
        throw StagingError(plural(staged.filesFailed, "file") + " could not be staged and are missing from the backup", repo);

    runLog.success("File backup completed for " + site.label);
}


bool Orchestrator::runBackup(string filter) {
    results.clear();
    vector<const SiteSpec*> sites;

    if (filter.length())
        sites.push_back(&requireSite(filter));
    else
        for (auto &site: config.sites)
            sites.push_back(&site);

    if (!sites.size()) {
        runLog.warning("no sites are configured");
        return true;
    }

    timer runTime;
    runTime.start();
    runLog.startBackup();

    for (auto site: sites) {
        runLog.heading("Processing site: " + site->label);

        // independent steps:  a failed dump never costs the site its file snapshot
        runSteps(site->label, {
            { "database backup", [&]() { dbAdapter.dump(*site, config.dumpFileFor(*site)); } },
            { "file backup", [&]() { backupFiles(*site); } }
        }, CONTINUE_ON_ERROR);
    }

    bool success = true;
    for (auto &result: results)
        success = success && result.success;

    runTime.stop();
    runLog.finish(success, runTime.elapsed());

    return success;
}


bool Orchestrator::runRestore(string label, string reference, Confirmation confirm) {
    results.clear();

    const SiteSpec& site = requireSite(label);
    string repo = config.repositoryFor(site);
    string target = config.sourceFor(site);

    if (!confirm(site, target, reference)) {
        NOTQUIET && cout << "Restore cancelled" << endl;
        log("restore of " + label + " cancelled by the operator");
        return true;
    }

    timer runTime;
    runTime.start();
    runLog.startRestore(site, target, reference);

    // each step depends on the one before;  there's no rollback, so a failure part way
    // leaves the target as the failing step left it
    string resolved;
    runSteps(site.label, {
        { "resolve", [&]() {
            resolved = resolver.resolveReference(repo, reference);
            runLog.info("Restoring backup " + resolved);
        } },
        { "file restore", [&]() { resolver.materialize(repo, resolved, target, config.excludesFor(site)); } },
        { "database restore", [&]() { dbAdapter.restore(site, config.dumpFileFor(site)); } }
    }, ABORT_ON_FIRST_FAILURE);

    bool success = results.size() == 3 && results.back().success;

    if (!success && results.size() > 1)
        runLog.warning("restore of " + site.label + " stopped part way; " + target + " may hold a mix of old and new files");

    runTime.stop();
    runLog.finish(success, runTime.elapsed());

    return success;
}


void Orchestrator::listBackups(string label, ostream& out) {
    const SiteSpec& site = requireSite(label);

    auto backups = resolver.listBackups(config.repositoryFor(site));

    out << BOLDBLUE << "Backups for " << site.label << " (most recent first):" << RESET << endl;
    for (auto &backup: backups)
        out << "  " << backup << endl;
}


void Orchestrator::listSites(ostream& out) {
    if (!config.sites.size()) {
        out << "no sites are configured" << endl;
        return;
    }

    for (auto &site: config.sites)
        out << BOLDBLUE << site.label << RESET << "  " << config.sourceFor(site) << "  (database " << site.database << ", user " << site.dbUser << ")" << endl;
}

