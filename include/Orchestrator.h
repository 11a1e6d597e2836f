
#ifndef ORCHESTRATOR_H
#define ORCHESTRATOR_H

#include <string>
#include <vector>
#include <functional>
#include <iostream>
#include "RunConfig.h"
#include "RunLog.h"
#include "RetryPolicy.h"
#include "VersionControlBackend.h"
#include "DatabaseBackend.h"
#include "MirrorBackend.h"
#include "SnapshotRepository.h"
#include "MirrorStager.h"
#include "StagedCommitter.h"
#include "RestoreResolver.h"
#include "DatabaseAdapter.h"

using namespace std;


enum FailurePolicy { CONTINUE_ON_ERROR, ABORT_ON_FIRST_FAILURE };

struct Step {
    string name;
    function<void()> action;
};

struct StepResult {
    string site;
    string step;
    bool success;
    string detail;
};

// asked once per restore, before anything is touched;  false cancels
typedef function<bool(const SiteSpec& site, string target, string reference)> Confirmation;


class Orchestrator {
    const RunConfig& config;
    RunLog& runLog;
    RetryPolicies policies;
    VersionControlBackend& vcs;

    SnapshotRepository repository;
    MirrorStager stager;
    StagedCommitter committer;
    RestoreResolver resolver;
    DatabaseAdapter dbAdapter;

    vector<StepResult> results;

    const SiteSpec& requireSite(string label);
    void settle();
    void backupFiles(const SiteSpec& site);

public:
    Orchestrator(const RunConfig& runConfig, VersionControlBackend& vcsBackend, DatabaseBackend& dbBackend,
                 MirrorBackend& mirrorBackend, RunLog& log, RetryPolicies retries = RetryPolicies());

    /* Run each step in order, recording a StepResult for each one that ran.  A step fails by
     * throwing;  the failure is logged as "<site> <step> failed: ..." and then either the
     * remaining steps still run (CONTINUE_ON_ERROR) or they don't (ABORT_ON_FIRST_FAILURE). */
    vector<StepResult> runSteps(string site, vector<Step> steps, FailurePolicy policy);

    // every site (or just filter), database then files per site;  true only if every step succeeded
    bool runBackup(string filter = "");

    // true if the restore completed or the operator declined it
    bool runRestore(string label, string reference, Confirmation confirm);

    void listBackups(string label, ostream& out);
    void listSites(ostream& out);

    const vector<StepResult>& lastResults() { return results; }
};

#endif

