#include "RetryPolicy.h"
#include "fakes.h"

#include <cassert>
#include <iostream>

namespace {

void TestFirstAttemptSucceedsWithoutWaiting() {
    RecordingSleeper recorder;
    auto policy = RetryPolicy::fixed(3, 5, recorder.sleeper());

    unsigned int calls = 0;
    assert(policy.run([&](unsigned int) { ++calls; return true; }) == 1);
    assert(calls == 1);
    assert(recorder.waits.empty());
}

void TestNoWaitAfterFinalAttempt() {
    RecordingSleeper recorder;
    auto policy = RetryPolicy::fixed(3, 5, recorder.sleeper());

    unsigned int calls = 0;
    assert(policy.run([&](unsigned int) { ++calls; return false; }) == 0);
    assert(calls == 3);
    assert((recorder.waits == vector<unsigned int>{ 5, 5 }));
}

void TestReturnsSucceedingAttempt() {
    RecordingSleeper recorder;
    auto policy = RetryPolicy::fixed(5, 1, recorder.sleeper());

    vector<unsigned int> retried;
    auto attempt = policy.run([](unsigned int n) { return n == 3; },
                                                        [&](unsigned int n, unsigned int wait) { retried.push_back(n); assert(wait == 1); });

    assert(attempt == 3);
    assert((retried == vector<unsigned int>{ 1, 2 }));
    assert(recorder.waits.size() == 2);
}

void TestEngineSchedules() {
    RecordingSleeper recorder;
    RetryPolicies policies(recorder.sleeper());
    auto fail = [](unsigned int) { return false; };

    assert(policies.init.maxAttempts == 3);
    policies.init.run(fail);
    assert((recorder.waits == vector<unsigned int>{ 3, 3 }));

    recorder.waits.clear();
    assert(policies.stageFile.maxAttempts == 5);
    policies.stageFile.run(fail);
    assert((recorder.waits == vector<unsigned int>{ 1, 1, 1, 1 }));

    // the first commit retry waits longer than the rest
    recorder.waits.clear();
    assert(policies.commit.maxAttempts == 5);
    policies.commit.run(fail);
    assert((recorder.waits == vector<unsigned int>{ 10, 5, 5, 5 }));

    recorder.waits.clear();
    assert(policies.dump.maxAttempts == 3);
    policies.dump.run(fail);
    assert((recorder.waits == vector<unsigned int>{ 5, 5 }));
}

void TestZeroBackoffSkipsSleeper() {
    RecordingSleeper recorder;
    RetryPolicy policy(4, [](unsigned int) { return 0U; }, recorder.sleeper());

    unsigned int calls = 0;
    policy.run([&](unsigned int) { ++calls; return false; });
    assert(calls == 4);
    assert(recorder.waits.empty());
}

}  // namespace

int main() {
    GLOBALS.quiet = true;

    TestFirstAttemptSucceedsWithoutWaiting();
    TestNoWaitAfterFinalAttempt();
    TestReturnsSucceedingAttempt();
    TestEngineSchedules();
    TestZeroBackoffSkipsSleeper();

    std::cout << "sitebackups_unit_retry_policy: pass\n";
    return 0;
}
