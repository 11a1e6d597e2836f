
#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include <functional>
#include <string>

using namespace std;


// how a wait is actually carried out;  tests substitute one that just records it
typedef function<void(unsigned int seconds)> Sleeper;

void realSleeper(unsigned int seconds);


/*
 RetryPolicy runs an operation until it succeeds or maxAttempts is reached.
 backoff(n) is the number of seconds to wait after failed attempt n (1-based)
 before trying again;  there's never a wait after the final attempt.  onRetry,
 if given, is called before each wait with the failed attempt number and the
 wait about to happen, which is where callers log and do any repair work.
 */
class RetryPolicy {
public:
    unsigned int maxAttempts;
    function<unsigned int(unsigned int attempt)> backoff;
    Sleeper sleeper;

    RetryPolicy(unsigned int attempts, function<unsigned int(unsigned int)> schedule, Sleeper s = realSleeper);

    static RetryPolicy fixed(unsigned int attempts, unsigned int seconds, Sleeper s = realSleeper);

    // returns the attempt number that succeeded, or 0 if every attempt failed
    unsigned int run(function<bool(unsigned int attempt)> operation, function<void(unsigned int attempt, unsigned int wait)> onRetry = nullptr) const;
};


/*
 The schedules the engine uses, in one place.  Built with a single sleeper so
 a test can observe every wait of a run (settle pauses included).
 */
struct RetryPolicies {
    Sleeper sleeper;
    RetryPolicy init;         // repository initialization
    RetryPolicy stageFile;    // per-file staging in fallback mode
    RetryPolicy commit;       // commit, first wait lengthened
    RetryPolicy dump;         // database export

    RetryPolicies(Sleeper s = realSleeper);
};

#endif

