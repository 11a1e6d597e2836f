
#include <unistd.h>
#include "RetryPolicy.h"


void realSleeper(unsigned int seconds) {
    // sleep() returns early on a signal;  finish the wait
    while (seconds)
        seconds = sleep(seconds);
}


RetryPolicy::RetryPolicy(unsigned int attempts, function<unsigned int(unsigned int)> schedule, Sleeper s) {
    maxAttempts = attempts;
    backoff = schedule;
    sleeper = s;
}


RetryPolicy RetryPolicy::fixed(unsigned int attempts, unsigned int seconds, Sleeper s) {
    return RetryPolicy(attempts, [seconds](unsigned int) { return seconds; }, s);
}


unsigned int RetryPolicy::run(function<bool(unsigned int)> operation, function<void(unsigned int, unsigned int)> onRetry) const {
    for (unsigned int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (operation(attempt))
            return attempt;

        if (attempt < maxAttempts) {
            unsigned int wait = backoff ? backoff(attempt) : 0;

            if (onRetry)
                onRetry(attempt, wait);

            if (wait && sleeper)
                sleeper(wait);
        }
    }

    return 0;
}


RetryPolicies::RetryPolicies(Sleeper s) :
    sleeper(s),
    init(RetryPolicy::fixed(3, 3, s)),
    stageFile(RetryPolicy::fixed(5, 1, s)),
    commit(5, [](unsigned int attempt) { return attempt == 1 ? 10U : 5U; }, s),
    dump(RetryPolicy::fixed(3, 5, s)) {
}

