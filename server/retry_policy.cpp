// server/retry_policy.cpp
#include "retry_policy.hpp"
#include <algorithm>

RetryPolicy::RetryPolicy(size_t retries, std::chrono::milliseconds base, std::chrono::milliseconds cap)
    : max_retries(retries), base_delay(base), max_delay(std::max(base, cap)) {}

RetryDecision RetryPolicy::decide(size_t attempt, WriteErrorKind /*kind*/) const {
    RetryDecision decision;
    if (attempt == 0 || attempt > max_retries) {
        return decision;
    }

    // All kinds are retried, Rejected included.
    decision.retry = true;

    auto delay = base_delay;
    for (size_t i = 1; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    decision.delay = std::min(delay, max_delay);
    return decision;
}
