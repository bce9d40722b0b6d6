// server/retry_policy.hpp
#pragma once
#include "errors.hpp"
#include <chrono>
#include <cstddef>

struct RetryDecision {
    bool retry{false};
    std::chrono::milliseconds delay{0};
};

// Bounded exponential backoff. Holds no per-batch state, so one instance is
// shared by every flush.
class RetryPolicy {
private:
    size_t max_retries;
    std::chrono::milliseconds base_delay;
    std::chrono::milliseconds max_delay;

public:
    RetryPolicy(size_t retries = 3,
                std::chrono::milliseconds base = std::chrono::milliseconds(1000),
                std::chrono::milliseconds cap = std::chrono::milliseconds(30000));

    // attempt is the 1-based number of the write attempt that just failed.
    RetryDecision decide(size_t attempt, WriteErrorKind kind) const;

    size_t retries() const { return max_retries; }
    size_t max_attempts() const { return max_retries + 1; }
};
