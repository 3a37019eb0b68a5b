#pragma once

#include <chrono>
#include <functional>

namespace shelf {

/**
 * Retry/backoff policy shared by catalog requests and file transfers.
 */
struct RetryPolicy {
    int maxAttempts{4};
    std::chrono::milliseconds initialBackoff{5000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{60000};
};

// Blocks the calling thread; injected so tests never wait
using Sleeper = std::function<void(std::chrono::milliseconds)>;
using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * Delay before retry `attempt` (1-based: the wait after the first failure is attempt 1):
 * min(initial * multiplier^(attempt-1), max).
 */
std::chrono::milliseconds backoffFor(const RetryPolicy& policy, int attempt);

Sleeper threadSleeper();
Clock systemClock();

} // namespace shelf
