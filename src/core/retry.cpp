#include <shelf/core/retry.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace shelf {

std::chrono::milliseconds backoffFor(const RetryPolicy& policy, int attempt) {
    if (attempt < 1)
        attempt = 1;
    const double base = static_cast<double>(policy.initialBackoff.count());
    const double cap = static_cast<double>(policy.maxBackoff.count());
    const double scaled = base * std::pow(std::max(policy.multiplier, 1.0), attempt - 1);
    return std::chrono::milliseconds(static_cast<long long>(std::min(scaled, cap)));
}

Sleeper threadSleeper() {
    return [](std::chrono::milliseconds d) {
        if (d.count() > 0)
            std::this_thread::sleep_for(d);
    };
}

Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace shelf
