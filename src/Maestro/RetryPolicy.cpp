// =================================================================
// src/Maestro/RetryPolicy.cpp
// =================================================================
// Backoff computation for model retries.

#include "Maestro/RetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace Maestro {

RetryPolicy RetryPolicy::fromConfig(const PerformanceConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = std::max<size_t>(config.retry_attempts, 1);
    policy.base_delay = config.backoff_base;
    policy.backoff_factor = config.backoff_factor;
    policy.max_delay = config.backoff_max;
    policy.jitter = config.jitter;
    return policy;
}

std::chrono::milliseconds RetryPolicy::delayForAttempt(size_t attempt, std::mt19937& rng) const {
    if (attempt == 0) {
        attempt = 1;
    }

    double delay = static_cast<double>(base_delay.count()) *
                   std::pow(backoff_factor, static_cast<double>(attempt - 1));
    delay = std::min(delay, static_cast<double>(max_delay.count()));

    if (jitter > 0.0 && delay > 0.0) {
        std::uniform_real_distribution<double> spread(1.0 - jitter, 1.0 + jitter);
        delay *= spread(rng);
    }

    return std::chrono::milliseconds(static_cast<long long>(std::max(delay, 0.0)));
}

} // namespace Maestro
