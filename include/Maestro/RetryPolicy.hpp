// =================================================================
// include/Maestro/RetryPolicy.hpp
// =================================================================
// Bounded retry with exponential backoff and jitter.

#pragma once

#include "Maestro/Config.hpp"
#include <chrono>
#include <random>

namespace Maestro {

/**
 * @brief Retry parameters applied around each model invocation
 */
struct RetryPolicy {
    size_t max_attempts = 3;                        ///< Attempts per model, including the first
    std::chrono::milliseconds base_delay{500};      ///< Delay after the first failure
    double backoff_factor = 2.0;                    ///< Multiplier per further failure
    std::chrono::milliseconds max_delay{8000};      ///< Cap on a single delay
    double jitter = 0.2;                            ///< Delay varies by +/- this fraction

    static RetryPolicy fromConfig(const PerformanceConfig& config);

    /**
     * @brief Delay to wait after a failed attempt
     * @param attempt Number of the attempt that just failed (1-based)
     * @param rng Random source for jitter
     */
    std::chrono::milliseconds delayForAttempt(size_t attempt, std::mt19937& rng) const;

    /**
     * @brief Whether another attempt is allowed after attempts_made
     */
    bool allowsAnotherAttempt(size_t attempts_made) const { return attempts_made < max_attempts; }
};

} // namespace Maestro
