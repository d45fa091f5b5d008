// =================================================================
// include/Maestro/CancellationToken.hpp
// =================================================================
// Cooperative cancellation and deadline propagation for model calls.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Maestro {

/**
 * @brief Shared cancellation flag with an optional deadline
 *
 * Copies share state. A child token observes its parent's cancellation
 * and carries the earlier of the parent's deadline and its own. Blocking
 * waits go through sleepFor() so that cancel() wakes them immediately.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Create a root token without a deadline
     */
    CancellationToken();

    /**
     * @brief Create a root token that expires at the given time
     * @param deadline Absolute deadline
     */
    static CancellationToken withDeadline(Clock::time_point deadline);

    /**
     * @brief Create a child token
     * @param deadline Child deadline, clamped to this token's deadline
     * @return Token cancelled whenever this one is
     */
    CancellationToken child(std::optional<Clock::time_point> deadline = std::nullopt) const;

    /**
     * @brief Cancel this token and every child created from it
     */
    void cancel();

    bool isCancelled() const;

    /**
     * @brief Whether the deadline has passed
     */
    bool isExpired() const;

    bool shouldStop() const { return isCancelled() || isExpired(); }

    std::optional<Clock::time_point> deadline() const;

    /**
     * @brief Time left until the deadline
     * @param fallback Value returned when there is no deadline
     */
    std::chrono::milliseconds remaining(std::chrono::milliseconds fallback = std::chrono::hours(24)) const;

    /**
     * @brief Sleep for a duration unless cancelled or expired first
     * @param duration Maximum time to sleep
     * @return True if the full duration elapsed, false if woken to stop
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    static void cancelState(const std::shared_ptr<State>& state);

    std::shared_ptr<State> m_state;
};

} // namespace Maestro
