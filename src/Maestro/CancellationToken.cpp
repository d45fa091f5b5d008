// =================================================================
// src/Maestro/CancellationToken.cpp
// =================================================================
// Implementation of cancellation tokens.

#include "Maestro/CancellationToken.hpp"
#include <algorithm>

namespace Maestro {

CancellationToken::CancellationToken()
    : m_state(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : m_state(std::move(state)) {}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) {
    auto state = std::make_shared<State>();
    state->deadline = deadline;
    return CancellationToken(state);
}

CancellationToken CancellationToken::child(std::optional<Clock::time_point> deadline) const {
    auto state = std::make_shared<State>();

    std::optional<Clock::time_point> effective = m_state->deadline;
    if (deadline) {
        effective = effective ? std::min(*effective, *deadline) : *deadline;
    }
    state->deadline = effective;

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->cancelled.load()) {
            state->cancelled.store(true);
        } else {
            // Drop registrations of children that are already gone
            auto& children = m_state->children;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const std::weak_ptr<State>& w) { return w.expired(); }),
                           children.end());
            children.push_back(state);
        }
    }

    return CancellationToken(state);
}

void CancellationToken::cancel() {
    cancelState(m_state);
}

void CancellationToken::cancelState(const std::shared_ptr<State>& state) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled.exchange(true)) {
            return;
        }
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (const auto& weak : children) {
        if (auto child = weak.lock()) {
            cancelState(child);
        }
    }
}

bool CancellationToken::isCancelled() const {
    return m_state->cancelled.load();
}

bool CancellationToken::isExpired() const {
    return m_state->deadline && Clock::now() >= *m_state->deadline;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
    return m_state->deadline;
}

std::chrono::milliseconds CancellationToken::remaining(std::chrono::milliseconds fallback) const {
    if (!m_state->deadline) {
        return fallback;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*m_state->deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    auto wake_at = Clock::now() + duration;
    bool capped = false;
    if (m_state->deadline && *m_state->deadline < wake_at) {
        wake_at = *m_state->deadline;
        capped = true;
    }

    std::unique_lock<std::mutex> lock(m_state->mutex);
    bool cancelled = m_state->cv.wait_until(lock, wake_at, [this]() {
        return m_state->cancelled.load();
    });

    return !cancelled && !capped;
}

} // namespace Maestro
