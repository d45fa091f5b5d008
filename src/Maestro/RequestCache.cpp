// =================================================================
// src/Maestro/RequestCache.cpp
// =================================================================
// Implementation of the response cache with request coalescing.

#include "Maestro/RequestCache.hpp"
#include "Maestro/Logger.hpp"
#include <cctype>

namespace Maestro {

RequestCache::RequestCache(std::chrono::seconds ttl, size_t max_entries)
    : m_ttl(ttl), m_max_entries(max_entries) {}

std::string RequestCache::makeKey(const std::string& query_text, const std::string& conversation_id) {
    std::string normalized;
    normalized.reserve(query_text.size());
    bool pending_space = false;
    for (char c : query_text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized += ' ';
            pending_space = false;
        }
        normalized += static_cast<char>(std::tolower(uc));
    }
    return conversation_id + "\x1f" + normalized;
}

std::optional<SynthesizedResponse> RequestCache::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto response = lookupLocked(key);
    if (response) {
        m_stats.hits++;
    }
    return response;
}

void RequestCache::store(const std::string& key, const SynthesizedResponse& response) {
    std::lock_guard<std::mutex> lock(m_mutex);
    storeLocked(key, response);
}

SynthesizedResponse RequestCache::getOrCompute(const std::string& key,
                                               const std::function<SynthesizedResponse()>& compute,
                                               bool* was_hit) {
    if (was_hit) {
        *was_hit = false;
    }

    std::promise<SynthesizedResponse> promise;
    std::unique_lock<std::mutex> lock(m_mutex);

    if (auto cached = lookupLocked(key)) {
        m_stats.hits++;
        if (was_hit) {
            *was_hit = true;
        }
        return *cached;
    }

    auto in_flight = m_in_flight.find(key);
    if (in_flight != m_in_flight.end()) {
        m_stats.coalesced++;
        std::shared_future<SynthesizedResponse> shared = in_flight->second;
        lock.unlock();
        SynthesizedResponse response = shared.get();
        if (was_hit) {
            *was_hit = true;
        }
        return response;
    }

    m_stats.misses++;
    m_in_flight.emplace(key, promise.get_future().share());
    lock.unlock();

    try {
        SynthesizedResponse response = compute();
        lock.lock();
        storeLocked(key, response);
        m_in_flight.erase(key);
        promise.set_value(response);
        return response;
    } catch (const std::exception& e) {
        LOG_WARNING("RequestCache", std::string("Computation failed: ") + e.what());
        if (!lock.owns_lock()) {
            lock.lock();
        }
        m_in_flight.erase(key);
        promise.set_exception(std::current_exception());
        throw;
    }
}

CacheStats RequestCache::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

size_t RequestCache::cleanupExpired() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.expires_at <= now) {
            m_lru.erase(it->second.lru_position);
            it = m_entries.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    m_stats.evictions += removed;
    return removed;
}

void RequestCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_lru.clear();
}

size_t RequestCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::optional<SynthesizedResponse> RequestCache::lookupLocked(const std::string& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at <= Clock::now()) {
        m_lru.erase(it->second.lru_position);
        m_entries.erase(it);
        m_stats.evictions++;
        return std::nullopt;
    }
    m_lru.splice(m_lru.begin(), m_lru, it->second.lru_position);
    return it->second.response;
}

void RequestCache::storeLocked(const std::string& key, const SynthesizedResponse& response) {
    if (response.status != ResponseStatus::SUCCESS || m_max_entries == 0) {
        return;
    }

    auto existing = m_entries.find(key);
    if (existing != m_entries.end()) {
        m_lru.erase(existing->second.lru_position);
        m_entries.erase(existing);
    }

    while (m_entries.size() >= m_max_entries && !m_lru.empty()) {
        m_entries.erase(m_lru.back());
        m_lru.pop_back();
        m_stats.evictions++;
    }

    m_lru.push_front(key);
    Entry entry;
    entry.response = response;
    entry.expires_at = Clock::now() + m_ttl;
    entry.lru_position = m_lru.begin();
    m_entries.emplace(key, std::move(entry));
}

} // namespace Maestro
