// =================================================================
// include/Maestro/RequestCache.hpp
// =================================================================
// TTL and LRU bounded cache of synthesized responses.

#pragma once

#include "Maestro/QueryTypes.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Maestro {

/**
 * @brief Cache counters
 */
struct CacheStats {
    size_t hits = 0;        ///< Lookups served from a stored entry
    size_t misses = 0;      ///< Lookups that triggered a computation
    size_t coalesced = 0;   ///< Requests that awaited an in-flight computation
    size_t evictions = 0;   ///< Entries dropped for size or age
};

/**
 * @brief Request-scoped response cache
 *
 * Keys combine the normalized query text with the conversation id.
 * Only successful responses are stored. Concurrent requests for the same
 * key share one computation: the first caller computes, later callers
 * wait for its result.
 */
class RequestCache {
public:
    /**
     * @brief Constructor
     * @param ttl Lifetime of an entry
     * @param max_entries Capacity; the least recently used entry is evicted
     */
    RequestCache(std::chrono::seconds ttl, size_t max_entries);

    /**
     * @brief Build a cache key
     *
     * Lowercases, trims and collapses whitespace runs in the query text.
     */
    static std::string makeKey(const std::string& query_text, const std::string& conversation_id);

    /**
     * @brief Look up a live entry
     */
    std::optional<SynthesizedResponse> lookup(const std::string& key);

    /**
     * @brief Store a response; non-success responses are ignored
     */
    void store(const std::string& key, const SynthesizedResponse& response);

    /**
     * @brief Return the cached response or compute it at most once
     * @param key Cache key
     * @param compute Producer run by the first caller for the key
     * @param was_hit Set to true when the response did not come from this
     *                caller's own computation
     * @return Response; exceptions from compute reach every waiter
     */
    SynthesizedResponse getOrCompute(const std::string& key,
                                     const std::function<SynthesizedResponse()>& compute,
                                     bool* was_hit = nullptr);

    CacheStats getStatistics() const;

    /**
     * @brief Drop expired entries
     * @return Number of entries removed
     */
    size_t cleanupExpired();

    void clear();
    size_t size() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        SynthesizedResponse response;
        Clock::time_point expires_at;
        std::list<std::string>::iterator lru_position;
    };

    std::chrono::seconds m_ttl;
    size_t m_max_entries;

    std::unordered_map<std::string, Entry> m_entries;
    std::list<std::string> m_lru;   ///< Most recent first
    std::unordered_map<std::string, std::shared_future<SynthesizedResponse>> m_in_flight;
    CacheStats m_stats;
    mutable std::mutex m_mutex;

    std::optional<SynthesizedResponse> lookupLocked(const std::string& key);
    void storeLocked(const std::string& key, const SynthesizedResponse& response);
};

} // namespace Maestro
