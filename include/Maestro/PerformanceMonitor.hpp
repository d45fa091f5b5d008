// =================================================================
// include/Maestro/PerformanceMonitor.hpp
// =================================================================
// Append-only performance records with windowed aggregation.

#pragma once

#include "Maestro/QueryTypes.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Maestro {

/**
 * @brief One observation; never mutated after it is recorded
 */
struct PerformanceRecord {
    std::string model_id;                               ///< Model id, or "synthesis" for whole queries
    std::chrono::milliseconds latency{0};               ///< Observed latency
    bool success = false;                               ///< Whether the call succeeded
    std::optional<TaskCategory> category;               ///< Category of the query, if known
    double confidence = 0.0;                            ///< Response confidence (synthesis records)
    ErrorCode error_code = ErrorCode::NONE;             ///< Failure kind
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct ModelStats {
    size_t calls = 0;                   ///< Recorded calls
    size_t successes = 0;               ///< Successful calls
    size_t failures = 0;                ///< Failed calls
    double average_latency_ms = 0.0;    ///< Mean latency
    double success_rate = 0.0;          ///< successes / calls
};

struct CategoryStats {
    size_t count = 0;                   ///< Queries in this category
    double average_confidence = 0.0;    ///< Mean response confidence
    double average_latency_ms = 0.0;    ///< Mean end-to-end latency
};

/**
 * @brief Aggregate view over a time window
 */
struct PerformanceSummary {
    size_t total_records = 0;
    double average_latency_ms = 0.0;
    double success_rate = 0.0;
    std::map<std::string, ModelStats> per_model;
    std::map<std::string, CategoryStats> per_category;
    std::map<std::string, size_t> error_counts;

    nlohmann::json toJson() const;
};

/**
 * @brief External consumer of observations (metrics exporters)
 *
 * Called from the monitor's dispatcher thread, one record at a time and
 * in record order, never from the thread that called record(). A slow
 * sink delays only later observations; once the dispatch queue is full
 * new observations are dropped for sinks (they are still retained for
 * aggregation). Exceptions are logged and dropped.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void observe(const PerformanceRecord& record) = 0;
};

/**
 * @brief Records latency and success of every model call and query
 *
 * Read-only to the rest of the router apart from the latency lookups
 * used as routing tie-breaks.
 */
class PerformanceMonitor {
public:
    /**
     * @brief Constructor
     * @param max_records Oldest records are dropped beyond this count
     * @param max_pending_observations Dispatch queue capacity for sinks
     */
    explicit PerformanceMonitor(size_t max_records = 10000, size_t max_pending_observations = 1024);

    /**
     * @brief Stops the dispatcher after delivering queued observations
     */
    ~PerformanceMonitor();

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    /**
     * @brief Append a record and queue it for sinks; never blocks on a sink
     */
    void record(const PerformanceRecord& record);

    /**
     * @brief Register a sink; starts the dispatcher on first use
     */
    void addSink(std::shared_ptr<MetricsSink> sink);

    /**
     * @brief Block until every queued observation reached the sinks
     */
    void flush();

    /**
     * @brief Observations not delivered because the queue was full
     */
    size_t droppedObservations() const;

    /**
     * @brief Aggregate records newer than now - window
     */
    PerformanceSummary aggregate(std::chrono::seconds window) const;

    /**
     * @brief Aggregate every retained record
     */
    PerformanceSummary aggregateAll() const;

    /**
     * @brief Mean latency of successful calls to a model within a window
     * @return Nothing when the model has no successful record in the window
     */
    std::optional<std::chrono::milliseconds> recentLatency(const std::string& model_id,
                                                           std::chrono::seconds window) const;

    size_t recordCount() const;

    /**
     * @brief Save the all-time summary as JSON
     * @return True on success
     */
    bool saveToFile(const std::string& path) const;

    void clear();

private:
    size_t m_max_records;
    std::deque<PerformanceRecord> m_records;
    mutable std::mutex m_mutex;

    // Sink dispatch
    size_t m_max_pending;
    std::vector<std::shared_ptr<MetricsSink>> m_sinks;
    std::deque<PerformanceRecord> m_pending;
    std::thread m_dispatcher;
    bool m_stop = false;
    bool m_delivering = false;
    size_t m_dropped = 0;
    mutable std::mutex m_dispatch_mutex;
    std::condition_variable m_dispatch_cv;
    std::condition_variable m_idle_cv;

    void dispatchLoop();

    PerformanceSummary summarize(std::optional<std::chrono::system_clock::time_point> since) const;
};

} // namespace Maestro
