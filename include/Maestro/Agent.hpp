// =================================================================
// include/Maestro/Agent.hpp
// =================================================================
// Query facade tying routing, orchestration, context and caching together.

#pragma once

#include "Maestro/CancellationToken.hpp"
#include "Maestro/Config.hpp"
#include "Maestro/ContextManager.hpp"
#include "Maestro/ModelRegistry.hpp"
#include "Maestro/Orchestrator.hpp"
#include "Maestro/PerformanceMonitor.hpp"
#include "Maestro/QueryTypes.hpp"
#include "Maestro/RequestCache.hpp"
#include "Maestro/ResponseSynthesizer.hpp"
#include "Maestro/TaskRouter.hpp"
#include "nlohmann/json.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Maestro {

/**
 * @brief Admission control hook consulted before every query
 */
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    /**
     * @brief Whether the caller may issue a query now
     * @param caller_id Caller identifier (may be empty)
     */
    virtual bool allow(const std::string& caller_id) = 0;
};

/**
 * @brief Overall health plus per-model circuit states
 */
struct HealthReport {
    std::string overall;                            ///< "healthy", "degraded" or "unhealthy"
    std::vector<ModelHealthState> models;           ///< Per-model state in declaration order
    std::vector<VerificationResult> verification;   ///< Latest endpoint checks, when any ran
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json toJson() const;
};

class Agent;

/**
 * @brief Pull-style view of a streaming query
 *
 * The query runs on a worker thread and events queue up until read.
 * The owning Agent must outlive the handle.
 */
class StreamHandle {
public:
    /**
     * @brief Construction token; only Agent can create one
     */
    class Key {
        friend class Agent;
        Key() {}
    };

    explicit StreamHandle(Key);
    ~StreamHandle();

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    /**
     * @brief Next event, blocking until one is available
     * @return Event, or nullopt once the final event has been returned
     */
    std::optional<StreamEvent> next();

    /**
     * @brief Cancel the query
     *
     * Returns after every in-flight model call has stopped. Events already
     * queued, including the final one, remain readable.
     */
    void cancel();

    bool isFinished() const;

private:
    friend class Agent;

    void push(const StreamEvent& event);

    CancellationToken m_token;
    std::thread m_worker;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<StreamEvent> m_events;
    bool m_final_queued = false;
    bool m_final_delivered = false;
};

/**
 * @brief Entry point for queries
 *
 * Validates input, applies admission control, classifies and plans,
 * consults the request cache, executes the plan and records the turn.
 * Model failures come back as a failed SynthesizedResponse carrying a
 * stable error code rather than as exceptions.
 */
class Agent {
public:
    /**
     * @brief Constructor
     * @param config Application configuration
     * @param registry Registry holding the model clients
     * @param scorer Optional classification scorer
     */
    Agent(const AppConfig& config,
          std::shared_ptr<ModelRegistry> registry,
          std::shared_ptr<ClassificationScorer> scorer = nullptr);

    ~Agent();

    /**
     * @brief Answer a query
     * @param query Incoming query
     * @return Final response; check status and error_code
     */
    SynthesizedResponse handleQuery(const Query& query);

    /**
     * @brief Answer a query incrementally
     * @param query Incoming query
     * @param sink Receives chunk events and exactly one final event
     * @param token Cancels the query and all of its model calls
     * @return The final event
     */
    StreamEvent handleQueryStream(const Query& query, const StreamSink& sink,
                                  const CancellationToken& token = CancellationToken());

    /**
     * @brief Start a streaming query read through a handle
     */
    std::unique_ptr<StreamHandle> openStream(const Query& query);

    /**
     * @brief Classify a query and build its plan without executing it
     * @throws ClassificationError when no plan can be built
     */
    RoutingDecision classify(const Query& query);

    /**
     * @brief Circuit health plus the latest endpoint checks
     */
    HealthReport getHealth() const;

    /**
     * @brief Check every endpoint with the configured test prompt
     * @return One result per model in declaration order
     */
    std::vector<VerificationResult> verifyModels();

    /**
     * @brief Aggregate performance over a trailing window
     * @param window Window length; all records when zero
     */
    PerformanceSummary getPerformanceSummary(std::chrono::seconds window = std::chrono::seconds(0)) const;

    void setRateLimiter(std::shared_ptr<RateLimiter> limiter);

    /**
     * @brief Drop expired conversations, idle turn locks and cache entries
     *
     * Also runs automatically every context.cleanup_interval queries.
     * @return Number of conversations and cache entries removed
     */
    size_t cleanupExpired();

    ModelRegistry& getRegistry() { return *m_registry; }
    ContextManager& getContextManager() { return *m_context; }
    PerformanceMonitor& getPerformanceMonitor() { return *m_monitor; }
    const TaskRouter& getRouter() const { return *m_router; }
    CacheStats getCacheStatistics() const { return m_cache->getStatistics(); }
    OrchestratorStats getOrchestratorStatistics() const { return m_orchestrator->getStatistics(); }
    const AppConfig& getConfig() const { return m_config; }

private:
    AppConfig m_config;
    std::shared_ptr<ModelRegistry> m_registry;
    std::unique_ptr<PerformanceMonitor> m_monitor;
    std::unique_ptr<ContextManager> m_context;
    std::unique_ptr<TaskRouter> m_router;
    std::unique_ptr<ResponseSynthesizer> m_synthesizer;
    std::unique_ptr<Orchestrator> m_orchestrator;
    std::unique_ptr<RequestCache> m_cache;

    std::shared_ptr<RateLimiter> m_rate_limiter;
    mutable std::mutex m_limiter_mutex;

    std::mutex m_slot_mutex;
    std::condition_variable m_slot_cv;
    size_t m_active_requests = 0;

    std::atomic<size_t> m_request_count{0};

    /**
     * @brief Validate, admit and answer a query
     * @param sink Chunk sink for streaming, null for batch
     * @param was_hit Set when the response came from the cache
     */
    SynthesizedResponse process(const Query& query, const StreamSink* sink,
                                const CancellationToken& token, bool& was_hit);

    /**
     * @brief Classify, plan and execute (cache miss path)
     */
    SynthesizedResponse runQuery(const Query& query, const StreamSink* sink,
                                 const CancellationToken& token);

    bool acquireSlot(const CancellationToken& token);
    void releaseSlot();

    void recordSynthesis(const SynthesizedResponse& response);
};

} // namespace Maestro
