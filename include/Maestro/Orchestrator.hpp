// =================================================================
// include/Maestro/Orchestrator.hpp
// =================================================================
// Executes model plans with retries, circuit breaking and deadlines.

#pragma once

#include "Maestro/CancellationToken.hpp"
#include "Maestro/ModelRegistry.hpp"
#include "Maestro/PerformanceMonitor.hpp"
#include "Maestro/QueryTypes.hpp"
#include "Maestro/ResponseSynthesizer.hpp"
#include "Maestro/RetryPolicy.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <vector>

namespace Maestro {

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    std::chrono::milliseconds global_timeout{30000};   ///< Wall-time bound for one call
    RetryPolicy retry;                                  ///< Per-model retry policy

    static OrchestratorConfig fromConfig(const PerformanceConfig& config);
};

/**
 * @brief Counters over the orchestrator's lifetime
 */
struct OrchestratorStats {
    size_t executions = 0;          ///< Plans executed
    size_t successes = 0;           ///< Responses with status success
    size_t partials = 0;            ///< Responses with status partial
    size_t failures = 0;            ///< Responses with status failure
    size_t timeouts = 0;            ///< Calls that hit the global deadline
    size_t cancellations = 0;       ///< Calls cancelled by the caller
    size_t model_attempts = 0;      ///< Remote attempts made
    size_t circuit_skips = 0;       ///< Models skipped with an open circuit
};

/**
 * @brief Per-attempt results plus the synthesized response
 */
struct ExecutionOutcome {
    std::vector<ModelInvocationResult> results;
    SynthesizedResponse response;
};

/**
 * @brief Runs a ModelPlan against the registered clients
 *
 * Multiple primaries are dispatched concurrently; otherwise the primary
 * is tried first and fallbacks follow in order. Every model gets up to
 * RetryPolicy::max_attempts attempts, retried only for transient errors,
 * and models with an open circuit are skipped without using an attempt.
 * All attempts share one global deadline. Attempts that overrun are
 * cancelled and joined before the call returns.
 */
class Orchestrator {
public:
    /**
     * @brief Constructor
     * @param registry Model clients and circuit state
     * @param synthesizer Response synthesizer
     * @param monitor Optional performance monitor
     * @param config Deadline and retry settings
     */
    Orchestrator(ModelRegistry& registry,
                 const ResponseSynthesizer& synthesizer,
                 PerformanceMonitor* monitor = nullptr,
                 const OrchestratorConfig& config = OrchestratorConfig());

    /**
     * @brief Execute a plan and synthesize the results
     * @param plan Plan to run
     * @param prompt Prompt sent to every model
     * @param token Caller cancellation
     * @return Results and response; never throws for model failures
     */
    ExecutionOutcome execute(const ModelPlan& plan, const Prompt& prompt,
                             const CancellationToken& token = CancellationToken());

    /**
     * @brief Execute a plan, streaming merged chunks to a sink
     *
     * The sink receives chunk events followed by exactly one final event,
     * also when every model fails or the caller cancels. The sink may be
     * called from worker threads but never concurrently.
     */
    ExecutionOutcome executeStream(const ModelPlan& plan, const Prompt& prompt,
                                   const StreamSink& sink,
                                   const CancellationToken& token = CancellationToken());

    OrchestratorStats getStatistics() const;
    const OrchestratorConfig& getConfig() const { return m_config; }

private:
    struct StreamHooks {
        std::function<void(const std::string& model_id, const std::string& text)> on_chunk;
        std::function<void(const std::string& model_id, bool succeeded)> on_finished;
    };

    struct AttemptOutcome {
        bool success = false;
        bool cancelled = false;
        bool timed_out = false;
        bool retryable = false;
        GenerationResult generation;
        ErrorCode error_code = ErrorCode::NONE;
        std::string message;
    };

    ModelRegistry& m_registry;
    const ResponseSynthesizer& m_synthesizer;
    PerformanceMonitor* m_monitor;
    OrchestratorConfig m_config;

    OrchestratorStats m_stats;
    mutable std::mutex m_stats_mutex;

    std::mt19937 m_rng;
    std::mutex m_rng_mutex;

    std::vector<ModelInvocationResult> runPlan(const ModelPlan& plan, const Prompt& prompt,
                                               const CancellationToken& call_token,
                                               const StreamHooks* hooks);

    ModelInvocationResult invokeWithRetry(const PlanEntry& entry, const Prompt& prompt,
                                          const CancellationToken& call_token,
                                          const StreamHooks* hooks);

    AttemptOutcome runAttempt(ModelClient& client, const ModelConfig& config, const Prompt& prompt,
                              const CancellationToken& call_token, const ChunkCallback* on_chunk);

    SynthesizedResponse finish(const ModelPlan& plan, const std::vector<ModelInvocationResult>& results,
                               const CancellationToken& call_token,
                               std::chrono::steady_clock::time_point started);

    std::chrono::milliseconds nextDelay(size_t attempt);

    void recordAttempt(const std::string& model_id, TaskCategory category,
                       std::chrono::milliseconds latency, bool success, ErrorCode code);
};

} // namespace Maestro
