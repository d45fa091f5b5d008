// =================================================================
// include/Maestro/ModelRegistry.hpp
// =================================================================
// Registry of model clients, capabilities and circuit breaker state.

#pragma once

#include "Maestro/Config.hpp"
#include "Maestro/CredentialProvider.hpp"
#include "Maestro/ModelClient.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Maestro {

/**
 * @brief Circuit breaker states
 */
enum class CircuitState {
    CLOSED,     ///< Calls flow normally
    OPEN,       ///< Calls are skipped until the cooldown elapses
    HALF_OPEN   ///< One trial call decides whether to close or reopen
};

std::string circuitStateToString(CircuitState state);

/**
 * @brief Live health of one model
 */
struct ModelHealthState {
    std::string model_id;                                   ///< Model identifier
    CircuitState circuit = CircuitState::CLOSED;            ///< Effective circuit state
    size_t consecutive_failures = 0;                        ///< Current failure streak
    size_t total_failures = 0;                              ///< Failures since registration
    size_t total_successes = 0;                             ///< Successes since registration
    std::optional<std::chrono::system_clock::time_point> last_failure; ///< Time of last failure
    std::chrono::steady_clock::time_point cooldown_until;   ///< End of the open window
    std::chrono::milliseconds last_latency{0};              ///< Latency of the last outcome
};

/**
 * @brief Result of one active endpoint check
 */
struct VerificationResult {
    std::string model_id;                               ///< Model identifier
    bool healthy = false;                               ///< Endpoint answered the check
    std::chrono::milliseconds latency{0};               ///< Time taken by the check
    std::string error_type;                             ///< "api_error", "connection_error", "credential_error" or "unknown_error"
    int http_status = 0;                                ///< HTTP status of a rejected check, 0 when none
    std::string message;                                ///< Error details
    std::chrono::system_clock::time_point timestamp;    ///< When the check finished
};

/**
 * @brief Answer from the circuit gate before an invocation
 */
enum class AttemptPermit {
    ALLOWED,    ///< Circuit closed
    TRIAL,      ///< Half-open trial; the outcome decides the circuit
    REJECTED    ///< Circuit open, or a trial is already running
};

/**
 * @brief Model factory function type
 */
using ModelFactory = std::function<std::shared_ptr<ModelClient>(const ModelConfig&)>;

/**
 * @brief Holds configured model clients and owns their health state
 *
 * Health state is mutated only through acquireAttempt() and
 * recordOutcome(), each under the model's own mutex, so concurrent
 * queries never lose an update.
 */
class ModelRegistry {
public:
    /**
     * @brief Constructor
     * @param breaker Circuit breaker thresholds
     * @param credentials Provider handed to HTTP clients
     */
    explicit ModelRegistry(const CircuitBreakerConfig& breaker = CircuitBreakerConfig(),
                           std::shared_ptr<CredentialProvider> credentials = nullptr);

    virtual ~ModelRegistry() = default;

    /**
     * @brief Register a model factory for a specific type
     * @param model_type The model type identifier
     * @param factory The factory function to create models
     */
    void registerModelFactory(const std::string& model_type, ModelFactory factory);

    /**
     * @brief Create and register clients for every configured model
     * @param models Model configurations in declaration order
     * @return Number of models registered
     * @throws ConfigError when a type has no factory or a factory fails
     */
    size_t loadModels(const std::vector<ModelConfig>& models);

    /**
     * @brief Register an already constructed client
     * @param config Model configuration (declaration order is the call order)
     * @param client Client instance
     */
    void registerModel(const ModelConfig& config, std::shared_ptr<ModelClient> client);

    /**
     * @brief Get a model by identifier
     * @return Client, or nullptr if not registered
     */
    std::shared_ptr<ModelClient> getModel(const std::string& model_id) const;

    std::optional<ModelConfig> getModelConfig(const std::string& model_id) const;

    /**
     * @brief Get all configured models in declaration order
     */
    std::vector<ModelConfig> getConfiguredModels() const;

    std::vector<std::string> getModelIds() const;
    bool hasModel(const std::string& model_id) const;

    /**
     * @brief Models declaring a category, ordered by specialization rank
     *
     * Equal ranks keep declaration order. Health is not considered.
     */
    std::vector<std::string> capableModels(TaskCategory category) const;

    /**
     * @brief Effective health of a model
     *
     * An open circuit whose cooldown has elapsed is reported as half-open.
     * @throws std::invalid_argument for unknown models
     */
    ModelHealthState health(const std::string& model_id) const;

    /**
     * @brief Whether a model may appear in a new plan
     * @return False for unknown models and open circuits
     */
    bool isAvailable(const std::string& model_id) const;

    /**
     * @brief Gate consulted before every invocation
     *
     * Moves an expired open circuit to half-open and admits a single
     * trial; concurrent callers are rejected until the trial resolves.
     */
    AttemptPermit acquireAttempt(const std::string& model_id);

    /**
     * @brief Record the outcome of an admitted attempt
     * @param model_id Model identifier
     * @param success Whether the attempt succeeded
     * @param latency Attempt duration
     */
    void recordOutcome(const std::string& model_id, bool success, std::chrono::milliseconds latency);

    /**
     * @brief Release an admitted attempt that ended without an outcome
     *
     * Used when the caller cancelled; the circuit is left unchanged.
     */
    void abandonAttempt(const std::string& model_id);

    /**
     * @brief Effective health of every model in declaration order
     */
    std::vector<ModelHealthState> healthSnapshot() const;

    /**
     * @brief Send a short test prompt to every model
     *
     * Checks run concurrently, each bounded by the configured timeout.
     * Results are kept for lastVerification() and unhealthy models are
     * logged; circuit state is left to real traffic.
     *
     * @param config Test prompt, generation cap and timeout
     * @return One result per model in declaration order
     */
    std::vector<VerificationResult> verifyModels(const VerificationConfig& config);

    /**
     * @brief Most recent check of a model, if any
     */
    std::optional<VerificationResult> lastVerification(const std::string& model_id) const;

    /**
     * @brief Get model info as formatted string (for CLI)
     */
    std::string getModelInfo(const std::string& model_id) const;

    /**
     * @brief Get all models info as formatted string (for CLI)
     */
    std::string getAllModelsInfo() const;

    const CircuitBreakerConfig& getBreakerConfig() const { return m_breaker; }

protected:
    /**
     * @brief Default factory for openai_compatible models
     */
    std::shared_ptr<ModelClient> createHttpModel(const ModelConfig& config);

private:
    struct Entry {
        ModelConfig config;
        std::shared_ptr<ModelClient> client;
        mutable std::mutex mutex;
        ModelHealthState state;
        bool trial_in_flight = false;
        std::optional<VerificationResult> last_verification;
    };

    CircuitBreakerConfig m_breaker;
    std::shared_ptr<CredentialProvider> m_credentials;
    std::unordered_map<std::string, ModelFactory> m_factories;
    std::vector<std::unique_ptr<Entry>> m_entries;
    std::unordered_map<std::string, Entry*> m_index;
    mutable std::mutex m_registry_mutex;

    Entry* findEntry(const std::string& model_id) const;
    Entry& requireEntry(const std::string& model_id) const;

    /**
     * @brief Circuit state as seen at this instant (entry lock held)
     */
    CircuitState effectiveState(const Entry& entry) const;

    void transition(Entry& entry, CircuitState to);

    static VerificationResult verifyEntry(const Entry& entry, const VerificationConfig& config);
};

} // namespace Maestro
