// =================================================================
// include/Maestro/Config.hpp
// =================================================================
// Application configuration loaded from maestro.yml.

#pragma once

#include "Maestro/ModelClient.hpp"
#include "Maestro/QueryTypes.hpp"
#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Maestro {

/**
 * @brief Configuration for one remote model
 */
struct ModelConfig {
    std::string id;                             ///< Registry identifier
    std::string type = "openai_compatible";     ///< Client factory type
    std::string endpoint;                       ///< Full chat completions URL
    std::string model_name;                     ///< Backend model name
    std::string credential;                     ///< Credential reference (empty for none)
    std::string description;                    ///< Human-readable description
    std::map<TaskCategory, int> capabilities;   ///< Category -> specialization rank (higher is better)
    double reliability = 0.9;                   ///< Declared reliability in [0, 1]
    std::chrono::milliseconds timeout{30000};   ///< Per-attempt timeout
    GenerationParams params;                    ///< Sampling parameters
    size_t declaration_index = 0;               ///< Position in the config file

    bool hasCapability(TaskCategory category) const;

    /**
     * @brief Specialization rank for a category, 0 when not capable
     */
    int rankFor(TaskCategory category) const;
};

/**
 * @brief One weighted regex in a category signature
 */
struct SignaturePattern {
    std::string pattern;    ///< ECMAScript regex, matched case-insensitively
    double weight = 0.0;    ///< Score contributed on match
};

using CategorySignatures = std::map<TaskCategory, std::vector<SignaturePattern>>;

/**
 * @brief Routing tables, immutable once the router is built
 */
struct RoutingConfig {
    std::string default_model;                          ///< General-purpose last resort
    double confidence_threshold = 0.8;                  ///< Below this, secondary categories join the chain early
    std::set<TaskCategory> multi_model_categories{TaskCategory::COMPLEX_ANALYSIS}; ///< Categories answered by several models
    size_t max_multi_primaries = 3;                     ///< Cap on parallel primaries
    size_t max_fallbacks = 3;                           ///< Cap on fallback chain length
    std::chrono::seconds latency_window{300};           ///< Window for latency tie-breaks
    CategorySignatures signatures;                      ///< Overrides for the default signatures
    double adaptive_step = 0.05;                        ///< Rank nudge per success, scaled by confidence (0 disables)
    double max_rank_adjustment = 0.45;                  ///< Bound on the accumulated nudge; below 0.5 it only reorders equal ranks
};

struct PerformanceConfig {
    std::chrono::milliseconds timeout{30000};           ///< Global per-call deadline
    size_t retry_attempts = 3;                          ///< Attempts per model
    std::chrono::milliseconds backoff_base{500};        ///< First retry delay
    double backoff_factor = 2.0;                        ///< Delay multiplier per attempt
    std::chrono::milliseconds backoff_max{8000};        ///< Upper bound on a single delay
    double jitter = 0.2;                                ///< Relative jitter applied to delays
    std::chrono::seconds cache_ttl{3600};               ///< Request cache lifetime
    size_t max_cache_entries = 1000;                    ///< Request cache capacity
    size_t max_concurrent_requests = 10;                ///< Queries processed at once
    size_t max_performance_records = 10000;             ///< Retained performance records
};

struct CircuitBreakerConfig {
    size_t failure_threshold = 3;                       ///< Consecutive failures before opening
    std::chrono::milliseconds cooldown{30000};          ///< Time spent open before a trial
};

struct ContextConfig {
    size_t max_history = 10;                            ///< Turns kept per conversation
    std::chrono::seconds ttl{3600};                     ///< Idle time before a window expires
    size_t prompt_history_turns = 3;                    ///< Turns included in prompts
    std::string system_prompt;                          ///< Optional leading system message
    size_t cleanup_interval = 100;                      ///< Queries between sweeps of expired state
};

/**
 * @brief How several distinct successful outputs are combined
 */
enum class CombineStrategy {
    ATTRIBUTED,     ///< Concatenate with per-model attribution markers
    CODE_BLOCKS,    ///< Most confident answer plus other models' code blocks
    KEY_POINTS      ///< De-duplicated key points, most confident answer first
};

std::string combineStrategyToString(CombineStrategy strategy);

/**
 * @brief Parse a strategy name ("attributed", "code_blocks", "key_points")
 * @throws std::invalid_argument for unknown names
 */
CombineStrategy combineStrategyFromString(const std::string& name);

/**
 * @brief Synthesis tuning
 */
struct SynthesisConfig {
    double duplicate_threshold = 0.85;                  ///< Word-set similarity above which outputs count as duplicates
    double default_reliability = 0.8;                   ///< Reliability for models missing from the registry
    std::map<TaskCategory, CombineStrategy> strategies; ///< Per-category strategy; ATTRIBUTED when absent
};

/**
 * @brief Active endpoint checks
 */
struct VerificationConfig {
    bool on_startup = false;                            ///< Check every endpoint when the CLI starts
    std::chrono::milliseconds timeout{10000};           ///< Deadline for each check
    std::string prompt = "test";                        ///< Text sent as the check
    size_t max_tokens = 50;                             ///< Generation cap for the check
};

struct LoggingConfig {
    std::string level = "INFO";                         ///< Console level
    std::string directory = ".maestro/logs";            ///< Log file directory
    bool console = true;                                ///< Console output enabled
    bool file = true;                                   ///< File output enabled
};

/**
 * @brief Complete application configuration
 */
struct AppConfig {
    std::vector<ModelConfig> models;    ///< Models in declaration order
    RoutingConfig routing;
    PerformanceConfig performance;
    CircuitBreakerConfig circuit_breaker;
    ContextConfig context;
    SynthesisConfig synthesis;
    VerificationConfig verification;
    LoggingConfig logging;

    const ModelConfig* findModel(const std::string& id) const;
};

/**
 * @brief Loads and validates AppConfig from YAML
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param config_path Path to the file
     * @return Parsed configuration with environment overrides applied
     * @throws ConfigError if the file is malformed or invalid. A missing
     *         file yields the built-in defaults.
     */
    static AppConfig loadFromFile(const std::string& config_path);

    /**
     * @brief Load configuration from YAML text
     * @throws ConfigError if the text is malformed or invalid
     */
    static AppConfig loadFromString(const std::string& yaml_text);

    /**
     * @brief Built-in defaults (no models configured)
     */
    static AppConfig defaults();

    /**
     * @brief Apply MAESTRO_* environment variable overrides
     */
    static void applyEnvironmentOverrides(AppConfig& config);

    /**
     * @brief Check cross-references and value ranges
     * @throws ConfigError describing the first problem found
     */
    static void validate(const AppConfig& config);

private:
    static AppConfig parse(const YAML::Node& root);
    static ModelConfig parseModel(const std::string& id, const YAML::Node& node, size_t index);
};

} // namespace Maestro
