// =================================================================
// include/Maestro/QueryTypes.hpp
// =================================================================
// Value types flowing through routing, orchestration and synthesis.

#pragma once

#include "Maestro/Errors.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace Maestro {

/**
 * @brief Task categories used for model routing
 */
enum class TaskCategory {
    REASONING,              ///< Explanations, logic, step-by-step thinking
    CODING,                 ///< Code generation, debugging, algorithms
    CREATIVE,               ///< Stories, poems, ideation
    RESEARCH,               ///< Fact finding and source gathering
    GENERAL_CONVERSATION,   ///< Small talk and simple questions
    COMPLEX_ANALYSIS        ///< Comparative, multi-faceted analysis
};

std::string taskCategoryToString(TaskCategory category);

/**
 * @brief Parse a category name
 * @param name Lowercase category name (e.g. "reasoning")
 * @return Category value
 * @throws std::invalid_argument for unknown names
 */
TaskCategory taskCategoryFromString(const std::string& name);

/**
 * @brief All categories in declaration order
 */
std::vector<TaskCategory> allTaskCategories();

/**
 * @brief Rough estimate of how demanding a query is
 */
enum class Complexity {
    LOW,
    MEDIUM,
    HIGH
};

std::string complexityToString(Complexity complexity);

/**
 * @brief Incoming user request, immutable once received
 */
struct Query {
    std::string text;                               ///< Query text (required, non-empty)
    std::map<std::string, std::string> context;     ///< Optional structured context
    std::string caller_id;                          ///< Optional caller identifier
    std::string conversation_id;                    ///< Optional conversation identifier
    bool stream = false;                            ///< Whether incremental output is wanted
};

/**
 * @brief One scored category
 */
struct CategoryScore {
    TaskCategory category;   ///< Category
    double confidence;       ///< Independent score in [0, 1]
};

/**
 * @brief Classification of a query, produced once and never mutated
 */
struct TaskClassification {
    std::vector<CategoryScore> scores;              ///< Confidence-descending scores
    Complexity complexity = Complexity::MEDIUM;     ///< Estimated complexity
    std::vector<std::string> context_requirements;  ///< Hints such as "previous" or "code"

    TaskCategory primary() const;
    double primaryConfidence() const;
    double confidenceFor(TaskCategory category) const;
};

/**
 * @brief Role of a model within a plan
 */
enum class PlanRole {
    PRIMARY,    ///< Dispatched up front
    FALLBACK    ///< Tried only after the primaries fail
};

struct PlanEntry {
    std::string model_id;       ///< Model identifier
    PlanRole role;              ///< Primary or fallback
    TaskCategory category;      ///< Category the model was selected for
};

/**
 * @brief Ordered list of models to try for one query
 */
struct ModelPlan {
    std::vector<PlanEntry> entries;

    std::vector<std::string> primaries() const;
    std::vector<std::string> fallbacks() const;
    std::vector<std::string> modelIds() const;
    bool isMultiPrimary() const;
    bool contains(const std::string& model_id) const;

    /**
     * @brief Position of a model in the plan
     * @return Index, or entries.size() when absent
     */
    size_t indexOf(const std::string& model_id) const;
    bool empty() const { return entries.empty(); }
};

/**
 * @brief Classification plus the plan derived from it
 */
struct RoutingDecision {
    TaskClassification classification;
    ModelPlan plan;
};

/**
 * @brief Terminal state of one model's participation in a query
 */
enum class InvocationStatus {
    SUCCESS,
    TIMEOUT,
    ERROR,
    CIRCUIT_OPEN,
    CANCELLED
};

std::string invocationStatusToString(InvocationStatus status);

struct ModelInvocationResult {
    std::string model_id;                               ///< Model identifier
    InvocationStatus status = InvocationStatus::ERROR;  ///< Terminal status
    std::string content;                                ///< Output, present iff success
    double confidence = 0.0;                            ///< Model's own confidence, iff success
    ErrorCode error_code = ErrorCode::NONE;             ///< Error kind, iff failure
    std::string error_message;                          ///< Error details, iff failure
    size_t attempts = 0;                                ///< Remote attempts made
    std::chrono::milliseconds latency{0};               ///< Total time spent on this model
    std::chrono::system_clock::time_point timestamp;    ///< Completion time

    bool succeeded() const { return status == InvocationStatus::SUCCESS; }
};

enum class ResponseStatus {
    SUCCESS,
    PARTIAL,
    FAILURE
};

std::string responseStatusToString(ResponseStatus status);

/**
 * @brief Final answer handed back to the caller
 */
struct SynthesizedResponse {
    std::string content;                            ///< Final content
    double confidence = 0.0;                        ///< Aggregate confidence
    std::vector<std::string> contributing_models;   ///< Successful models used in content
    ResponseStatus status = ResponseStatus::FAILURE;
    ErrorCode error_code = ErrorCode::NONE;         ///< Stable code for failures
    std::vector<std::string> causes;                ///< Underlying causes on failure
    std::vector<std::string> tried_models;          ///< Diagnostic trace of attempted models
    TaskCategory category = TaskCategory::GENERAL_CONVERSATION; ///< Primary category
    bool from_cache = false;                        ///< Served from the request cache
    std::chrono::milliseconds total_time{0};        ///< End-to-end duration

    bool ok() const { return status != ResponseStatus::FAILURE; }
    nlohmann::json toJson() const;
};

/**
 * @brief Build a failed response with a single cause
 */
SynthesizedResponse makeFailureResponse(ErrorCode code, const std::string& cause);

enum class StreamEventType {
    CHUNK,  ///< Incremental content
    FINAL   ///< Terminal event, exactly one per stream
};

struct StreamEvent {
    StreamEventType type = StreamEventType::CHUNK;
    std::string text;                   ///< Chunk text (CHUNK only)
    SynthesizedResponse response;       ///< Aggregate result (FINAL only)

    bool isFinal() const { return type == StreamEventType::FINAL; }
};

using StreamSink = std::function<void(const StreamEvent&)>;

} // namespace Maestro
