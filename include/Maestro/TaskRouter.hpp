// =================================================================
// include/Maestro/TaskRouter.hpp
// =================================================================
// Query classification and model plan construction.

#pragma once

#include "Maestro/Config.hpp"
#include "Maestro/ModelRegistry.hpp"
#include "Maestro/PerformanceMonitor.hpp"
#include "Maestro/QueryTypes.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace Maestro {

/**
 * @brief Scores query text against task categories
 *
 * Scores are independent per category and lie in [0, 1].
 */
class ClassificationScorer {
public:
    virtual ~ClassificationScorer() = default;

    virtual std::map<TaskCategory, double> score(const std::string& text) const = 0;
};

/**
 * @brief Weighted keyword signatures, deterministic
 *
 * A category's score is the sum of the weights of its patterns that
 * match the text, capped at 1.0.
 */
class KeywordScorer : public ClassificationScorer {
public:
    /**
     * @brief Construct from signatures
     * @param overrides Categories present here replace the defaults
     */
    explicit KeywordScorer(const CategorySignatures& overrides = CategorySignatures());

    std::map<TaskCategory, double> score(const std::string& text) const override;

    /**
     * @brief Built-in signatures for every category
     */
    static CategorySignatures defaultSignatures();

private:
    struct CompiledPattern {
        std::regex regex;
        double weight;
    };

    std::map<TaskCategory, std::vector<CompiledPattern>> m_patterns;
};

/**
 * @brief Classifies queries and turns classifications into model plans
 *
 * Plans only name models whose circuit is not open at build time. Models
 * are ordered by specialization rank plus its learned adjustment, then by
 * recent latency, then by registry declaration order.
 */
class TaskRouter {
public:
    /**
     * @brief Construct a new TaskRouter
     * @param config Routing tables
     * @param registry Source of capabilities and circuit state
     * @param monitor Optional source of recent latencies for tie-breaks
     * @param scorer Optional scorer, KeywordScorer when null
     */
    TaskRouter(const RoutingConfig& config,
               const ModelRegistry& registry,
               const PerformanceMonitor* monitor = nullptr,
               std::shared_ptr<ClassificationScorer> scorer = nullptr);

    /**
     * @brief Classify a query and build its plan
     * @param query Incoming query
     * @return Classification and plan
     * @throws ClassificationError when the text is empty or no model is eligible
     */
    RoutingDecision classifyAndPlan(const Query& query);

    /**
     * @brief Classify query text
     * @throws ClassificationError when the text is empty
     */
    TaskClassification classify(const std::string& text,
                                const std::map<std::string, std::string>& context = {});

    /**
     * @brief Build a plan from an existing classification
     * @throws ClassificationError when no model is eligible
     */
    ModelPlan buildPlan(const TaskClassification& classification) const;

    /**
     * @brief Estimate complexity from length and indicator words
     */
    static Complexity estimateComplexity(const std::string& text);

    /**
     * @brief Detect which kinds of context a query refers to
     * @return Subset of "previous", "code", "system", "user"
     */
    static std::vector<std::string> analyzeContextRequirements(const std::string& text,
                                                               const std::map<std::string, std::string>& context);

    /**
     * @brief Get classification statistics
     * @return Map of primary categories to classification counts
     */
    std::map<TaskCategory, size_t> getClassificationStats() const;

    void resetStats();

    /**
     * @brief Feed a model outcome back into its routing rank
     *
     * A success raises the model's rank for the category by
     * adaptive_step scaled by quality; a failure lowers it by twice the
     * step. The accumulated adjustment stays within max_rank_adjustment.
     * Ignored for models not capable of the category.
     *
     * @param model_id Model identifier
     * @param category Category the model was selected for
     * @param success Whether the model produced an answer
     * @param quality Answer confidence in [0, 1], ignored on failure
     */
    void recordOutcome(const std::string& model_id, TaskCategory category, bool success, double quality);

    /**
     * @brief Current learned adjustment, 0 when none
     */
    double rankAdjustment(const std::string& model_id, TaskCategory category) const;

    const RoutingConfig& getConfig() const { return m_config; }

private:
    RoutingConfig m_config;
    const ModelRegistry& m_registry;
    const PerformanceMonitor* m_monitor;
    std::shared_ptr<ClassificationScorer> m_scorer;

    std::map<TaskCategory, size_t> m_classification_counts;
    mutable std::mutex m_stats_mutex;

    std::map<std::pair<std::string, TaskCategory>, double> m_rank_adjustments;
    mutable std::mutex m_adjustment_mutex;

    /**
     * @brief Available models for a category in plan order
     */
    std::vector<std::string> rankedCandidates(TaskCategory category) const;
};

} // namespace Maestro
