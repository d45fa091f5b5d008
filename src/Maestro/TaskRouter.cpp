// =================================================================
// src/Maestro/TaskRouter.cpp
// =================================================================
// Implementation of query classification and plan construction.

#include "Maestro/TaskRouter.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace Maestro {

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

size_t countWords(const std::string& text) {
    std::istringstream stream(text);
    size_t count = 0;
    std::string word;
    while (stream >> word) {
        count++;
    }
    return count;
}

} // namespace

// --- KeywordScorer ---------------------------------------------------

KeywordScorer::KeywordScorer(const CategorySignatures& overrides) {
    CategorySignatures signatures = defaultSignatures();
    for (const auto& [category, patterns] : overrides) {
        signatures[category] = patterns;
    }

    for (const auto& [category, patterns] : signatures) {
        auto& compiled = m_patterns[category];
        for (const auto& pattern : patterns) {
            try {
                compiled.push_back({std::regex(pattern.pattern, std::regex::ECMAScript | std::regex::icase),
                                    pattern.weight});
            } catch (const std::regex_error& e) {
                throw ConfigError("Invalid signature pattern for " + taskCategoryToString(category) +
                                  ": " + pattern.pattern + " (" + e.what() + ")");
            }
        }
    }
}

std::map<TaskCategory, double> KeywordScorer::score(const std::string& text) const {
    std::map<TaskCategory, double> scores;
    for (const auto& [category, patterns] : m_patterns) {
        double total = 0.0;
        for (const auto& pattern : patterns) {
            if (std::regex_search(text, pattern.regex)) {
                total += pattern.weight;
            }
        }
        scores[category] = std::min(total, 1.0);
    }
    return scores;
}

CategorySignatures KeywordScorer::defaultSignatures() {
    CategorySignatures signatures;

    signatures[TaskCategory::REASONING] = {
        {R"(\b(explain|why|reason|reasoning|logic|logical|prove|proof|understand)\b)", 0.6},
        {R"(\b(step by step|derive|deduce|infer|implication|because)\b)", 0.3},
        {R"(\b(math|equation|calculate|solve|puzzle|riddle)\b)", 0.3}
    };

    signatures[TaskCategory::CODING] = {
        {R"(\b(code|function|class|method|implement|script|api|program|programming|debug|compile|refactor)\b)", 0.5},
        {R"(\b(python|javascript|typescript|java|c\+\+|rust|golang|sql|html|css|react)\b)", 0.4},
        {R"(\b(bug|error|syntax|runtime|exception|segfault|stack trace)\b)", 0.3},
        {R"(\b(algorithm|quicksort|mergesort|sort|sorting|recursion|data structure|complexity)\b)", 0.4}
    };

    signatures[TaskCategory::CREATIVE] = {
        {R"(\b(write|story|poem|article|essay|lyrics|novel|script for)\b)", 0.5},
        {R"(\b(creative|imagine|imagination|artistic|original|fiction)\b)", 0.4},
        {R"(\b(brainstorm|ideate|inspire|slogan|tagline)\b)", 0.4}
    };

    signatures[TaskCategory::RESEARCH] = {
        {R"(\b(research|investigate|find|search|explore|discover|sources?)\b)", 0.5},
        {R"(\b(information|facts|reference|study|paper|citation|literature)\b)", 0.3},
        {R"(\b(latest|recent|current|news|update)\b)", 0.3}
    };

    signatures[TaskCategory::GENERAL_CONVERSATION] = {
        {R"(\b(hello|hi|hey|thanks|thank you|help|question|tell me|chat)\b)", 0.4},
        {R"(\b(general|basic|simple|quick)\b)", 0.2}
    };

    signatures[TaskCategory::COMPLEX_ANALYSIS] = {
        {R"(\b(analy[sz]e|analysis|compare|comparison|evaluate|assess|trade-?offs?)\b)", 0.5},
        {R"(\b(architecture|system design|comprehensive|in-depth|detailed|pros and cons)\b)", 0.4},
        {R"(\b(data|statistics|metrics|performance|trend|pattern)\b)", 0.2}
    };

    return signatures;
}

// --- TaskRouter ------------------------------------------------------

TaskRouter::TaskRouter(const RoutingConfig& config,
                       const ModelRegistry& registry,
                       const PerformanceMonitor* monitor,
                       std::shared_ptr<ClassificationScorer> scorer)
    : m_config(config), m_registry(registry), m_monitor(monitor), m_scorer(std::move(scorer)) {
    if (!m_scorer) {
        m_scorer = std::make_shared<KeywordScorer>(m_config.signatures);
    }
}

RoutingDecision TaskRouter::classifyAndPlan(const Query& query) {
    RoutingDecision decision;
    decision.classification = classify(query.text, query.context);
    decision.plan = buildPlan(decision.classification);

    Logger::getInstance().logRoutingDecision(taskCategoryToString(decision.classification.primary()),
                                             decision.classification.primaryConfidence(),
                                             decision.plan.modelIds());
    return decision;
}

TaskClassification TaskRouter::classify(const std::string& text,
                                        const std::map<std::string, std::string>& context) {
    if (text.empty() || isBlank(text)) {
        throw ClassificationError("Cannot classify an empty query");
    }

    std::string lower = toLower(text);
    auto raw_scores = m_scorer->score(lower);

    TaskClassification classification;
    for (const auto& category : allTaskCategories()) {
        auto it = raw_scores.find(category);
        if (it != raw_scores.end() && it->second > 0.0) {
            classification.scores.push_back({category, std::clamp(it->second, 0.0, 1.0)});
        }
    }

    // Ties keep category declaration order
    std::stable_sort(classification.scores.begin(), classification.scores.end(),
                     [](const CategoryScore& a, const CategoryScore& b) {
                         return a.confidence > b.confidence;
                     });

    if (classification.scores.empty()) {
        classification.scores.push_back({TaskCategory::GENERAL_CONVERSATION, 0.5});
    }

    classification.complexity = estimateComplexity(text);
    classification.context_requirements = analyzeContextRequirements(lower, context);

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_classification_counts[classification.primary()]++;
    }

    return classification;
}

ModelPlan TaskRouter::buildPlan(const TaskClassification& classification) const {
    const TaskCategory primary_category = classification.primary();
    const bool multi_model = m_config.multi_model_categories.count(primary_category) > 0;

    std::vector<std::pair<std::string, TaskCategory>> chain;
    std::set<std::string> seen;
    auto push = [&](const std::string& id, TaskCategory category) {
        if (seen.insert(id).second) {
            chain.emplace_back(id, category);
        }
    };

    auto primary_candidates = rankedCandidates(primary_category);
    if (!primary_candidates.empty()) {
        push(primary_candidates.front(), primary_category);
    }

    // An uncertain classification promotes the runner-up specialist
    if (!multi_model && classification.primaryConfidence() < m_config.confidence_threshold &&
        classification.scores.size() > 1) {
        TaskCategory runner_up = classification.scores[1].category;
        for (const auto& id : rankedCandidates(runner_up)) {
            if (!seen.count(id)) {
                push(id, runner_up);
                break;
            }
        }
    }

    for (const auto& id : primary_candidates) {
        push(id, primary_category);
    }
    const size_t primary_category_count = chain.size();

    for (size_t i = 1; i < classification.scores.size(); ++i) {
        TaskCategory category = classification.scores[i].category;
        for (const auto& id : rankedCandidates(category)) {
            push(id, category);
        }
    }

    if (!m_config.default_model.empty() && m_registry.isAvailable(m_config.default_model)) {
        push(m_config.default_model, TaskCategory::GENERAL_CONVERSATION);
    }

    if (chain.empty()) {
        throw ClassificationError("No eligible model for category " + taskCategoryToString(primary_category));
    }

    size_t primary_count = 1;
    if (multi_model) {
        primary_count = std::max<size_t>(primary_category_count, 2);
        primary_count = std::min(primary_count, std::max<size_t>(m_config.max_multi_primaries, 2));
        primary_count = std::min(primary_count, chain.size());
    }

    ModelPlan plan;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i < primary_count) {
            plan.entries.push_back({chain[i].first, PlanRole::PRIMARY, chain[i].second});
        } else if (i - primary_count < m_config.max_fallbacks) {
            plan.entries.push_back({chain[i].first, PlanRole::FALLBACK, chain[i].second});
        }
    }

    return plan;
}

std::vector<std::string> TaskRouter::rankedCandidates(TaskCategory category) const {
    struct Candidate {
        std::string id;
        double rank;
        std::optional<std::chrono::milliseconds> latency;
    };

    std::vector<Candidate> candidates;
    for (const auto& id : m_registry.capableModels(category)) {
        if (!m_registry.isAvailable(id)) {
            continue;
        }
        auto config = m_registry.getModelConfig(id);
        double rank = config ? static_cast<double>(config->rankFor(category)) : 0.0;
        Candidate candidate{id, rank + rankAdjustment(id, category), std::nullopt};
        if (m_monitor) {
            candidate.latency = m_monitor->recentLatency(id, m_config.latency_window);
        }
        candidates.push_back(candidate);
    }

    // capableModels() is already in declaration order within a rank
    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.rank != b.rank) {
            return a.rank > b.rank;
        }
        if (a.latency && b.latency) {
            return *a.latency < *b.latency;
        }
        return a.latency.has_value() && !b.latency.has_value();
    });

    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        ids.push_back(candidate.id);
    }
    return ids;
}

Complexity TaskRouter::estimateComplexity(const std::string& text) {
    static const std::vector<std::string> high_indicators = {
        "complex", "advanced", "sophisticated", "optimize", "architecture",
        "system", "integration", "comprehensive", "detailed", "thorough"
    };
    static const std::vector<std::string> medium_indicators = {
        "multiple", "several", "various", "different", "compare",
        "analyze", "implement", "design", "create"
    };

    std::string lower = toLower(text);
    auto fraction = [&lower](const std::vector<std::string>& indicators) {
        size_t hits = std::count_if(indicators.begin(), indicators.end(), [&lower](const std::string& word) {
            return lower.find(word) != std::string::npos;
        });
        return static_cast<double>(hits) / indicators.size();
    };

    double length_score = std::min(static_cast<double>(countWords(text)) / 50.0, 1.0);
    double total = (length_score + fraction(high_indicators) * 2.0 + fraction(medium_indicators)) / 4.0;

    if (total > 0.6) {
        return Complexity::HIGH;
    }
    if (total > 0.3) {
        return Complexity::MEDIUM;
    }
    return Complexity::LOW;
}

std::vector<std::string> TaskRouter::analyzeContextRequirements(const std::string& text,
                                                                const std::map<std::string, std::string>& context) {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> indicators = {
        {"previous", {"previous", "before", "last time", "earlier", "continue"}},
        {"code", {"code", "function", "class", "implementation", "script"}},
        {"system", {"system", "architecture", "design", "structure"}},
        {"user", {"my ", "preference", "setting", "profile", "remember"}}
    };

    std::string lower = toLower(text);
    std::vector<std::string> required;
    for (const auto& [type, words] : indicators) {
        bool mentioned = std::any_of(words.begin(), words.end(), [&lower](const std::string& word) {
            return lower.find(word) != std::string::npos;
        });
        if (mentioned || context.count(type)) {
            required.push_back(type);
        }
    }
    return required;
}

std::map<TaskCategory, size_t> TaskRouter::getClassificationStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_classification_counts;
}

void TaskRouter::resetStats() {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_classification_counts.clear();
}

void TaskRouter::recordOutcome(const std::string& model_id, TaskCategory category, bool success, double quality) {
    if (m_config.adaptive_step <= 0.0) {
        return;
    }
    auto config = m_registry.getModelConfig(model_id);
    if (!config || !config->hasCapability(category)) {
        return;
    }

    double delta = success ? m_config.adaptive_step * std::clamp(quality, 0.0, 1.0)
                           : -2.0 * m_config.adaptive_step;

    double adjusted = 0.0;
    {
        std::lock_guard<std::mutex> lock(m_adjustment_mutex);
        double& current = m_rank_adjustments[{model_id, category}];
        current = std::clamp(current + delta, -m_config.max_rank_adjustment, m_config.max_rank_adjustment);
        adjusted = current;
    }

    LOG_DEBUG("TaskRouter", model_id + " rank adjustment for " + taskCategoryToString(category) +
                                " is now " + std::to_string(adjusted));
}

double TaskRouter::rankAdjustment(const std::string& model_id, TaskCategory category) const {
    std::lock_guard<std::mutex> lock(m_adjustment_mutex);
    auto it = m_rank_adjustments.find({model_id, category});
    return it == m_rank_adjustments.end() ? 0.0 : it->second;
}

} // namespace Maestro
