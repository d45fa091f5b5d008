// =================================================================
// src/Maestro/QueryTypes.cpp
// =================================================================
// Helpers for query, plan and response value types.

#include "Maestro/QueryTypes.hpp"
#include <algorithm>
#include <stdexcept>

namespace Maestro {

std::string taskCategoryToString(TaskCategory category) {
    switch (category) {
        case TaskCategory::REASONING: return "reasoning";
        case TaskCategory::CODING: return "coding";
        case TaskCategory::CREATIVE: return "creative";
        case TaskCategory::RESEARCH: return "research";
        case TaskCategory::GENERAL_CONVERSATION: return "general_conversation";
        case TaskCategory::COMPLEX_ANALYSIS: return "complex_analysis";
        default: return "general_conversation";
    }
}

TaskCategory taskCategoryFromString(const std::string& name) {
    static const std::map<std::string, TaskCategory> names = {
        {"reasoning", TaskCategory::REASONING},
        {"coding", TaskCategory::CODING},
        {"creative", TaskCategory::CREATIVE},
        {"research", TaskCategory::RESEARCH},
        {"general_conversation", TaskCategory::GENERAL_CONVERSATION},
        {"general", TaskCategory::GENERAL_CONVERSATION},
        {"complex_analysis", TaskCategory::COMPLEX_ANALYSIS},
        {"analysis", TaskCategory::COMPLEX_ANALYSIS}
    };

    auto it = names.find(name);
    if (it == names.end()) {
        throw std::invalid_argument("Unknown task category: " + name);
    }
    return it->second;
}

std::vector<TaskCategory> allTaskCategories() {
    return {
        TaskCategory::REASONING,
        TaskCategory::CODING,
        TaskCategory::CREATIVE,
        TaskCategory::RESEARCH,
        TaskCategory::GENERAL_CONVERSATION,
        TaskCategory::COMPLEX_ANALYSIS
    };
}

std::string complexityToString(Complexity complexity) {
    switch (complexity) {
        case Complexity::LOW: return "low";
        case Complexity::MEDIUM: return "medium";
        case Complexity::HIGH: return "high";
        default: return "medium";
    }
}

TaskCategory TaskClassification::primary() const {
    return scores.empty() ? TaskCategory::GENERAL_CONVERSATION : scores.front().category;
}

double TaskClassification::primaryConfidence() const {
    return scores.empty() ? 0.0 : scores.front().confidence;
}

double TaskClassification::confidenceFor(TaskCategory category) const {
    for (const auto& score : scores) {
        if (score.category == category) {
            return score.confidence;
        }
    }
    return 0.0;
}

std::vector<std::string> ModelPlan::primaries() const {
    std::vector<std::string> ids;
    for (const auto& entry : entries) {
        if (entry.role == PlanRole::PRIMARY) {
            ids.push_back(entry.model_id);
        }
    }
    return ids;
}

std::vector<std::string> ModelPlan::fallbacks() const {
    std::vector<std::string> ids;
    for (const auto& entry : entries) {
        if (entry.role == PlanRole::FALLBACK) {
            ids.push_back(entry.model_id);
        }
    }
    return ids;
}

std::vector<std::string> ModelPlan::modelIds() const {
    std::vector<std::string> ids;
    ids.reserve(entries.size());
    for (const auto& entry : entries) {
        ids.push_back(entry.model_id);
    }
    return ids;
}

bool ModelPlan::isMultiPrimary() const {
    return std::count_if(entries.begin(), entries.end(), [](const PlanEntry& e) {
        return e.role == PlanRole::PRIMARY;
    }) > 1;
}

bool ModelPlan::contains(const std::string& model_id) const {
    return indexOf(model_id) < entries.size();
}

size_t ModelPlan::indexOf(const std::string& model_id) const {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].model_id == model_id) {
            return i;
        }
    }
    return entries.size();
}

std::string invocationStatusToString(InvocationStatus status) {
    switch (status) {
        case InvocationStatus::SUCCESS: return "success";
        case InvocationStatus::TIMEOUT: return "timeout";
        case InvocationStatus::ERROR: return "error";
        case InvocationStatus::CIRCUIT_OPEN: return "circuit_open";
        case InvocationStatus::CANCELLED: return "cancelled";
        default: return "error";
    }
}

std::string responseStatusToString(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::SUCCESS: return "success";
        case ResponseStatus::PARTIAL: return "partial";
        case ResponseStatus::FAILURE: return "failure";
        default: return "failure";
    }
}

nlohmann::json SynthesizedResponse::toJson() const {
    nlohmann::json j;
    j["status"] = responseStatusToString(status);
    j["content"] = content;
    j["confidence"] = confidence;
    j["category"] = taskCategoryToString(category);
    j["models"] = contributing_models;
    j["tried_models"] = tried_models;
    j["from_cache"] = from_cache;
    j["total_time_ms"] = total_time.count();
    if (status == ResponseStatus::FAILURE || error_code != ErrorCode::NONE) {
        j["error"] = {
            {"code", errorCodeToString(error_code)},
            {"client_error", isClientError(error_code)},
            {"causes", causes}
        };
    }
    return j;
}

SynthesizedResponse makeFailureResponse(ErrorCode code, const std::string& cause) {
    SynthesizedResponse response;
    response.status = ResponseStatus::FAILURE;
    response.error_code = code;
    response.causes.push_back(cause);
    return response;
}

} // namespace Maestro
