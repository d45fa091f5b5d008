// =================================================================
// src/Maestro/ResponseSynthesizer.cpp
// =================================================================
// Implementation of batch and streaming response synthesis.

#include "Maestro/ResponseSynthesizer.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace Maestro {

namespace {

// Index just past the last complete sentence, or npos
size_t lastSentenceBoundary(const std::string& text) {
    for (size_t i = text.size(); i-- > 0;) {
        char c = text[i];
        if (c == '\n') {
            return i + 1;
        }
        if ((c == '.' || c == '!' || c == '?') && i + 1 < text.size() &&
            std::isspace(static_cast<unsigned char>(text[i + 1]))) {
            return i + 1;
        }
    }
    return std::string::npos;
}

std::string describeFailure(const ModelInvocationResult& result) {
    std::string cause = result.model_id + ": " + invocationStatusToString(result.status);
    if (result.error_code != ErrorCode::NONE && result.error_code != ErrorCode::CIRCUIT_OPEN) {
        cause += " [" + errorCodeToString(result.error_code) + "]";
    }
    if (!result.error_message.empty()) {
        cause += " " + result.error_message;
    }
    if (result.attempts > 1) {
        cause += " after " + std::to_string(result.attempts) + " attempts";
    }
    return cause;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

// Length of a leading "- ", "* ", "• " or "12. " / "12) " marker, 0 when none
size_t listMarkerLength(const std::string& line) {
    static const std::vector<std::string> bullets = {"- ", "* ", "• "};
    for (const auto& bullet : bullets) {
        if (line.compare(0, bullet.size(), bullet) == 0) {
            return bullet.size();
        }
    }

    size_t digits = 0;
    while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) {
        digits++;
    }
    if (digits > 0 && digits < line.size() && (line[digits] == '.' || line[digits] == ')')) {
        return digits + 1;
    }
    return 0;
}

// Key used to spot the same point phrased with different markers or case
std::string normalizePoint(const std::string& point) {
    std::string body = trim(point.substr(listMarkerLength(point)));
    std::string normalized;
    bool space = false;
    for (unsigned char c : body) {
        if (std::isspace(c)) {
            space = !normalized.empty();
            continue;
        }
        if (space) {
            normalized += ' ';
            space = false;
        }
        normalized += static_cast<char>(std::tolower(c));
    }
    return normalized;
}

} // namespace

ResponseSynthesizer::ResponseSynthesizer(const ModelRegistry* registry, const SynthesisConfig& config)
    : m_registry(registry), m_config(config) {}

SynthesizedResponse ResponseSynthesizer::synthesize(const ModelPlan& plan,
                                                    const std::vector<ModelInvocationResult>& results) const {
    SynthesizedResponse response;
    if (!plan.empty()) {
        response.category = plan.entries.front().category;
    }

    // Work in plan order so attribution and tie-breaks are deterministic
    std::vector<const ModelInvocationResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& result : results) {
        ordered.push_back(&result);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [&plan](const ModelInvocationResult* a, const ModelInvocationResult* b) {
                         return plan.indexOf(a->model_id) < plan.indexOf(b->model_id);
                     });

    std::vector<const ModelInvocationResult*> successes;
    for (const auto* result : ordered) {
        response.tried_models.push_back(result->model_id);
        if (result->succeeded()) {
            successes.push_back(result);
        } else {
            response.causes.push_back(describeFailure(*result));
        }
    }

    if (successes.empty()) {
        response.status = ResponseStatus::FAILURE;
        response.error_code = ErrorCode::SYNTHESIS_FAILURE;
        if (response.causes.empty()) {
            response.causes.push_back("no model was attempted");
        }
        return response;
    }

    response.status = ResponseStatus::SUCCESS;
    if (plan.isMultiPrimary()) {
        for (const auto& id : plan.primaries()) {
            bool succeeded = std::any_of(successes.begin(), successes.end(),
                                         [&id](const ModelInvocationResult* r) { return r->model_id == id; });
            if (!succeeded) {
                response.status = ResponseStatus::PARTIAL;
                break;
            }
        }
    }

    if (successes.size() == 1) {
        response.content = successes.front()->content;
        response.confidence = successes.front()->confidence;
        response.contributing_models.push_back(successes.front()->model_id);
        return response;
    }

    bool near_duplicates = true;
    for (size_t i = 0; i < successes.size() && near_duplicates; ++i) {
        for (size_t j = i + 1; j < successes.size(); ++j) {
            if (calculateSimilarity(successes[i]->content, successes[j]->content) <= m_config.duplicate_threshold) {
                near_duplicates = false;
                break;
            }
        }
    }

    if (near_duplicates) {
        const ModelInvocationResult* best = successes.front();
        for (const auto* result : successes) {
            if (result->confidence > best->confidence) {
                best = result;
            }
        }
        response.content = best->content;
        response.confidence = best->confidence;
        response.contributing_models.push_back(best->model_id);
        return response;
    }

    CombineStrategy strategy = strategyFor(response.category);
    if (!combine(strategy, successes, response)) {
        combineAttributed(successes, response);
    }
    return response;
}

CombineStrategy ResponseSynthesizer::strategyFor(TaskCategory category) const {
    auto it = m_config.strategies.find(category);
    return it == m_config.strategies.end() ? CombineStrategy::ATTRIBUTED : it->second;
}

bool ResponseSynthesizer::combine(CombineStrategy strategy,
                                  const std::vector<const ModelInvocationResult*>& successes,
                                  SynthesizedResponse& response) const {
    // Most confident first; ties keep plan order
    std::vector<const ModelInvocationResult*> ranked = successes;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ModelInvocationResult* a, const ModelInvocationResult* b) {
                         return a->confidence > b->confidence;
                     });

    switch (strategy) {
        case CombineStrategy::ATTRIBUTED:
            combineAttributed(successes, response);
            return true;

        case CombineStrategy::CODE_BLOCKS: {
            const ModelInvocationResult* best = ranked.front();
            std::vector<const ModelInvocationResult*> contributors{best};

            std::set<std::string> seen;
            for (const auto& block : extractCodeBlocks(best->content)) {
                seen.insert(block);
            }

            std::vector<std::string> alternatives;
            for (size_t i = 1; i < ranked.size(); ++i) {
                bool contributed = false;
                for (const auto& block : extractCodeBlocks(ranked[i]->content)) {
                    if (seen.insert(block).second) {
                        alternatives.push_back(attributionMarker(ranked[i]->model_id) + "\n" + block);
                        contributed = true;
                    }
                }
                if (contributed) {
                    contributors.push_back(ranked[i]);
                }
            }

            response.content = best->content;
            if (!alternatives.empty()) {
                response.content += "\n\nAlternative implementations:";
                for (const auto& alternative : alternatives) {
                    response.content += "\n\n" + alternative;
                }
            }
            for (const auto* result : contributors) {
                response.contributing_models.push_back(result->model_id);
            }
            response.confidence = weightedConfidence(contributors);
            return true;
        }

        case CombineStrategy::KEY_POINTS: {
            std::vector<std::string> points;
            std::vector<const ModelInvocationResult*> contributors;
            std::unordered_set<std::string> seen;

            for (const auto* result : ranked) {
                bool contributed = false;
                for (const auto& point : extractKeyPoints(result->content)) {
                    if (seen.insert(normalizePoint(point)).second) {
                        points.push_back(point);
                        contributed = true;
                    }
                }
                if (contributed) {
                    contributors.push_back(result);
                }
            }

            if (points.empty()) {
                return false;
            }

            std::ostringstream content;
            for (size_t i = 0; i < points.size(); ++i) {
                if (i > 0) {
                    content << "\n";
                }
                content << points[i];
            }
            response.content = content.str();
            for (const auto* result : contributors) {
                response.contributing_models.push_back(result->model_id);
            }
            response.confidence = weightedConfidence(contributors);
            return true;
        }
    }
    return false;
}

void ResponseSynthesizer::combineAttributed(const std::vector<const ModelInvocationResult*>& successes,
                                            SynthesizedResponse& response) const {
    std::ostringstream content;
    for (size_t i = 0; i < successes.size(); ++i) {
        if (i > 0) {
            content << "\n\n";
        }
        content << attributionMarker(successes[i]->model_id) << "\n" << successes[i]->content;
        response.contributing_models.push_back(successes[i]->model_id);
    }
    response.content = content.str();
    response.confidence = weightedConfidence(successes);
}

double ResponseSynthesizer::weightedConfidence(const std::vector<const ModelInvocationResult*>& contributors) const {
    if (contributors.empty()) {
        return 0.0;
    }

    auto weights = computeWeights(contributors);
    double weight_sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    double confidence = 0.0;
    for (size_t i = 0; i < contributors.size(); ++i) {
        confidence += weight_sum > 0.0 ? weights[i] * contributors[i]->confidence
                                       : contributors[i]->confidence;
    }
    return weight_sum > 0.0 ? confidence / weight_sum
                            : confidence / static_cast<double>(contributors.size());
}

StreamMergeState ResponseSynthesizer::beginStream(const ModelPlan& plan) const {
    StreamMergeState state;
    state.multi_model = plan.isMultiPrimary();
    return state;
}

MergeOutcome ResponseSynthesizer::mergeChunk(StreamMergeState& state, const StreamChunk& chunk) const {
    MergeOutcome outcome;

    if (!state.multi_model) {
        if (chunk.final) {
            state.finished.insert(chunk.model_id);
        }
        if (chunk.text.empty()) {
            return outcome;
        }
        state.last_emitted_model = chunk.model_id;
        state.emitted_chars += chunk.text.size();
        outcome.emit = true;
        outcome.text = chunk.text;
        return outcome;
    }

    auto& buffer = state.pending[chunk.model_id];
    buffer += chunk.text;

    std::string ready;
    if (chunk.final) {
        state.finished.insert(chunk.model_id);
        ready.swap(buffer);
    } else {
        size_t cut = lastSentenceBoundary(buffer);
        if (cut != std::string::npos) {
            ready = buffer.substr(0, cut);
            buffer.erase(0, cut);
        }
    }

    if (ready.empty()) {
        return outcome;
    }

    outcome.emit = true;
    outcome.text = takeForEmission(state, chunk.model_id, ready);
    return outcome;
}

MergeOutcome ResponseSynthesizer::flush(StreamMergeState& state) const {
    MergeOutcome outcome;
    for (auto& [model_id, buffer] : state.pending) {
        if (buffer.empty()) {
            continue;
        }
        outcome.text += state.multi_model ? takeForEmission(state, model_id, buffer) : buffer;
        buffer.clear();
    }
    outcome.emit = !outcome.text.empty();
    return outcome;
}

std::string ResponseSynthesizer::attributionMarker(const std::string& model_id) {
    return "[" + model_id + "]";
}

double ResponseSynthesizer::calculateSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    auto toWords = [](std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        static const std::regex word_regex(R"(\w+)");
        std::unordered_set<std::string> words;
        for (std::sregex_iterator it(text.begin(), text.end(), word_regex), end; it != end; ++it) {
            words.insert(it->str());
        }
        return words;
    };

    auto set1 = toWords(a);
    auto set2 = toWords(b);
    if (set1.empty() || set2.empty()) {
        return 0.0;
    }

    size_t intersection = 0;
    for (const auto& word : set1) {
        if (set2.count(word)) {
            intersection++;
        }
    }
    size_t union_size = set1.size() + set2.size() - intersection;

    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::vector<std::string> ResponseSynthesizer::extractCodeBlocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::istringstream stream(text);
    std::string line;
    std::string current;
    bool in_block = false;

    while (std::getline(stream, line)) {
        bool fence = line.compare(0, 3, "```") == 0;
        if (!in_block) {
            if (fence) {
                in_block = true;
                current = line;
            }
            continue;
        }
        current += "\n" + line;
        if (fence) {
            blocks.push_back(current);
            current.clear();
            in_block = false;
        }
    }
    return blocks;
}

std::vector<std::string> ResponseSynthesizer::extractKeyPoints(const std::string& text) {
    std::vector<std::string> points;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        std::string point = trim(line);
        if (point.empty()) {
            continue;
        }
        unsigned char first = static_cast<unsigned char>(point.front());
        char last = point.back();
        if (listMarkerLength(point) > 0 ||
            (std::isupper(first) && (last == '.' || last == '!' || last == '?'))) {
            points.push_back(point);
        }
    }
    return points;
}

double ResponseSynthesizer::reliabilityOf(const std::string& model_id) const {
    if (m_registry) {
        if (auto config = m_registry->getModelConfig(model_id)) {
            return config->reliability;
        }
    }
    return m_config.default_reliability;
}

std::vector<double> ResponseSynthesizer::computeWeights(
    const std::vector<const ModelInvocationResult*>& successes) const {

    std::vector<size_t> by_latency(successes.size());
    std::iota(by_latency.begin(), by_latency.end(), 0);
    std::stable_sort(by_latency.begin(), by_latency.end(), [&successes](size_t a, size_t b) {
        return successes[a]->latency < successes[b]->latency;
    });

    // Fastest gets factor 1.0, slowest 0.5
    std::vector<double> weights(successes.size(), 0.0);
    const size_t n = successes.size();
    for (size_t rank = 0; rank < n; ++rank) {
        size_t index = by_latency[rank];
        double factor = n > 1 ? 1.0 - 0.5 * static_cast<double>(rank) / static_cast<double>(n - 1) : 1.0;
        weights[index] = reliabilityOf(successes[index]->model_id) * factor;
    }
    return weights;
}

std::string ResponseSynthesizer::takeForEmission(StreamMergeState& state, const std::string& model_id,
                                                 const std::string& text) const {
    std::string out;
    if (state.last_emitted_model != model_id) {
        if (state.emitted_chars > 0) {
            out += "\n\n";
        }
        out += attributionMarker(model_id) + "\n";
        state.last_emitted_model = model_id;
    }
    out += text;
    state.emitted_chars += out.size();
    return out;
}

} // namespace Maestro
