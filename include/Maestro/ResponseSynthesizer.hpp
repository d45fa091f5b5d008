// =================================================================
// include/Maestro/ResponseSynthesizer.hpp
// =================================================================
// Merges model outputs into a single response, batch or streaming.

#pragma once

#include "Maestro/Config.hpp"
#include "Maestro/ModelRegistry.hpp"
#include "Maestro/QueryTypes.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Maestro {

/**
 * @brief Incremental output from one model
 */
struct StreamChunk {
    std::string model_id;   ///< Producing model
    std::string text;       ///< New text (may be empty on the final chunk)
    bool final = false;     ///< The model has finished, successfully or not
};

/**
 * @brief Whether to forward text to the caller
 */
struct MergeOutcome {
    bool emit = false;      ///< True when text should be emitted
    std::string text;       ///< Text to emit
};

/**
 * @brief Per-stream merge buffers
 */
struct StreamMergeState {
    bool multi_model = false;                       ///< Buffer to sentence boundaries when true
    std::map<std::string, std::string> pending;     ///< Unemitted text per model
    std::set<std::string> finished;                 ///< Models that sent their final chunk
    std::string last_emitted_model;                 ///< Model of the previous emission
    size_t emitted_chars = 0;                       ///< Characters forwarded so far
};

/**
 * @brief Combines possibly partial and conflicting outputs
 *
 * Batch rules: a single success passes through unchanged; near-duplicate
 * successes collapse to the most confident one; otherwise outputs are
 * combined with the strategy configured for the category (attributed
 * concatenation by default) and their confidences averaged, weighted by
 * declared reliability and latency rank.
 *
 * Streams emit attributed text as it arrives; the final response always
 * comes from synthesize().
 */
class ResponseSynthesizer {
public:
    /**
     * @brief Constructor
     * @param registry Optional source of declared reliabilities
     * @param config Synthesis tuning
     */
    explicit ResponseSynthesizer(const ModelRegistry* registry = nullptr,
                                 const SynthesisConfig& config = SynthesisConfig());

    /**
     * @brief Merge complete results
     * @param plan Plan the results were produced for
     * @param results One result per attempted model
     * @return Final response; status failure with causes when nothing succeeded
     */
    SynthesizedResponse synthesize(const ModelPlan& plan,
                                   const std::vector<ModelInvocationResult>& results) const;

    /**
     * @brief Create merge state for a streaming call
     */
    StreamMergeState beginStream(const ModelPlan& plan) const;

    /**
     * @brief Merge one chunk
     *
     * Single-model streams forward every chunk immediately. Multi-model
     * streams forward whole sentences only, each run prefixed with the
     * producing model's marker, and flush the remainder on the final chunk.
     */
    MergeOutcome mergeChunk(StreamMergeState& state, const StreamChunk& chunk) const;

    /**
     * @brief Flush everything still buffered
     */
    MergeOutcome flush(StreamMergeState& state) const;

    /**
     * @brief Attribution marker placed before a model's content
     */
    static std::string attributionMarker(const std::string& model_id);

    /**
     * @brief Jaccard similarity of the word sets of two texts
     * @return Value in [0, 1]
     */
    static double calculateSimilarity(const std::string& a, const std::string& b);

    /**
     * @brief Fenced code blocks of a markdown text, fences included
     *
     * An unterminated block at the end of the text is dropped.
     */
    static std::vector<std::string> extractCodeBlocks(const std::string& text);

    /**
     * @brief Key points of a text
     *
     * A key point is a trimmed line that is a bullet or numbered list item,
     * or a complete sentence starting with an uppercase letter.
     */
    static std::vector<std::string> extractKeyPoints(const std::string& text);

    CombineStrategy strategyFor(TaskCategory category) const;

private:
    const ModelRegistry* m_registry;
    SynthesisConfig m_config;

    double reliabilityOf(const std::string& model_id) const;

    /**
     * @brief Reliability times latency-rank factor per result
     */
    std::vector<double> computeWeights(const std::vector<const ModelInvocationResult*>& successes) const;

    /**
     * @brief Apply a combining strategy to distinct successes
     * @return False when the strategy had nothing to work with
     */
    bool combine(CombineStrategy strategy, const std::vector<const ModelInvocationResult*>& successes,
                 SynthesizedResponse& response) const;

    void combineAttributed(const std::vector<const ModelInvocationResult*>& successes,
                           SynthesizedResponse& response) const;

    double weightedConfidence(const std::vector<const ModelInvocationResult*>& contributors) const;

    std::string takeForEmission(StreamMergeState& state, const std::string& model_id,
                                const std::string& text) const;
};

} // namespace Maestro
