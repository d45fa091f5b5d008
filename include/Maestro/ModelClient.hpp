// =================================================================
// include/Maestro/ModelClient.hpp
// =================================================================
// Abstract interface for a remote generative model.

#pragma once

#include "Maestro/CancellationToken.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace Maestro {

/**
 * @brief One chat message sent to a model
 */
struct ChatMessage {
    std::string role;       ///< "system", "user" or "assistant"
    std::string content;    ///< Message text
};

/**
 * @brief Prompt sent to a model: the conversation window plus the query
 */
struct Prompt {
    std::vector<ChatMessage> messages;

    /**
     * @brief Build a prompt consisting of a single user message
     */
    static Prompt fromText(const std::string& text);

    /**
     * @brief Text of the last user message, empty if none
     */
    std::string userText() const;
};

/**
 * @brief Sampling parameters for a generation request
 */
struct GenerationParams {
    double temperature = 0.7;   ///< Sampling temperature
    size_t max_tokens = 2000;   ///< Maximum tokens to generate
    double top_p = 0.9;         ///< Nucleus sampling parameter
};

/**
 * @brief Successful generation
 */
struct GenerationResult {
    std::string content;            ///< Generated text
    double confidence = 0.0;        ///< Model's own confidence in [0, 1]
    size_t tokens_generated = 0;    ///< Tokens reported by the backend
    std::string finish_reason;      ///< Backend finish reason
};

/**
 * @brief Receives incremental output while streaming
 */
using ChunkCallback = std::function<void(const std::string& chunk)>;

/**
 * @brief Uniform capability wrapper around one remote model endpoint
 *
 * Implementations throw RemoteError on failure and CancelledError when the
 * token is cancelled mid-call. They must return promptly once the token
 * asks them to stop.
 */
class ModelClient {
public:
    virtual ~ModelClient() = default;

    /**
     * @brief Get model identifier
     * @return Registry identifier of this model
     */
    virtual std::string getModelId() const = 0;

    /**
     * @brief Generate a complete response
     * @param prompt Chat messages to send
     * @param params Sampling parameters
     * @param token Cancellation and deadline for this attempt
     * @return Generation result
     */
    virtual GenerationResult generate(const Prompt& prompt,
                                      const GenerationParams& params,
                                      const CancellationToken& token) = 0;

    /**
     * @brief Generate a response, delivering chunks as they arrive
     * @param prompt Chat messages to send
     * @param params Sampling parameters
     * @param on_chunk Called for every chunk, in order
     * @param token Cancellation and deadline for this attempt
     * @return Generation result holding the full text
     */
    virtual GenerationResult stream(const Prompt& prompt,
                                    const GenerationParams& params,
                                    const ChunkCallback& on_chunk,
                                    const CancellationToken& token) = 0;
};

/**
 * @brief Confidence heuristic for backends that do not report one
 *
 * Longer answers score higher: 0.8 plus up to 0.2 at 1000 characters.
 */
double estimateConfidence(const std::string& content);

} // namespace Maestro
