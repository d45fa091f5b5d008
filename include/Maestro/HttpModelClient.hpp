// =================================================================
// include/Maestro/HttpModelClient.hpp
// =================================================================
// Model client for OpenAI-compatible chat completion endpoints.

#pragma once

#include "Maestro/Config.hpp"
#include "Maestro/CredentialProvider.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/ModelClient.hpp"
#include "nlohmann/json.hpp"
#include <memory>
#include <string>

namespace Maestro {

/**
 * @brief Talks to a remote chat completions API over HTTP(S)
 *
 * Sends the prompt messages with the model's sampling parameters and a
 * bearer credential. Non-streaming calls read choices[0].message.content;
 * streaming calls consume server-sent events until "[DONE]".
 */
class HttpModelClient : public ModelClient {
public:
    /**
     * @brief Construct a client for one configured model
     * @param config Model configuration (endpoint, model name, credential)
     * @param credentials Provider used to resolve config.credential
     */
    HttpModelClient(const ModelConfig& config, std::shared_ptr<CredentialProvider> credentials);

    std::string getModelId() const override { return m_config.id; }

    GenerationResult generate(const Prompt& prompt,
                              const GenerationParams& params,
                              const CancellationToken& token) override;

    GenerationResult stream(const Prompt& prompt,
                            const GenerationParams& params,
                            const ChunkCallback& on_chunk,
                            const CancellationToken& token) override;

    /**
     * @brief Map an HTTP status to a retry classification
     * @param status HTTP status code (non-2xx)
     */
    static RemoteErrorKind classifyStatus(int status);

    /**
     * @brief Build the JSON request body
     */
    static nlohmann::json buildRequestBody(const std::string& model_name, const Prompt& prompt,
                                           const GenerationParams& params, bool stream);

    /**
     * @brief Parse a non-streaming response body
     * @throws RemoteError (transient) if the body is malformed
     */
    static GenerationResult parseCompletionBody(const std::string& body);

    /**
     * @brief Parse one server-sent event line
     * @param line Line without the trailing newline
     * @param delta Receives content carried by the event
     * @param finish_reason Receives the finish reason when present
     * @return False once the "[DONE]" marker is seen
     * @throws RemoteError (transient) if the payload is not valid JSON
     */
    static bool parseStreamLine(const std::string& line, std::string& delta, std::string& finish_reason);

    /**
     * @brief Split an endpoint URL into scheme://host[:port] and path
     */
    static std::pair<std::string, std::string> splitEndpoint(const std::string& endpoint);

private:
    ModelConfig m_config;
    std::shared_ptr<CredentialProvider> m_credentials;
    std::string m_base_url;
    std::string m_path;

    /**
     * @brief Perform one POST, feeding body bytes to a receiver
     * @return HTTP status code
     */
    int post(const nlohmann::json& body, const CancellationToken& token,
             const std::function<bool(const char*, size_t)>& receiver,
             std::string& error_body);

    std::string resolveCredential() const;
};

} // namespace Maestro
