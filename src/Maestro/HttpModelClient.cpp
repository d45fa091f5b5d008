// =================================================================
// src/Maestro/HttpModelClient.cpp
// =================================================================
// HTTP chat completions client with server-sent event streaming.

#include "Maestro/HttpModelClient.hpp"
#include "Maestro/Logger.hpp"
#include "httplib.h"
#include <algorithm>
#include <exception>

namespace Maestro {

namespace {

const char* kDefaultPath = "/v1/chat/completions";

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string excerpt(const std::string& body) {
    const size_t limit = 200;
    return body.size() <= limit ? body : body.substr(0, limit) + "...";
}

} // namespace

HttpModelClient::HttpModelClient(const ModelConfig& config, std::shared_ptr<CredentialProvider> credentials)
    : m_config(config), m_credentials(std::move(credentials)) {
    auto parts = splitEndpoint(m_config.endpoint);
    m_base_url = parts.first;
    m_path = parts.second;

    Logger::getInstance().debug("HttpModelClient", "Configured client for " + m_config.id,
                                m_base_url + m_path + " (" + m_config.model_name + ")");
}

GenerationResult HttpModelClient::generate(const Prompt& prompt,
                                           const GenerationParams& params,
                                           const CancellationToken& token) {
    std::string body_text;
    std::string error_body;

    int status = post(buildRequestBody(m_config.model_name, prompt, params, false), token,
                      [&body_text](const char* data, size_t length) {
                          body_text.append(data, length);
                          return true;
                      },
                      error_body);

    if (status < 200 || status >= 300) {
        throw RemoteError(classifyStatus(status),
                          m_config.id + " returned HTTP " + std::to_string(status) + ": " + excerpt(error_body),
                          status);
    }

    return parseCompletionBody(body_text);
}

GenerationResult HttpModelClient::stream(const Prompt& prompt,
                                         const GenerationParams& params,
                                         const ChunkCallback& on_chunk,
                                         const CancellationToken& token) {
    GenerationResult result;
    std::string buffer;
    std::string error_body;
    bool done = false;
    std::exception_ptr failure;

    auto receiver = [&](const char* data, size_t length) {
        buffer.append(data, length);

        size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (done) {
                continue;
            }

            try {
                std::string delta;
                if (!parseStreamLine(line, delta, result.finish_reason)) {
                    done = true;
                    continue;
                }
                if (!delta.empty()) {
                    result.content += delta;
                    result.tokens_generated++;
                    on_chunk(delta);
                }
            } catch (const std::exception&) {
                failure = std::current_exception();
                return false;
            }
        }
        return true;
    };

    int status = 0;
    try {
        status = post(buildRequestBody(m_config.model_name, prompt, params, true), token, receiver, error_body);
    } catch (const RemoteError&) {
        // A receiver failure aborts the transfer; report the original cause
        if (failure) {
            std::rethrow_exception(failure);
        }
        throw;
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    if (status < 200 || status >= 300) {
        throw RemoteError(classifyStatus(status),
                          m_config.id + " returned HTTP " + std::to_string(status) + ": " + excerpt(error_body),
                          status);
    }

    if (!done && result.content.empty()) {
        throw RemoteError(RemoteErrorKind::TRANSIENT, m_config.id + " stream ended without content");
    }

    result.confidence = estimateConfidence(result.content);
    return result;
}

int HttpModelClient::post(const nlohmann::json& body, const CancellationToken& token,
                          const std::function<bool(const char*, size_t)>& receiver,
                          std::string& error_body) {
    auto timeout = std::min(token.remaining(m_config.timeout), m_config.timeout);
    if (timeout.count() <= 0) {
        throw RemoteError(RemoteErrorKind::TRANSIENT, "deadline exceeded before contacting " + m_config.id);
    }
    const time_t seconds = static_cast<time_t>(timeout.count() / 1000);
    const time_t micros = static_cast<time_t>((timeout.count() % 1000) * 1000);

    httplib::Client client(m_base_url);
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    client.set_write_timeout(seconds, micros);

    httplib::Request req;
    req.method = "POST";
    req.path = m_path;
    req.headers = {
        {"Content-Type", "application/json"},
        {"Accept", body.value("stream", false) ? "text/event-stream" : "application/json"}
    };

    std::string secret = resolveCredential();
    if (!secret.empty()) {
        req.headers.emplace("Authorization", "Bearer " + secret);
    }
    req.body = body.dump();

    int status = 0;
    req.response_handler = [&status, &token](const httplib::Response& response) {
        status = response.status;
        return !token.shouldStop();
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (token.shouldStop()) {
            return false;
        }
        if (status >= 200 && status < 300) {
            return receiver(data, length);
        }
        error_body.append(data, length);
        return true;
    };

    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    if (!client.send(req, res, err)) {
        if (token.isCancelled()) {
            throw CancelledError("request to " + m_config.id + " cancelled");
        }
        if (token.isExpired()) {
            throw RemoteError(RemoteErrorKind::TRANSIENT, "request to " + m_config.id + " exceeded its deadline");
        }
        throw RemoteError(RemoteErrorKind::TRANSIENT,
                          "request to " + m_config.id + " failed: " + httplib::to_string(err));
    }

    return status != 0 ? status : res.status;
}

std::string HttpModelClient::resolveCredential() const {
    if (m_config.credential.empty()) {
        return "";
    }
    if (!m_credentials) {
        throw CredentialError("No credential provider for " + m_config.id);
    }
    return m_credentials->resolve(m_config.credential);
}

RemoteErrorKind HttpModelClient::classifyStatus(int status) {
    if (status == 408 || status == 425 || status == 429 || status >= 500) {
        return RemoteErrorKind::TRANSIENT;
    }
    return RemoteErrorKind::PERMANENT;
}

nlohmann::json HttpModelClient::buildRequestBody(const std::string& model_name, const Prompt& prompt,
                                                 const GenerationParams& params, bool stream) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : prompt.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }

    return {
        {"model", model_name},
        {"messages", messages},
        {"temperature", params.temperature},
        {"max_tokens", params.max_tokens},
        {"top_p", params.top_p},
        {"stream", stream}
    };
}

GenerationResult HttpModelClient::parseCompletionBody(const std::string& body) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw RemoteError(RemoteErrorKind::TRANSIENT, std::string("malformed response body: ") + e.what());
    }

    if (!json.is_object() || !json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw RemoteError(RemoteErrorKind::TRANSIENT, "response contains no choices");
    }

    const auto& choice = json["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object() ||
        !choice["message"].contains("content") || !choice["message"]["content"].is_string()) {
        throw RemoteError(RemoteErrorKind::TRANSIENT, "response choice has no message content");
    }

    GenerationResult result;
    result.content = choice["message"]["content"].get<std::string>();

    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        result.finish_reason = choice["finish_reason"].get<std::string>();
    }

    if (choice.contains("confidence") && choice["confidence"].is_number()) {
        result.confidence = std::clamp(choice["confidence"].get<double>(), 0.0, 1.0);
    } else {
        result.confidence = estimateConfidence(result.content);
    }

    if (json.contains("usage") && json["usage"].is_object() &&
        json["usage"].contains("completion_tokens") && json["usage"]["completion_tokens"].is_number_integer()) {
        result.tokens_generated = json["usage"]["completion_tokens"].get<size_t>();
    }

    return result;
}

bool HttpModelClient::parseStreamLine(const std::string& line, std::string& delta, std::string& finish_reason) {
    delta.clear();

    // Comments, event names and keep-alives carry no content
    if (line.rfind("data:", 0) != 0) {
        return true;
    }

    std::string payload = trim(line.substr(5));
    if (payload.empty()) {
        return true;
    }
    if (payload == "[DONE]") {
        return false;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw RemoteError(RemoteErrorKind::TRANSIENT, std::string("malformed stream event: ") + e.what());
    }

    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        return true;
    }

    const auto& choice = json["choices"][0];
    if (choice.contains("delta") && choice["delta"].is_object() &&
        choice["delta"].contains("content") && choice["delta"]["content"].is_string()) {
        delta = choice["delta"]["content"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        finish_reason = choice["finish_reason"].get<std::string>();
    }

    return true;
}

std::pair<std::string, std::string> HttpModelClient::splitEndpoint(const std::string& endpoint) {
    size_t scheme_end = endpoint.find("://");
    size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t path_start = endpoint.find('/', host_start);

    if (path_start == std::string::npos) {
        return {endpoint, kDefaultPath};
    }
    return {endpoint.substr(0, path_start), endpoint.substr(path_start)};
}

} // namespace Maestro
