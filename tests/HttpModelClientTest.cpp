// =================================================================
// tests/HttpModelClientTest.cpp
// =================================================================
// Tests for the HTTP chat completions client against a local stub server.

#include "Maestro/HttpModelClient.hpp"
#include "Maestro/CredentialProvider.hpp"
#include "TestModels.hpp"
#include "httplib.h"
#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>

using namespace Maestro;

namespace {

/**
 * @brief Minimal chat completions backend on a random local port
 */
class StubServer {
public:
    StubServer() {
        m_server.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            m_requests++;
            nlohmann::json body = nlohmann::json::parse(req.body);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_last_authorization = req.get_header_value("Authorization");
                m_last_model = body.value("model", "");
            }

            nlohmann::json reply = {
                {"choices", nlohmann::json::array({
                    {
                        {"message", {{"role", "assistant"}, {"content", "Hello from the stub"}}},
                        {"finish_reason", "stop"},
                        {"confidence", 0.66}
                    }
                })},
                {"usage", {{"completion_tokens", 4}}}
            };
            res.set_content(reply.dump(), "application/json");
        });

        m_server.Post("/stream", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                [](size_t /*offset*/, httplib::DataSink& sink) {
                    const char* words[] = {"Streamed ", "reply ", "text."};
                    for (const char* word : words) {
                        nlohmann::json event = {
                            {"choices", nlohmann::json::array({{{"delta", {{"content", word}}}}})}
                        };
                        std::string line = "data: " + event.dump() + "\n\n";
                        sink.write(line.data(), line.size());
                    }
                    std::string done = "data: [DONE]\n\n";
                    sink.write(done.data(), done.size());
                    sink.done();
                    return true;
                });
        });

        m_server.Post("/busy", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
            res.set_content("{\"error\":\"overloaded\"}", "application/json");
        });

        m_server.Post("/denied", [](const httplib::Request&, httplib::Response& res) {
            res.status = 401;
            res.set_content("{\"error\":\"bad key\"}", "application/json");
        });

        m_server.Post("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            res.set_content("{}", "application/json");
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        while (!m_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~StubServer() {
        m_server.stop();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(m_port) + path;
    }

    size_t requests() const { return m_requests.load(); }
    std::string lastAuthorization() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_authorization;
    }

    std::string lastModel() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_model;
    }

private:
    httplib::Server m_server;
    int m_port = 0;
    std::thread m_thread;
    std::atomic<size_t> m_requests{0};
    std::string m_last_authorization;
    std::string m_last_model;
    mutable std::mutex m_mutex;
};

ModelConfig stubConfig(const std::string& endpoint, const std::string& credential = "STUB_KEY") {
    ModelConfig config = MaestroTest::makeModelConfig("stub", {{TaskCategory::GENERAL_CONVERSATION, 5}});
    config.type = "openai_compatible";
    config.endpoint = endpoint;
    config.model_name = "stub-model";
    config.credential = credential;
    return config;
}

} // namespace

class HttpModelClientTest {
private:
    std::shared_ptr<StaticCredentialProvider> m_credentials;

public:
    HttpModelClientTest()
        : m_credentials(std::make_shared<StaticCredentialProvider>(
              std::map<std::string, std::string>{{"STUB_KEY", "secret-token"}})) {
        MaestroTest::silenceLogging();
    }

    void testStatusClassification() {
        std::cout << "Testing HTTP status classification..." << std::endl;

        assert(HttpModelClient::classifyStatus(429) == RemoteErrorKind::TRANSIENT);
        assert(HttpModelClient::classifyStatus(408) == RemoteErrorKind::TRANSIENT);
        assert(HttpModelClient::classifyStatus(500) == RemoteErrorKind::TRANSIENT);
        assert(HttpModelClient::classifyStatus(503) == RemoteErrorKind::TRANSIENT);
        assert(HttpModelClient::classifyStatus(400) == RemoteErrorKind::PERMANENT);
        assert(HttpModelClient::classifyStatus(401) == RemoteErrorKind::PERMANENT);
        assert(HttpModelClient::classifyStatus(404) == RemoteErrorKind::PERMANENT);

        std::cout << "✓ Status classification test passed" << std::endl;
    }

    void testRequestBody() {
        std::cout << "Testing request body construction..." << std::endl;

        Prompt prompt;
        prompt.messages.push_back({"system", "Be brief."});
        prompt.messages.push_back({"user", "explain quicksort"});
        GenerationParams params;
        params.temperature = 0.2;
        params.max_tokens = 64;

        nlohmann::json body = HttpModelClient::buildRequestBody("deepseek-reasoner", prompt, params, true);
        assert(body["model"] == "deepseek-reasoner");
        assert(body["messages"].size() == 2);
        assert(body["messages"][0]["role"] == "system");
        assert(body["messages"][1]["content"] == "explain quicksort");
        assert(body["temperature"] == 0.2);
        assert(body["max_tokens"] == 64);
        assert(body["stream"] == true);

        std::cout << "✓ Request body test passed" << std::endl;
    }

    void testCompletionParsing() {
        std::cout << "Testing completion body parsing..." << std::endl;

        GenerationResult explicit_confidence = HttpModelClient::parseCompletionBody(
            R"({"choices":[{"message":{"content":"Answer"},"finish_reason":"stop","confidence":1.7}],
                "usage":{"completion_tokens":12}})");
        assert(explicit_confidence.content == "Answer");
        assert(explicit_confidence.finish_reason == "stop");
        assert(explicit_confidence.confidence == 1.0);
        assert(explicit_confidence.tokens_generated == 12);

        // Without a reported confidence, longer answers score higher
        GenerationResult short_answer = HttpModelClient::parseCompletionBody(
            R"({"choices":[{"message":{"content":"ok"}}]})");
        nlohmann::json long_body;
        long_body["choices"] = nlohmann::json::array();
        long_body["choices"].push_back({{"message", {{"content", std::string(2000, 'x')}}}});
        GenerationResult long_answer = HttpModelClient::parseCompletionBody(long_body.dump());
        assert(short_answer.confidence >= 0.8 && short_answer.confidence < 0.81);
        assert(long_answer.confidence == 1.0);

        const char* malformed[] = {
            "not json",
            R"({"choices":[]})",
            R"({"choices":[{"message":{}}]})",
            R"([1,2,3])"
        };
        for (const char* body : malformed) {
            bool threw = false;
            try {
                HttpModelClient::parseCompletionBody(body);
            } catch (const RemoteError& e) {
                threw = true;
                assert(e.isTransient());
            }
            assert(threw);
        }

        std::cout << "✓ Completion parsing test passed" << std::endl;
    }

    void testStreamLineParsing() {
        std::cout << "Testing server-sent event parsing..." << std::endl;

        std::string delta;
        std::string finish_reason;

        assert(HttpModelClient::parseStreamLine(
            R"(data: {"choices":[{"delta":{"content":"Hel"}}]})", delta, finish_reason));
        assert(delta == "Hel");

        assert(HttpModelClient::parseStreamLine(
            R"(data: {"choices":[{"delta":{},"finish_reason":"stop"}]})", delta, finish_reason));
        assert(delta.empty());
        assert(finish_reason == "stop");

        assert(HttpModelClient::parseStreamLine(": keep-alive", delta, finish_reason));
        assert(HttpModelClient::parseStreamLine("event: message", delta, finish_reason));
        assert(HttpModelClient::parseStreamLine("data:", delta, finish_reason));
        assert(!HttpModelClient::parseStreamLine("data: [DONE]", delta, finish_reason));

        bool threw = false;
        try {
            HttpModelClient::parseStreamLine("data: {broken", delta, finish_reason);
        } catch (const RemoteError& e) {
            threw = e.isTransient();
        }
        assert(threw);

        std::cout << "✓ Stream line parsing test passed" << std::endl;
    }

    void testEndpointSplitting() {
        std::cout << "Testing endpoint splitting..." << std::endl;

        auto full = HttpModelClient::splitEndpoint("https://api.example.com/v1/chat/completions");
        assert(full.first == "https://api.example.com");
        assert(full.second == "/v1/chat/completions");

        auto with_port = HttpModelClient::splitEndpoint("http://localhost:8080/custom/path");
        assert(with_port.first == "http://localhost:8080");
        assert(with_port.second == "/custom/path");

        auto bare = HttpModelClient::splitEndpoint("http://localhost:8080");
        assert(bare.first == "http://localhost:8080");
        assert(bare.second == "/v1/chat/completions");

        std::cout << "✓ Endpoint splitting test passed" << std::endl;
    }

    void testGenerateAgainstServer() {
        std::cout << "Testing generate against a local server..." << std::endl;

        StubServer server;
        HttpModelClient client(stubConfig(server.url("/v1/chat/completions")), m_credentials);

        GenerationResult result = client.generate(Prompt::fromText("hello"), GenerationParams(), CancellationToken());
        assert(result.content == "Hello from the stub");
        assert(result.confidence == 0.66);
        assert(result.tokens_generated == 4);
        assert(server.lastAuthorization() == "Bearer secret-token");
        assert(server.lastModel() == "stub-model");
        assert(client.getModelId() == "stub");

        std::cout << "✓ Generate test passed" << std::endl;
    }

    void testStreamAgainstServer() {
        std::cout << "Testing streaming against a local server..." << std::endl;

        StubServer server;
        HttpModelClient client(stubConfig(server.url("/stream")), m_credentials);

        std::vector<std::string> chunks;
        GenerationResult result = client.stream(Prompt::fromText("hello"), GenerationParams(),
            [&chunks](const std::string& chunk) { chunks.push_back(chunk); }, CancellationToken());

        assert(chunks.size() == 3);
        assert(chunks[0] == "Streamed ");
        assert(result.content == "Streamed reply text.");
        assert(result.confidence > 0.0);

        std::cout << "✓ Streaming test passed" << std::endl;
    }

    void testErrorClassification() {
        std::cout << "Testing remote failures map to transient or permanent..." << std::endl;

        StubServer server;

        auto expectError = [this](const std::string& endpoint, RemoteErrorKind kind, int status,
                                  const std::string& credential = "STUB_KEY") {
            HttpModelClient client(stubConfig(endpoint, credential), m_credentials);
            bool threw = false;
            try {
                client.generate(Prompt::fromText("hello"), GenerationParams(), CancellationToken());
            } catch (const RemoteError& e) {
                threw = true;
                assert(e.kind() == kind);
                if (status != 0) {
                    assert(e.httpStatus() == status);
                }
            }
            assert(threw);
        };

        expectError(server.url("/busy"), RemoteErrorKind::TRANSIENT, 503);
        expectError(server.url("/denied"), RemoteErrorKind::PERMANENT, 401);

        // Nothing listens on port 1
        expectError("http://127.0.0.1:1/v1/chat/completions", RemoteErrorKind::TRANSIENT, 0);

        // Unresolvable credentials fail before any request is sent
        size_t before = server.requests();
        expectError(server.url("/v1/chat/completions"), RemoteErrorKind::PERMANENT, 0, "MISSING_KEY");
        assert(server.requests() == before);

        std::cout << "✓ Error classification test passed" << std::endl;
    }

    void testDeadline() {
        std::cout << "Testing the call deadline bounds slow backends..." << std::endl;

        StubServer server;
        HttpModelClient client(stubConfig(server.url("/slow")), m_credentials);

        auto token = CancellationToken::withDeadline(CancellationToken::Clock::now() + std::chrono::milliseconds(200));
        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            client.generate(Prompt::fromText("hello"), GenerationParams(), token);
        } catch (const RemoteError& e) {
            threw = true;
            assert(e.isTransient());
        }
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert(threw);
        assert(elapsed < std::chrono::milliseconds(900));

        std::cout << "✓ Deadline test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HttpModelClient Tests..." << std::endl;
        std::cout << "===============================" << std::endl;

        testStatusClassification();
        std::cout << std::endl;

        testRequestBody();
        std::cout << std::endl;

        testCompletionParsing();
        std::cout << std::endl;

        testStreamLineParsing();
        std::cout << std::endl;

        testEndpointSplitting();
        std::cout << std::endl;

        testGenerateAgainstServer();
        std::cout << std::endl;

        testStreamAgainstServer();
        std::cout << std::endl;

        testErrorClassification();
        std::cout << std::endl;

        testDeadline();
        std::cout << std::endl;

        std::cout << "All HttpModelClient tests passed!" << std::endl;
    }
};

int main() {
    try {
        HttpModelClientTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All HttpModelClient component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
