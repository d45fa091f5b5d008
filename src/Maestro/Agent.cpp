// =================================================================
// src/Maestro/Agent.cpp
// =================================================================
// Implementation of the query facade and stream handles.

#include "Maestro/Agent.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Maestro {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

StreamEvent makeChunkEvent(const std::string& text) {
    StreamEvent event;
    event.type = StreamEventType::CHUNK;
    event.text = text;
    return event;
}

StreamEvent makeFinalEvent(const SynthesizedResponse& response) {
    StreamEvent event;
    event.type = StreamEventType::FINAL;
    event.response = response;
    return event;
}

} // namespace

// --- HealthReport ---

nlohmann::json HealthReport::toJson() const {
    nlohmann::json j;
    j["overall"] = overall;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
        timestamp.time_since_epoch()).count();

    nlohmann::json model_list = nlohmann::json::array();
    for (const auto& state : models) {
        nlohmann::json model;
        model["id"] = state.model_id;
        model["circuit"] = circuitStateToString(state.circuit);
        model["consecutive_failures"] = state.consecutive_failures;
        model["total_failures"] = state.total_failures;
        model["total_successes"] = state.total_successes;
        model["last_latency_ms"] = state.last_latency.count();
        if (state.last_failure) {
            model["last_failure"] = std::chrono::duration_cast<std::chrono::seconds>(
                state.last_failure->time_since_epoch()).count();
        }
        model_list.push_back(model);
    }
    j["models"] = model_list;

    if (!verification.empty()) {
        nlohmann::json checks = nlohmann::json::array();
        for (const auto& result : verification) {
            nlohmann::json check;
            check["id"] = result.model_id;
            check["status"] = result.healthy ? "healthy" : "error";
            check["latency_ms"] = result.latency.count();
            if (!result.healthy) {
                check["error_type"] = result.error_type;
                check["message"] = result.message;
                if (result.http_status > 0) {
                    check["status_code"] = result.http_status;
                }
            }
            checks.push_back(check);
        }
        j["verification"] = checks;
    }
    return j;
}

// --- StreamHandle ---

StreamHandle::StreamHandle(Key) {}

StreamHandle::~StreamHandle() {
    cancel();
}

std::optional<StreamEvent> StreamHandle::next() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_final_delivered) {
        return std::nullopt;
    }
    m_cv.wait(lock, [this] { return !m_events.empty(); });

    StreamEvent event = std::move(m_events.front());
    m_events.pop_front();
    if (event.isFinal()) {
        m_final_delivered = true;
    }
    return event;
}

void StreamHandle::cancel() {
    m_token.cancel();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool StreamHandle::isFinished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_final_delivered;
}

void StreamHandle::push(const StreamEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_final_queued) {
            return;
        }
        if (event.isFinal()) {
            m_final_queued = true;
        }
        m_events.push_back(event);
    }
    m_cv.notify_all();
}

// --- Agent ---

Agent::Agent(const AppConfig& config,
             std::shared_ptr<ModelRegistry> registry,
             std::shared_ptr<ClassificationScorer> scorer)
    : m_config(config), m_registry(std::move(registry)) {

    if (!m_registry) {
        throw std::invalid_argument("Agent requires a model registry");
    }

    m_monitor = std::make_unique<PerformanceMonitor>(m_config.performance.max_performance_records);
    m_context = std::make_unique<ContextManager>(m_config.context);
    m_router = std::make_unique<TaskRouter>(m_config.routing, *m_registry, m_monitor.get(), std::move(scorer));
    m_synthesizer = std::make_unique<ResponseSynthesizer>(m_registry.get(), m_config.synthesis);
    m_orchestrator = std::make_unique<Orchestrator>(*m_registry, *m_synthesizer, m_monitor.get(),
                                                    OrchestratorConfig::fromConfig(m_config.performance));
    m_cache = std::make_unique<RequestCache>(m_config.performance.cache_ttl,
                                             m_config.performance.max_cache_entries);

    LOG_INFO("Agent", "Ready with " + std::to_string(m_registry->getModelIds().size()) + " models");
}

Agent::~Agent() = default;

SynthesizedResponse Agent::handleQuery(const Query& query) {
    Logger::getInstance().logQueryStart("query", query.text, query.conversation_id);

    bool was_hit = false;
    SynthesizedResponse response = process(query, nullptr, CancellationToken(), was_hit);

    Logger::getInstance().logQueryEnd("query", responseStatusToString(response.status),
                                      static_cast<long>(response.total_time.count()));
    return response;
}

StreamEvent Agent::handleQueryStream(const Query& query, const StreamSink& sink,
                                     const CancellationToken& token) {
    Logger::getInstance().logQueryStart("stream", query.text, query.conversation_id);

    // The orchestrator's final event is replaced by the one sent below
    StreamSink chunks_only = [&sink](const StreamEvent& event) {
        if (!event.isFinal()) {
            sink(event);
        }
    };

    bool was_hit = false;
    SynthesizedResponse response = process(query, &chunks_only, token, was_hit);

    if (was_hit && response.ok() && !response.content.empty() && !token.isCancelled()) {
        sink(makeChunkEvent(response.content));
    }

    StreamEvent final_event = makeFinalEvent(response);
    sink(final_event);

    Logger::getInstance().logQueryEnd("stream", responseStatusToString(response.status),
                                      static_cast<long>(response.total_time.count()));
    return final_event;
}

std::unique_ptr<StreamHandle> Agent::openStream(const Query& query) {
    auto handle = std::make_unique<StreamHandle>(StreamHandle::Key());
    StreamHandle* raw = handle.get();

    raw->m_worker = std::thread([this, raw, query]() {
        try {
            handleQueryStream(query, [raw](const StreamEvent& event) { raw->push(event); }, raw->m_token);
        } catch (const std::exception& e) {
            LOG_ERROR("Agent", std::string("Stream worker failed: ") + e.what());
            raw->push(makeFinalEvent(makeFailureResponse(ErrorCode::SYNTHESIS_FAILURE, e.what())));
        }
    });

    return handle;
}

RoutingDecision Agent::classify(const Query& query) {
    if (isBlank(query.text)) {
        throw InvalidQueryError("query text is empty");
    }
    return m_router->classifyAndPlan(query);
}

HealthReport Agent::getHealth() const {
    HealthReport report;
    report.timestamp = std::chrono::system_clock::now();
    report.models = m_registry->healthSnapshot();
    for (const auto& state : report.models) {
        if (auto verified = m_registry->lastVerification(state.model_id)) {
            report.verification.push_back(*verified);
        }
    }

    size_t closed = 0;
    size_t usable = 0;
    for (const auto& state : report.models) {
        if (state.circuit == CircuitState::CLOSED) {
            closed++;
        }
        if (state.circuit != CircuitState::OPEN) {
            usable++;
        }
    }

    if (report.models.empty() || usable == 0) {
        report.overall = "unhealthy";
    } else if (closed == report.models.size()) {
        report.overall = "healthy";
    } else {
        report.overall = "degraded";
    }
    return report;
}

std::vector<VerificationResult> Agent::verifyModels() {
    return m_registry->verifyModels(m_config.verification);
}

PerformanceSummary Agent::getPerformanceSummary(std::chrono::seconds window) const {
    if (window.count() <= 0) {
        return m_monitor->aggregateAll();
    }
    return m_monitor->aggregate(window);
}

void Agent::setRateLimiter(std::shared_ptr<RateLimiter> limiter) {
    std::lock_guard<std::mutex> lock(m_limiter_mutex);
    m_rate_limiter = std::move(limiter);
}

size_t Agent::cleanupExpired() {
    size_t removed = m_context->cleanupExpired();
    removed += m_cache->cleanupExpired();
    return removed;
}

SynthesizedResponse Agent::process(const Query& query, const StreamSink* sink,
                                   const CancellationToken& token, bool& was_hit) {
    was_hit = false;
    auto started = std::chrono::steady_clock::now();

    if (isBlank(query.text)) {
        return makeFailureResponse(ErrorCode::INVALID_QUERY, "query text is empty");
    }

    std::shared_ptr<RateLimiter> limiter;
    {
        std::lock_guard<std::mutex> lock(m_limiter_mutex);
        limiter = m_rate_limiter;
    }
    if (limiter && !limiter->allow(query.caller_id)) {
        LOG_WARNING("Agent", "Rate limit refused caller '" + query.caller_id + "'");
        return makeFailureResponse(ErrorCode::RATE_LIMITED, "caller '" + query.caller_id + "' is rate limited");
    }

    if (!acquireSlot(token)) {
        return makeFailureResponse(ErrorCode::CANCELLED, "cancelled while waiting for a request slot");
    }

    SynthesizedResponse response;
    try {
        std::string key = RequestCache::makeKey(query.text, query.conversation_id);

        // Identical queries join the in-flight computation before taking the
        // turn lock; only the leader runs the turn and records it.
        response = m_cache->getOrCompute(key, [this, &query, sink, &token]() {
            TurnLock turn = m_context->beginTurn(query.conversation_id);
            SynthesizedResponse computed = runQuery(query, sink, token);
            if (computed.ok()) {
                m_context->append(query.conversation_id, query.text, computed.content);
            }
            return computed;
        }, &was_hit);

        if (was_hit) {
            response.from_cache = true;
        }
    } catch (const MaestroError& e) {
        LOG_ERROR("Agent", std::string("Query failed: ") + e.what());
        response = makeFailureResponse(e.code(), e.what());
    } catch (const std::exception&) {
        releaseSlot();
        throw;
    }
    releaseSlot();

    response.total_time = elapsedSince(started);
    recordSynthesis(response);

    if (++m_request_count % std::max<size_t>(m_config.context.cleanup_interval, 1) == 0) {
        cleanupExpired();
    }
    return response;
}

SynthesizedResponse Agent::runQuery(const Query& query, const StreamSink* sink,
                                    const CancellationToken& token) {
    RoutingDecision decision;
    try {
        decision = m_router->classifyAndPlan(query);
    } catch (const ClassificationError& e) {
        LOG_WARNING("Agent", std::string("Routing failed: ") + e.what());
        return makeFailureResponse(ErrorCode::CLASSIFICATION_ERROR, e.what());
    }

    Prompt prompt = m_context->buildPrompt(query.conversation_id, query.text);

    ExecutionOutcome outcome = sink
        ? m_orchestrator->executeStream(decision.plan, prompt, *sink, token)
        : m_orchestrator->execute(decision.plan, prompt, token);

    for (const auto& result : outcome.results) {
        size_t index = decision.plan.indexOf(result.model_id);
        if (index == decision.plan.entries.size()) {
            continue;
        }
        if (result.status == InvocationStatus::CIRCUIT_OPEN || result.status == InvocationStatus::CANCELLED) {
            continue;
        }
        m_router->recordOutcome(result.model_id, decision.plan.entries[index].category,
                                result.succeeded(), result.confidence);
    }

    outcome.response.category = decision.classification.primary();
    return outcome.response;
}

bool Agent::acquireSlot(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(m_slot_mutex);
    const size_t limit = std::max<size_t>(m_config.performance.max_concurrent_requests, 1);
    while (m_active_requests >= limit) {
        if (token.shouldStop()) {
            return false;
        }
        m_slot_cv.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (token.isCancelled()) {
        return false;
    }
    m_active_requests++;
    return true;
}

void Agent::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(m_slot_mutex);
        if (m_active_requests > 0) {
            m_active_requests--;
        }
    }
    m_slot_cv.notify_one();
}

void Agent::recordSynthesis(const SynthesizedResponse& response) {
    PerformanceRecord record;
    record.model_id = "synthesis";
    record.latency = response.total_time;
    record.success = response.ok();
    record.category = response.category;
    record.confidence = response.confidence;
    record.error_code = response.error_code;
    m_monitor->record(record);
}

} // namespace Maestro
