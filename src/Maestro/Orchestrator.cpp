// =================================================================
// src/Maestro/Orchestrator.cpp
// =================================================================
// Implementation of plan execution with retry and circuit breaking.

#include "Maestro/Orchestrator.hpp"
#include "Maestro/Logger.hpp"
#include <atomic>
#include <future>

namespace Maestro {

namespace {

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

OrchestratorConfig OrchestratorConfig::fromConfig(const PerformanceConfig& config) {
    OrchestratorConfig result;
    result.global_timeout = config.timeout;
    result.retry = RetryPolicy::fromConfig(config);
    return result;
}

Orchestrator::Orchestrator(ModelRegistry& registry,
                           const ResponseSynthesizer& synthesizer,
                           PerformanceMonitor* monitor,
                           const OrchestratorConfig& config)
    : m_registry(registry),
      m_synthesizer(synthesizer),
      m_monitor(monitor),
      m_config(config),
      m_rng(std::random_device{}()) {

    LOG_DEBUG("Orchestrator", "Initialized with global timeout " +
              std::to_string(m_config.global_timeout.count()) + "ms and " +
              std::to_string(m_config.retry.max_attempts) + " attempts per model");
}

ExecutionOutcome Orchestrator::execute(const ModelPlan& plan, const Prompt& prompt,
                                       const CancellationToken& token) {
    auto started = std::chrono::steady_clock::now();
    CancellationToken call_token = token.child(started + m_config.global_timeout);

    ExecutionOutcome outcome;
    outcome.results = runPlan(plan, prompt, call_token, nullptr);
    outcome.response = finish(plan, outcome.results, call_token, started);
    return outcome;
}

ExecutionOutcome Orchestrator::executeStream(const ModelPlan& plan, const Prompt& prompt,
                                             const StreamSink& sink,
                                             const CancellationToken& token) {
    auto started = std::chrono::steady_clock::now();
    CancellationToken call_token = token.child(started + m_config.global_timeout);

    StreamMergeState merge = m_synthesizer.beginStream(plan);
    std::mutex sink_mutex;
    bool sink_failed = false;

    // Caller holds sink_mutex
    auto emit = [&](const std::string& text) {
        if (text.empty() || sink_failed || call_token.isCancelled()) {
            return;
        }
        StreamEvent event;
        event.type = StreamEventType::CHUNK;
        event.text = text;
        try {
            sink(event);
        } catch (const std::exception& e) {
            sink_failed = true;
            Logger::getInstance().error("Orchestrator", "Stream consumer failed, cancelling call", e.what());
            call_token.cancel();
        }
    };

    StreamHooks hooks;
    hooks.on_chunk = [&](const std::string& model_id, const std::string& text) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        MergeOutcome merged = m_synthesizer.mergeChunk(merge, StreamChunk{model_id, text, false});
        if (merged.emit) {
            emit(merged.text);
        }
    };
    hooks.on_finished = [&](const std::string& model_id, bool succeeded) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        if (!succeeded) {
            // Sentences not yet released by a failed model are dropped
            merge.pending.erase(model_id);
            merge.finished.insert(model_id);
            return;
        }
        MergeOutcome merged = m_synthesizer.mergeChunk(merge, StreamChunk{model_id, "", true});
        if (merged.emit) {
            emit(merged.text);
        }
    };

    ExecutionOutcome outcome;
    outcome.results = runPlan(plan, prompt, call_token, &hooks);

    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        MergeOutcome rest = m_synthesizer.flush(merge);
        if (rest.emit) {
            emit(rest.text);
        }
    }

    outcome.response = finish(plan, outcome.results, call_token, started);

    StreamEvent final_event;
    final_event.type = StreamEventType::FINAL;
    final_event.response = outcome.response;
    sink(final_event);

    return outcome;
}

OrchestratorStats Orchestrator::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

std::vector<ModelInvocationResult> Orchestrator::runPlan(const ModelPlan& plan, const Prompt& prompt,
                                                         const CancellationToken& call_token,
                                                         const StreamHooks* hooks) {
    std::vector<ModelInvocationResult> results;

    std::vector<PlanEntry> primaries;
    std::vector<PlanEntry> fallbacks;
    for (const auto& entry : plan.entries) {
        if (entry.role == PlanRole::PRIMARY) {
            primaries.push_back(entry);
        } else {
            fallbacks.push_back(entry);
        }
    }

    if (primaries.size() > 1) {
        std::vector<std::future<ModelInvocationResult>> futures;
        futures.reserve(primaries.size());
        for (const auto& entry : primaries) {
            futures.push_back(std::async(std::launch::async, [this, entry, &prompt, &call_token, hooks]() {
                return invokeWithRetry(entry, prompt, call_token, hooks);
            }));
        }
        // Every primary reaches a terminal state before synthesis
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    } else if (primaries.size() == 1) {
        results.push_back(invokeWithRetry(primaries.front(), prompt, call_token, hooks));
    }

    for (const auto& result : results) {
        if (result.succeeded()) {
            return results;
        }
    }

    for (const auto& entry : fallbacks) {
        if (call_token.shouldStop()) {
            break;
        }
        LOG_INFO("Orchestrator", "Falling back to " + entry.model_id);
        results.push_back(invokeWithRetry(entry, prompt, call_token, hooks));
        if (results.back().succeeded()) {
            break;
        }
    }

    return results;
}

ModelInvocationResult Orchestrator::invokeWithRetry(const PlanEntry& entry, const Prompt& prompt,
                                                    const CancellationToken& call_token,
                                                    const StreamHooks* hooks) {
    const std::string& model_id = entry.model_id;
    auto started = std::chrono::steady_clock::now();

    ModelInvocationResult result;
    result.model_id = model_id;

    auto client = m_registry.getModel(model_id);
    auto config = m_registry.getModelConfig(model_id);
    if (!client || !config) {
        result.status = InvocationStatus::ERROR;
        result.error_code = ErrorCode::REMOTE_PERMANENT;
        result.error_message = "model is not registered";
        result.timestamp = std::chrono::system_clock::now();
        if (hooks) {
            hooks->on_finished(model_id, false);
        }
        return result;
    }

    std::atomic<bool> streamed{false};
    ChunkCallback forward;
    if (hooks) {
        forward = [&streamed, hooks, &model_id](const std::string& text) {
            if (text.empty()) {
                return;
            }
            streamed = true;
            hooks->on_chunk(model_id, text);
        };
    }

    while (true) {
        if (call_token.isCancelled()) {
            result.status = InvocationStatus::CANCELLED;
            result.error_code = ErrorCode::CANCELLED;
            result.error_message = "cancelled by caller";
            break;
        }
        if (call_token.isExpired()) {
            result.status = InvocationStatus::TIMEOUT;
            result.error_code = ErrorCode::TIMEOUT;
            result.error_message = "global deadline exceeded";
            break;
        }

        AttemptPermit permit = m_registry.acquireAttempt(model_id);
        if (permit == AttemptPermit::REJECTED) {
            if (result.attempts == 0) {
                result.status = InvocationStatus::CIRCUIT_OPEN;
                result.error_code = ErrorCode::CIRCUIT_OPEN;
                result.error_message = "circuit open, skipped";
                std::lock_guard<std::mutex> lock(m_stats_mutex);
                m_stats.circuit_skips++;
            }
            break;
        }

        result.attempts++;
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.model_attempts++;
        }

        auto attempt_started = std::chrono::steady_clock::now();
        AttemptOutcome outcome = runAttempt(*client, *config, prompt, call_token,
                                            hooks ? &forward : nullptr);
        auto attempt_latency = elapsedSince(attempt_started);

        if (outcome.cancelled) {
            m_registry.abandonAttempt(model_id);
            Logger::getInstance().logModelInvocation(model_id, result.attempts,
                                                    attempt_latency.count(), "cancelled");
            result.status = InvocationStatus::CANCELLED;
            result.error_code = ErrorCode::CANCELLED;
            result.error_message = outcome.message;
            break;
        }

        m_registry.recordOutcome(model_id, outcome.success, attempt_latency);
        recordAttempt(model_id, entry.category, attempt_latency, outcome.success, outcome.error_code);

        if (outcome.success) {
            Logger::getInstance().logModelInvocation(model_id, result.attempts,
                                                    attempt_latency.count(), "success");
            result.status = InvocationStatus::SUCCESS;
            result.content = outcome.generation.content;
            result.confidence = outcome.generation.confidence;
            result.error_code = ErrorCode::NONE;
            result.error_message.clear();
            break;
        }

        std::string label = outcome.timed_out ? "timeout"
                          : outcome.retryable ? "transient" : "permanent";
        Logger::getInstance().logModelInvocation(model_id, result.attempts,
                                                attempt_latency.count(), label + ": " + outcome.message);

        result.status = outcome.timed_out ? InvocationStatus::TIMEOUT : InvocationStatus::ERROR;
        result.error_code = outcome.error_code;
        result.error_message = outcome.message;

        // Output already forwarded to the caller cannot be retried
        if (!outcome.retryable || streamed || !m_config.retry.allowsAnotherAttempt(result.attempts)) {
            break;
        }

        auto delay = nextDelay(result.attempts);
        LOG_DEBUG("Orchestrator", "Retrying " + model_id + " in " + std::to_string(delay.count()) + "ms");
        call_token.sleepFor(delay);
    }

    if (hooks) {
        hooks->on_finished(model_id, result.succeeded());
    }

    result.latency = elapsedSince(started);
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

Orchestrator::AttemptOutcome Orchestrator::runAttempt(ModelClient& client, const ModelConfig& config,
                                                      const Prompt& prompt,
                                                      const CancellationToken& call_token,
                                                      const ChunkCallback* on_chunk) {
    AttemptOutcome outcome;
    auto attempt_started = std::chrono::steady_clock::now();
    CancellationToken attempt_token = call_token.child(attempt_started + config.timeout);

    auto future = std::async(std::launch::async, [&client, &config, &prompt, &attempt_token, on_chunk]() {
        if (on_chunk) {
            return client.stream(prompt, config.params, *on_chunk, attempt_token);
        }
        return client.generate(prompt, config.params, attempt_token);
    });

    bool overran = false;
    auto deadline = attempt_token.deadline();
    if (deadline) {
        if (future.wait_until(*deadline) == std::future_status::timeout) {
            overran = true;
            attempt_token.cancel();
            future.wait();
        }
    } else {
        future.wait();
    }

    try {
        outcome.generation = future.get();
        outcome.success = !overran;
    } catch (const CancelledError& e) {
        outcome.error_code = ErrorCode::REMOTE_TRANSIENT;
        outcome.retryable = true;
        outcome.message = e.what();
    } catch (const RemoteError& e) {
        outcome.error_code = e.code();
        outcome.retryable = e.isTransient();
        outcome.message = e.what();
    } catch (const std::exception& e) {
        outcome.error_code = ErrorCode::REMOTE_TRANSIENT;
        outcome.retryable = true;
        outcome.message = e.what();
    }

    if (call_token.isCancelled()) {
        outcome.success = false;
        outcome.cancelled = true;
        outcome.error_code = ErrorCode::CANCELLED;
        outcome.message = "cancelled by caller";
        return outcome;
    }

    if (overran || (!outcome.success && attempt_token.isExpired())) {
        outcome.success = false;
        outcome.timed_out = true;
        outcome.retryable = true;
        outcome.error_code = ErrorCode::REMOTE_TRANSIENT;
        outcome.message = "timed out after " + std::to_string(elapsedSince(attempt_started).count()) + "ms";
    }

    return outcome;
}

SynthesizedResponse Orchestrator::finish(const ModelPlan& plan,
                                         const std::vector<ModelInvocationResult>& results,
                                         const CancellationToken& call_token,
                                         std::chrono::steady_clock::time_point started) {
    SynthesizedResponse response = m_synthesizer.synthesize(plan, results);

    bool cancelled = call_token.isCancelled();
    bool timed_out = !cancelled && call_token.isExpired();

    if (response.status != ResponseStatus::SUCCESS) {
        if (cancelled) {
            response.error_code = ErrorCode::CANCELLED;
            response.causes.push_back("cancelled by caller");
        } else if (timed_out) {
            response.error_code = ErrorCode::TIMEOUT;
            response.causes.push_back("global deadline of " +
                                      std::to_string(m_config.global_timeout.count()) + "ms exceeded");
        }
    }

    response.total_time = elapsedSince(started);

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.executions++;
        switch (response.status) {
            case ResponseStatus::SUCCESS: m_stats.successes++; break;
            case ResponseStatus::PARTIAL: m_stats.partials++; break;
            case ResponseStatus::FAILURE: m_stats.failures++; break;
        }
        if (cancelled) {
            m_stats.cancellations++;
        } else if (timed_out && response.status != ResponseStatus::SUCCESS) {
            m_stats.timeouts++;
        }
    }

    if (response.status == ResponseStatus::FAILURE) {
        Logger::getInstance().warning("Orchestrator", "Plan failed with " + errorCodeToString(response.error_code),
                    std::to_string(response.causes.size()) + " causes");
    } else {
        Logger::getInstance().debug("Orchestrator", "Plan completed as " + responseStatusToString(response.status),
                  "Models: " + std::to_string(response.contributing_models.size()));
    }

    return response;
}

std::chrono::milliseconds Orchestrator::nextDelay(size_t attempt) {
    std::lock_guard<std::mutex> lock(m_rng_mutex);
    return m_config.retry.delayForAttempt(attempt, m_rng);
}

void Orchestrator::recordAttempt(const std::string& model_id, TaskCategory category,
                                 std::chrono::milliseconds latency, bool success, ErrorCode code) {
    if (!m_monitor) {
        return;
    }
    PerformanceRecord record;
    record.model_id = model_id;
    record.latency = latency;
    record.success = success;
    record.category = category;
    record.error_code = success ? ErrorCode::NONE : code;
    m_monitor->record(record);
}

} // namespace Maestro
