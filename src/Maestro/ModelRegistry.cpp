// =================================================================
// src/Maestro/ModelRegistry.cpp
// =================================================================
// Implementation of the model registry and circuit breaker.

#include "Maestro/ModelRegistry.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/HttpModelClient.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Maestro {

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default: return "closed";
    }
}

ModelRegistry::ModelRegistry(const CircuitBreakerConfig& breaker,
                             std::shared_ptr<CredentialProvider> credentials)
    : m_breaker(breaker), m_credentials(std::move(credentials)) {

    registerModelFactory("openai_compatible", [this](const ModelConfig& cfg) {
        return createHttpModel(cfg);
    });
}

void ModelRegistry::registerModelFactory(const std::string& model_type, ModelFactory factory) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_factories[model_type] = std::move(factory);
    Logger::getInstance().debug("ModelRegistry", "Registered factory for model type: " + model_type);
}

size_t ModelRegistry::loadModels(const std::vector<ModelConfig>& models) {
    size_t loaded = 0;

    for (const auto& config : models) {
        ModelFactory factory;
        {
            std::lock_guard<std::mutex> lock(m_registry_mutex);
            auto it = m_factories.find(config.type);
            if (it == m_factories.end()) {
                throw ConfigError("No factory registered for model type '" + config.type +
                                  "' (model " + config.id + ")");
            }
            factory = it->second;
        }

        std::shared_ptr<ModelClient> client;
        try {
            client = factory(config);
        } catch (const std::exception& e) {
            throw ConfigError("Failed to create model " + config.id + ": " + e.what());
        }
        if (!client) {
            throw ConfigError("Factory returned null model: " + config.id);
        }

        registerModel(config, client);
        loaded++;
    }

    Logger::getInstance().info("ModelRegistry", "Model loading complete",
                               "Loaded: " + std::to_string(loaded) + "/" + std::to_string(models.size()));
    return loaded;
}

void ModelRegistry::registerModel(const ModelConfig& config, std::shared_ptr<ModelClient> client) {
    if (config.id.empty()) {
        throw std::invalid_argument("Model configuration missing id");
    }
    if (!client) {
        throw std::invalid_argument("Null client for model " + config.id);
    }

    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_index.count(config.id)) {
        throw std::invalid_argument("Model already registered: " + config.id);
    }

    auto entry = std::make_unique<Entry>();
    entry->config = config;
    entry->config.declaration_index = m_entries.size();
    entry->client = std::move(client);
    entry->state.model_id = config.id;

    m_index[config.id] = entry.get();
    m_entries.push_back(std::move(entry));

    Logger::getInstance().info("ModelRegistry", "Registered model: " + config.id, config.type);
}

std::shared_ptr<ModelClient> ModelRegistry::getModel(const std::string& model_id) const {
    Entry* entry = findEntry(model_id);
    return entry ? entry->client : nullptr;
}

std::optional<ModelConfig> ModelRegistry::getModelConfig(const std::string& model_id) const {
    Entry* entry = findEntry(model_id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->config;
}

std::vector<ModelConfig> ModelRegistry::getConfiguredModels() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    std::vector<ModelConfig> configs;
    configs.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        configs.push_back(entry->config);
    }
    return configs;
}

std::vector<std::string> ModelRegistry::getModelIds() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        ids.push_back(entry->config.id);
    }
    return ids;
}

bool ModelRegistry::hasModel(const std::string& model_id) const {
    return findEntry(model_id) != nullptr;
}

std::vector<std::string> ModelRegistry::capableModels(TaskCategory category) const {
    std::vector<const ModelConfig*> capable;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        for (const auto& entry : m_entries) {
            if (entry->config.hasCapability(category)) {
                capable.push_back(&entry->config);
            }
        }
    }

    std::stable_sort(capable.begin(), capable.end(),
                     [category](const ModelConfig* a, const ModelConfig* b) {
                         return a->rankFor(category) > b->rankFor(category);
                     });

    std::vector<std::string> ids;
    ids.reserve(capable.size());
    for (const auto* config : capable) {
        ids.push_back(config->id);
    }
    return ids;
}

ModelHealthState ModelRegistry::health(const std::string& model_id) const {
    Entry& entry = requireEntry(model_id);
    std::lock_guard<std::mutex> lock(entry.mutex);

    ModelHealthState state = entry.state;
    state.circuit = effectiveState(entry);
    return state;
}

bool ModelRegistry::isAvailable(const std::string& model_id) const {
    Entry* entry = findEntry(model_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return effectiveState(*entry) != CircuitState::OPEN;
}

AttemptPermit ModelRegistry::acquireAttempt(const std::string& model_id) {
    Entry& entry = requireEntry(model_id);
    std::lock_guard<std::mutex> lock(entry.mutex);

    switch (effectiveState(entry)) {
        case CircuitState::CLOSED:
            return AttemptPermit::ALLOWED;

        case CircuitState::OPEN:
            return AttemptPermit::REJECTED;

        case CircuitState::HALF_OPEN:
            if (entry.trial_in_flight) {
                return AttemptPermit::REJECTED;
            }
            if (entry.state.circuit == CircuitState::OPEN) {
                transition(entry, CircuitState::HALF_OPEN);
            }
            entry.trial_in_flight = true;
            return AttemptPermit::TRIAL;
    }
    return AttemptPermit::REJECTED;
}

void ModelRegistry::recordOutcome(const std::string& model_id, bool success, std::chrono::milliseconds latency) {
    Entry& entry = requireEntry(model_id);
    std::lock_guard<std::mutex> lock(entry.mutex);

    auto& state = entry.state;
    state.last_latency = latency;

    if (success) {
        state.total_successes++;
        state.consecutive_failures = 0;
        if (state.circuit == CircuitState::HALF_OPEN) {
            entry.trial_in_flight = false;
            transition(entry, CircuitState::CLOSED);
        }
        return;
    }

    state.total_failures++;
    state.consecutive_failures++;
    state.last_failure = std::chrono::system_clock::now();

    switch (state.circuit) {
        case CircuitState::HALF_OPEN:
            entry.trial_in_flight = false;
            state.cooldown_until = std::chrono::steady_clock::now() + m_breaker.cooldown;
            transition(entry, CircuitState::OPEN);
            break;

        case CircuitState::CLOSED:
            if (state.consecutive_failures >= m_breaker.failure_threshold) {
                state.cooldown_until = std::chrono::steady_clock::now() + m_breaker.cooldown;
                transition(entry, CircuitState::OPEN);
            }
            break;

        case CircuitState::OPEN:
            // Late failure from a call admitted before the circuit opened
            break;
    }
}

void ModelRegistry::abandonAttempt(const std::string& model_id) {
    Entry& entry = requireEntry(model_id);
    std::lock_guard<std::mutex> lock(entry.mutex);

    if (entry.state.circuit == CircuitState::HALF_OPEN && entry.trial_in_flight) {
        entry.trial_in_flight = false;
    }
}

std::vector<ModelHealthState> ModelRegistry::healthSnapshot() const {
    std::vector<Entry*> entries;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        for (const auto& entry : m_entries) {
            entries.push_back(entry.get());
        }
    }

    std::vector<ModelHealthState> snapshot;
    snapshot.reserve(entries.size());
    for (Entry* entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ModelHealthState state = entry->state;
        state.circuit = effectiveState(*entry);
        snapshot.push_back(state);
    }
    return snapshot;
}

std::vector<VerificationResult> ModelRegistry::verifyModels(const VerificationConfig& config) {
    std::vector<Entry*> entries;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        for (const auto& entry : m_entries) {
            entries.push_back(entry.get());
        }
    }

    std::vector<std::future<VerificationResult>> futures;
    futures.reserve(entries.size());
    for (Entry* entry : entries) {
        futures.push_back(std::async(std::launch::async, [entry, &config]() {
            return verifyEntry(*entry, config);
        }));
    }

    std::vector<VerificationResult> results;
    results.reserve(entries.size());
    size_t unhealthy = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
        VerificationResult result = futures[i].get();
        {
            std::lock_guard<std::mutex> lock(entries[i]->mutex);
            entries[i]->last_verification = result;
        }
        if (!result.healthy) {
            unhealthy++;
            Logger::getInstance().warning("ModelRegistry", "Model " + result.model_id + " is unhealthy",
                                          result.error_type + ": " + result.message);
        }
        results.push_back(result);
    }

    LOG_INFO("ModelRegistry", "Verified " + std::to_string(results.size()) + " models, " +
                                  std::to_string(unhealthy) + " unhealthy");
    return results;
}

std::optional<VerificationResult> ModelRegistry::lastVerification(const std::string& model_id) const {
    Entry* entry = findEntry(model_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->last_verification;
}

VerificationResult ModelRegistry::verifyEntry(const Entry& entry, const VerificationConfig& config) {
    VerificationResult result;
    result.model_id = entry.config.id;

    GenerationParams params = entry.config.params;
    params.max_tokens = config.max_tokens;
    CancellationToken token = CancellationToken::withDeadline(CancellationToken::Clock::now() + config.timeout);

    auto started = std::chrono::steady_clock::now();
    try {
        entry.client->generate(Prompt::fromText(config.prompt), params, token);
        result.healthy = true;
    } catch (const CredentialError& e) {
        result.error_type = "credential_error";
        result.message = e.what();
    } catch (const RemoteError& e) {
        result.http_status = e.httpStatus();
        result.error_type = e.httpStatus() > 0 ? "api_error" : "connection_error";
        result.message = e.what();
    } catch (const CancelledError& e) {
        result.error_type = "connection_error";
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error_type = "unknown_error";
        result.message = e.what();
    }

    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

std::string ModelRegistry::getModelInfo(const std::string& model_id) const {
    Entry* entry = findEntry(model_id);
    if (!entry) {
        return "Model not found: " + model_id;
    }

    ModelConfig config = entry->config;
    ModelHealthState state = health(model_id);

    std::stringstream ss;
    ss << "Model: " << config.id << "\n";
    if (!config.description.empty()) {
        ss << "  Description: " << config.description << "\n";
    }
    ss << "  Type: " << config.type << "\n";
    if (!config.endpoint.empty()) {
        ss << "  Endpoint: " << config.endpoint << " (" << config.model_name << ")\n";
    }
    ss << "  Reliability: " << std::fixed << std::setprecision(2) << config.reliability << "\n";
    ss << "  Capabilities: ";
    bool first = true;
    for (const auto& [category, rank] : config.capabilities) {
        if (!first) ss << ", ";
        ss << taskCategoryToString(category) << "=" << rank;
        first = false;
    }
    ss << "\n";
    ss << "  Circuit: " << circuitStateToString(state.circuit) << "\n";
    ss << "  Successes: " << state.total_successes << ", Failures: " << state.total_failures;
    ss << " (streak " << state.consecutive_failures << ")\n";
    if (auto verified = lastVerification(model_id)) {
        ss << "  Verified: " << (verified->healthy ? "healthy" : "unhealthy (" + verified->error_type + ")")
           << " in " << verified->latency.count() << "ms\n";
    }

    return ss.str();
}

std::string ModelRegistry::getAllModelsInfo() const {
    std::stringstream ss;
    auto ids = getModelIds();

    ss << "=== Registered Models ===\n";
    ss << "Total: " << ids.size() << "\n\n";
    for (const auto& id : ids) {
        ss << getModelInfo(id) << "\n";
    }
    return ss.str();
}

std::shared_ptr<ModelClient> ModelRegistry::createHttpModel(const ModelConfig& config) {
    return std::make_shared<HttpModelClient>(config, m_credentials);
}

ModelRegistry::Entry* ModelRegistry::findEntry(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    auto it = m_index.find(model_id);
    return it == m_index.end() ? nullptr : it->second;
}

ModelRegistry::Entry& ModelRegistry::requireEntry(const std::string& model_id) const {
    Entry* entry = findEntry(model_id);
    if (!entry) {
        throw std::invalid_argument("Unknown model: " + model_id);
    }
    return *entry;
}

CircuitState ModelRegistry::effectiveState(const Entry& entry) const {
    if (entry.state.circuit == CircuitState::OPEN &&
        std::chrono::steady_clock::now() >= entry.state.cooldown_until) {
        return CircuitState::HALF_OPEN;
    }
    return entry.state.circuit;
}

void ModelRegistry::transition(Entry& entry, CircuitState to) {
    CircuitState from = entry.state.circuit;
    if (from == to) {
        return;
    }
    entry.state.circuit = to;
    Logger::getInstance().logCircuitTransition(entry.config.id, circuitStateToString(from),
                                               circuitStateToString(to), entry.state.consecutive_failures);
}

} // namespace Maestro
