// =================================================================
// src/Maestro/Config.cpp
// =================================================================
// YAML configuration loading for the router.

#include "Maestro/Config.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace Maestro {

namespace {

template <typename T>
T readOr(const YAML::Node& node, const char* key, const T& fallback) {
    if (node && node[key]) {
        return node[key].as<T>();
    }
    return fallback;
}

// Accepts either "<key>_ms" or "<key>_seconds"; milliseconds win.
std::chrono::milliseconds readDuration(const YAML::Node& node, const std::string& key,
                                       std::chrono::milliseconds fallback) {
    if (!node) {
        return fallback;
    }
    if (node[key + "_ms"]) {
        return std::chrono::milliseconds(node[key + "_ms"].as<long>());
    }
    if (node[key + "_seconds"]) {
        return std::chrono::milliseconds(
            static_cast<long>(node[key + "_seconds"].as<double>() * 1000.0));
    }
    return fallback;
}

bool readEnvSize(const char* name, size_t& out) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return false;
    }
    try {
        long parsed = std::stol(value);
        if (parsed <= 0) {
            return false;
        }
        out = static_cast<size_t>(parsed);
        return true;
    } catch (const std::exception&) {
        Logger::getInstance().warning("Config", std::string("Ignoring non-numeric ") + name, value);
        return false;
    }
}

} // namespace

bool ModelConfig::hasCapability(TaskCategory category) const {
    return capabilities.count(category) > 0;
}

int ModelConfig::rankFor(TaskCategory category) const {
    auto it = capabilities.find(category);
    return it == capabilities.end() ? 0 : it->second;
}

std::string combineStrategyToString(CombineStrategy strategy) {
    switch (strategy) {
        case CombineStrategy::ATTRIBUTED: return "attributed";
        case CombineStrategy::CODE_BLOCKS: return "code_blocks";
        case CombineStrategy::KEY_POINTS: return "key_points";
    }
    return "attributed";
}

CombineStrategy combineStrategyFromString(const std::string& name) {
    if (name == "attributed") return CombineStrategy::ATTRIBUTED;
    if (name == "code_blocks") return CombineStrategy::CODE_BLOCKS;
    if (name == "key_points") return CombineStrategy::KEY_POINTS;
    throw std::invalid_argument("Unknown synthesis strategy: " + name);
}

const ModelConfig* AppConfig::findModel(const std::string& id) const {
    for (const auto& model : models) {
        if (model.id == id) {
            return &model;
        }
    }
    return nullptr;
}

AppConfig ConfigLoader::loadFromFile(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        Logger::getInstance().warning("Config", "Configuration file not found, using defaults", config_path);
        AppConfig config = defaults();
        applyEnvironmentOverrides(config);
        return config;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse " + config_path + ": " + e.what());
    }

    AppConfig config = parse(root);
    applyEnvironmentOverrides(config);
    validate(config);

    Logger::getInstance().info("Config", "Configuration loaded", config_path + ", " +
                               std::to_string(config.models.size()) + " models");
    return config;
}

AppConfig ConfigLoader::loadFromString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }

    AppConfig config = parse(root);
    applyEnvironmentOverrides(config);
    validate(config);
    return config;
}

AppConfig ConfigLoader::defaults() {
    return AppConfig();
}

void ConfigLoader::applyEnvironmentOverrides(AppConfig& config) {
    size_t value = 0;
    if (readEnvSize("MAESTRO_TIMEOUT_SECONDS", value)) {
        config.performance.timeout = std::chrono::seconds(value);
    }
    if (readEnvSize("MAESTRO_MAX_CONCURRENT_REQUESTS", value)) {
        config.performance.max_concurrent_requests = value;
    }
}

void ConfigLoader::validate(const AppConfig& config) {
    for (size_t i = 0; i < config.models.size(); ++i) {
        const auto& model = config.models[i];
        if (model.capabilities.empty()) {
            throw ConfigError("Model '" + model.id + "' declares no capabilities");
        }
        if (model.reliability < 0.0 || model.reliability > 1.0) {
            throw ConfigError("Model '" + model.id + "' reliability must be within [0, 1]");
        }
        for (size_t j = 0; j < i; ++j) {
            if (config.models[j].id == model.id) {
                throw ConfigError("Duplicate model id: " + model.id);
            }
        }
    }

    if (!config.routing.default_model.empty() && !config.findModel(config.routing.default_model)) {
        throw ConfigError("routing.default_model refers to unknown model: " + config.routing.default_model);
    }
    if (config.performance.retry_attempts == 0) {
        throw ConfigError("performance.retry_attempts must be at least 1");
    }
    if (config.performance.backoff_factor < 1.0) {
        throw ConfigError("performance.backoff_factor must be at least 1");
    }
    if (config.performance.jitter < 0.0 || config.performance.jitter > 1.0) {
        throw ConfigError("performance.jitter must be within [0, 1]");
    }
    if (config.circuit_breaker.failure_threshold == 0) {
        throw ConfigError("circuit_breaker.failure_threshold must be at least 1");
    }
    if (config.context.max_history == 0) {
        throw ConfigError("context.max_history must be at least 1");
    }
    if (config.context.cleanup_interval == 0) {
        throw ConfigError("context.cleanup_interval must be at least 1");
    }
    if (config.routing.adaptive_step < 0.0 || config.routing.max_rank_adjustment < 0.0) {
        throw ConfigError("routing.adaptive_step and routing.max_rank_adjustment must not be negative");
    }
    if (config.synthesis.duplicate_threshold < 0.0 || config.synthesis.duplicate_threshold > 1.0) {
        throw ConfigError("synthesis.duplicate_threshold must be within [0, 1]");
    }
    if (config.verification.timeout.count() <= 0) {
        throw ConfigError("verification.timeout must be positive");
    }
}

AppConfig ConfigLoader::parse(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    try {
        // Models, in declaration order
        if (const auto models = root["models"]) {
            if (!models.IsMap()) {
                throw ConfigError("'models' must be a mapping of id to settings");
            }
            size_t index = 0;
            for (const auto& item : models) {
                config.models.push_back(parseModel(item.first.as<std::string>(), item.second, index++));
            }
        }

        const auto routing = root["routing"];
        config.routing.default_model = readOr<std::string>(routing, "default_model", "");
        config.routing.confidence_threshold = readOr(routing, "confidence_threshold", config.routing.confidence_threshold);
        config.routing.max_fallbacks = readOr(routing, "max_fallbacks", config.routing.max_fallbacks);
        config.routing.max_multi_primaries = readOr(routing, "max_multi_primaries", config.routing.max_multi_primaries);
        config.routing.latency_window = std::chrono::seconds(
            readOr<long>(routing, "latency_window_seconds", config.routing.latency_window.count()));
        config.routing.adaptive_step = readOr(routing, "adaptive_step", config.routing.adaptive_step);
        config.routing.max_rank_adjustment =
            readOr(routing, "max_rank_adjustment", config.routing.max_rank_adjustment);

        if (routing && routing["multi_model_categories"]) {
            config.routing.multi_model_categories.clear();
            for (const auto& name : routing["multi_model_categories"]) {
                config.routing.multi_model_categories.insert(taskCategoryFromString(name.as<std::string>()));
            }
        }

        if (routing && routing["signatures"]) {
            for (const auto& item : routing["signatures"]) {
                TaskCategory category = taskCategoryFromString(item.first.as<std::string>());
                auto& patterns = config.routing.signatures[category];
                for (const auto& entry : item.second) {
                    SignaturePattern pattern;
                    pattern.pattern = entry["pattern"].as<std::string>();
                    pattern.weight = readOr(entry, "weight", 0.3);
                    patterns.push_back(pattern);
                }
            }
        }

        const auto performance = root["performance"];
        auto& perf = config.performance;
        perf.timeout = readDuration(performance, "timeout", perf.timeout);
        perf.retry_attempts = readOr(performance, "retry_attempts", perf.retry_attempts);
        perf.backoff_base = readDuration(performance, "backoff_base", perf.backoff_base);
        perf.backoff_factor = readOr(performance, "backoff_factor", perf.backoff_factor);
        perf.backoff_max = readDuration(performance, "backoff_max", perf.backoff_max);
        perf.jitter = readOr(performance, "jitter", perf.jitter);
        perf.cache_ttl = std::chrono::seconds(readOr<long>(performance, "cache_ttl", perf.cache_ttl.count()));
        perf.max_cache_entries = readOr(performance, "max_cache_entries", perf.max_cache_entries);
        perf.max_concurrent_requests = readOr(performance, "max_concurrent_requests", perf.max_concurrent_requests);
        perf.max_performance_records = readOr(performance, "max_performance_records", perf.max_performance_records);

        const auto circuit = root["circuit_breaker"];
        config.circuit_breaker.failure_threshold =
            readOr(circuit, "failure_threshold", config.circuit_breaker.failure_threshold);
        config.circuit_breaker.cooldown = readDuration(circuit, "cooldown", config.circuit_breaker.cooldown);

        const auto context = root["context"];
        config.context.max_history = readOr(context, "max_history", config.context.max_history);
        config.context.ttl = std::chrono::seconds(readOr<long>(context, "ttl_seconds", config.context.ttl.count()));
        config.context.prompt_history_turns =
            readOr(context, "prompt_history_turns", config.context.prompt_history_turns);
        config.context.system_prompt = readOr<std::string>(context, "system_prompt", "");
        config.context.cleanup_interval = readOr(context, "cleanup_interval", config.context.cleanup_interval);

        const auto synthesis = root["synthesis"];
        config.synthesis.duplicate_threshold =
            readOr(synthesis, "duplicate_threshold", config.synthesis.duplicate_threshold);
        config.synthesis.default_reliability =
            readOr(synthesis, "default_reliability", config.synthesis.default_reliability);
        if (synthesis && synthesis["strategies"]) {
            for (const auto& item : synthesis["strategies"]) {
                config.synthesis.strategies[taskCategoryFromString(item.first.as<std::string>())] =
                    combineStrategyFromString(item.second.as<std::string>());
            }
        }

        const auto verification = root["verification"];
        auto& verify = config.verification;
        verify.on_startup = readOr(verification, "on_startup", verify.on_startup);
        verify.timeout = readDuration(verification, "timeout", verify.timeout);
        verify.prompt = readOr(verification, "prompt", verify.prompt);
        verify.max_tokens = readOr(verification, "max_tokens", verify.max_tokens);

        const auto logging = root["logging"];
        config.logging.level = readOr(logging, "level", config.logging.level);
        config.logging.directory = readOr(logging, "directory", config.logging.directory);
        config.logging.console = readOr(logging, "console", config.logging.console);
        config.logging.file = readOr(logging, "file", config.logging.file);

    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    return config;
}

ModelConfig ConfigLoader::parseModel(const std::string& id, const YAML::Node& node, size_t index) {
    ModelConfig model;
    model.id = id;
    model.declaration_index = index;
    model.type = readOr<std::string>(node, "type", model.type);
    model.endpoint = readOr<std::string>(node, "endpoint", "");
    model.model_name = readOr<std::string>(node, "model_name", id);
    model.credential = readOr<std::string>(node, "credential", "");
    model.description = readOr<std::string>(node, "description", "");
    model.reliability = readOr(node, "reliability", model.reliability);
    model.timeout = readDuration(node, "timeout", model.timeout);

    if (const auto caps = node["capabilities"]) {
        if (caps.IsMap()) {
            for (const auto& item : caps) {
                model.capabilities[taskCategoryFromString(item.first.as<std::string>())] = item.second.as<int>();
            }
        } else {
            // Plain list: every listed category gets the same rank
            for (const auto& item : caps) {
                model.capabilities[taskCategoryFromString(item.as<std::string>())] = 5;
            }
        }
    }

    if (const auto params = node["parameters"]) {
        model.params.temperature = readOr(params, "temperature", model.params.temperature);
        model.params.max_tokens = readOr(params, "max_tokens", model.params.max_tokens);
        model.params.top_p = readOr(params, "top_p", model.params.top_p);
    }

    if (model.type == "openai_compatible" && model.endpoint.empty()) {
        throw ConfigError("Model '" + id + "' is missing an endpoint");
    }

    return model;
}

} // namespace Maestro
