// =================================================================
// src/Maestro/Core.cpp
// =================================================================
// Implementation for the command-line application driver.

#include "Maestro/Core.hpp"
#include "Maestro/Agent.hpp"
#include "Maestro/Config.hpp"
#include "Maestro/CredentialProvider.hpp"
#include "Maestro/Logger.hpp"
#include "Maestro/ModelRegistry.hpp"
#include <iomanip>
#include <iostream>

namespace Maestro {

Core::Core(const Commands& commands)
    : m_commands(commands) {}

Core::~Core() = default;

int Core::run() {
    try {
        initialize();
    } catch (const ConfigError& e) {
        std::cerr << "[FATAL] Invalid configuration in '" << m_commands.config_path << "'\n"
                  << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (m_commands.active_command == "query") {
        return handleQuery();
    } else if (m_commands.active_command == "classify") {
        return handleClassify();
    } else if (m_commands.active_command == "models") {
        return handleModels();
    } else if (m_commands.active_command == "health") {
        return handleHealth();
    } else if (m_commands.active_command == "stats") {
        return handleStats();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

void Core::initialize() {
    m_config = std::make_unique<AppConfig>(ConfigLoader::loadFromFile(m_commands.config_path));

    Logger& logger = Logger::getInstance();
    logger.setFileLogging(m_config->logging.file);
    logger.setConsoleLogging(m_config->logging.console && !m_commands.quiet);
    logger.setConsoleLogLevel(Logger::parseLevel(m_config->logging.level));
    logger.initialize(m_config->logging.directory);

    m_registry = std::make_shared<ModelRegistry>(m_config->circuit_breaker,
                                                 std::make_shared<EnvCredentialProvider>());
    m_registry->loadModels(m_config->models);
    m_agent = std::make_unique<Agent>(*m_config, m_registry);

    // 'health --verify' runs its own checks
    if (m_config->verification.on_startup && !(m_commands.active_command == "health" && m_commands.verify)) {
        m_agent->verifyModels();
    }
}

int Core::handleQuery() {
    Query query;
    query.text = m_commands.query_text;
    query.conversation_id = m_commands.conversation_id;
    query.caller_id = m_commands.caller_id;
    query.stream = m_commands.stream;

    SynthesizedResponse response;
    if (query.stream) {
        StreamEvent final_event = m_agent->handleQueryStream(query, [](const StreamEvent& event) {
            if (!event.isFinal()) {
                std::cout << event.text << std::flush;
            }
        });
        std::cout << std::endl;
        response = final_event.response;
    } else {
        response = m_agent->handleQuery(query);
        if (response.ok()) {
            std::cout << response.content << std::endl;
        }
    }

    if (!response.ok()) {
        std::cerr << "Error [" << errorCodeToString(response.error_code) << "]" << std::endl;
        for (const auto& cause : response.causes) {
            std::cerr << "  - " << cause << std::endl;
        }
        return 1;
    }

    if (!m_commands.quiet) {
        std::cerr << "\n[" << responseStatusToString(response.status)
                  << " | " << taskCategoryToString(response.category)
                  << " | confidence " << std::fixed << std::setprecision(2) << response.confidence
                  << " | " << response.total_time.count() << "ms";
        for (const auto& model : response.contributing_models) {
            std::cerr << " | " << model;
        }
        std::cerr << "]" << std::endl;
    }
    return 0;
}

int Core::handleClassify() {
    Query query;
    query.text = m_commands.query_text;

    RoutingDecision decision;
    try {
        decision = m_agent->classify(query);
    } catch (const MaestroError& e) {
        std::cerr << "Error [" << errorCodeToString(e.code()) << "]: " << e.what() << std::endl;
        return 1;
    }

    const auto& classification = decision.classification;
    std::cout << "Categories:" << std::endl;
    for (const auto& score : classification.scores) {
        std::cout << "  " << std::left << std::setw(22) << taskCategoryToString(score.category)
                  << std::fixed << std::setprecision(2) << score.confidence << std::endl;
    }
    std::cout << "Complexity: " << complexityToString(classification.complexity) << std::endl;
    if (!classification.context_requirements.empty()) {
        std::cout << "Context:   ";
        for (const auto& requirement : classification.context_requirements) {
            std::cout << " " << requirement;
        }
        std::cout << std::endl;
    }

    std::cout << "Plan:" << std::endl;
    for (const auto& entry : decision.plan.entries) {
        std::cout << "  " << (entry.role == PlanRole::PRIMARY ? "primary  " : "fallback ")
                  << entry.model_id << " (" << taskCategoryToString(entry.category) << ")" << std::endl;
    }
    return 0;
}

int Core::handleModels() {
    if (m_registry->getModelIds().empty()) {
        std::cout << "No models configured in '" << m_commands.config_path << "'." << std::endl;
        return 1;
    }
    std::cout << m_registry->getAllModelsInfo() << std::endl;
    return 0;
}

int Core::handleHealth() {
    size_t unhealthy = 0;
    if (m_commands.verify) {
        for (const auto& result : m_agent->verifyModels()) {
            if (!result.healthy) {
                unhealthy++;
            }
        }
    }

    HealthReport report = m_agent->getHealth();
    std::cout << report.toJson().dump(2) << std::endl;
    return report.overall == "unhealthy" || unhealthy > 0 ? 1 : 0;
}

int Core::handleStats() {
    PerformanceSummary summary = m_agent->getPerformanceSummary(std::chrono::seconds(m_commands.window_seconds));
    std::cout << summary.toJson().dump(2) << std::endl;
    return 0;
}

} // namespace Maestro
