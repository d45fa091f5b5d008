// =================================================================
// src/Maestro/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Maestro/CliParser.hpp"

namespace Maestro {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Maestro: routes queries to specialized remote AI models.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration (default: maestro.yml)");
    m_app->add_flag("-q,--quiet", m_commands.quiet, "Suppress log output on the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupQueryCommand(*m_app);
    setupClassifyCommand(*m_app);
    setupModelsCommand(*m_app);
    setupHealthCommand(*m_app);
    setupStatsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupQueryCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("query", "Answers a query using the best suited models.");
    sub->add_option("text", m_commands.query_text, "The query text.")->required();
    sub->add_option("--conversation", m_commands.conversation_id, "Conversation identifier for multi-turn context.");
    sub->add_option("--caller", m_commands.caller_id, "Caller identifier used for admission control.");
    sub->add_flag("-s,--stream", m_commands.stream, "Print the answer incrementally as it arrives.");
}

void CliParser::setupClassifyCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("classify", "Shows the classification and model plan for a query without running it.");
    sub->add_option("text", m_commands.query_text, "The query text.")->required();
}

void CliParser::setupModelsCommand(CLI::App& app) {
    app.add_subcommand("models", "Lists configured models with their capabilities and circuit state.");
}

void CliParser::setupHealthCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("health", "Prints the health report as JSON.");
    sub->add_flag("--verify", m_commands.verify, "Send a test prompt to every model before reporting.");
}

void CliParser::setupStatsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("stats", "Prints aggregate performance statistics as JSON.");
    sub->add_option("--window", m_commands.window_seconds, "Trailing window in seconds (default: all records)")
        ->check(CLI::NonNegativeNumber);
}

} // namespace Maestro
