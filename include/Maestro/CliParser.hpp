// =================================================================
// include/Maestro/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Maestro {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = "maestro.yml";
    bool quiet = false;

    // Options for 'query' and 'classify'
    std::string query_text;
    std::string conversation_id;
    std::string caller_id;
    bool stream = false;

    // Options for 'health'
    bool verify = false;

    // Options for 'stats'
    long window_seconds = 0;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupQueryCommand(CLI::App& app);
    void setupClassifyCommand(CLI::App& app);
    void setupModelsCommand(CLI::App& app);
    void setupHealthCommand(CLI::App& app);
    void setupStatsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Maestro
