// =================================================================
// include/Maestro/Core.hpp
// =================================================================
// Defines the command-line application driver.

#pragma once

#include "Maestro/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Maestro {
    struct AppConfig;
    class Agent;
    class ModelRegistry;
}

namespace Maestro {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    /**
     * @brief Loads configuration, sets up logging and builds the agent.
     * @throws ConfigError when the configuration is invalid
     */
    void initialize();

    // Command Handlers
    int handleQuery();
    int handleClassify();
    int handleModels();
    int handleHealth();
    int handleStats();

    const Commands& m_commands;
    std::unique_ptr<AppConfig> m_config;
    std::shared_ptr<ModelRegistry> m_registry;
    std::unique_ptr<Agent> m_agent;
};

} // namespace Maestro
