// =================================================================
// include/Maestro/Logger.hpp
// =================================================================
// Header for structured logging of routing, dispatch and synthesis.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Maestro {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger shared by every component
 *
 * Writes component-tagged entries to the console (colored) and to a
 * rotating set of log files. All public methods are safe to call from
 * the orchestrator's worker threads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".maestro/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable file logging
     * @param enabled True to enable file output
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log one remote model attempt
     * @param model_id Model identifier
     * @param attempt Attempt number (1-based)
     * @param duration_ms Attempt duration in milliseconds
     * @param outcome Short outcome label ("success", "transient", ...)
     */
    void logModelInvocation(const std::string& model_id, size_t attempt,
                           long duration_ms, const std::string& outcome);

    /**
     * @brief Log a circuit breaker state change
     * @param model_id Model identifier
     * @param from Previous state name
     * @param to New state name
     * @param consecutive_failures Failure streak at the time of change
     */
    void logCircuitTransition(const std::string& model_id, const std::string& from,
                             const std::string& to, size_t consecutive_failures);

    /**
     * @brief Log a routing decision
     * @param category Primary category name
     * @param confidence Primary category confidence
     * @param plan Model identifiers in plan order
     */
    void logRoutingDecision(const std::string& category, double confidence,
                           const std::vector<std::string>& plan);

    /**
     * @brief Log query start
     * @param mode "query" or "stream"
     * @param query_text Raw query text
     * @param conversation_id Conversation identifier (may be empty)
     */
    void logQueryStart(const std::string& mode, const std::string& query_text,
                      const std::string& conversation_id);

    /**
     * @brief Log query end
     * @param mode "query" or "stream"
     * @param status Final response status name
     * @param duration_ms Total duration in milliseconds
     */
    void logQueryEnd(const std::string& mode, const std::string& status, long duration_ms);

    /**
     * @brief Parse a level name from configuration
     * @param name Level name (case-insensitive, "WARN" accepted, "CRITICAL" maps to ERROR)
     * @return Matching level, INFO when unrecognized
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    std::recursive_mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void flush();
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Maestro::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Maestro::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Maestro::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Maestro::Logger::getInstance().error(component, message)

} // namespace Maestro
