// =================================================================
// src/Maestro/Logger.cpp
// =================================================================
// Implementation for the shared logging system.

#include "Maestro/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace Maestro {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    m_current_log_file.reset();
    if (m_file_enabled) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    }

    debug("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        m_current_log_file.reset();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::logModelInvocation(const std::string& model_id, size_t attempt,
                               long duration_ms, const std::string& outcome) {
    std::ostringstream context;
    context << "Attempt: " << attempt << ", ";
    context << "Duration: " << duration_ms << "ms, ";
    context << "Outcome: " << outcome;

    if (outcome == "success") {
        debug("Model", "Invocation of " + model_id + " completed", context.str());
    } else {
        warning("Model", "Invocation of " + model_id + " failed", context.str());
    }

    if (duration_ms > 30000) { // > 30 seconds
        warning("Model", "Slow response detected from " + model_id,
                "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logCircuitTransition(const std::string& model_id, const std::string& from,
                                 const std::string& to, size_t consecutive_failures) {
    std::ostringstream context;
    context << from << " -> " << to << ", ";
    context << "Consecutive failures: " << consecutive_failures;

    if (to == "open") {
        warning("CircuitBreaker", "Circuit opened for " + model_id, context.str());
    } else {
        info("CircuitBreaker", "Circuit changed for " + model_id, context.str());
    }
}

void Logger::logRoutingDecision(const std::string& category, double confidence,
                               const std::vector<std::string>& plan) {
    std::ostringstream context;
    context << "Category: " << category << ", ";
    context << "Confidence: " << std::fixed << std::setprecision(2) << confidence << ", ";
    context << "Plan: ";
    for (size_t i = 0; i < plan.size(); i++) {
        if (i > 0) context << " > ";
        context << plan[i];
    }

    info("TaskRouter", "Routing decision made", context.str());
}

void Logger::logQueryStart(const std::string& mode, const std::string& query_text,
                          const std::string& conversation_id) {
    std::ostringstream context;
    context << "Mode: " << mode << ", ";
    context << "Query length: " << query_text.length() << " chars";
    if (!conversation_id.empty()) {
        context << ", Conversation: " << conversation_id;
    }

    info("Session", "Query received", context.str());
    debug("Session", "Query text: " + query_text);
}

void Logger::logQueryEnd(const std::string& mode, const std::string& status, long duration_ms) {
    std::ostringstream context;
    context << "Mode: " << mode << ", ";
    context << "Status: " << status << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (status == "failure") {
        error("Session", "Query completed with errors", context.str());
    } else {
        info("Session", "Query completed", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR" || upper == "CRITICAL" || upper == "CRIT") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // Diagnostics go to stderr so they never mix with answers on stdout
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush errors immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_log_dir << "/maestro_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace Maestro
