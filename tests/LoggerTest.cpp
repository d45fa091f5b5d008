// =================================================================
// tests/LoggerTest.cpp
// =================================================================
// Unit tests for level parsing and the file sink.

#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Maestro;

class LoggerTest {
private:
    static std::string readLogs(const std::filesystem::path& dir) {
        std::string all;
        for (const auto& file : std::filesystem::directory_iterator(dir)) {
            std::ifstream in(file.path());
            std::stringstream buffer;
            buffer << in.rdbuf();
            all += buffer.str();
        }
        return all;
    }

public:
    void testParseLevel() {
        std::cout << "Testing level names from configuration..." << std::endl;

        assert(Logger::parseLevel("debug") == LogLevel::DEBUG);
        assert(Logger::parseLevel("Info") == LogLevel::INFO);
        assert(Logger::parseLevel("WARN") == LogLevel::WARNING);
        assert(Logger::parseLevel("warning") == LogLevel::WARNING);
        assert(Logger::parseLevel("ERROR") == LogLevel::ERROR);

        // No separate critical level
        assert(Logger::parseLevel("CRITICAL") == LogLevel::ERROR);
        assert(Logger::parseLevel("crit") == LogLevel::ERROR);

        assert(Logger::parseLevel("verbose") == LogLevel::INFO);
        assert(Logger::parseLevel("") == LogLevel::INFO);

        std::cout << "✓ Level parsing test passed" << std::endl;
    }

    void testFileSinkIgnoresConsoleLevel() {
        std::cout << "Testing file sink records every level..." << std::endl;

        auto dir = std::filesystem::temp_directory_path() / "maestro_logger_test";
        std::filesystem::remove_all(dir);

        Logger& logger = Logger::getInstance();
        logger.setConsoleLogging(false);
        logger.setConsoleLogLevel(LogLevel::ERROR);
        logger.setFileLogging(true);
        logger.initialize(dir.string());

        logger.debug("LoggerTest", "debug entry");
        logger.warning("LoggerTest", "warning entry", "ctx");
        LOG_ERROR("LoggerTest", "error entry");

        std::string logs = readLogs(dir);
        assert(logs.find("[DEBUG] LoggerTest: debug entry") != std::string::npos);
        assert(logs.find("[WARN] LoggerTest: warning entry") != std::string::npos);
        assert(logs.find("[ERROR] LoggerTest: error entry") != std::string::npos);

        logger.setFileLogging(false);
        logger.info("LoggerTest", "not written");
        assert(readLogs(dir).find("not written") == std::string::npos);

        std::filesystem::remove_all(dir);

        std::cout << "✓ File sink test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Logger Tests..." << std::endl;
        std::cout << "=======================" << std::endl;

        testParseLevel();
        std::cout << std::endl;

        testFileSinkIgnoresConsoleLevel();
        std::cout << std::endl;

        std::cout << "All Logger tests passed!" << std::endl;
    }
};

int main() {
    try {
        LoggerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Logger component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
