#pragma once

#include <memory>
#include <string>

namespace geoscan {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Accepts trace|debug|info|warn|warning|error|critical, case-insensitive.
// Throws ConfigurationError for anything else.
LogLevel parse_log_level(const std::string& text);

class Logger {
public:
    static Logger& getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds a file sink next to the console sink. An empty name removes it.
    // Safe while other threads log: they finish on the logger they started with.
    void set_output_file(const std::string& filename);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Convenience macros
#define LOG_TRACE(msg) geoscan::Logger::getInstance().trace(msg)
#define LOG_DEBUG(msg) geoscan::Logger::getInstance().debug(msg)
#define LOG_INFO(msg) geoscan::Logger::getInstance().info(msg)
#define LOG_WARNING(msg) geoscan::Logger::getInstance().warning(msg)
#define LOG_ERROR(msg) geoscan::Logger::getInstance().error(msg)
#define LOG_CRITICAL(msg) geoscan::Logger::getInstance().critical(msg)

} // namespace geoscan
