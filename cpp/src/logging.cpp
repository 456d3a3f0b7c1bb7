#include "geoscan/logging.hpp"
#include "geoscan/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace geoscan {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARNING:  return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& text) {
    std::string val = text;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "trace") return LogLevel::TRACE;
    if (val == "debug") return LogLevel::DEBUG;
    if (val == "info") return LogLevel::INFO;
    if (val == "warn" || val == "warning") return LogLevel::WARNING;
    if (val == "error") return LogLevel::ERROR;
    if (val == "critical") return LogLevel::CRITICAL;

    throw ConfigurationError("Unknown log level '" + text + "'", __func__,
                             "Use one of trace, debug, info, warning, error, critical");
}

// Logger implementation
class Logger::Impl {
public:
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    LogLevel level = LogLevel::INFO;
    mutable std::mutex mutex;

    Impl() {
        // Console goes to stderr so CLI output on stdout stays machine readable
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger = build();
    }

    // A published logger keeps its sinks; callers hold their copy alive
    std::shared_ptr<spdlog::logger> current() const {
        std::lock_guard<std::mutex> lock(mutex);
        return logger;
    }

    void set_level(LogLevel new_level) {
        std::lock_guard<std::mutex> lock(mutex);
        level = new_level;
        logger->set_level(to_spdlog(new_level));
    }

    void set_output_file(const std::string& filename) {
        std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
        if (!filename.empty()) {
            try {
                sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
            } catch (const spdlog::spdlog_ex& e) {
                throw ConfigurationError("Cannot open log file '" + filename + "': " + e.what(), __func__);
            }
            sink->set_level(spdlog::level::trace);
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (logger) logger->flush();
        file_sink = std::move(sink);
        logger = build();
    }

private:
    std::shared_ptr<spdlog::logger> logger;

    // Fresh logger over the current sinks, so a sink swap never touches a
    // sink list another thread is iterating
    std::shared_ptr<spdlog::logger> build() const {
        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (file_sink) sinks.push_back(file_sink);
        auto fresh = std::make_shared<spdlog::logger>("geoscan", sinks.begin(), sinks.end());
        fresh->set_level(to_spdlog(level));
        fresh->flush_on(spdlog::level::warn);
        return fresh;
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->current()->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->current()->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->current()->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->current()->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->current()->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->current()->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->level;
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->set_output_file(filename);
}

} // namespace geoscan
