#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace chunkscribe {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Accepts trace/debug/info/warn/warning/error/critical, case-insensitive.
// Unknown names fall back to INFO.
LogLevel parse_log_level(const std::string& name);

/**
 * Process-wide logger backed by spdlog.
 *
 * Records go to a colored console sink and, when configured, to an
 * append-mode file. Metric lines have their own logger so they can be routed
 * to a separate file.
 */
class Logger {
public:
    static Logger& getInstance();

    // Rebuilds the sinks. Empty paths disable the corresponding file sink.
    void configure(LogLevel level, const std::string& log_file, const std::string& metrics_file);

    void set_level(LogLevel level);
    LogLevel level() const;
    bool should_log(LogLevel level) const;

    void write(LogLevel level, const std::string& message);
    void metric(const std::string& line);
    void flush();

    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!should_log(level)) return;
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        write(level, ss.str());
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

inline void initialize_logging(const std::string& level, const std::string& log_file = "",
                               const std::string& metrics_file = "") {
    Logger::getInstance().configure(parse_log_level(level), log_file, metrics_file);
}

} // namespace chunkscribe

// Convenience macros
#define LOG_TRACE(...)    ::chunkscribe::Logger::getInstance().log(::chunkscribe::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...)    ::chunkscribe::Logger::getInstance().log(::chunkscribe::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)     ::chunkscribe::Logger::getInstance().log(::chunkscribe::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARNING(...)  ::chunkscribe::Logger::getInstance().log(::chunkscribe::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...)    ::chunkscribe::Logger::getInstance().log(::chunkscribe::LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) ::chunkscribe::Logger::getInstance().log(::chunkscribe::LogLevel::CRITICAL, __VA_ARGS__)
