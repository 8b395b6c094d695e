#include "chunkscribe/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <vector>

namespace chunkscribe {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical" || lower == "fatal") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::logger> metrics;
    std::atomic<LogLevel> level{LogLevel::INFO};
    std::mutex reconfigure_mutex;

    Impl() {
        build("", "");
    }

    void build(const std::string& log_file, const std::string& metrics_file) {
        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        sinks.push_back(console_sink);

        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
                file_sink->set_level(spdlog::level::trace);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                std::cerr << "Could not open log file " << log_file << ": " << e.what() << std::endl;
            }
        }

        auto main_logger = std::make_shared<spdlog::logger>("chunkscribe", sinks.begin(), sinks.end());
        main_logger->set_level(to_spdlog(level.load()));
        main_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        main_logger->flush_on(spdlog::level::warn);

        std::shared_ptr<spdlog::logger> metrics_logger;
        if (!metrics_file.empty()) {
            try {
                auto metrics_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(metrics_file, false);
                metrics_logger = std::make_shared<spdlog::logger>("metrics", metrics_sink);
                metrics_logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %v");
                metrics_logger->set_level(spdlog::level::info);
                metrics_logger->flush_on(spdlog::level::info);
            } catch (const spdlog::spdlog_ex& e) {
                std::cerr << "Could not open metrics log " << metrics_file << ": " << e.what() << std::endl;
            }
        }

        std::atomic_store(&logger, main_logger);
        std::atomic_store(&metrics, metrics_logger);
    }

    void write(LogLevel lvl, const std::string& message) {
        auto current = std::atomic_load(&logger);
        current->log(to_spdlog(lvl), message);
    }

    void metric(const std::string& line) {
        auto sink = std::atomic_load(&metrics);
        if (sink) {
            sink->info(line);
        } else {
            write(LogLevel::DEBUG, "metric: " + line);
        }
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::configure(LogLevel level, const std::string& log_file, const std::string& metrics_file) {
    std::lock_guard<std::mutex> lock(pImpl->reconfigure_mutex);
    pImpl->level.store(level);
    pImpl->build(log_file, metrics_file);
}

void Logger::set_level(LogLevel level) {
    pImpl->level.store(level);
    std::atomic_load(&pImpl->logger)->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return pImpl->level.load();
}

bool Logger::should_log(LogLevel level) const {
    return level >= pImpl->level.load();
}

void Logger::write(LogLevel level, const std::string& message) {
    pImpl->write(level, message);
}

void Logger::metric(const std::string& line) {
    pImpl->metric(line);
}

void Logger::flush() {
    std::atomic_load(&pImpl->logger)->flush();
    if (auto metrics = std::atomic_load(&pImpl->metrics)) {
        metrics->flush();
    }
}

} // namespace chunkscribe
