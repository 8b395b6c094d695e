#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkscribe {

// One directory tree that receives audio segments.
struct IntakeRoot {
    std::string name;
    std::filesystem::path path;
    int priority;
};

struct PathsConfig {
    std::vector<IntakeRoot> intake_roots;
    std::string upload_root;        // name of the intake root fed by uploads
    std::string upload_subdir;      // directory under that root for loose uploads
    std::filesystem::path fragments_root;
    std::filesystem::path output_root;
};

struct SegmentsConfig {
    std::string marker;
    uint32_t max_part;              // higher part numbers are malformed names
    std::string fragment_extension;
    std::vector<std::string> audio_extensions;
    double nominal_minutes;         // assumed length of one segment, for the speed metric only
};

struct ScanConfig {
    uint32_t interval_seconds;
};

struct TranscriptionConfig {
    // argv template; "{input}" and "{model}" are substituted per call
    std::vector<std::string> command;
    std::string model;
    uint32_t max_concurrent;
};

struct RetryConfig {
    uint32_t max_attempts;
    uint32_t initial_backoff_seconds;
    uint32_t max_backoff_seconds;
};

struct TelegramConfig {
    std::string token;
    std::string chat_id;
    uint32_t timeout_seconds;

    bool enabled() const { return !token.empty() && !chat_id.empty(); }
};

struct LoggingConfig {
    std::string level;
    std::string file;
    std::string metrics_file;
};

struct MetricsConfig {
    uint32_t sample_capacity;
    uint32_t event_capacity;
};

struct Config {
    PathsConfig paths;
    SegmentsConfig segments;
    ScanConfig scan;
    TranscriptionConfig transcription;
    RetryConfig retry;
    TelegramConfig telegram;
    LoggingConfig logging;
    MetricsConfig metrics;
    std::string config_file;
};

Config default_config();

// Defaults, then the YAML file (skipped when it does not exist), then
// CHUNKSCRIBE_* / WHISPER_MODEL / TELEGRAM_* environment variables.
// Throws ConfigError when the file cannot be parsed or the result is invalid.
Config load_config(const std::string& config_file = "config.yaml");

void apply_env_overrides(Config& config);
void validate_config(const Config& config);

const IntakeRoot* find_intake_root(const Config& config, const std::string& name);

} // namespace chunkscribe
