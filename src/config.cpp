#include "chunkscribe/config.hpp"

#include "chunkscribe/error.hpp"
#include "chunkscribe/identity.hpp"
#include "chunkscribe/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>

namespace chunkscribe {

namespace {

template<typename T>
void read_if(const YAML::Node& node, const char* key, T& target) {
    if (node && node[key]) {
        target = node[key].as<T>();
    }
}

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

uint32_t parse_env_uint(const char* name, const char* value) {
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0) {
            throw ConfigError("must not be negative", name);
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string("not a number: ") + value, name);
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string("out of range: ") + value, name);
    }
}

} // namespace

Config default_config() {
    Config config;

    config.paths.intake_roots = {
        {"gdrive", "input", 70},
        {"web", "input_web", 30},
    };
    config.paths.upload_root = "web";
    config.paths.upload_subdir = "uploads";
    config.paths.fragments_root = "output_parts";
    config.paths.output_root = "output";

    config.segments.marker = "_part";
    config.segments.max_part = IdentityResolver::kDefaultMaxPart;
    config.segments.fragment_extension = ".txt";
    config.segments.audio_extensions = {".mp3", ".wav", ".m4a", ".flac"};
    config.segments.nominal_minutes = 15.0;

    config.scan.interval_seconds = 300;

    config.transcription.command = {"whisper-cli", "-m", "models/ggml-{model}.bin", "-nt", "-np", "-f", "{input}"};
    config.transcription.model = "tiny";
    config.transcription.max_concurrent = 1;

    config.retry.max_attempts = 5;
    config.retry.initial_backoff_seconds = 60;
    config.retry.max_backoff_seconds = 3600;

    config.telegram.timeout_seconds = 10;

    config.logging.level = "info";
    config.logging.file = "";
    config.logging.metrics_file = "";

    config.metrics.sample_capacity = 1000;
    config.metrics.event_capacity = 100;

    return config;
}

Config load_config(const std::string& config_file) {
    Config config = default_config();
    config.config_file = config_file;

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        YAML::Node yaml;
        try {
            yaml = YAML::LoadFile(config_file);
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("cannot parse YAML: ") + e.what(), config_file);
        }

        try {
            if (const auto paths = yaml["paths"]) {
                if (const auto roots = paths["intake_roots"]) {
                    config.paths.intake_roots.clear();
                    for (const auto& root : roots) {
                        IntakeRoot intake;
                        intake.name = root["name"].as<std::string>();
                        intake.path = root["path"].as<std::string>();
                        intake.priority = root["priority"] ? root["priority"].as<int>() : 50;
                        config.paths.intake_roots.push_back(std::move(intake));
                    }
                }
                read_if(paths, "upload_root", config.paths.upload_root);
                read_if(paths, "upload_subdir", config.paths.upload_subdir);
                if (paths["fragments_root"]) config.paths.fragments_root = paths["fragments_root"].as<std::string>();
                if (paths["output_root"]) config.paths.output_root = paths["output_root"].as<std::string>();
            }

            if (const auto segments = yaml["segments"]) {
                read_if(segments, "marker", config.segments.marker);
                read_if(segments, "max_part", config.segments.max_part);
                read_if(segments, "fragment_extension", config.segments.fragment_extension);
                read_if(segments, "audio_extensions", config.segments.audio_extensions);
                read_if(segments, "nominal_minutes", config.segments.nominal_minutes);
            }

            read_if(yaml["scan"], "interval_seconds", config.scan.interval_seconds);

            if (const auto transcription = yaml["transcription"]) {
                read_if(transcription, "command", config.transcription.command);
                read_if(transcription, "model", config.transcription.model);
                read_if(transcription, "max_concurrent", config.transcription.max_concurrent);
            }

            if (const auto retry = yaml["retry"]) {
                read_if(retry, "max_attempts", config.retry.max_attempts);
                read_if(retry, "initial_backoff_seconds", config.retry.initial_backoff_seconds);
                read_if(retry, "max_backoff_seconds", config.retry.max_backoff_seconds);
            }

            if (const auto notifications = yaml["notifications"]) {
                const auto telegram = notifications["telegram"];
                read_if(telegram, "token", config.telegram.token);
                read_if(telegram, "chat_id", config.telegram.chat_id);
                read_if(telegram, "timeout_seconds", config.telegram.timeout_seconds);
            }

            if (const auto logging = yaml["logging"]) {
                read_if(logging, "level", config.logging.level);
                read_if(logging, "file", config.logging.file);
                read_if(logging, "metrics_file", config.logging.metrics_file);
            }

            if (const auto metrics = yaml["metrics"]) {
                read_if(metrics, "sample_capacity", config.metrics.sample_capacity);
                read_if(metrics, "event_capacity", config.metrics.event_capacity);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("bad value: ") + e.what(), config_file);
        }
    } else if (!config_file.empty()) {
        LOG_INFO("Config file ", config_file, " not found, using defaults");
    }

    apply_env_overrides(config);
    validate_config(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (const char* v = env_value("CHUNKSCRIBE_FRAGMENTS_ROOT")) config.paths.fragments_root = v;
    if (const char* v = env_value("CHUNKSCRIBE_OUTPUT_ROOT")) config.paths.output_root = v;
    if (const char* v = env_value("CHUNKSCRIBE_SCAN_INTERVAL")) {
        config.scan.interval_seconds = parse_env_uint("CHUNKSCRIBE_SCAN_INTERVAL", v);
    }
    if (const char* v = env_value("CHUNKSCRIBE_LOG_LEVEL")) config.logging.level = v;
    if (const char* v = env_value("CHUNKSCRIBE_LOG_FILE")) config.logging.file = v;
    if (const char* v = env_value("WHISPER_MODEL")) config.transcription.model = v;
    if (const char* v = env_value("TELEGRAM_TOKEN")) config.telegram.token = v;
    if (const char* v = env_value("TELEGRAM_CHAT_ID")) config.telegram.chat_id = v;
}

void validate_config(const Config& config) {
    if (config.paths.intake_roots.empty()) {
        throw ConfigError("at least one intake root is required", "paths.intake_roots");
    }

    std::set<std::string> names;
    for (const auto& root : config.paths.intake_roots) {
        if (root.name.empty() || root.path.empty()) {
            throw ConfigError("intake root needs a name and a path", "paths.intake_roots");
        }
        if (!names.insert(root.name).second) {
            throw ConfigError("duplicate intake root name '" + root.name + "'", "paths.intake_roots");
        }
    }

    if (!config.paths.upload_root.empty() && !find_intake_root(config, config.paths.upload_root)) {
        throw ConfigError("unknown intake root '" + config.paths.upload_root + "'", "paths.upload_root");
    }
    if (config.paths.fragments_root.empty()) {
        throw ConfigError("must not be empty", "paths.fragments_root");
    }
    if (config.paths.output_root.empty()) {
        throw ConfigError("must not be empty", "paths.output_root");
    }
    if (config.paths.fragments_root == config.paths.output_root) {
        throw ConfigError("fragments and output must be separate trees", "paths.fragments_root");
    }
    if (config.segments.marker.empty()) {
        throw ConfigError("must not be empty", "segments.marker");
    }
    if (config.segments.max_part == 0) {
        throw ConfigError("must be at least 1", "segments.max_part");
    }
    if (config.segments.audio_extensions.empty()) {
        throw ConfigError("at least one audio extension is required", "segments.audio_extensions");
    }
    if (config.scan.interval_seconds == 0) {
        throw ConfigError("must be positive", "scan.interval_seconds");
    }
    if (config.transcription.command.empty()) {
        throw ConfigError("must not be empty", "transcription.command");
    }
    if (config.transcription.max_concurrent == 0) {
        throw ConfigError("must be positive", "transcription.max_concurrent");
    }
    if (config.retry.max_attempts == 0) {
        throw ConfigError("must be positive", "retry.max_attempts");
    }
    if (config.retry.initial_backoff_seconds > config.retry.max_backoff_seconds) {
        throw ConfigError("initial backoff exceeds maximum", "retry.initial_backoff_seconds");
    }
    if (config.metrics.sample_capacity == 0 || config.metrics.event_capacity == 0) {
        throw ConfigError("ring capacities must be positive", "metrics");
    }
}

const IntakeRoot* find_intake_root(const Config& config, const std::string& name) {
    for (const auto& root : config.paths.intake_roots) {
        if (root.name == name) return &root;
    }
    return nullptr;
}

} // namespace chunkscribe
