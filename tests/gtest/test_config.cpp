#include <gtest/gtest.h>

#include "chunkscribe/config.hpp"
#include "chunkscribe/error.hpp"
#include "chunkscribe/logging.hpp"
#include "support/temp_dir.hpp"

#include <cstdlib>

using namespace chunkscribe;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* name : {"CHUNKSCRIBE_FRAGMENTS_ROOT", "CHUNKSCRIBE_OUTPUT_ROOT", "CHUNKSCRIBE_SCAN_INTERVAL",
                                 "CHUNKSCRIBE_LOG_LEVEL", "CHUNKSCRIBE_LOG_FILE", "WHISPER_MODEL",
                                 "TELEGRAM_TOKEN", "TELEGRAM_CHAT_ID"}) {
            ::unsetenv(name);
        }
    }

    std::string write_config(const std::string& yaml) {
        const auto path = dir_ / "config.yaml";
        test::write_file(path, yaml);
        return path.string();
    }

    test::TempDir dir_;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config = default_config();
    EXPECT_NO_THROW(validate_config(config));
    ASSERT_EQ(config.paths.intake_roots.size(), 2u);
    EXPECT_EQ(config.paths.intake_roots[0].name, "gdrive");
    EXPECT_GT(config.paths.intake_roots[0].priority, config.paths.intake_roots[1].priority);
    EXPECT_EQ(config.segments.marker, "_part");
    EXPECT_EQ(config.segments.max_part, 9999u);
    EXPECT_EQ(config.scan.interval_seconds, 300u);
    EXPECT_EQ(config.transcription.model, "tiny");
    EXPECT_FALSE(config.telegram.enabled());
}

TEST_F(ConfigTest, MissingFileUsesDefaults) {
    Config config = load_config((dir_ / "absent.yaml").string());
    EXPECT_EQ(config.paths.output_root, std::filesystem::path("output"));
    EXPECT_EQ(config.retry.max_attempts, 5u);
}

TEST_F(ConfigTest, LoadsYamlValues) {
    Config config = load_config(write_config(R"(
paths:
  intake_roots:
    - name: lectures
      path: /data/lectures
      priority: 90
    - name: phone
      path: /data/phone
  upload_root: phone
  fragments_root: /data/parts
  output_root: /data/out
segments:
  marker: "-seg"
  max_part: 500
  audio_extensions: [".ogg"]
scan:
  interval_seconds: 45
transcription:
  command: ["whisper", "{input}"]
  model: base
  max_concurrent: 2
retry:
  max_attempts: 2
  initial_backoff_seconds: 5
  max_backoff_seconds: 50
notifications:
  telegram:
    token: abc
    chat_id: "42"
)"));

    ASSERT_EQ(config.paths.intake_roots.size(), 2u);
    EXPECT_EQ(config.paths.intake_roots[0].path, std::filesystem::path("/data/lectures"));
    EXPECT_EQ(config.paths.intake_roots[0].priority, 90);
    EXPECT_EQ(config.paths.intake_roots[1].priority, 50);
    EXPECT_EQ(config.paths.upload_root, "phone");
    EXPECT_EQ(config.paths.fragments_root, std::filesystem::path("/data/parts"));
    EXPECT_EQ(config.segments.marker, "-seg");
    EXPECT_EQ(config.segments.max_part, 500u);
    EXPECT_EQ(config.segments.audio_extensions, std::vector<std::string>{".ogg"});
    EXPECT_EQ(config.scan.interval_seconds, 45u);
    EXPECT_EQ(config.transcription.command.size(), 2u);
    EXPECT_EQ(config.transcription.model, "base");
    EXPECT_EQ(config.transcription.max_concurrent, 2u);
    EXPECT_EQ(config.retry.max_backoff_seconds, 50u);
    EXPECT_TRUE(config.telegram.enabled());
    EXPECT_EQ(config.telegram.chat_id, "42");
    EXPECT_NE(find_intake_root(config, "phone"), nullptr);
    EXPECT_EQ(find_intake_root(config, "gdrive"), nullptr);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    const auto file = write_config("transcription:\n  model: base\nscan:\n  interval_seconds: 45\n");
    ::setenv("WHISPER_MODEL", "medium", 1);
    ::setenv("CHUNKSCRIBE_SCAN_INTERVAL", "10", 1);
    ::setenv("TELEGRAM_TOKEN", "token", 1);
    ::setenv("TELEGRAM_CHAT_ID", "7", 1);
    ::setenv("CHUNKSCRIBE_OUTPUT_ROOT", "/srv/out", 1);

    Config config = load_config(file);
    EXPECT_EQ(config.transcription.model, "medium");
    EXPECT_EQ(config.scan.interval_seconds, 10u);
    EXPECT_TRUE(config.telegram.enabled());
    EXPECT_EQ(config.paths.output_root, std::filesystem::path("/srv/out"));
}

TEST_F(ConfigTest, BadEnvironmentNumberIsConfigError) {
    ::setenv("CHUNKSCRIBE_SCAN_INTERVAL", "often", 1);
    Config config = default_config();
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
}

TEST_F(ConfigTest, MalformedYamlIsConfigError) {
    EXPECT_THROW(load_config(write_config("paths: [unclosed\n")), ConfigError);
    EXPECT_THROW(load_config(write_config("scan:\n  interval_seconds: soon\n")), ConfigError);
}

TEST_F(ConfigTest, ValidationRejectsInconsistentSettings) {
    Config config = default_config();
    config.paths.intake_roots.clear();
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.paths.intake_roots.push_back({"gdrive", "elsewhere", 10});
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.paths.upload_root = "nowhere";
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.paths.output_root = config.paths.fragments_root;
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.scan.interval_seconds = 0;
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.retry.initial_backoff_seconds = config.retry.max_backoff_seconds + 1;
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.transcription.command.clear();
    EXPECT_THROW(validate_config(config), ConfigError);

    config = default_config();
    config.segments.max_part = 0;
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("chatty"), LogLevel::INFO);
}
