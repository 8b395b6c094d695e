// =============================================================================
// chunkscribe CLI
// =============================================================================
//
// Usage:
//   chunkscribe [-c FILE] <command> [options]
//
// Commands:
//   run         Scan intake roots and process segments until SIGINT/SIGTERM
//   once        One scan of every intake root, then exit
//   submit      Process freshly uploaded segments immediately, then exit
//   status      Show pending segments, transcripts and metrics
//   version     Show version information
//   help        Show this help message
//
// =============================================================================

#include "chunkscribe/config.hpp"
#include "chunkscribe/error.hpp"
#include "chunkscribe/logging.hpp"
#include "chunkscribe/service.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#define CHUNKSCRIBE_VERSION_STRING "1.0.0"

namespace chunkscribe::cli {

int cmd_run(int argc, char* argv[]);
int cmd_once(int argc, char* argv[]);
int cmd_submit(int argc, char* argv[]);
int cmd_status(int argc, char* argv[]);
int cmd_version(int argc, char* argv[]);
int cmd_help(int argc, char* argv[]);

} // namespace chunkscribe::cli

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"run",     "Scan intake roots and process segments until stopped", chunkscribe::cli::cmd_run},
    {"once",    "One scan of every intake root, then exit", chunkscribe::cli::cmd_once},
    {"submit",  "Process freshly uploaded segments immediately", chunkscribe::cli::cmd_submit},
    {"status",  "Show pending segments, transcripts and metrics", chunkscribe::cli::cmd_status},
    {"version", "Show version information", chunkscribe::cli::cmd_version},
    {"help",    "Show this help message", chunkscribe::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

struct GlobalOptions {
    std::string config_file = "config.yaml";
    std::string log_level;
};

static GlobalOptions g_options;

static chunkscribe::Config load_and_initialize() {
    auto config = chunkscribe::load_config(g_options.config_file);
    if (!g_options.log_level.empty()) {
        config.logging.level = g_options.log_level;
    }
    chunkscribe::initialize_logging(config.logging.level, config.logging.file, config.logging.metrics_file);
    return config;
}

namespace chunkscribe::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "chunkscribe - chunked audio transcription coordinator\n";
    std::cout << "Version " << CHUNKSCRIBE_VERSION_STRING << "\n\n";
    std::cout << "Usage: chunkscribe [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: config.yaml)\n";
    std::cout << "  -l, --log-level <lvl>   trace, debug, info, warning, error, critical\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  WHISPER_MODEL           Transcription model name\n";
    std::cout << "  TELEGRAM_TOKEN          Bot token for notifications\n";
    std::cout << "  TELEGRAM_CHAT_ID        Chat receiving notifications\n";
    std::cout << "  CHUNKSCRIBE_LOG_LEVEL   Log level override\n";
    std::cout << "\nExamples:\n";
    std::cout << "  chunkscribe run\n";
    std::cout << "  chunkscribe -c /etc/chunkscribe.yaml once\n";
    std::cout << "  chunkscribe submit input_web/uploads/lecture_part1.mp3\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "chunkscribe " << CHUNKSCRIBE_VERSION_STRING << "\n";
    return 0;
}

int cmd_run([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    const auto config = load_and_initialize();
    LOG_INFO("Starting chunkscribe ", CHUNKSCRIBE_VERSION_STRING);

    Service service(config);

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal ", signal_number, ", shutting down");
        }
    });

    service.start();
    signals_context.run();

    // In-flight transcriptions finish before stop() returns.
    service.stop();
    Logger::getInstance().flush();
    return 0;
}

int cmd_once([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    const auto config = load_and_initialize();
    Service service(config);
    const auto handled = service.run_once();
    std::cout << handled << " candidates handled, " << service.artifact_count() << " transcripts in "
              << service.config().paths.output_root.string() << "\n";
    Logger::getInstance().flush();
    return 0;
}

int cmd_submit(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: chunkscribe submit <segment> [segment...]\n";
        return 1;
    }
    const auto config = load_and_initialize();
    Service service(config);

    int rejected = 0;
    for (int i = 0; i < argc; ++i) {
        try {
            service.submit(argv[i]);
        } catch (const InvalidArgumentError& e) {
            std::cerr << "Rejected " << argv[i] << ": " << e.what() << "\n";
            ++rejected;
        }
    }
    service.drain_uploads();
    Logger::getInstance().flush();
    return rejected == 0 ? 0 : 1;
}

int cmd_status([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    const auto config = load_and_initialize();
    Service service(config);

    std::cout << "Pending segments:\n";
    for (const auto& root : service.config().paths.intake_roots) {
        std::cout << "  " << root.name << " (" << root.path.string() << "): "
                  << service.pending_segments(root.name) << "\n";
    }
    std::cout << "Transcripts: " << service.artifact_count() << "\n\n";
    std::cout << service.metrics_text();
    return 0;
}

} // namespace chunkscribe::cli

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            g_options.log_level = argv[++i];
        } else {
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        chunkscribe::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const chunkscribe::ConfigError& e) {
                LOG_CRITICAL("Configuration error: ", e.what());
                return 2;
            } catch (const std::exception& e) {
                LOG_CRITICAL("Fatal error: ", e.what());
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'chunkscribe help' for usage.\n";
    return 1;
}
