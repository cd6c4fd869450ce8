/**
 * @file main.cpp
 * @brief BundleForwarder daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a complete forwarding pipeline:
 *   Config → Logger → Upload Backend → BundledOutput ← stdin records
 *
 * SIGHUP forces a rollover; SIGINT/SIGTERM stop the daemon. Once stdin
 * reaches EOF the live file is flushed and the daemon exits after every
 * bundle has been delivered.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "output/bundled_output.hpp"
#include "telemetry/json_sink.hpp"
#include "upload/upload_backend.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

using namespace bundle_forwarder;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_flush_requested = 0;

void signal_handler(int signal) {
    if (signal == SIGHUP) {
        g_flush_requested = 1;
    } else {
        g_shutdown_requested = 1;
    }
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         BundleForwarder v1.0.0            ║
  ║   Durable Buffering Output Stage for      ║
  ║   Event Forwarding Pipelines              ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string connection;
    std::string backend;
    std::string log_dir;
    std::string log_level;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--connection" && i + 1 < argc) {
            args.connection = argv[++i];
        } else if (arg == "--backend" && i + 1 < argc) {
            args.backend = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: bundle_forwarder [OPTIONS]\n"
                      << "  --config <path>       Configuration file (default: config/default.toml)\n"
                      << "  --connection <desc>   [localDirectory:]backendSuffix\n"
                      << "  --backend <name>      Upload backend: mirror | tcp\n"
                      << "  --log-dir <path>      Log output directory (default: stdout)\n"
                      << "  --log-level <level>   debug | info | warn | error\n"
                      << "  --help, -h            Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

/**
 * @brief Read newline-terminated records from stdin into @p records.
 *
 * Each record keeps its trailing newline. A final unterminated line is
 * delivered at EOF. The channel is closed when stdin ends.
 */
void read_stdin(RecordChannel& records, Logger& logger,
                std::atomic<bool>& eof, std::stop_token stop) {
    std::string partial;
    char buf[64 * 1024];

    while (!stop.stop_requested()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger.error(std::string{"poll() on stdin failed: "} + std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            logger.error(std::string{"read() on stdin failed: "} + std::strerror(errno));
            break;
        }
        if (n == 0) break;

        partial.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        for (size_t nl = partial.find('\n', start); nl != std::string::npos;
             nl = partial.find('\n', start)) {
            if (!records.push(partial.substr(start, nl - start + 1), stop)) return;
            start = nl + 1;
        }
        partial.erase(0, start);
    }

    if (!partial.empty() && !stop.stop_requested()) {
        if (!records.push(std::move(partial), stop)) return;
    }
    records.close();
    eof.store(true);
    logger.info("stdin closed");
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.connection.empty()) config.upload.connection = args.connection;
    if (!args.backend.empty()) config.upload.backend = args.backend;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    auto make_sink = [&config](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (config.telemetry.log_dir.empty()) {
            return std::make_unique<StdoutSink>();
        }
        return std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                              config.telemetry.max_file_size_mb,
                                              config.telemetry.rotate_count);
    };
    Logger logger(make_sink("bundle_forwarder_main"), *level, "main");
    logger.info("BundleForwarder starting...");
    logger.info("Backend: " + config.upload.backend);
    logger.info("Connection: " + config.upload.connection);

    // ── Initialize Upload Backend ────────────
    auto backend = make_upload_backend(config);
    if (!backend) {
        logger.error("Cannot create upload backend: " + backend.error().message);
        return 1;
    }

    // ── Initialize Output ────────────────────
    BundledOutput::Options opts;
    opts.config = config;
    opts.backend = std::move(*backend);
    opts.log_sink = make_sink("bundle_forwarder");
    opts.log_level = *level;
    if (!config.telemetry.log_dir.empty()) {
        opts.metrics_sink = make_sink("bundle_forwarder_metrics");
    }
    BundledOutput output(std::move(opts));

    if (auto init = output.initialize(config.upload.connection); !init) {
        logger.error("Initialization failed: " + init.error().message);
        return 1;
    }
    logger.info("Output ready: " + output.describe());

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    // ── Start Pipeline ───────────────────────
    RecordChannel records(config.buffer.record_queue_capacity);
    std::atomic<bool> fatal{false};
    auto on_error = [&](const Error& err) {
        logger.error("Output failed: " + err.message);
        fatal.store(true);
    };
    if (auto started = output.run(records, on_error); !started) {
        logger.error("Cannot start event loop: " + started.error().message);
        return 1;
    }

    std::atomic<bool> stdin_eof{false};
    std::jthread reader([&](std::stop_token stop) {
        read_stdin(records, logger, stdin_eof, stop);
    });

    // ── Main Loop ────────────────────────────
    logger.info("Forwarding stdin. SIGHUP flushes, Ctrl+C shuts down.");

    const auto status_interval = std::chrono::seconds(config.telemetry.status_interval_s);
    auto next_status = std::chrono::steady_clock::now() + status_interval;

    while (!g_shutdown_requested && !fatal.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (g_flush_requested) {
            g_flush_requested = 0;
            logger.info("SIGHUP received; flushing live file");
            output.request_flush();
        }

        // At end of input, flush the live file and wait for every bundle
        if (stdin_eof.load() && output.input_drained()) {
            if (output.idle()) {
                logger.info("All bundles delivered");
                break;
            }
            if (output.current_file_size() > 0) {
                output.request_flush();
            }
        }

        if (config.telemetry.status_interval_s > 0
            && std::chrono::steady_clock::now() >= next_status) {
            auto json = output.statistics().to_json();
            output.metrics().record_statistics(json);
            logger.info("Status: " + json);
            next_status = std::chrono::steady_clock::now() + status_interval;
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutting down...");
    reader.request_stop();
    records.close();
    if (reader.joinable()) reader.join();

    // Lines already read from stdin still go to disk
    while (output.is_running() && !output.input_drained()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    output.stop();
    output.wait_for_uploads();

    logger.info("Final statistics: " + output.statistics().to_json());
    output.metrics().flush();
    logger.info("BundleForwarder stopped.");
    logger.flush();
    return fatal.load() ? 1 : 0;
}
