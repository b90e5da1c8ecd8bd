/**
 * @file main.cpp
 * @brief Standalone host for the usage metrics core.
 *
 * **Bootstrap**
 * - Parse --config / --log-level, load config, init the process logger.
 * - Construct StateRegistry, Aggregator, LogSink and Exporter.
 *
 * **Runtime**
 * - The reconciler embedding this core feeds the registry; standalone, the
 *   registry stays empty and every export reports zero counts.
 * - Export periodically until SIGINT/SIGTERM, then export once more and exit.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "tally/config/config_loader.hpp"
#include "tally/metrics/aggregator.hpp"
#include "tally/metrics/state_registry.hpp"
#include "tally/obs/exporter.hpp"
#include "tally/obs/metrics_sink.hpp"
#include "tally/util/logger.hpp"
#include "tally/version.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_signal(int) {
    g_shutdown_requested.store(true);
}

struct CliArgs {
    std::string config_path;
    std::string log_level;
};

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config <file.json>] [--log-level <level>]\n";
}

bool parse_cli_args(int argc, char* argv[], CliArgs& out) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            out.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            out.log_level = argv[++i];
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    using tally::util::Logger;

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        usage(argv[0]);
        return 2;
    }

    auto cfg = tally::config::Loader::defaults();
    if (!args.config_path.empty()) {
        auto loaded = tally::config::Loader::load_from_file(args.config_path);
        if (!loaded) {
            std::cerr << "config " << args.config_path << ": "
                      << tally::config::describe(loaded.error()) << "\n";
            return 1;
        }
        cfg = *loaded;
    }
    if (!args.log_level.empty()) {
        auto level = Logger::parse_level(args.log_level);
        if (!level) {
            std::cerr << "unknown log level: " << args.log_level << "\n";
            return 2;
        }
        cfg.log.level = *level;
    }

    try {
        Logger::init(cfg.log);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "logger init failed: " << e.what() << "\n";
        return 1;
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "tally {} starting", tally::version_string);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    tally::metrics::StateRegistry registry;
    tally::metrics::Aggregator aggregator(registry);
    tally::obs::LogSink sink;
    tally::obs::Exporter exporter(aggregator, sink, cfg.exporter);

    exporter.start();

    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Shutdown requested, exporting final usage report");

    exporter.stop();
    exporter.exportOnce();

    SPDLOG_LOGGER_INFO(Logger::instance(), "Exiting");
    return 0;
}
