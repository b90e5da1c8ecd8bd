/**
 * @file logger.cpp
 * @brief spdlog-backed Logger implementation.
 */
#include "tally/util/logger.hpp"
#include "tally/config/constants.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <vector>

namespace tally::util {

std::shared_ptr<spdlog::logger> Logger::logger_;

std::optional<spdlog::level::level_enum> Logger::parse_level(std::string_view name) noexcept {
    if (name == "trace")                      return spdlog::level::trace;
    if (name == "debug")                      return spdlog::level::debug;
    if (name == "info")                       return spdlog::level::info;
    if (name == "warn" || name == "warning")  return spdlog::level::warn;
    if (name == "err" || name == "error")     return spdlog::level::err;
    if (name == "critical")                   return spdlog::level::critical;
    if (name == "off")                        return spdlog::level::off;
    return std::nullopt;
}

void Logger::init(const LogConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        // Throws spdlog::spdlog_ex if the file cannot be opened; startup code reports it.
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, /*truncate=*/false));
    }

    auto logger = std::make_shared<spdlog::logger>(
        std::string(config::constants::LOGGER_NAME), sinks.begin(), sinks.end());
    logger->set_level(cfg.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    std::atomic_store_explicit(&logger_, std::move(logger), std::memory_order_release);
}

std::shared_ptr<spdlog::logger> Logger::instance() {
    auto logger = std::atomic_load_explicit(&logger_, std::memory_order_acquire);
    return logger ? logger : spdlog::default_logger();
}

} // namespace tally::util
