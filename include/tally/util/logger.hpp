#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide spdlog logger facade.
 *
 * Call Logger::init(cfg) once at startup, then log anywhere with
 * SPDLOG_LOGGER_<LEVEL>(Logger::instance(), ...). Before init() the facade
 * hands out spdlog's default logger so library code and tests can log
 * without any setup.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tally::util {

/** @struct LogConfig
 *  @brief Sinks and minimum level for the process logger.
 */
struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info}; ///< Minimum severity emitted
    std::string file;                                     ///< Optional file sink path (empty = console only)
};

/** @class Logger
 *  @brief Owner of the shared spdlog logger.
 *
 * Threading: spdlog loggers are thread-safe; init() must complete before
 * other threads start logging.
 */
class Logger {
public:
    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "err",
     *        "critical", "off"; "warning" and "error" are accepted too).
     * @return The level, or std::nullopt for unknown names.
     */
    static std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept;

    /// Create console (and optional file) sinks and install the logger.
    static void init(const LogConfig& cfg);

    /// Shared logger; spdlog's default logger until init() ran.
    static std::shared_ptr<spdlog::logger> instance();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tally::util
