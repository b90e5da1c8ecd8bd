#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden from a JSON file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <iosfwd>
#include <string>
#include <string_view>

#include "tally/compat/expected.hpp"
#include "tally/obs/exporter.hpp"
#include "tally/util/logger.hpp"

namespace tally::config {

    /** @enum ConfigErr
     *  @brief Reasons a configuration source is rejected.
     */
    enum class ConfigErr {
        NotFound,   ///< File could not be opened.
        Parse,      ///< Document is not valid JSON.
        Invalid     ///< A value is out of range or of the wrong type.
    };

    /// Short human-readable name of an error code.
    std::string_view describe(ConfigErr err) noexcept;

    /** @struct TallyConfig
     *  @brief Aggregate of sub-configs required by the exporter process.
     */
    struct TallyConfig {
        tally::obs::ExportConfig exporter; ///< Export cadence
        tally::util::LogConfig   log;      ///< Log level and optional file sink
    };

    template <class T>
    using Result = tally_detail::expected<T, ConfigErr>;

    /** @class Loader
     *  @brief Source of exporter configuration (defaults or parsed files).
     *
     * Recognized document (every key optional):
     * @code
     * { "export": { "interval_ms": 600000, "enabled": true },
     *   "log":    { "level": "info", "file": "" } }
     * @endcode
     */
    class Loader {
    public:
        /// Configuration built purely from constants.
        static TallyConfig defaults();

        /**
         * @brief Load configuration from a JSON file.
         * @param path File to read.
         * @return Parsed config with missing keys defaulted, or the error.
         */
        static Result<TallyConfig> load_from_file(const std::string& path);

        /// Same as load_from_file() for an already opened stream.
        static Result<TallyConfig> load_from_stream(std::istream& input, const std::string& source);
    };

} // namespace tally::config
