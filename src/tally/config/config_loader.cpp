/**
* @file config_loader.cpp
 * @brief JSON loader built on boost::property_tree.
 */
#include "tally/config/config_loader.hpp"
#include "tally/config/constants.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>

namespace tally::config {
    using namespace tally::config::constants;
    using tally::util::Logger;
    namespace pt = boost::property_tree;

    std::string_view describe(ConfigErr err) noexcept {
        switch (err) {
            case ConfigErr::NotFound: return "not found";
            case ConfigErr::Parse:    return "parse error";
            case ConfigErr::Invalid:  return "invalid value";
        }
        return "unknown";
    }

    TallyConfig Loader::defaults() {
        TallyConfig tc;
        tc.exporter = tally::obs::ExportConfig{}; // picks defaults from constants
        tc.log.level = *Logger::parse_level(LOG_LEVEL_DEFAULT);
        return tc;
    }

    // Unlike ptree::get_optional, a present but unconvertible value throws ptree_bad_data.
    template <class T>
    static std::optional<T> read(const pt::ptree& root, const char* path) {
        auto child = root.get_child_optional(path);
        if (!child) return std::nullopt;
        return child->get_value<T>();
    }

    static Result<TallyConfig> invalid(const std::string& source, const std::string& what) {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "{}: {}", source, what);
        return tally_detail::unexpected<ConfigErr>(ConfigErr::Invalid);
    }

    Result<TallyConfig> Loader::load_from_stream(std::istream& input, const std::string& source) {
        pt::ptree root;
        try {
            pt::read_json(input, root);
        } catch (const pt::json_parser_error& e) {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "failed to parse {}: {} line {}",
                                source, e.message(), e.line());
            return tally_detail::unexpected<ConfigErr>(ConfigErr::Parse);
        }

        TallyConfig tc = defaults();
        try {
            if (auto interval = read<int64_t>(root, "export.interval_ms")) {
                if (*interval <= 0 || *interval > std::numeric_limits<uint32_t>::max())
                    return invalid(source, "export.interval_ms must be in [1, 4294967295]");
                tc.exporter.interval_ms = static_cast<uint32_t>(*interval);
            }
            if (auto enabled = read<bool>(root, "export.enabled")) {
                tc.exporter.enabled = *enabled;
            }
            if (auto level = read<std::string>(root, "log.level")) {
                auto parsed = Logger::parse_level(*level);
                if (!parsed) return invalid(source, "unknown log.level '" + *level + "'");
                tc.log.level = *parsed;
            }
            if (auto file = read<std::string>(root, "log.file")) {
                tc.log.file = *file;
            }
        } catch (const pt::ptree_bad_data& e) {
            return invalid(source, e.what());
        }
        return tc;
    }

    Result<TallyConfig> Loader::load_from_file(const std::string& path) {
        std::ifstream input(path);
        if (!input.good()) {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "failed to read configuration file {}", path);
            return tally_detail::unexpected<ConfigErr>(ConfigErr::NotFound);
        }
        return load_from_stream(input, path);
    }

} // namespace tally::config
