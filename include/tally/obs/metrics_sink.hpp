#pragma once
/**
 * @file metrics_sink.hpp
 * @brief Sink seam for computed usage counts, plus logging and capturing sinks.
 * @details Serialization and transport belong to the sink. LogSink writes one
 *          labelled line per feature; a monitoring backend plugs in by
 *          implementing MetricsSink.
 */

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "tally/metrics/aggregator.hpp"

namespace tally::obs {

    /** @struct UsageReport
     *  @brief Everything one export carries.
     */
    struct UsageReport {
        metrics::ObjectMetrics objects;                    ///< Frontend and distinct-backend counts
        metrics::GroupMetrics  groups;                     ///< NEG counts by origin
        std::chrono::system_clock::time_point generated_at{}; ///< Wall-clock time of the pass
    };

    /** @class MetricsSink
     *  @brief Receiver of usage reports. Implementations must be thread-safe.
     */
    class MetricsSink {
    public:
        virtual ~MetricsSink() = default;
        /// Publish one report.
        virtual void publish(const UsageReport& report) = 0;
    };

    /** @class LogSink
     *  @brief Writes reports through the process logger at info level.
     */
    class LogSink final : public MetricsSink {
    public:
        void publish(const UsageReport& report) override;
    };

    /** @class CapturingSink
     *  @brief Keeps the most recent report for polling callers.
     */
    class CapturingSink final : public MetricsSink {
    public:
        void publish(const UsageReport& report) override;

        /// Last published report, if any.
        std::optional<UsageReport> last() const;
        /// Number of reports received.
        uint64_t publishes() const;

    private:
        mutable std::mutex mu_;
        std::optional<UsageReport> last_;
        uint64_t publishes_{0};
    };

} // namespace tally::obs
