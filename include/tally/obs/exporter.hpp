#pragma once
/**
 * @file exporter.hpp
 * @brief Periodic trigger: aggregate the registry and hand the result to a sink.
 * @details Defaults are named in constants.hpp; override via the Config Loader.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>

#include "tally/config/constants.hpp"
#include "tally/metrics/aggregator.hpp"
#include "tally/obs/metrics_sink.hpp"

namespace tally::obs {

/** @struct ExportConfig
 *  @brief Export cadence.
 */
struct ExportConfig {
    uint32_t interval_ms{tally::config::constants::EXPORT_INTERVAL_MS_DEFAULT}; ///< Time between exports
    bool     enabled{tally::config::constants::EXPORT_ENABLED_DEFAULT};         ///< start() is a no-op when false
};

/** @class Exporter
 *  @brief Runs both aggregation passes on a worker thread.
 *
 * The worker exports once right after start() and then every interval until
 * stop(). stop() wakes the worker immediately and joins it. The aggregator
 * and the sink must outlive the exporter.
 */
class Exporter {
public:
    Exporter(const metrics::Aggregator& aggregator, MetricsSink& sink, ExportConfig cfg) noexcept
        : aggregator_(aggregator), sink_(sink), cfg_(cfg) {}
    ~Exporter();

    Exporter(const Exporter&) = delete;
    Exporter& operator=(const Exporter&) = delete;

    /// Compute a report, publish it, and return it. Runs on the caller's thread.
    UsageReport exportOnce();

    /**
     * @brief Launch the worker.
     * @return false if exporting is disabled, the interval is zero, or the
     *         worker already runs.
     */
    bool start();

    /// Stop and join the worker. Safe to call when not running.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Reports published so far (manual and periodic).
    [[nodiscard]] uint64_t exports() const noexcept { return exports_.load(std::memory_order_relaxed); }

    /// @return Current configuration (by const reference).
    const ExportConfig& config() const noexcept { return cfg_; }

private:
    void run(std::stop_token st);

    const metrics::Aggregator& aggregator_;
    MetricsSink& sink_;
    ExportConfig cfg_{};

    std::mutex lifecycle_mu_;            ///< Guards worker_ across start()/stop()
    std::mutex wait_mu_;                 ///< Worker's interval wait
    std::condition_variable_any cv_;
    std::jthread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> exports_{0};
};

} // namespace tally::obs
