/**
 * @file exporter.cpp
 * @brief Exporter worker loop.
 */
#include "tally/obs/exporter.hpp"
#include "tally/util/logger.hpp"

#include <chrono>
#include <exception>

namespace tally::obs {
using tally::util::Logger;

Exporter::~Exporter() {
    stop();
}

UsageReport Exporter::exportOnce() {
    UsageReport report;
    report.generated_at = std::chrono::system_clock::now();
    report.objects = aggregator_.computeObjectMetrics();
    report.groups  = aggregator_.computeGroupMetrics();

    sink_.publish(report);
    exports_.fetch_add(1, std::memory_order_relaxed);
    return report;
}

bool Exporter::start() {
    if (!cfg_.enabled) {
        SPDLOG_LOGGER_INFO(Logger::instance(), "usage export disabled by configuration");
        return false;
    }
    if (cfg_.interval_ms == 0) {
        SPDLOG_LOGGER_WARN(Logger::instance(), "usage export interval is zero, not starting");
        return false;
    }

    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (worker_.joinable()) return false;

    worker_ = std::jthread([this](std::stop_token st) { run(st); });
    running_.store(true, std::memory_order_release);
    SPDLOG_LOGGER_INFO(Logger::instance(), "usage export started, interval {} ms", cfg_.interval_ms);
    return true;
}

void Exporter::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!worker_.joinable()) return;

    worker_.request_stop();
    worker_.join();
    running_.store(false, std::memory_order_release);
    SPDLOG_LOGGER_INFO(Logger::instance(), "usage export stopped after {} exports", exports());
}

void Exporter::run(std::stop_token st) {
    const auto interval = std::chrono::milliseconds(cfg_.interval_ms);

    while (!st.stop_requested()) {
        try {
            exportOnce();
        } catch (const std::exception& e) {
            // A failing sink must not end the loop; the next interval retries.
            SPDLOG_LOGGER_ERROR(Logger::instance(), "usage export failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lk(wait_mu_);
        cv_.wait_for(lk, st, interval, [] { return false; });
    }
}

} // namespace tally::obs
