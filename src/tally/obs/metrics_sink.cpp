/**
* @file metrics_sink.cpp
 * @brief spdlog-backed LogSink and the in-memory CapturingSink.
 */
#include "tally/obs/metrics_sink.hpp"
#include "tally/util/logger.hpp"

namespace tally::obs {
    using tally::util::Logger;

    namespace {
        template <class Counts>
        void log_counts(const char* metric, const Counts& counts) {
            for (const auto& [feature, count] : counts) {
                SPDLOG_LOGGER_INFO(Logger::instance(), "{} feature={} count={}",
                                   metric, features::label(feature), count);
            }
        }
    } // namespace

    void LogSink::publish(const UsageReport& report) {
        // Metric names follow the controller's gauges.
        log_counts("number_of_ingresses", report.objects.objects);
        log_counts("number_of_ingresses", report.objects.object_backends);
        log_counts("number_of_service_ports", report.objects.backends);
        log_counts("number_of_negs", report.groups);
    }

    void CapturingSink::publish(const UsageReport& report) {
        std::lock_guard<std::mutex> lk(mu_);
        last_ = report;
        ++publishes_;
    }

    std::optional<UsageReport> CapturingSink::last() const {
        std::lock_guard<std::mutex> lk(mu_);
        return last_;
    }

    uint64_t CapturingSink::publishes() const {
        std::lock_guard<std::mutex> lk(mu_);
        return publishes_;
    }

} // namespace tally::obs
