// StateRegistry: thin layer over two SnapshotStores that adds mutation
// counters and trace logging. Snapshot publication lives in snapshot_store.hpp.

#include "tally/metrics/state_registry.hpp"
#include "tally/util/logger.hpp"

#include <utility>

namespace tally::metrics {
using tally::util::Logger;

void StateRegistry::setRoutingObject(std::string_view key, model::RoutingObjectState state) {
    const auto backends = state.backends.size();
    routing_.assign(key, std::move(state));
    sets_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_LOGGER_TRACE(Logger::instance(), "set routing object {} ({} backends)", key, backends);
}

void StateRegistry::deleteRoutingObject(std::string_view key) {
    if (routing_.erase(key)) {
        deletes_.fetch_add(1, std::memory_order_relaxed);
        SPDLOG_LOGGER_TRACE(Logger::instance(), "deleted routing object {}", key);
    } else {
        delete_misses_.fetch_add(1, std::memory_order_relaxed);
    }
}

void StateRegistry::setBackendGroup(std::string_view key, model::BackendGroupState state) {
    groups_.assign(key, state);
    sets_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_LOGGER_TRACE(Logger::instance(), "set backend group {} (standalone={}, ingress={}, asm={})",
                        key, state.standalone_neg, state.ingress_neg, state.asm_neg);
}

void StateRegistry::deleteBackendGroup(std::string_view key) {
    if (groups_.erase(key)) {
        deletes_.fetch_add(1, std::memory_order_relaxed);
        SPDLOG_LOGGER_TRACE(Logger::instance(), "deleted backend group {}", key);
    } else {
        delete_misses_.fetch_add(1, std::memory_order_relaxed);
    }
}

StateRegistry::Stats StateRegistry::stats() const noexcept {
    return Stats{
        sets_.load(std::memory_order_relaxed),
        deletes_.load(std::memory_order_relaxed),
        delete_misses_.load(std::memory_order_relaxed),
    };
}

} // namespace tally::metrics
