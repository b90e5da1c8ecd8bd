#pragma once
/**
 * @file state_registry.hpp
 * @brief Latest observed state per routing-object key and per backend-group key.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

#include "tally/metrics/snapshot_store.hpp"
#include "tally/model/backend_group.hpp"
#include "tally/model/routing_object.hpp"

namespace tally::metrics {

class Aggregator;

// -----------------------------------------------------------------------------
// StateRegistry class
// -----------------------------------------------------------------------------
///
/// Two independent stores mirrored from the reconciler:
///   routing-object key → RoutingObjectState
///   backend-group key  → BackendGroupState
/// Writers only set or delete; the Aggregator is the sole reader and sees one
/// frozen snapshot per computation pass.
///
/// Thread-safety:
///   - Any number of concurrent writers; only writes whose keys share a shard
///     serialize, and a write copies pointers, never stored values.
///   - Reads are lock-free and never observe a half-written entry.
///   - Values are copied in; callers keep no handle into the registry.
///
/// Construct explicitly and pass by reference; there is no global instance.
//
class StateRegistry final {
public:
    using RoutingSnapshot = SnapshotStore<model::RoutingObjectState>::Snapshot;
    using GroupSnapshot   = SnapshotStore<model::BackendGroupState>::Snapshot;

    StateRegistry() = default;
    StateRegistry(const StateRegistry&) = delete;
    StateRegistry& operator=(const StateRegistry&) = delete;

    // --------------------------- Routing objects -----------------------------
    /// Insert or replace the state stored under `key`.
    void setRoutingObject(std::string_view key, model::RoutingObjectState state);

    /// Remove `key`; no-op if absent.
    void deleteRoutingObject(std::string_view key);

    // --------------------------- Backend groups ------------------------------
    void setBackendGroup(std::string_view key, model::BackendGroupState state);
    void deleteBackendGroup(std::string_view key);

    // --------------------------- Observability -------------------------------
    /// Mutation counters (cumulative since construction).
    struct Stats {
        uint64_t sets{0}, deletes{0}, delete_misses{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    friend class Aggregator;

    RoutingSnapshot routingSnapshot() const noexcept { return routing_.snapshot(); }
    GroupSnapshot   groupSnapshot() const noexcept { return groups_.snapshot(); }

    SnapshotStore<model::RoutingObjectState> routing_;
    SnapshotStore<model::BackendGroupState>  groups_;

    std::atomic<uint64_t> sets_{0}, deletes_{0}, delete_misses_{0};
};

} // namespace tally::metrics
