#pragma once
// SnapshotStore: string-keyed map read through immutable snapshots.
//
// Layout: keys hash into a fixed number of shards. Each shard publishes an
// immutable unordered_map of key → shared_ptr<const Value> through an atomic
// shared_ptr (writers RELEASE, readers ACQUIRE).
//
// A write builds its value once, outside any lock, then copies only its own
// shard's map of pointers. Stored values are never copied again: successive
// snapshots share every entry the write did not touch. Writers on different
// shards do not contend; writers on one shard serialize on that shard's mutex.
//
// A Snapshot pins one map per shard. Every write that completed before
// snapshot() was called is visible in it, and nothing it holds changes
// afterwards.

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tally::metrics {

// Transparent hash/equal functors for heterogeneous lookup
// with string_view keys.
struct SKeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};
struct SKeyEq {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

///
/// Key → Value map published as immutable, sharded snapshots.
/// - assign(): insert or overwrite, always publishes.
/// - erase(): publishes only when the key was present.
/// - snapshot(): consistent, non-blocking view for the duration of a pass.
///
template <class Value>
class SnapshotStore final {
public:
    static constexpr std::size_t Shards = 64;

    using Entry = std::shared_ptr<const Value>;
    using Map   = std::unordered_map<std::string, Entry, SKeyHash, SKeyEq>;

    /// Frozen view over all shards.
    class Snapshot final {
    public:
        /// Number of keys across all shards.
        [[nodiscard]] std::size_t size() const noexcept {
            std::size_t n = 0;
            for (const auto& m : maps_) n += m->size();
            return n;
        }

        /// Calls fn(std::string_view key, const Value&) once per entry, in no particular order.
        template <class Fn>
        void for_each(Fn&& fn) const {
            for (const auto& m : maps_) {
                for (const auto& [key, entry] : *m) fn(std::string_view(key), *entry);
            }
        }

        /// Stored value under `key`, or nullptr. Shared with later snapshots
        /// until that key is written again.
        [[nodiscard]] Entry find(std::string_view key) const {
            const auto& m = maps_[shard_of(key)];
            auto it = m->find(key);
            return it == m->end() ? nullptr : it->second;
        }

    private:
        friend class SnapshotStore;
        std::array<std::shared_ptr<const Map>, Shards> maps_;
    };

    SnapshotStore() = default;
    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /// Return a consistent snapshot of the entire store.
    Snapshot snapshot() const noexcept {
        Snapshot snap;
        for (std::size_t i = 0; i < Shards; ++i) snap.maps_[i] = shards_[i].load();
        return snap;
    }

    /// Insert or replace `key`. Last write wins.
    void assign(std::string_view key, Value value) {
        Entry entry = std::make_shared<const Value>(std::move(value));
        auto& shard = shards_[shard_of(key)];

        std::lock_guard<std::mutex> lk(shard.write_mu);
        auto next = std::make_shared<Map>(*shard.load()); // copies pointers only
        next->insert_or_assign(std::string(key), std::move(entry));
        shard.publish(std::move(next));
    }

    /// Remove `key`. Returns false (and publishes nothing) if it was absent.
    bool erase(std::string_view key) {
        auto& shard = shards_[shard_of(key)];

        std::lock_guard<std::mutex> lk(shard.write_mu);
        auto current = shard.load();
        if (current->find(key) == current->end()) return false;

        auto next = std::make_shared<Map>(*current);
        next->erase(next->find(key));
        shard.publish(std::move(next));
        return true;
    }

private:
    struct Shard {
        std::shared_ptr<const Map> map{std::make_shared<Map>()};
        std::mutex write_mu;

        std::shared_ptr<const Map> load() const noexcept {
            return std::atomic_load_explicit(&map, std::memory_order_acquire);
        }
        void publish(std::shared_ptr<Map> next) noexcept {
            std::shared_ptr<const Map> cnext = std::move(next);
            std::atomic_store_explicit(&map, std::move(cnext), std::memory_order_release);
        }
    };

    static std::size_t shard_of(std::string_view key) noexcept {
        return SKeyHash{}(key) % Shards;
    }

    std::array<Shard, Shards> shards_;
};

} // namespace tally::metrics
