// stage_cache.hpp - Bounded store of per-simulation stage waveforms
//
// Keeps the six stage snapshots of recent simulations so they can be
// queried after the simulate call returns. Eviction is by insertion order:
// storing an id again moves it to the newest position, reads never do.
//
// Usage:
//   1. After a run: store(id, stages)
//   2. On a stage query: get(id, stage), throws NotFound once evicted

#pragma once

#include "dsss/types.hpp"
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dsss {

class StageCache {
public:
    explicit StageCache(size_t capacity = 16);
    ~StageCache() = default;

    // Non-copyable
    StageCache(const StageCache&) = delete;
    StageCache& operator=(const StageCache&) = delete;

    // Insert or refresh; evicts the oldest entry when over capacity
    void store(const std::string& id, StageMap stages);

    // Throws NotFound if the id or the stage is absent
    StageSnapshotPtr get(const std::string& id, Stage stage) const;

    bool contains(const std::string& id) const;

    // Remove all entries
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }

    // Statistics
    struct Stats {
        uint64_t stores = 0;            // store() calls
        uint64_t refreshes = 0;         // store() of an id already present
        uint64_t evictions = 0;         // Entries dropped over capacity
        uint64_t hits = 0;              // get() found the snapshot
        uint64_t misses = 0;            // get() threw NotFound
    };

    Stats getStats() const;
    void resetStats();

private:
    struct Entry {
        std::string id;
        StageMap stages;
    };

    size_t capacity_;
    mutable std::mutex mutex_;

    // Front = oldest insertion
    std::list<Entry> order_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    mutable Stats stats_;
};

} // namespace dsss
