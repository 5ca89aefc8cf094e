// stage_cache.cpp - Bounded store of per-simulation stage waveforms

#include "stage_cache.hpp"
#include "dsss/errors.hpp"
#include "dsss/logging.hpp"
#include <iterator>

namespace dsss {

StageCache::StageCache(size_t capacity)
    : capacity_(capacity)
{
}

void StageCache::store(const std::string& id, StageMap stages) {
    std::lock_guard<std::mutex> lock(mutex_);

    stats_.stores++;

    auto it = index_.find(id);
    if (it != index_.end()) {
        order_.erase(it->second);
        index_.erase(it);
        stats_.refreshes++;
    }

    order_.push_back(Entry{id, std::move(stages)});
    index_[id] = std::prev(order_.end());

    if (order_.size() > capacity_) {
        const std::string& oldest = order_.front().id;
        LOG_CACHE(DEBUG, "Evicting simulation %s (capacity %zu)", oldest.c_str(), capacity_);
        index_.erase(oldest);
        order_.pop_front();
        stats_.evictions++;
    }
}

StageSnapshotPtr StageCache::get(const std::string& id, Stage stage) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
        stats_.misses++;
        throw NotFound("Unknown simulation_id/stage combination: " + id + "/" + stageName(stage));
    }

    const auto& stages = it->second->stages;
    auto st = stages.find(stage);
    if (st == stages.end() || !st->second) {
        stats_.misses++;
        LOG_CACHE(WARN, "Simulation %s has no %s stage", id.c_str(), stageName(stage));
        throw NotFound("Unknown simulation_id/stage combination: " + id + "/" + stageName(stage));
    }

    stats_.hits++;
    return st->second;
}

bool StageCache::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(id) > 0;
}

void StageCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
}

size_t StageCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

StageCache::Stats StageCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void StageCache::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = Stats{};
}

} // namespace dsss
