// src/validation/validation_cache.cpp

#include "decision_gate/validation/validation_cache.hpp"
#include "decision_gate/core/logger.hpp"

namespace decision_gate {

nlohmann::json CacheStats::to_json() const {
    nlohmann::json j;
    j["size"] = size;
    j["capacity"] = capacity;
    j["hits"] = hits;
    j["misses"] = misses;
    j["evictions"] = evictions;
    j["rotations"] = rotations;
    j["hit_rate"] = hit_rate();
    return j;
}

ValidationCache::ValidationCache(size_t capacity) : capacity_(capacity) {}

std::string ValidationCache::make_key(const std::string& claim, const std::string& date) {
    // Unit separator keeps "a|b" + "c" distinct from "a" + "b|c"
    return date + '\x1f' + claim;
}

std::optional<ValidationResult> ValidationCache::get(const std::string& claim,
                                                     const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(make_key(claim, date));
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }

    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;

    ValidationResult result = it->second->second;
    result.cached = true;
    return result;
}

void ValidationCache::put(const std::string& claim, const std::string& date,
                          ValidationResult result) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (capacity_ == 0)
        return;

    result.cached = false;
    const std::string key = make_key(claim, date);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(result);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    if (entries_.size() >= capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
        ++evictions_;
    }

    entries_.emplace_front(key, std::move(result));
    index_[key] = entries_.begin();
}

bool ValidationCache::rotate(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    // YYYY-MM-DD orders lexically; keys carry the date, so an earlier day needs no clear
    if (date <= active_date_)
        return false;

    const bool had_entries = !entries_.empty();
    if (had_entries) {
        DEBUG("Rotating validation cache from " << active_date_ << " to " << date << ", dropping "
                                                << entries_.size() << " entries");
    }

    entries_.clear();
    index_.clear();
    active_date_ = date;
    ++rotations_;
    return had_entries;
}

void ValidationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

CacheStats ValidationCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.size = entries_.size();
    stats.capacity = capacity_;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.rotations = rotations_;
    return stats;
}

std::string ValidationCache::active_date() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_date_;
}

}  // namespace decision_gate
