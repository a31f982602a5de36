// include/decision_gate/validation/validation_cache.hpp
#pragma once

#include <cstdint>
#include <list>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "decision_gate/validation/validation_types.hpp"

namespace decision_gate {

/**
 * @brief Counters describing cache effectiveness
 */
struct CacheStats {
    size_t size{0};
    size_t capacity{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
    uint64_t rotations{0};

    double hit_rate() const {
        const uint64_t lookups = hits + misses;
        return lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Bounded LRU memo of claim verdicts scoped to one trading day
 *
 * Entries are keyed by claim text and date string, so a lookup for one day
 * can never return a verdict computed for another. rotate() drops everything
 * when a later trading day begins; requests for an earlier day that are still
 * in flight leave the cache intact. All operations are internally synchronized.
 */
class ValidationCache {
public:
    explicit ValidationCache(size_t capacity);

    /**
     * @brief Look up a verdict, refreshing its recency on a hit
     * @param claim Claim text
     * @param date Trading date as YYYY-MM-DD
     * @return Cached result with cached=true, or nullopt
     */
    std::optional<ValidationResult> get(const std::string& claim, const std::string& date);

    /**
     * @brief Store a verdict, evicting the least recently used entry when full
     */
    void put(const std::string& claim, const std::string& date, ValidationResult result);

    /**
     * @brief Advance the active trading day, clearing entries of earlier days
     * @param date Trading date as YYYY-MM-DD; dates not after the active one are ignored
     * @return true if the cache was cleared
     */
    bool rotate(const std::string& date);

    void clear();

    CacheStats stats() const;

    std::string active_date() const;

private:
    using Entry = std::pair<std::string, ValidationResult>;

    static std::string make_key(const std::string& claim, const std::string& date);

    size_t capacity_;
    std::string active_date_;
    std::list<Entry> entries_;  // Most recently used at the front
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    uint64_t hits_{0};
    uint64_t misses_{0};
    uint64_t evictions_{0};
    uint64_t rotations_{0};
    mutable std::mutex mutex_;
};

}  // namespace decision_gate
