// include/decision_gate/regime/price_series.hpp
#pragma once

#include <string>
#include <vector>
#include "decision_gate/core/error.hpp"
#include "decision_gate/core/types.hpp"

namespace decision_gate {

/**
 * @brief Immutable chronological OHLCV history for one asset
 *
 * Instances only come out of create(), which rejects unordered timestamps and
 * non-positive or non-finite prices.
 */
class PriceSeries {
public:
    PriceSeries() = default;

    /**
     * @brief Validate bars and build a series
     * @param asset_id Asset the bars belong to
     * @param bars Bars in chronological order
     * @return Result containing the series, or INVALID_DATA
     */
    static Result<PriceSeries> create(std::string asset_id, std::vector<Bar> bars);

    const std::string& asset_id() const {
        return asset_id_;
    }

    const std::vector<Bar>& bars() const {
        return bars_;
    }

    size_t size() const {
        return bars_.size();
    }

    bool empty() const {
        return bars_.empty();
    }

    /**
     * @brief Number of bars with a timestamp at or before as_of
     */
    size_t count_until(Timestamp as_of) const;

private:
    PriceSeries(std::string asset_id, std::vector<Bar> bars)
        : asset_id_(std::move(asset_id)), bars_(std::move(bars)) {}

    std::string asset_id_;
    std::vector<Bar> bars_;
};

}  // namespace decision_gate
