// src/regime/price_series.cpp

#include "decision_gate/regime/price_series.hpp"
#include <algorithm>
#include <cmath>
#include "decision_gate/core/time_utils.hpp"

namespace decision_gate {

Result<PriceSeries> PriceSeries::create(std::string asset_id, std::vector<Bar> bars) {
    if (asset_id.empty()) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT, "Asset id cannot be empty",
                                       "PriceSeries");
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        const bool finite = std::isfinite(bar.open) && std::isfinite(bar.high) &&
                            std::isfinite(bar.low) && std::isfinite(bar.close);
        if (!finite || bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 ||
            bar.close <= 0.0) {
            return make_error<PriceSeries>(
                ErrorCode::INVALID_DATA,
                "Non-positive or non-finite price in bar " + std::to_string(i) + " of " + asset_id,
                "PriceSeries");
        }
        if (bar.high < bar.low) {
            return make_error<PriceSeries>(
                ErrorCode::INVALID_DATA,
                "High below low on " + core::to_date_string(bar.timestamp) + " for " + asset_id,
                "PriceSeries");
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            return make_error<PriceSeries>(
                ErrorCode::INVALID_DATA,
                "Bars for " + asset_id + " are not strictly chronological at index " +
                    std::to_string(i),
                "PriceSeries");
        }
    }

    return Result<PriceSeries>(PriceSeries(std::move(asset_id), std::move(bars)));
}

size_t PriceSeries::count_until(Timestamp as_of) const {
    auto it = std::upper_bound(bars_.begin(), bars_.end(), as_of,
                               [](Timestamp ts, const Bar& bar) { return ts < bar.timestamp; });
    return static_cast<size_t>(std::distance(bars_.begin(), it));
}

}  // namespace decision_gate
