// include/decision_gate/regime/indicator_profile.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "decision_gate/core/types.hpp"

namespace decision_gate {

/**
 * @brief Indicator parameters suited to a market regime
 *
 * Passed to the generating agent as context and recorded in the audit trail.
 */
struct IndicatorProfile {
    int rsi_period{14};
    int macd_fast{12};
    int macd_slow{26};
    int macd_signal{9};
    int bollinger_period{20};
    double bollinger_std{2.0};
    int ema_period{20};
    std::string strategy;
    std::string rationale;

    nlohmann::json to_json() const;
};

/**
 * @brief Recommended indicator settings for a regime
 * @param regime Classified regime
 * @return Profile with shorter periods and wider bands in volatile markets,
 *         longer smoothing in range-bound ones
 */
IndicatorProfile recommended_indicator_profile(MarketRegime regime);

}  // namespace decision_gate
