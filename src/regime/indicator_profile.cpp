// src/regime/indicator_profile.cpp

#include "decision_gate/regime/indicator_profile.hpp"

namespace decision_gate {

nlohmann::json IndicatorProfile::to_json() const {
    nlohmann::json j;
    j["rsi_period"] = rsi_period;
    j["macd_fast"] = macd_fast;
    j["macd_slow"] = macd_slow;
    j["macd_signal"] = macd_signal;
    j["bollinger_period"] = bollinger_period;
    j["bollinger_std"] = bollinger_std;
    j["ema_period"] = ema_period;
    j["strategy"] = strategy;
    j["rationale"] = rationale;
    return j;
}

IndicatorProfile recommended_indicator_profile(MarketRegime regime) {
    IndicatorProfile profile;

    switch (regime) {
        case MarketRegime::TRENDING_UP:
        case MarketRegime::TRENDING_DOWN:
            profile.strategy = "trend_following";
            profile.rationale = "Strong trend detected, use trend-following indicators";
            break;

        case MarketRegime::VOLATILE:
            profile.rsi_period = 7;
            profile.macd_fast = 8;
            profile.macd_slow = 17;
            profile.bollinger_period = 10;
            profile.bollinger_std = 2.5;
            profile.ema_period = 10;
            profile.strategy = "volatility_breakout";
            profile.rationale = "High volatility, use shorter periods and wider bands";
            break;

        case MarketRegime::MEAN_REVERTING:
            profile.ema_period = 50;
            profile.strategy = "mean_reversion";
            profile.rationale = "Mean reverting market, trade extremes back to average";
            break;

        case MarketRegime::SIDEWAYS:
            profile.rsi_period = 21;
            profile.bollinger_std = 1.5;
            profile.ema_period = 50;
            profile.strategy = "range_trading";
            profile.rationale = "Sideways market, trade support and resistance levels";
            break;
    }

    return profile;
}

}  // namespace decision_gate
