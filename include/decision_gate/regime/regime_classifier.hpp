// include/decision_gate/regime/regime_classifier.hpp
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "decision_gate/core/config_base.hpp"
#include "decision_gate/core/error.hpp"
#include "decision_gate/core/types.hpp"
#include "decision_gate/regime/price_series.hpp"

namespace decision_gate {

/**
 * @brief Configuration for regime classification
 */
struct RegimeClassifierConfig : public ConfigBase {
    int min_lookback_bars{60};               // Trailing window, also the minimum history
    double volatility_threshold{0.40};       // Annualized volatility above which VOLATILE wins
    double trend_strength_threshold{25.0};   // ADX level that counts as a trend
    double mean_reversion_threshold{0.10};   // 0.5 - Hurst above this is MEAN_REVERTING
    int adx_period{14};                      // Wilder smoothing period
    double periods_per_year{252.0};          // Annualization factor for daily bars
    int hurst_max_lag{20};                   // Lags [2, hurst_max_lag) used for Hurst

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_lookback_bars"] = min_lookback_bars;
        j["volatility_threshold"] = volatility_threshold;
        j["trend_strength_threshold"] = trend_strength_threshold;
        j["mean_reversion_threshold"] = mean_reversion_threshold;
        j["adx_period"] = adx_period;
        j["periods_per_year"] = periods_per_year;
        j["hurst_max_lag"] = hurst_max_lag;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_lookback_bars"))
            min_lookback_bars = j.at("min_lookback_bars").get<int>();
        if (j.contains("volatility_threshold"))
            volatility_threshold = j.at("volatility_threshold").get<double>();
        if (j.contains("trend_strength_threshold"))
            trend_strength_threshold = j.at("trend_strength_threshold").get<double>();
        if (j.contains("mean_reversion_threshold"))
            mean_reversion_threshold = j.at("mean_reversion_threshold").get<double>();
        if (j.contains("adx_period"))
            adx_period = j.at("adx_period").get<int>();
        if (j.contains("periods_per_year"))
            periods_per_year = j.at("periods_per_year").get<double>();
        if (j.contains("hurst_max_lag"))
            hurst_max_lag = j.at("hurst_max_lag").get<int>();
    }

    /**
     * @brief Check parameter ranges and their mutual consistency
     */
    std::vector<ConfigValidationError> validate() const override;
};

/**
 * @brief Regime of one asset on one date together with the statistics behind it
 */
struct RegimeClassification {
    std::string asset_id;
    Timestamp as_of_date;
    MarketRegime regime{MarketRegime::SIDEWAYS};
    double volatility{0.0};            // Annualized std of log returns
    double trend_strength{0.0};        // ADX, 0 to 100
    double mean_reversion_score{0.0};  // 0.5 - Hurst exponent
    double hurst_exponent{0.5};
    double autocorrelation_lag1{0.0};
    double trailing_return{0.0};  // Simple return over the window
    size_t bars_used{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Deterministic classifier mapping a price window to a MarketRegime
 *
 * Precedence is VOLATILE, then TRENDING_UP/TRENDING_DOWN, then MEAN_REVERTING,
 * then SIDEWAYS. A window shorter than min_lookback_bars is an error, never a
 * default regime.
 */
class RegimeClassifier {
public:
    explicit RegimeClassifier(RegimeClassifierConfig config);

    /**
     * @brief Classify the trailing window ending at as_of
     * @param series Price history; bars after as_of are ignored
     * @param as_of Evaluation date
     * @return Result containing the classification, or INSUFFICIENT_DATA
     */
    Result<RegimeClassification> classify(const PriceSeries& series, Timestamp as_of) const;

    const RegimeClassifierConfig& get_config() const {
        return config_;
    }

private:
    RegimeClassifierConfig config_;

    /**
     * @brief Annualized sample standard deviation of log returns
     */
    double calculate_volatility(const Eigen::VectorXd& log_returns) const;

    /**
     * @brief Wilder average directional index over the window
     * @return ADX in [0, 100], 0 when the window is too short
     */
    double calculate_trend_strength(const std::vector<Bar>& window) const;

    /**
     * @brief Hurst exponent from the scaling of lagged log-price differences
     * @return Slope of log(std) against log(lag), 0.5 when undetermined
     */
    double calculate_hurst(const Eigen::VectorXd& log_prices) const;

    double calculate_autocorrelation(const Eigen::VectorXd& log_returns) const;

    MarketRegime resolve_regime(const RegimeClassification& stats) const;
};

}  // namespace decision_gate
