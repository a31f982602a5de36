// src/regime/regime_classifier.cpp

#include "decision_gate/regime/regime_classifier.hpp"
#include <algorithm>
#include <cmath>
#include "decision_gate/core/logger.hpp"
#include "decision_gate/core/time_utils.hpp"

namespace decision_gate {

std::vector<ConfigValidationError> RegimeClassifierConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    if (adx_period < 2) {
        errors.push_back({"regime_adx_period", "Must be at least 2"});
    }
    if (hurst_max_lag < 4) {
        errors.push_back({"regime_hurst_max_lag", "Must be at least 4"});
    }
    if (min_lookback_bars < 2 * adx_period + 1) {
        errors.push_back({"regime_min_lookback_bars",
                          "Must cover at least two ADX periods plus one bar"});
    }
    if (min_lookback_bars < hurst_max_lag + 2) {
        errors.push_back({"regime_min_lookback_bars", "Must exceed the largest Hurst lag"});
    }
    if (volatility_threshold <= 0.0) {
        errors.push_back({"regime_volatility_threshold", "Must be positive"});
    }
    if (trend_strength_threshold <= 0.0 || trend_strength_threshold > 100.0) {
        errors.push_back({"regime_trend_strength_threshold", "Must be in (0, 100]"});
    }
    if (periods_per_year <= 0.0) {
        errors.push_back({"regime_periods_per_year", "Must be positive"});
    }

    return errors;
}

nlohmann::json RegimeClassification::to_json() const {
    nlohmann::json j;
    j["asset_id"] = asset_id;
    j["as_of_date"] = core::to_date_string(as_of_date);
    j["regime"] = regime_to_string(regime);
    j["volatility"] = volatility;
    j["trend_strength"] = trend_strength;
    j["mean_reversion_score"] = mean_reversion_score;
    j["hurst_exponent"] = hurst_exponent;
    j["autocorrelation_lag1"] = autocorrelation_lag1;
    j["trailing_return"] = trailing_return;
    j["bars_used"] = bars_used;
    return j;
}

RegimeClassifier::RegimeClassifier(RegimeClassifierConfig config) : config_(std::move(config)) {}

Result<RegimeClassification> RegimeClassifier::classify(const PriceSeries& series,
                                                        Timestamp as_of) const {
    ScopedLogComponent log_scope("RegimeClassifier");
    try {
        const size_t available = series.count_until(as_of);
        const size_t lookback = static_cast<size_t>(std::max(config_.min_lookback_bars, 2));

        if (available < lookback) {
            DEBUG("Regime classification refused for " << series.asset_id() << ": "
                                                        << available << " bars, need "
                                                        << lookback);
            return make_error<RegimeClassification>(
                ErrorCode::INSUFFICIENT_DATA,
                "Insufficient price history for " + series.asset_id() + ": " +
                    std::to_string(available) + " bars available, " + std::to_string(lookback) +
                    " required",
                "RegimeClassifier");
        }

        const auto& bars = series.bars();
        std::vector<Bar> window(bars.begin() + static_cast<std::ptrdiff_t>(available - lookback),
                                bars.begin() + static_cast<std::ptrdiff_t>(available));

        Eigen::VectorXd log_prices(static_cast<Eigen::Index>(window.size()));
        for (size_t i = 0; i < window.size(); ++i) {
            log_prices(static_cast<Eigen::Index>(i)) = std::log(window[i].close);
        }
        const Eigen::Index n = log_prices.size();
        Eigen::VectorXd log_returns = log_prices.tail(n - 1) - log_prices.head(n - 1);

        RegimeClassification result;
        result.asset_id = series.asset_id();
        result.as_of_date = as_of;
        result.bars_used = window.size();
        result.volatility = calculate_volatility(log_returns);
        result.trend_strength = calculate_trend_strength(window);
        result.hurst_exponent = calculate_hurst(log_prices);
        result.mean_reversion_score = 0.5 - result.hurst_exponent;
        result.autocorrelation_lag1 = calculate_autocorrelation(log_returns);
        result.trailing_return = window.back().close / window.front().close - 1.0;
        result.regime = resolve_regime(result);

        DEBUG("Regime " << regime_to_string(result.regime) << " for " << result.asset_id
                        << " (vol=" << result.volatility << ", adx=" << result.trend_strength
                        << ", hurst=" << result.hurst_exponent << ")");

        return Result<RegimeClassification>(std::move(result));

    } catch (const std::exception& e) {
        return make_error<RegimeClassification>(
            ErrorCode::UNKNOWN_ERROR, std::string("Regime classification failed: ") + e.what(),
            "RegimeClassifier");
    }
}

double RegimeClassifier::calculate_volatility(const Eigen::VectorXd& log_returns) const {
    if (log_returns.size() < 2)
        return 0.0;

    const double mean = log_returns.mean();
    const double variance =
        (log_returns.array() - mean).square().sum() / static_cast<double>(log_returns.size() - 1);

    return std::sqrt(variance * config_.periods_per_year);
}

double RegimeClassifier::calculate_trend_strength(const std::vector<Bar>& window) const {
    const size_t period = static_cast<size_t>(config_.adx_period);
    if (period < 2 || window.size() < 2 * period + 1)
        return 0.0;

    std::vector<double> tr, plus_dm, minus_dm;
    tr.reserve(window.size() - 1);
    plus_dm.reserve(window.size() - 1);
    minus_dm.reserve(window.size() - 1);

    for (size_t i = 1; i < window.size(); ++i) {
        const auto& cur = window[i];
        const auto& prev = window[i - 1];

        tr.push_back(std::max({cur.high - cur.low, std::abs(cur.high - prev.close),
                               std::abs(cur.low - prev.close)}));

        const double up_move = cur.high - prev.high;
        const double down_move = prev.low - cur.low;
        plus_dm.push_back((up_move > down_move && up_move > 0.0) ? up_move : 0.0);
        minus_dm.push_back((down_move > up_move && down_move > 0.0) ? down_move : 0.0);
    }

    // Seed the Wilder sums with the first period
    double smoothed_tr = 0.0, smoothed_plus = 0.0, smoothed_minus = 0.0;
    for (size_t i = 0; i < period; ++i) {
        smoothed_tr += tr[i];
        smoothed_plus += plus_dm[i];
        smoothed_minus += minus_dm[i];
    }

    auto directional_index = [](double s_tr, double s_plus, double s_minus) {
        if (s_tr <= 0.0)
            return 0.0;
        const double plus_di = 100.0 * s_plus / s_tr;
        const double minus_di = 100.0 * s_minus / s_tr;
        const double di_sum = plus_di + minus_di;
        return di_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
    };

    std::vector<double> dx;
    dx.push_back(directional_index(smoothed_tr, smoothed_plus, smoothed_minus));

    const double p = static_cast<double>(period);
    for (size_t i = period; i < tr.size(); ++i) {
        smoothed_tr = smoothed_tr - smoothed_tr / p + tr[i];
        smoothed_plus = smoothed_plus - smoothed_plus / p + plus_dm[i];
        smoothed_minus = smoothed_minus - smoothed_minus / p + minus_dm[i];
        dx.push_back(directional_index(smoothed_tr, smoothed_plus, smoothed_minus));
    }

    if (dx.size() < period)
        return 0.0;

    double adx = 0.0;
    for (size_t i = 0; i < period; ++i) {
        adx += dx[i];
    }
    adx /= p;

    for (size_t i = period; i < dx.size(); ++i) {
        adx = (adx * (p - 1.0) + dx[i]) / p;
    }

    return adx;
}

double RegimeClassifier::calculate_hurst(const Eigen::VectorXd& log_prices) const {
    const Eigen::Index n = log_prices.size();
    std::vector<double> log_lags;
    std::vector<double> log_tau;

    for (int lag = 2; lag < config_.hurst_max_lag; ++lag) {
        if (lag >= n - 1)
            break;

        Eigen::VectorXd diffs = log_prices.tail(n - lag) - log_prices.head(n - lag);
        const double mean = diffs.mean();
        const double tau =
            std::sqrt((diffs.array() - mean).square().sum() / static_cast<double>(diffs.size()));

        // Zero-spread lags carry no scaling information
        if (tau > 1e-12) {
            log_lags.push_back(std::log(static_cast<double>(lag)));
            log_tau.push_back(std::log(tau));
        }
    }

    if (log_lags.size() < 2)
        return 0.5;

    const Eigen::Index m = static_cast<Eigen::Index>(log_lags.size());
    Eigen::MatrixXd design(m, 2);
    Eigen::VectorXd target(m);
    for (Eigen::Index i = 0; i < m; ++i) {
        design(i, 0) = log_lags[static_cast<size_t>(i)];
        design(i, 1) = 1.0;
        target(i) = log_tau[static_cast<size_t>(i)];
    }

    Eigen::VectorXd coefficients = design.colPivHouseholderQr().solve(target);
    const double hurst = coefficients(0);

    return std::isfinite(hurst) ? hurst : 0.5;
}

double RegimeClassifier::calculate_autocorrelation(const Eigen::VectorXd& log_returns) const {
    const Eigen::Index n = log_returns.size();
    if (n < 3)
        return 0.0;

    Eigen::ArrayXd centered = log_returns.array() - log_returns.mean();
    const double denominator = centered.square().sum();
    if (denominator <= 0.0)
        return 0.0;

    const double numerator = (centered.head(n - 1) * centered.tail(n - 1)).sum();
    return numerator / denominator;
}

MarketRegime RegimeClassifier::resolve_regime(const RegimeClassification& stats) const {
    // Violent markets are dangerous even when they trend
    if (stats.volatility > config_.volatility_threshold) {
        return MarketRegime::VOLATILE;
    }

    if (stats.trend_strength > config_.trend_strength_threshold) {
        if (stats.trailing_return > 0.0)
            return MarketRegime::TRENDING_UP;
        if (stats.trailing_return < 0.0)
            return MarketRegime::TRENDING_DOWN;
    }

    if (stats.mean_reversion_score > config_.mean_reversion_threshold) {
        return MarketRegime::MEAN_REVERTING;
    }

    return MarketRegime::SIDEWAYS;
}

}  // namespace decision_gate
