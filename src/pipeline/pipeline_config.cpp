// src/pipeline/pipeline_config.cpp

#include "decision_gate/pipeline/pipeline_config.hpp"

namespace decision_gate {

nlohmann::json PipelineConfig::to_json() const {
    nlohmann::json j;
    j["numeric_tolerance"] = numeric_tolerance;
    j["fact_check_latency_budget_ms"] = fact_check_latency_budget_ms;
    j["validation_cache_capacity"] = validation_cache_capacity;
    j["fallback_confidence"] = fallback_confidence;

    j["schema_max_retries"] = schema_max_retries;
    j["schema_max_claim_chars"] = schema_max_claim_chars;

    j["regime_min_lookback_bars"] = regime_min_lookback_bars;
    j["regime_volatility_threshold"] = regime_volatility_threshold;
    j["regime_trend_strength_threshold"] = regime_trend_strength_threshold;
    j["regime_mean_reversion_threshold"] = regime_mean_reversion_threshold;
    j["regime_adx_period"] = regime_adx_period;
    j["regime_periods_per_year"] = regime_periods_per_year;

    j["risk_per_trade_max"] = risk_per_trade_max;
    j["portfolio_heat_max"] = portfolio_heat_max;
    j["circuit_breaker_drawdown"] = circuit_breaker_drawdown;
    j["max_asset_exposure"] = max_asset_exposure;
    j["atr_stop_multiple"] = atr_stop_multiple;
    j["allow_short_entry"] = allow_short_entry;

    j["logging"] = logging.to_json();
    return j;
}

void PipelineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("numeric_tolerance"))
        numeric_tolerance = j.at("numeric_tolerance").get<double>();
    if (j.contains("fact_check_latency_budget_ms"))
        fact_check_latency_budget_ms = j.at("fact_check_latency_budget_ms").get<int>();
    if (j.contains("validation_cache_capacity"))
        validation_cache_capacity = j.at("validation_cache_capacity").get<size_t>();
    if (j.contains("fallback_confidence"))
        fallback_confidence = j.at("fallback_confidence").get<double>();

    if (j.contains("schema_max_retries"))
        schema_max_retries = j.at("schema_max_retries").get<int>();
    if (j.contains("schema_max_claim_chars"))
        schema_max_claim_chars = j.at("schema_max_claim_chars").get<size_t>();

    if (j.contains("regime_min_lookback_bars"))
        regime_min_lookback_bars = j.at("regime_min_lookback_bars").get<int>();
    if (j.contains("regime_volatility_threshold"))
        regime_volatility_threshold = j.at("regime_volatility_threshold").get<double>();
    if (j.contains("regime_trend_strength_threshold"))
        regime_trend_strength_threshold = j.at("regime_trend_strength_threshold").get<double>();
    if (j.contains("regime_mean_reversion_threshold"))
        regime_mean_reversion_threshold = j.at("regime_mean_reversion_threshold").get<double>();
    if (j.contains("regime_adx_period"))
        regime_adx_period = j.at("regime_adx_period").get<int>();
    if (j.contains("regime_periods_per_year"))
        regime_periods_per_year = j.at("regime_periods_per_year").get<double>();

    if (j.contains("risk_per_trade_max"))
        risk_per_trade_max = j.at("risk_per_trade_max").get<double>();
    if (j.contains("portfolio_heat_max"))
        portfolio_heat_max = j.at("portfolio_heat_max").get<double>();
    if (j.contains("circuit_breaker_drawdown"))
        circuit_breaker_drawdown = j.at("circuit_breaker_drawdown").get<double>();
    if (j.contains("max_asset_exposure"))
        max_asset_exposure = j.at("max_asset_exposure").get<double>();
    if (j.contains("atr_stop_multiple"))
        atr_stop_multiple = j.at("atr_stop_multiple").get<double>();
    if (j.contains("allow_short_entry"))
        allow_short_entry = j.at("allow_short_entry").get<bool>();

    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

std::vector<ConfigValidationError> PipelineConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    auto append = [&errors](const std::vector<ConfigValidationError>& more) {
        errors.insert(errors.end(), more.begin(), more.end());
    };

    append(regime_config().validate());
    append(fact_validator_config().validate());
    append(schema_gate_config().validate());
    append(risk_gate_config().validate());

    if (regime_volatility_threshold > 5.0) {
        errors.push_back({"regime_volatility_threshold",
                          "Annualized volatility threshold above 500% is almost certainly a "
                          "unit error"});
    }
    for (const auto& error : logging.validate()) {
        errors.push_back({"logging." + error.field, error.message});
    }

    return errors;
}

RegimeClassifierConfig PipelineConfig::regime_config() const {
    RegimeClassifierConfig config;
    config.min_lookback_bars = regime_min_lookback_bars;
    config.volatility_threshold = regime_volatility_threshold;
    config.trend_strength_threshold = regime_trend_strength_threshold;
    config.mean_reversion_threshold = regime_mean_reversion_threshold;
    config.adx_period = regime_adx_period;
    config.periods_per_year = regime_periods_per_year;
    return config;
}

FactValidatorConfig PipelineConfig::fact_validator_config() const {
    FactValidatorConfig config;
    config.numeric_tolerance = numeric_tolerance;
    config.fallback_confidence = fallback_confidence;
    config.cache_capacity = validation_cache_capacity;
    config.latency_budget_ms = fact_check_latency_budget_ms;
    return config;
}

SchemaGateConfig PipelineConfig::schema_gate_config() const {
    SchemaGateConfig config;
    config.max_retries = schema_max_retries;
    config.max_claim_chars = schema_max_claim_chars;
    return config;
}

RiskGateConfig PipelineConfig::risk_gate_config() const {
    RiskGateConfig config;
    config.risk_per_trade_max = risk_per_trade_max;
    config.portfolio_heat_max = portfolio_heat_max;
    config.circuit_breaker_drawdown = circuit_breaker_drawdown;
    config.max_asset_exposure = max_asset_exposure;
    config.atr_stop_multiple = atr_stop_multiple;
    config.allow_short_entry = allow_short_entry;
    return config;
}

}  // namespace decision_gate
