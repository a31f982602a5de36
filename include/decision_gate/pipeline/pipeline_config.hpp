// include/decision_gate/pipeline/pipeline_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "decision_gate/core/config_base.hpp"
#include "decision_gate/core/logger.hpp"
#include "decision_gate/regime/regime_classifier.hpp"
#include "decision_gate/risk/risk_gate.hpp"
#include "decision_gate/schema/schema_gate.hpp"
#include "decision_gate/validation/fact_validator.hpp"

namespace decision_gate {

/**
 * @brief Flat configuration for the whole decision pipeline
 *
 * Serializes to the flat key set consumed by deployments, with logging as
 * the only nested section. Component configs are derived from it.
 */
struct PipelineConfig : public ConfigBase {
    // Fact validation
    double numeric_tolerance{0.10};
    int fact_check_latency_budget_ms{2000};
    size_t validation_cache_capacity{10000};
    double fallback_confidence{0.6};

    // Schema gate
    int schema_max_retries{2};
    size_t schema_max_claim_chars{500};

    // Regime classification
    int regime_min_lookback_bars{60};
    double regime_volatility_threshold{0.40};
    double regime_trend_strength_threshold{25.0};
    double regime_mean_reversion_threshold{0.10};
    int regime_adx_period{14};
    double regime_periods_per_year{252.0};

    // Risk limits
    double risk_per_trade_max{0.02};
    double portfolio_heat_max{0.10};
    double circuit_breaker_drawdown{0.15};
    double max_asset_exposure{0.25};
    double atr_stop_multiple{2.0};
    bool allow_short_entry{false};

    LoggerConfig logging;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check every parameter, including the component-level rules
     * @return All problems found, empty when the configuration is usable
     */
    std::vector<ConfigValidationError> validate() const override;

    RegimeClassifierConfig regime_config() const;
    FactValidatorConfig fact_validator_config() const;
    SchemaGateConfig schema_gate_config() const;
    RiskGateConfig risk_gate_config() const;
};

}  // namespace decision_gate
