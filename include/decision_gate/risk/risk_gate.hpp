// include/decision_gate/risk/risk_gate.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "decision_gate/core/config_base.hpp"
#include "decision_gate/core/types.hpp"

namespace decision_gate {

/**
 * @brief Configuration for deterministic risk limits
 */
struct RiskGateConfig : public ConfigBase {
    // Risk limits
    double risk_per_trade_max{0.02};        // Max equity at risk per trade (2%)
    double portfolio_heat_max{0.10};        // Max total open risk (10%)
    double circuit_breaker_drawdown{0.15};  // Drawdown from high-water mark that halts new risk
    double max_asset_exposure{0.25};        // Max allocation to a single asset

    // Sizing parameters
    double atr_stop_multiple{2.0};  // Stop distance in ATRs
    bool allow_short_entry{false};  // Whether SELL may open or add to a short

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["risk_per_trade_max"] = risk_per_trade_max;
        j["portfolio_heat_max"] = portfolio_heat_max;
        j["circuit_breaker_drawdown"] = circuit_breaker_drawdown;
        j["max_asset_exposure"] = max_asset_exposure;
        j["atr_stop_multiple"] = atr_stop_multiple;
        j["allow_short_entry"] = allow_short_entry;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
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
    }

    std::vector<ConfigValidationError> validate() const override;
};

/**
 * @brief Candidate trade handed to the risk gate
 */
struct TradeProposal {
    std::string asset_id;
    Timestamp date;
    TradeAction action{TradeAction::HOLD};
    double proposed_risk_fraction{0.0};
    std::vector<std::string> supporting_claims;
    MarketRegime regime{MarketRegime::SIDEWAYS};

    nlohmann::json to_json() const;
};

/**
 * @brief Current holding in one asset
 */
struct PositionState {
    PositionSide side{PositionSide::FLAT};
    double allocation{0.0};  // Fraction of equity
    double open_risk{0.0};   // Fraction of equity at risk to the stop
};

/**
 * @brief Volatility input for stop placement
 */
struct VolatilityMeasure {
    double atr{0.0};
    double reference_price{0.0};
};

/**
 * @brief Read-only view of the ledger for one asset
 */
struct PortfolioSnapshot {
    double equity{0.0};
    double high_water_mark{0.0};
    double portfolio_heat{0.0};  // Open plus reserved risk across all assets
    PositionState position;
    VolatilityMeasure volatility;

    double drawdown() const {
        if (high_water_mark <= 0.0)
            return 0.0;
        return std::max(0.0, (high_water_mark - equity) / high_water_mark);
    }
};

/**
 * @brief Verdict of the risk gate
 */
struct RiskDecision {
    bool approved{false};
    double adjusted_risk_fraction{0.0};
    double position_fraction{0.0};
    double stop_distance{0.0};  // As a fraction of price
    ReasonCode rejection_reason{ReasonCode::APPROVED};
    std::string detail;
    std::optional<uint64_t> reservation_id;  // Set when the ledger holds the risk

    nlohmann::json to_json() const;
};

/**
 * @brief Pure rule engine applying hard risk limits to a trade proposal
 *
 * Checks run in order: position-transition legality, circuit breaker,
 * position sizing, portfolio heat. The gate reads the snapshot and never
 * changes portfolio state.
 */
class RiskGate {
public:
    explicit RiskGate(RiskGateConfig config);

    /**
     * @brief Evaluate a proposal against the limits
     * @param proposal Trade under consideration
     * @param snapshot Ledger state for the proposal's asset
     * @return Decision with the admissible risk, or the first violated rule
     */
    RiskDecision evaluate(const TradeProposal& proposal, const PortfolioSnapshot& snapshot) const;

    /**
     * @brief Whether the action adds exposure given the current side
     */
    static bool is_risk_increasing(TradeAction action, PositionSide side);

    const RiskGateConfig& get_config() const {
        return config_;
    }

private:
    RiskGateConfig config_;

    std::optional<RiskDecision> check_transition(const TradeProposal& proposal,
                                                 const PositionState& position) const;

    RiskDecision size_position(const TradeProposal& proposal,
                               const PortfolioSnapshot& snapshot) const;

    static RiskDecision reject(ReasonCode reason, std::string detail);
};

}  // namespace decision_gate
