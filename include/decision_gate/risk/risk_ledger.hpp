// include/decision_gate/risk/risk_ledger.hpp
#pragma once

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include "decision_gate/core/error.hpp"
#include "decision_gate/risk/risk_gate.hpp"

namespace decision_gate {

/**
 * @brief Approved risk held back until the accounting side confirms the fill
 */
struct RiskReservation {
    uint64_t id{0};
    std::string asset_id;
    TradeAction action{TradeAction::HOLD};
    double risk_fraction{0.0};
    double position_fraction{0.0};
};

/**
 * @brief Thread-safe portfolio state shared by concurrent evaluations
 *
 * Holds equity, high-water mark, per-asset positions and volatility, and
 * pending reservations. evaluate_and_reserve() runs the gate and books the
 * approved risk under one lock, so two concurrent approvals can never both
 * spend the same heat headroom.
 */
class RiskLedger {
public:
    /**
     * @brief Constructor
     * @param equity Starting equity, also the initial high-water mark
     */
    explicit RiskLedger(double equity);

    /**
     * @brief Record new equity, raising the high-water mark when exceeded
     */
    Result<void> update_equity(double equity);

    Result<void> set_position(const std::string& asset_id, const PositionState& position);

    Result<void> set_volatility(const std::string& asset_id, const VolatilityMeasure& volatility);

    /**
     * @brief Consistent view for one asset; unknown assets are FLAT with no volatility data
     *
     * Pending reservations on the asset are folded into its position, so a
     * FLAT asset with a reserved BUY already reads as LONG.
     */
    PortfolioSnapshot snapshot(const std::string& asset_id) const;

    /**
     * @brief Run the gate against the current state and reserve approved risk
     * @param proposal Trade under consideration
     * @param gate Rule engine to apply
     * @return Gate decision, carrying a reservation id when risk was booked
     */
    RiskDecision evaluate_and_reserve(const TradeProposal& proposal, const RiskGate& gate);

    /**
     * @brief Turn a reservation into open position risk
     */
    Result<void> commit(uint64_t reservation_id);

    /**
     * @brief Drop a reservation without touching positions
     */
    Result<void> release(uint64_t reservation_id);

    double portfolio_heat() const;
    double pending_heat() const;
    double drawdown() const;
    size_t pending_reservations() const;

    nlohmann::json to_json() const;

private:
    double heat_unsafe() const;
    PortfolioSnapshot snapshot_unsafe(const std::string& asset_id) const;

    double equity_;
    double high_water_mark_;
    std::unordered_map<std::string, PositionState> positions_;
    std::unordered_map<std::string, VolatilityMeasure> volatility_;
    std::unordered_map<uint64_t, RiskReservation> reservations_;
    uint64_t next_reservation_id_{1};
    mutable std::mutex mutex_;
};

}  // namespace decision_gate
