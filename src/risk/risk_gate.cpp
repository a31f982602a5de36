// src/risk/risk_gate.cpp

#include "decision_gate/risk/risk_gate.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "decision_gate/core/logger.hpp"
#include "decision_gate/core/time_utils.hpp"

namespace decision_gate {

namespace {
constexpr double kEpsilon = 1e-9;
}

std::vector<ConfigValidationError> RiskGateConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    if (risk_per_trade_max <= 0.0 || risk_per_trade_max > 1.0) {
        errors.push_back({"risk_per_trade_max", "Must be in (0, 1]"});
    }
    if (portfolio_heat_max <= 0.0 || portfolio_heat_max > 1.0) {
        errors.push_back({"portfolio_heat_max", "Must be in (0, 1]"});
    }
    if (risk_per_trade_max > portfolio_heat_max) {
        errors.push_back({"risk_per_trade_max", "Cannot exceed portfolio_heat_max"});
    }
    if (circuit_breaker_drawdown <= 0.0 || circuit_breaker_drawdown >= 1.0) {
        errors.push_back({"circuit_breaker_drawdown", "Must be in (0, 1)"});
    }
    if (max_asset_exposure <= 0.0) {
        errors.push_back({"max_asset_exposure", "Must be positive"});
    }
    if (atr_stop_multiple <= 0.0) {
        errors.push_back({"atr_stop_multiple", "Must be positive"});
    }

    return errors;
}

nlohmann::json TradeProposal::to_json() const {
    nlohmann::json j;
    j["asset_id"] = asset_id;
    j["date"] = core::to_date_string(date);
    j["action"] = action_to_string(action);
    j["proposed_risk_fraction"] = proposed_risk_fraction;
    j["supporting_claims"] = supporting_claims;
    j["regime"] = regime_to_string(regime);
    return j;
}

nlohmann::json RiskDecision::to_json() const {
    nlohmann::json j;
    j["approved"] = approved;
    j["adjusted_risk_fraction"] = adjusted_risk_fraction;
    j["position_fraction"] = position_fraction;
    j["stop_distance"] = stop_distance;
    j["rejection_reason"] = reason_to_string(rejection_reason);
    j["detail"] = detail;
    if (reservation_id) {
        j["reservation_id"] = *reservation_id;
    }
    return j;
}

RiskGate::RiskGate(RiskGateConfig config) : config_(std::move(config)) {}

bool RiskGate::is_risk_increasing(TradeAction action, PositionSide side) {
    switch (action) {
        case TradeAction::BUY:
            return side != PositionSide::SHORT;
        case TradeAction::SELL:
            return side != PositionSide::LONG;
        case TradeAction::HOLD:
            return false;
    }
    return false;
}

RiskDecision RiskGate::reject(ReasonCode reason, std::string detail) {
    RiskDecision decision;
    decision.approved = false;
    decision.rejection_reason = reason;
    decision.detail = std::move(detail);
    return decision;
}

RiskDecision RiskGate::evaluate(const TradeProposal& proposal,
                                const PortfolioSnapshot& snapshot) const {
    ScopedLogComponent log_scope("RiskGate");
    const auto& position = snapshot.position;

    if (proposal.action == TradeAction::HOLD) {
        RiskDecision decision;
        decision.approved = true;
        decision.detail = "HOLD adds no risk";
        return decision;
    }

    // 1. Position-transition legality
    auto illegal = check_transition(proposal, position);
    if (illegal) {
        return *illegal;
    }

    const bool increasing = is_risk_increasing(proposal.action, position.side);

    // 2. Circuit breaker
    const double drawdown = snapshot.drawdown();
    if (increasing && drawdown > config_.circuit_breaker_drawdown) {
        std::ostringstream detail;
        detail << "Drawdown " << drawdown << " exceeds circuit breaker "
               << config_.circuit_breaker_drawdown << ", " << action_to_string(proposal.action)
               << " would add risk";
        return reject(ReasonCode::CIRCUIT_BREAKER, detail.str());
    }

    if (!increasing) {
        RiskDecision decision;
        decision.approved = true;
        decision.position_fraction = position.allocation;
        decision.detail = action_to_string(proposal.action) + " reduces " +
                          position_side_to_string(position.side) + " exposure";
        return decision;
    }

    // 3 and 4. Sizing, then portfolio heat
    return size_position(proposal, snapshot);
}

std::optional<RiskDecision> RiskGate::check_transition(const TradeProposal& proposal,
                                                       const PositionState& position) const {
    if (proposal.action == TradeAction::SELL && position.side != PositionSide::LONG &&
        !config_.allow_short_entry) {
        return reject(ReasonCode::INVALID_POSITION_TRANSITION,
                      "SELL on " + position_side_to_string(position.side) +
                          " position requires short entry, which is disabled");
    }

    const bool adds_to_same_side =
        (proposal.action == TradeAction::BUY && position.side == PositionSide::LONG) ||
        (proposal.action == TradeAction::SELL && position.side == PositionSide::SHORT);

    if (adds_to_same_side && position.allocation >= config_.max_asset_exposure - kEpsilon) {
        std::ostringstream detail;
        detail << action_to_string(proposal.action) << " on "
               << position_side_to_string(position.side) << " already at allocation "
               << position.allocation << ", limit " << config_.max_asset_exposure;
        return reject(ReasonCode::INVALID_POSITION_TRANSITION, detail.str());
    }

    return std::nullopt;
}

RiskDecision RiskGate::size_position(const TradeProposal& proposal,
                                     const PortfolioSnapshot& snapshot) const {
    const double atr = snapshot.volatility.atr;
    const double price = snapshot.volatility.reference_price;

    if (!std::isfinite(atr) || !std::isfinite(price) || atr <= 0.0 || price <= 0.0) {
        return reject(ReasonCode::INSUFFICIENT_DATA,
                      "Missing or invalid volatility data for " + proposal.asset_id);
    }

    if (!std::isfinite(proposal.proposed_risk_fraction) ||
        proposal.proposed_risk_fraction <= 0.0) {
        return reject(ReasonCode::RISK_LIMIT_EXCEEDED,
                      "Proposal requests no usable risk budget");
    }

    RiskDecision decision;
    decision.stop_distance = config_.atr_stop_multiple * atr / price;

    double risk = std::min(proposal.proposed_risk_fraction, config_.risk_per_trade_max);
    double fraction = risk / decision.stop_distance;

    std::ostringstream detail;
    detail << "Risk " << risk;

    // Cap by the room left in this asset
    const bool same_side = snapshot.position.side != PositionSide::FLAT;
    const double current_allocation = same_side ? snapshot.position.allocation : 0.0;
    const double exposure_room = config_.max_asset_exposure - current_allocation;
    if (fraction > exposure_room) {
        fraction = std::max(0.0, exposure_room);
        risk = fraction * decision.stop_distance;
        detail << ", capped by asset exposure to " << risk;
    }

    const double heat_room = config_.portfolio_heat_max - snapshot.portfolio_heat;
    if (heat_room <= kEpsilon) {
        std::ostringstream reason;
        reason << "Portfolio heat " << snapshot.portfolio_heat << " leaves no room under limit "
               << config_.portfolio_heat_max;
        return reject(ReasonCode::RISK_LIMIT_EXCEEDED, reason.str());
    }

    if (risk > heat_room) {
        risk = heat_room;
        fraction = risk / decision.stop_distance;
        detail << ", capped by portfolio heat to " << risk;
    }

    if (risk <= kEpsilon) {
        return reject(ReasonCode::RISK_LIMIT_EXCEEDED, detail.str() + ", nothing left to allocate");
    }

    decision.approved = true;
    decision.adjusted_risk_fraction = risk;
    decision.position_fraction = fraction;
    decision.detail = detail.str();

    DEBUG("Risk gate sized " << proposal.asset_id << " " << action_to_string(proposal.action)
                             << ": risk=" << risk << ", position=" << fraction
                             << ", stop=" << decision.stop_distance);
    return decision;
}

}  // namespace decision_gate
