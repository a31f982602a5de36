// src/risk/risk_ledger.cpp

#include "decision_gate/risk/risk_ledger.hpp"
#include <algorithm>
#include <cmath>
#include "decision_gate/core/logger.hpp"

namespace decision_gate {

RiskLedger::RiskLedger(double equity) : equity_(equity), high_water_mark_(equity) {}

Result<void> RiskLedger::update_equity(double equity) {
    if (!std::isfinite(equity) || equity <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Equity must be positive and finite", "RiskLedger");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    equity_ = equity;
    high_water_mark_ = std::max(high_water_mark_, equity);
    return Result<void>();
}

Result<void> RiskLedger::set_position(const std::string& asset_id,
                                      const PositionState& position) {
    if (asset_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Asset id cannot be empty",
                                "RiskLedger");
    }
    if (position.allocation < 0.0 || position.open_risk < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Allocation and open risk cannot be negative for " + asset_id,
                                "RiskLedger");
    }
    if (position.side == PositionSide::FLAT && position.allocation > 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "FLAT position cannot carry an allocation for " + asset_id,
                                "RiskLedger");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    positions_[asset_id] = position;
    return Result<void>();
}

Result<void> RiskLedger::set_volatility(const std::string& asset_id,
                                        const VolatilityMeasure& volatility) {
    if (asset_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Asset id cannot be empty",
                                "RiskLedger");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    volatility_[asset_id] = volatility;
    return Result<void>();
}

PortfolioSnapshot RiskLedger::snapshot(const std::string& asset_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_unsafe(asset_id);
}

PortfolioSnapshot RiskLedger::snapshot_unsafe(const std::string& asset_id) const {
    PortfolioSnapshot snap;
    snap.equity = equity_;
    snap.high_water_mark = high_water_mark_;
    snap.portfolio_heat = heat_unsafe();

    auto pos_it = positions_.find(asset_id);
    if (pos_it != positions_.end()) {
        snap.position = pos_it->second;
    }

    // Pending entries count as exposure already taken, the way commit() will book them
    for (const auto& [_, reservation] : reservations_) {
        if (reservation.asset_id != asset_id)
            continue;
        const PositionSide side =
            reservation.action == TradeAction::SELL ? PositionSide::SHORT : PositionSide::LONG;
        if (snap.position.side == PositionSide::FLAT) {
            snap.position.side = side;
        }
        if (snap.position.side == side) {
            snap.position.allocation += reservation.position_fraction;
        }
    }

    auto vol_it = volatility_.find(asset_id);
    if (vol_it != volatility_.end()) {
        snap.volatility = vol_it->second;
    }

    return snap;
}

RiskDecision RiskLedger::evaluate_and_reserve(const TradeProposal& proposal,
                                              const RiskGate& gate) {
    std::lock_guard<std::mutex> lock(mutex_);

    RiskDecision decision = gate.evaluate(proposal, snapshot_unsafe(proposal.asset_id));

    if (decision.approved && decision.adjusted_risk_fraction > 0.0) {
        RiskReservation reservation;
        reservation.id = next_reservation_id_++;
        reservation.asset_id = proposal.asset_id;
        reservation.action = proposal.action;
        reservation.risk_fraction = decision.adjusted_risk_fraction;
        reservation.position_fraction = decision.position_fraction;

        decision.reservation_id = reservation.id;
        reservations_[reservation.id] = reservation;

        DEBUG("Reserved " << reservation.risk_fraction << " heat for " << proposal.asset_id
                          << " as reservation " << reservation.id);
    }

    return decision;
}

Result<void> RiskLedger::commit(uint64_t reservation_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end()) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                "Unknown reservation " + std::to_string(reservation_id),
                                "RiskLedger");
    }

    const auto& reservation = it->second;
    auto& position = positions_[reservation.asset_id];

    if (position.side == PositionSide::FLAT) {
        position.side =
            reservation.action == TradeAction::SELL ? PositionSide::SHORT : PositionSide::LONG;
    }
    position.allocation += reservation.position_fraction;
    position.open_risk += reservation.risk_fraction;

    reservations_.erase(it);
    return Result<void>();
}

Result<void> RiskLedger::release(uint64_t reservation_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (reservations_.erase(reservation_id) == 0) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                "Unknown reservation " + std::to_string(reservation_id),
                                "RiskLedger");
    }
    return Result<void>();
}

double RiskLedger::heat_unsafe() const {
    double heat = 0.0;
    for (const auto& [_, position] : positions_) {
        heat += position.open_risk;
    }
    for (const auto& [_, reservation] : reservations_) {
        heat += reservation.risk_fraction;
    }
    return heat;
}

double RiskLedger::portfolio_heat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heat_unsafe();
}

double RiskLedger::pending_heat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double heat = 0.0;
    for (const auto& [_, reservation] : reservations_) {
        heat += reservation.risk_fraction;
    }
    return heat;
}

double RiskLedger::drawdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (high_water_mark_ <= 0.0)
        return 0.0;
    return std::max(0.0, (high_water_mark_ - equity_) / high_water_mark_);
}

size_t RiskLedger::pending_reservations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reservations_.size();
}

nlohmann::json RiskLedger::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["equity"] = equity_;
    j["high_water_mark"] = high_water_mark_;
    j["portfolio_heat"] = heat_unsafe();
    j["pending_reservations"] = reservations_.size();

    nlohmann::json positions = nlohmann::json::object();
    for (const auto& [asset, position] : positions_) {
        positions[asset] = {{"side", position_side_to_string(position.side)},
                            {"allocation", position.allocation},
                            {"open_risk", position.open_risk}};
    }
    j["positions"] = positions;
    return j;
}

}  // namespace decision_gate
