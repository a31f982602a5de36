// include/decision_gate/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace decision_gate {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Market data bar structure
 * Represents daily OHLCV data
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}
};

/**
 * @brief Action recommended by the generating agent
 */
enum class TradeAction { BUY, SELL, HOLD };

/**
 * @brief Side of the currently held position for an asset
 */
enum class PositionSide { FLAT, LONG, SHORT };

/**
 * @brief Market state classification
 */
enum class MarketRegime { TRENDING_UP, TRENDING_DOWN, MEAN_REVERTING, VOLATILE, SIDEWAYS };

/**
 * @brief Terminal reason attached to every pipeline outcome
 */
enum class ReasonCode {
    APPROVED,
    SCHEMA_INVALID,
    FACT_CHECK_FAILED,
    INVALID_POSITION_TRANSITION,
    RISK_LIMIT_EXCEEDED,
    CIRCUIT_BREAKER,
    INSUFFICIENT_DATA
};

inline std::string action_to_string(TradeAction action) {
    switch (action) {
        case TradeAction::BUY:
            return "BUY";
        case TradeAction::SELL:
            return "SELL";
        case TradeAction::HOLD:
            return "HOLD";
    }
    return "HOLD";
}

inline std::optional<TradeAction> action_from_string(const std::string& value) {
    if (value == "BUY")
        return TradeAction::BUY;
    if (value == "SELL")
        return TradeAction::SELL;
    if (value == "HOLD")
        return TradeAction::HOLD;
    return std::nullopt;
}

inline std::string position_side_to_string(PositionSide side) {
    switch (side) {
        case PositionSide::FLAT:
            return "FLAT";
        case PositionSide::LONG:
            return "LONG";
        case PositionSide::SHORT:
            return "SHORT";
    }
    return "FLAT";
}

inline std::string regime_to_string(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::TRENDING_UP:
            return "TRENDING_UP";
        case MarketRegime::TRENDING_DOWN:
            return "TRENDING_DOWN";
        case MarketRegime::MEAN_REVERTING:
            return "MEAN_REVERTING";
        case MarketRegime::VOLATILE:
            return "VOLATILE";
        case MarketRegime::SIDEWAYS:
            return "SIDEWAYS";
    }
    return "SIDEWAYS";
}

inline std::string reason_to_string(ReasonCode reason) {
    switch (reason) {
        case ReasonCode::APPROVED:
            return "APPROVED";
        case ReasonCode::SCHEMA_INVALID:
            return "SCHEMA_INVALID";
        case ReasonCode::FACT_CHECK_FAILED:
            return "FACT_CHECK_FAILED";
        case ReasonCode::INVALID_POSITION_TRANSITION:
            return "INVALID_POSITION_TRANSITION";
        case ReasonCode::RISK_LIMIT_EXCEEDED:
            return "RISK_LIMIT_EXCEEDED";
        case ReasonCode::CIRCUIT_BREAKER:
            return "CIRCUIT_BREAKER";
        case ReasonCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
    }
    return "INSUFFICIENT_DATA";
}

}  // namespace decision_gate
