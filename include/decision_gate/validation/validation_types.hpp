// include/decision_gate/validation/validation_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include "decision_gate/core/types.hpp"

namespace decision_gate {

/**
 * @brief Unit a ground-truth value is expressed in
 */
enum class FactUnit {
    RATIO,     // 0.08 means 8%
    PERCENT,   // 8.0 means 8%
    CURRENCY,  // Price or monetary level
    POINTS     // Indicator level such as RSI
};

/**
 * @brief Verified metric supplied by the data layer, read-only to the validator
 */
struct GroundTruthFact {
    std::string metric_name;
    double value{0.0};
    FactUnit unit{FactUnit::RATIO};
    Timestamp scope_date;

    GroundTruthFact() = default;
    GroundTruthFact(std::string name, double v, FactUnit u, Timestamp date)
        : metric_name(std::move(name)), value(v), unit(u), scope_date(date) {}
};

using GroundTruthMap = std::unordered_map<std::string, GroundTruthFact>;

enum class Verdict { ENTAILMENT, CONTRADICTION, NEUTRAL };

/**
 * @brief Layer that produced a verdict
 */
enum class ValidationSource {
    NUMERIC,   // Hard arithmetic check
    SEMANTIC,  // External entailment classifier
    FALLBACK   // Directional keyword matching, classifier unavailable
};

/**
 * @brief Verdict on a single claim
 */
struct ValidationResult {
    std::string claim;
    std::string metric_name;  // Empty when no fact could be associated
    Verdict verdict{Verdict::NEUTRAL};
    double confidence{0.0};
    std::string evidence;
    ValidationSource source{ValidationSource::FALLBACK};
    bool cached{false};

    bool is_contradiction() const {
        return verdict == Verdict::CONTRADICTION;
    }

    nlohmann::json to_json() const;
};

inline std::string fact_unit_to_string(FactUnit unit) {
    switch (unit) {
        case FactUnit::RATIO:
            return "RATIO";
        case FactUnit::PERCENT:
            return "PERCENT";
        case FactUnit::CURRENCY:
            return "CURRENCY";
        case FactUnit::POINTS:
            return "POINTS";
    }
    return "RATIO";
}

inline std::string verdict_to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::ENTAILMENT:
            return "ENTAILMENT";
        case Verdict::CONTRADICTION:
            return "CONTRADICTION";
        case Verdict::NEUTRAL:
            return "NEUTRAL";
    }
    return "NEUTRAL";
}

inline std::string validation_source_to_string(ValidationSource source) {
    switch (source) {
        case ValidationSource::NUMERIC:
            return "NUMERIC";
        case ValidationSource::SEMANTIC:
            return "SEMANTIC";
        case ValidationSource::FALLBACK:
            return "FALLBACK";
    }
    return "FALLBACK";
}

inline nlohmann::json ValidationResult::to_json() const {
    nlohmann::json j;
    j["claim"] = claim;
    j["metric_name"] = metric_name;
    j["verdict"] = verdict_to_string(verdict);
    j["confidence"] = confidence;
    j["evidence"] = evidence;
    j["source"] = validation_source_to_string(source);
    j["cached"] = cached;
    return j;
}

}  // namespace decision_gate
