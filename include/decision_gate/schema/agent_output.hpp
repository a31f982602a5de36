// include/decision_gate/schema/agent_output.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "decision_gate/core/types.hpp"

namespace decision_gate {

/**
 * @brief Fields of a structurally valid agent decision
 */
struct AgentDecisionFields {
    TradeAction action{TradeAction::HOLD};
    double confidence{0.0};
    std::vector<std::string> key_claims;
    std::optional<double> risk_fraction;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["action"] = action_to_string(action);
        j["confidence"] = confidence;
        j["key_claims"] = key_claims;
        if (risk_fraction) {
            j["risk_fraction"] = *risk_fraction;
        } else {
            j["risk_fraction"] = nullptr;
        }
        return j;
    }
};

/**
 * @brief Raw agent text together with its parsed form
 *
 * Only the schema gate's retry loop writes to an envelope: each regeneration
 * replaces raw_text and parsed_fields wholesale and bumps retry_count.
 */
struct AgentOutputEnvelope {
    std::string raw_text;
    AgentDecisionFields parsed_fields;
    bool schema_valid{false};
    int retry_count{0};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["raw_text"] = raw_text;
        j["schema_valid"] = schema_valid;
        j["retry_count"] = retry_count;
        j["parsed_fields"] = schema_valid ? parsed_fields.to_json() : nlohmann::json(nullptr);
        return j;
    }
};

}  // namespace decision_gate
