// include/decision_gate/schema/schema_contract.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "decision_gate/core/error.hpp"
#include "decision_gate/schema/agent_output.hpp"

namespace decision_gate {

/**
 * @brief Named field contract for agent decisions
 *
 * Required: "action" (one of BUY, SELL, HOLD), "confidence" (number in
 * [0, 1]) and "key_claims" (array of non-empty strings). Optional:
 * "risk_fraction" (number in [0, 1]). Other fields are ignored. A claim
 * longer than max_claim_chars is a violation, so the retry loop asks for a
 * shorter one.
 */
class SchemaContract {
public:
    explicit SchemaContract(std::string name = "trade_decision_v1", size_t min_claims = 1,
                            size_t max_claims = 5, size_t max_claim_chars = 500);

    /**
     * @brief Pull the JSON payload out of agent text
     *
     * Handles ```json fenced blocks, bare ``` fences and a JSON object
     * embedded in prose. Text without any of these is returned trimmed.
     */
    static std::string extract_json(const std::string& raw_text);

    /**
     * @brief Parse and validate agent text against the contract
     * @param raw_text Agent output as received
     * @return Result containing the fields, JSON_PARSE_ERROR when the payload
     *         is not JSON, or SCHEMA_VIOLATION listing every violated field
     */
    Result<AgentDecisionFields> parse(const std::string& raw_text) const;

    /**
     * @brief Human-readable contract, sent to the agent on retries
     */
    std::string describe() const;

    const std::string& name() const {
        return name_;
    }

private:
    std::string name_;
    size_t min_claims_;
    size_t max_claims_;
    size_t max_claim_chars_;

    std::vector<std::string> check_fields(const nlohmann::json& payload,
                                          AgentDecisionFields& fields) const;
};

}  // namespace decision_gate
