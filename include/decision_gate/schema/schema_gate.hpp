// include/decision_gate/schema/schema_gate.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "decision_gate/core/config_base.hpp"
#include "decision_gate/schema/agent_output.hpp"
#include "decision_gate/schema/generating_agent.hpp"
#include "decision_gate/schema/schema_contract.hpp"

namespace decision_gate {

/**
 * @brief Configuration for the schema compliance gate
 */
struct SchemaGateConfig : public ConfigBase {
    int max_retries{2};         // Retries after the initial attempt
    size_t max_key_claims{5};
    size_t max_claim_chars{500};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_retries"] = max_retries;
        j["max_key_claims"] = max_key_claims;
        j["max_claim_chars"] = max_claim_chars;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_retries"))
            max_retries = j.at("max_retries").get<int>();
        if (j.contains("max_key_claims"))
            max_key_claims = j.at("max_key_claims").get<size_t>();
        if (j.contains("max_claim_chars"))
            max_claim_chars = j.at("max_claim_chars").get<size_t>();
    }

    std::vector<ConfigValidationError> validate() const override;
};

/**
 * @brief Snapshot of retry counters across all gate runs
 */
struct RetryStats {
    uint64_t total_runs{0};
    uint64_t first_try_successes{0};
    uint64_t successes_after_retry{0};
    uint64_t failures{0};

    double first_try_success_rate() const;
    double overall_success_rate() const;
    double failure_rate() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of one gate run
 */
struct SchemaGateResult {
    AgentOutputEnvelope envelope;
    bool valid{false};
    int attempts{0};
    std::vector<std::string> errors;  // One entry per failed attempt

    nlohmann::json to_json() const;
};

/**
 * @brief Bounded regenerate-until-valid loop around the generating agent
 *
 * Makes at most max_retries + 1 calls. Each retry carries the previous text
 * and its validation errors. A failed agent call counts as a failed attempt.
 * Exhaustion is reported in the result, never thrown.
 */
class SchemaGate {
public:
    SchemaGate(SchemaGateConfig config, std::shared_ptr<GeneratingAgent> agent);

    /**
     * @brief Obtain a schema-valid decision from the agent
     * @param request Initial request; attempt and retry fields are filled in here
     * @return Final envelope with attempt count and accumulated errors
     */
    SchemaGateResult run(GenerationRequest request);

    RetryStats stats() const;

    const SchemaContract& contract() const {
        return contract_;
    }

private:
    SchemaGateConfig config_;
    std::shared_ptr<GeneratingAgent> agent_;
    SchemaContract contract_;

    std::atomic<uint64_t> total_runs_{0};
    std::atomic<uint64_t> first_try_successes_{0};
    std::atomic<uint64_t> successes_after_retry_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace decision_gate
