// include/decision_gate/pipeline/pipeline_outcome.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "decision_gate/core/types.hpp"
#include "decision_gate/regime/indicator_profile.hpp"
#include "decision_gate/regime/regime_classifier.hpp"
#include "decision_gate/risk/risk_gate.hpp"
#include "decision_gate/schema/schema_gate.hpp"
#include "decision_gate/validation/fact_validator.hpp"

namespace decision_gate {

/**
 * @brief States of the evaluation state machine
 */
enum class PipelineStage { REGIME_CLASSIFIED, SCHEMA_VALIDATION, FACT_VALIDATION, RISK_GATE, TERMINAL };

std::string stage_to_string(PipelineStage stage);

/**
 * @brief One completed stage of an evaluation
 */
struct StageRecord {
    PipelineStage stage{PipelineStage::TERMINAL};
    double elapsed_ms{0.0};
    bool passed{false};
    std::string note;
};

/**
 * @brief Everything that led to a decision, for the logging collaborator
 *
 * Sections are present only for the stages that actually ran.
 */
struct AuditTrail {
    std::vector<StageRecord> stages;
    std::optional<RegimeClassification> regime;
    std::optional<IndicatorProfile> indicator_profile;
    std::optional<SchemaGateResult> schema;
    std::optional<FactCheckReport> fact_check;
    std::optional<TradeProposal> proposal;
    std::optional<RiskDecision> risk;
    std::string detail;  // Why the evaluation ended where it did
    double total_elapsed_ms{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief The single terminal result of an evaluation
 *
 * Always fully populated. Every rejection carries action HOLD, zero risk and
 * a specific reason code.
 */
struct PipelineOutcome {
    std::string asset_id;
    Timestamp date;
    TradeAction action{TradeAction::HOLD};
    double risk_fraction{0.0};
    ReasonCode reason_code{ReasonCode::INSUFFICIENT_DATA};
    AuditTrail audit_trail;

    bool is_approved() const {
        return reason_code == ReasonCode::APPROVED;
    }

    /**
     * @brief Outcome that lets the action through at the given risk
     */
    static PipelineOutcome approved(std::string asset_id, Timestamp date, TradeAction action,
                                    double risk_fraction, AuditTrail audit);

    /**
     * @brief Dead-state outcome: HOLD with zero risk and the rejection reason
     */
    static PipelineOutcome rejected(std::string asset_id, Timestamp date, ReasonCode reason,
                                    AuditTrail audit);

    nlohmann::json to_json() const;
};

}  // namespace decision_gate
