// src/pipeline/pipeline_outcome.cpp

#include "decision_gate/pipeline/pipeline_outcome.hpp"
#include "decision_gate/core/time_utils.hpp"

namespace decision_gate {

std::string stage_to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::REGIME_CLASSIFIED:
            return "REGIME_CLASSIFIED";
        case PipelineStage::SCHEMA_VALIDATION:
            return "SCHEMA_VALIDATION";
        case PipelineStage::FACT_VALIDATION:
            return "FACT_VALIDATION";
        case PipelineStage::RISK_GATE:
            return "RISK_GATE";
        case PipelineStage::TERMINAL:
            return "TERMINAL";
    }
    return "TERMINAL";
}

nlohmann::json AuditTrail::to_json() const {
    nlohmann::json j;

    nlohmann::json stage_list = nlohmann::json::array();
    for (const auto& record : stages) {
        stage_list.push_back({{"stage", stage_to_string(record.stage)},
                              {"elapsed_ms", record.elapsed_ms},
                              {"passed", record.passed},
                              {"note", record.note}});
    }
    j["stages"] = stage_list;

    if (regime)
        j["regime"] = regime->to_json();
    if (indicator_profile)
        j["indicator_profile"] = indicator_profile->to_json();
    if (schema)
        j["schema"] = schema->to_json();
    if (fact_check)
        j["fact_check"] = fact_check->to_json();
    if (proposal)
        j["proposal"] = proposal->to_json();
    if (risk)
        j["risk"] = risk->to_json();

    j["detail"] = detail;
    j["total_elapsed_ms"] = total_elapsed_ms;
    return j;
}

PipelineOutcome PipelineOutcome::approved(std::string asset_id, Timestamp date,
                                          TradeAction action, double risk_fraction,
                                          AuditTrail audit) {
    PipelineOutcome outcome;
    outcome.asset_id = std::move(asset_id);
    outcome.date = date;
    outcome.action = action;
    outcome.risk_fraction = risk_fraction;
    outcome.reason_code = ReasonCode::APPROVED;
    outcome.audit_trail = std::move(audit);
    return outcome;
}

PipelineOutcome PipelineOutcome::rejected(std::string asset_id, Timestamp date, ReasonCode reason,
                                          AuditTrail audit) {
    PipelineOutcome outcome;
    outcome.asset_id = std::move(asset_id);
    outcome.date = date;
    outcome.action = TradeAction::HOLD;
    outcome.risk_fraction = 0.0;
    outcome.reason_code = reason;
    outcome.audit_trail = std::move(audit);
    return outcome;
}

nlohmann::json PipelineOutcome::to_json() const {
    nlohmann::json j;
    j["asset_id"] = asset_id;
    j["date"] = core::to_date_string(date);
    j["action"] = action_to_string(action);
    j["risk_fraction"] = risk_fraction;
    j["reason_code"] = reason_to_string(reason_code);
    j["approved"] = is_approved();
    j["audit_trail"] = audit_trail.to_json();
    return j;
}

}  // namespace decision_gate
