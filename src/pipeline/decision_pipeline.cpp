// src/pipeline/decision_pipeline.cpp

#include "decision_gate/pipeline/decision_pipeline.hpp"
#include <iostream>
#include <stdexcept>
#include "decision_gate/core/logger.hpp"
#include "decision_gate/regime/indicator_profile.hpp"

namespace decision_gate {

namespace {

double elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

}  // namespace

DecisionPipeline::DecisionPipeline(PipelineConfig config, std::shared_ptr<GeneratingAgent> agent,
                                   std::shared_ptr<EntailmentClient> entailment,
                                   std::shared_ptr<RiskLedger> ledger, std::string id)
    : config_(std::move(config)),
      id_(std::move(id)),
      ledger_(std::move(ledger)),
      regime_classifier_(config_.regime_config()),
      risk_gate_(config_.risk_gate_config()) {
    const auto config_errors = config_.validate();
    if (!config_errors.empty()) {
        throw std::invalid_argument("Invalid pipeline configuration: " +
                                    format_validation_errors(config_errors));
    }
    if (!agent) {
        throw std::invalid_argument("DecisionPipeline requires a generating agent");
    }
    if (!ledger_) {
        throw std::invalid_argument("DecisionPipeline requires a risk ledger");
    }

    schema_gate_ = std::make_unique<SchemaGate>(config_.schema_gate_config(), std::move(agent));
    fact_validator_ = std::make_unique<FactValidator>(config_.fact_validator_config(),
                                                      std::move(entailment));

    ComponentInfo info{ComponentType::DECISION_PIPELINE,
                       ComponentState::INITIALIZED,
                       id_,
                       "",
                       std::chrono::system_clock::now(),
                       {{"evaluations", 0.0}}};

    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        throw std::runtime_error(register_result.error()->what());
    }
}

DecisionPipeline::~DecisionPipeline() {
    auto unregister_result = StateManager::instance().unregister_component(id_);
    if (unregister_result.is_error()) {
        // The registry may already have been reset; nothing to throw to
        std::cerr << "Error unregistering " << id_ << " from StateManager: "
                  << unregister_result.error()->what() << std::endl;
    }
}

Result<void> DecisionPipeline::initialize() {
    try {
        if (!Logger::instance().is_initialized()) {
            Logger::instance().initialize(config_.logging);
        }

        if (running_.load()) {
            return Result<void>();
        }

        auto& states = StateManager::instance();
        auto current = states.get_state(id_);
        if (current.is_error()) {
            return make_error<void>(current.error()->code(), current.error()->what(),
                                    "DecisionPipeline");
        }
        if (current.value().state == ComponentState::STOPPED) {
            auto reset_result = states.update_state(id_, ComponentState::INITIALIZED);
            if (reset_result.is_error()) {
                return reset_result;
            }
        }

        auto state_result = states.update_state(id_, ComponentState::RUNNING);
        if (state_result.is_error()) {
            return state_result;
        }

        running_.store(true);
        if (!fact_validator_->has_entailment_client()) {
            WARN("No entailment client configured, semantic checks use keyword fallback");
        }
        INFO("Decision pipeline " << id_ << " running with schema retries="
                                  << config_.schema_max_retries
                                  << ", numeric tolerance=" << config_.numeric_tolerance);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                std::string("Failed to initialize pipeline: ") + e.what(),
                                "DecisionPipeline");
    }
}

Result<void> DecisionPipeline::stop() {
    if (!running_.exchange(false)) {
        return Result<void>();
    }

    auto state_result = StateManager::instance().update_state(id_, ComponentState::STOPPED);
    if (state_result.is_error()) {
        return state_result;
    }
    INFO("Decision pipeline " << id_ << " stopped");
    return Result<void>();
}

Result<PipelineOutcome> DecisionPipeline::evaluate(const EvaluationRequest& request) {
    if (!running_.load()) {
        return make_error<PipelineOutcome>(ErrorCode::NOT_INITIALIZED,
                                           "Pipeline " + id_ + " is not initialized",
                                           "DecisionPipeline");
    }

    if (request.asset_id.empty() || request.asset_id != request.prices.asset_id()) {
        return make_error<PipelineOutcome>(
            ErrorCode::INVALID_ARGUMENT,
            "Evaluation asset '" + request.asset_id + "' does not match price series '" +
                request.prices.asset_id() + "'",
            "DecisionPipeline");
    }

    ScopedLogComponent log_scope("DecisionPipeline");
    try {
        const auto started = std::chrono::steady_clock::now();
        AuditTrail audit;
        size_t model_invocations = 0;

        // Regime classification
        auto stage_start = std::chrono::steady_clock::now();
        auto regime_result = regime_classifier_.classify(request.prices, request.date);
        if (regime_result.is_error()) {
            if (regime_result.error()->code() != ErrorCode::INSUFFICIENT_DATA) {
                return make_error<PipelineOutcome>(regime_result.error()->code(),
                                                   regime_result.error()->what(),
                                                   "DecisionPipeline");
            }
            audit.stages.push_back({PipelineStage::REGIME_CLASSIFIED, elapsed_since(stage_start),
                                    false, regime_result.error()->what()});
            audit.detail = regime_result.error()->what();
            return finish(PipelineOutcome::rejected(request.asset_id, request.date,
                                                    ReasonCode::INSUFFICIENT_DATA,
                                                    std::move(audit)),
                          model_invocations, started);
        }

        const RegimeClassification& regime = regime_result.value();
        const IndicatorProfile profile = recommended_indicator_profile(regime.regime);
        audit.regime = regime;
        audit.indicator_profile = profile;
        audit.stages.push_back({PipelineStage::REGIME_CLASSIFIED, elapsed_since(stage_start),
                                true, regime_to_string(regime.regime)});
        DEBUG(request.asset_id << " classified " << regime_to_string(regime.regime));

        // Schema validation with bounded retries
        stage_start = std::chrono::steady_clock::now();
        GenerationRequest generation;
        generation.asset_id = request.asset_id;
        generation.date = request.date;
        generation.regime = regime.regime;
        generation.indicator_profile = profile;

        SchemaGateResult schema = schema_gate_->run(std::move(generation));
        const bool schema_valid = schema.valid;
        audit.stages.push_back({PipelineStage::SCHEMA_VALIDATION, elapsed_since(stage_start),
                                schema_valid,
                                std::to_string(schema.attempts) + " attempt(s)"});
        audit.schema = schema;

        if (!schema_valid) {
            audit.detail = schema.errors.empty() ? "Agent produced no valid output"
                                                 : schema.errors.back();
            return finish(PipelineOutcome::rejected(request.asset_id, request.date,
                                                    ReasonCode::SCHEMA_INVALID, std::move(audit)),
                          model_invocations, started);
        }

        const AgentDecisionFields& fields = schema.envelope.parsed_fields;

        // Fact validation on the final output's claims only
        stage_start = std::chrono::steady_clock::now();
        auto report_result = fact_validator_->validate(fields.key_claims, request.facts,
                                                       request.date);
        if (report_result.is_error()) {
            WARN("Fact validation of " << request.asset_id
                                       << " failed: " << report_result.error()->to_string());
            audit.stages.push_back({PipelineStage::FACT_VALIDATION, elapsed_since(stage_start),
                                    false, report_result.error()->what()});
            audit.detail = report_result.error()->what();
            return finish(PipelineOutcome::rejected(request.asset_id, request.date,
                                                    ReasonCode::FACT_CHECK_FAILED,
                                                    std::move(audit)),
                          model_invocations, started);
        }

        const FactCheckReport& report = report_result.value();
        model_invocations = report.model_invocations;
        audit.fact_check = report;

        std::string fact_note = std::to_string(report.results.size()) + " claim(s), " +
                                std::to_string(report.cache_hits) + " cached";
        if (report.budget_exceeded) {
            fact_note += ", latency budget exceeded";
        }
        audit.stages.push_back({PipelineStage::FACT_VALIDATION, elapsed_since(stage_start),
                                report.all_valid, fact_note});

        if (!report.all_valid) {
            audit.detail = report.contradictions.front();
            return finish(PipelineOutcome::rejected(request.asset_id, request.date,
                                                    ReasonCode::FACT_CHECK_FAILED,
                                                    std::move(audit)),
                          model_invocations, started);
        }

        // Risk gate
        stage_start = std::chrono::steady_clock::now();
        TradeProposal proposal;
        proposal.asset_id = request.asset_id;
        proposal.date = request.date;
        proposal.action = fields.action;
        proposal.proposed_risk_fraction = fields.risk_fraction
                                              ? *fields.risk_fraction
                                              : config_.risk_per_trade_max * fields.confidence;
        proposal.supporting_claims = fields.key_claims;
        proposal.regime = regime.regime;

        RiskDecision decision = ledger_->evaluate_and_reserve(proposal, risk_gate_);
        audit.stages.push_back({PipelineStage::RISK_GATE, elapsed_since(stage_start),
                                decision.approved, decision.detail});
        audit.proposal = proposal;
        audit.risk = decision;

        if (!decision.approved) {
            audit.detail = decision.detail;
            return finish(PipelineOutcome::rejected(request.asset_id, request.date,
                                                    decision.rejection_reason, std::move(audit)),
                          model_invocations, started);
        }

        audit.detail = "All gates passed";
        return finish(PipelineOutcome::approved(request.asset_id, request.date, proposal.action,
                                                decision.adjusted_risk_fraction,
                                                std::move(audit)),
                      model_invocations, started);

    } catch (const std::exception& e) {
        ERROR("Evaluation of " << request.asset_id << " failed: " << e.what());
        return make_error<PipelineOutcome>(ErrorCode::UNKNOWN_ERROR,
                                           std::string("Evaluation failed: ") + e.what(),
                                           "DecisionPipeline");
    }
}

PipelineOutcome DecisionPipeline::finish(PipelineOutcome outcome, size_t model_invocations,
                                         std::chrono::steady_clock::time_point started) {
    outcome.audit_trail.total_elapsed_ms = elapsed_since(started);
    outcome.audit_trail.stages.push_back(
        {PipelineStage::TERMINAL, 0.0, outcome.is_approved(), reason_to_string(outcome.reason_code)});

    if (outcome.is_approved()) {
        INFO("Approved " << action_to_string(outcome.action) << " " << outcome.asset_id
                         << " at risk " << outcome.risk_fraction);
    } else {
        INFO("Rejected " << outcome.asset_id << " with "
                         << reason_to_string(outcome.reason_code) << ": "
                         << outcome.audit_trail.detail);
    }

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        ++evaluations_;
        model_invocations_ += model_invocations;
        ++outcomes_by_reason_[outcome.reason_code];
    }
    publish_metrics();

    return outcome;
}

std::unordered_map<std::string, double> DecisionPipeline::get_metrics() const {
    std::unordered_map<std::string, double> metrics;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics["evaluations"] = static_cast<double>(evaluations_);
        metrics["model_invocations"] = static_cast<double>(model_invocations_);

        uint64_t rejections = 0;
        for (const auto& [reason, count] : outcomes_by_reason_) {
            if (reason == ReasonCode::APPROVED) {
                metrics["approvals"] = static_cast<double>(count);
            } else {
                metrics["rejected_" + reason_to_string(reason)] = static_cast<double>(count);
                rejections += count;
            }
        }
        metrics["rejections"] = static_cast<double>(rejections);
    }

    const CacheStats cache = fact_validator_->cache_stats();
    metrics["cache_size"] = static_cast<double>(cache.size);
    metrics["cache_hit_rate"] = cache.hit_rate();
    metrics["cache_evictions"] = static_cast<double>(cache.evictions);

    const RetryStats retries = schema_gate_->stats();
    metrics["schema_runs"] = static_cast<double>(retries.total_runs);
    metrics["schema_first_try_successes"] = static_cast<double>(retries.first_try_successes);
    metrics["schema_successes_after_retry"] = static_cast<double>(retries.successes_after_retry);
    metrics["schema_failures"] = static_cast<double>(retries.failures);

    metrics["portfolio_heat"] = ledger_->portfolio_heat();
    return metrics;
}

void DecisionPipeline::publish_metrics() {
    auto result = StateManager::instance().update_metrics(id_, get_metrics());
    if (result.is_error()) {
        WARN("Failed to publish metrics for " << id_ << ": " << result.error()->what());
    }
}

CacheStats DecisionPipeline::cache_stats() const {
    return fact_validator_->cache_stats();
}

RetryStats DecisionPipeline::retry_stats() const {
    return schema_gate_->stats();
}

}  // namespace decision_gate
