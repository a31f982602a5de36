// include/decision_gate/pipeline/decision_pipeline.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "decision_gate/core/error.hpp"
#include "decision_gate/core/state_manager.hpp"
#include "decision_gate/pipeline/pipeline_config.hpp"
#include "decision_gate/pipeline/pipeline_outcome.hpp"
#include "decision_gate/regime/price_series.hpp"
#include "decision_gate/regime/regime_classifier.hpp"
#include "decision_gate/risk/risk_gate.hpp"
#include "decision_gate/risk/risk_ledger.hpp"
#include "decision_gate/schema/generating_agent.hpp"
#include "decision_gate/schema/schema_gate.hpp"
#include "decision_gate/validation/entailment_client.hpp"
#include "decision_gate/validation/fact_validator.hpp"

namespace decision_gate {

/**
 * @brief Inputs of one (asset, date) evaluation
 */
struct EvaluationRequest {
    std::string asset_id;
    Timestamp date;
    PriceSeries prices;
    GroundTruthMap facts;
};

/**
 * @brief State machine sequencing regime, schema, fact and risk checks
 *
 * Evaluations run sequentially inside, and separate evaluations may run on
 * separate threads. The validation cache and the risk ledger are the only
 * shared state and both synchronize internally.
 */
class DecisionPipeline {
public:
    /**
     * @brief Constructor
     * @param config Pipeline configuration, validated here
     * @param agent Generating agent
     * @param entailment Entailment classifier, may be null
     * @param ledger Portfolio risk ledger
     * @param id Component id in the StateManager
     * @throws std::invalid_argument when the configuration is invalid or a collaborator is missing
     * @throws std::runtime_error when registration fails
     */
    DecisionPipeline(PipelineConfig config, std::shared_ptr<GeneratingAgent> agent,
                     std::shared_ptr<EntailmentClient> entailment,
                     std::shared_ptr<RiskLedger> ledger, std::string id = "DECISION_PIPELINE");

    ~DecisionPipeline();

    DecisionPipeline(const DecisionPipeline&) = delete;
    DecisionPipeline& operator=(const DecisionPipeline&) = delete;

    /**
     * @brief Bring up logging if needed and mark the component running
     * @return Result indicating success or failure
     */
    Result<void> initialize();

    /**
     * @brief Stop accepting evaluations. initialize() brings the pipeline back.
     */
    Result<void> stop();

    /**
     * @brief Evaluate one asset on one date
     *
     * Every recoverable condition ends in a HOLD outcome with a reason code.
     * Only infrastructure failures are returned as errors.
     *
     * @param request Asset, date, price history and ground truth
     * @return Result containing the terminal outcome
     */
    Result<PipelineOutcome> evaluate(const EvaluationRequest& request);

    /**
     * @brief Counters published to the StateManager
     */
    std::unordered_map<std::string, double> get_metrics() const;

    CacheStats cache_stats() const;

    RetryStats retry_stats() const;

    const std::string& get_id() const {
        return id_;
    }

    const PipelineConfig& get_config() const {
        return config_;
    }

private:
    PipelineConfig config_;
    std::string id_;
    std::shared_ptr<RiskLedger> ledger_;

    RegimeClassifier regime_classifier_;
    std::unique_ptr<SchemaGate> schema_gate_;
    std::unique_ptr<FactValidator> fact_validator_;
    RiskGate risk_gate_;

    std::atomic<bool> running_{false};

    mutable std::mutex metrics_mutex_;
    uint64_t evaluations_{0};
    uint64_t model_invocations_{0};
    std::unordered_map<ReasonCode, uint64_t> outcomes_by_reason_;

    PipelineOutcome finish(PipelineOutcome outcome, size_t model_invocations,
                           std::chrono::steady_clock::time_point started);

    void publish_metrics();
};

}  // namespace decision_gate
