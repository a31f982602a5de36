#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "../core/test_base.hpp"
#include "../regime/test_utils.hpp"
#include "../schema/mock_generating_agent.hpp"
#include "../validation/mock_entailment_client.hpp"
#include "decision_gate/pipeline/decision_pipeline.hpp"

using namespace decision_gate;
using namespace decision_gate::testing;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::StrictMock;

class DecisionPipelineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();

        agent_ = std::make_shared<StrictMock<MockGeneratingAgent>>();
        entailment_ = std::make_shared<StrictMock<MockEntailmentClient>>();
        ledger_ = std::make_shared<RiskLedger>(1000000.0);
        ASSERT_TRUE(ledger_->set_volatility("AAPL", {5.0, 100.0}).is_ok());
        ASSERT_TRUE(ledger_->set_volatility("MSFT", {5.0, 100.0}).is_ok());
    }

    void TearDown() override {
        pipeline_.reset();
        TestBase::TearDown();
    }

    DecisionPipeline& make_pipeline() {
        pipeline_ = std::make_unique<DecisionPipeline>(config_, agent_, entailment_, ledger_);
        auto init = pipeline_->initialize();
        EXPECT_TRUE(init.is_ok());
        return *pipeline_;
    }

    EvaluationRequest make_request(size_t bars = 80) {
        EvaluationRequest request{"AAPL", test_day(bars - 1),
                                  create_series("AAPL", trending_closes(bars, 0.002)), {}};
        request.facts["revenue_growth_yoy"] =
            GroundTruthFact("revenue_growth_yoy", 0.08, FactUnit::RATIO, request.date);
        request.facts["price_change_pct"] =
            GroundTruthFact("price_change_pct", 2.5, FactUnit::PERCENT, request.date);
        return request;
    }

    static std::vector<PipelineStage> stages_of(const PipelineOutcome& outcome) {
        std::vector<PipelineStage> stages;
        for (const auto& record : outcome.audit_trail.stages) {
            stages.push_back(record.stage);
        }
        return stages;
    }

    PipelineConfig config_;
    std::shared_ptr<StrictMock<MockGeneratingAgent>> agent_;
    std::shared_ptr<StrictMock<MockEntailmentClient>> entailment_;
    std::shared_ptr<RiskLedger> ledger_;
    std::unique_ptr<DecisionPipeline> pipeline_;
};

TEST_F(DecisionPipelineTest, ConstructorRejectsBadSetup) {
    PipelineConfig bad;
    bad.portfolio_heat_max = 0.0;
    EXPECT_THROW({ DecisionPipeline pipeline(bad, agent_, entailment_, ledger_); },
                 std::invalid_argument);
    EXPECT_THROW({ DecisionPipeline pipeline(config_, nullptr, entailment_, ledger_); },
                 std::invalid_argument);
    EXPECT_THROW({ DecisionPipeline pipeline(config_, agent_, entailment_, nullptr); },
                 std::invalid_argument);
}

TEST_F(DecisionPipelineTest, MissingEntailmentClientWarnsOnceLoggerIsUp) {
    // Logging comes up inside initialize(), after construction
    Logger::reset_for_tests();
    Logger::register_component("");
    config_.logging.min_level = LogLevel::WARNING;
    config_.logging.include_timestamp = false;

    std::stringstream captured;
    std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());

    pipeline_ = std::make_unique<DecisionPipeline>(config_, agent_, nullptr, ledger_);
    const std::string before_init = captured.str();
    auto init = pipeline_->initialize();

    std::cout.rdbuf(saved);
    ASSERT_TRUE(init.is_ok());
    EXPECT_TRUE(before_init.empty());
    EXPECT_THAT(captured.str(), HasSubstr("[WARNING]"));
    EXPECT_THAT(captured.str(), HasSubstr("No entailment client configured"));
}

TEST_F(DecisionPipelineTest, DuplicateIdFailsRegistration) {
    DecisionPipeline first(config_, agent_, entailment_, ledger_, "GATE_A");
    EXPECT_THROW({ DecisionPipeline second(config_, agent_, entailment_, ledger_, "GATE_A"); },
                 std::runtime_error);
}

TEST_F(DecisionPipelineTest, EvaluateRequiresInitialization) {
    DecisionPipeline pipeline(config_, agent_, entailment_, ledger_);

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(DecisionPipelineTest, StoppedPipelineRefusesUntilRestarted) {
    DecisionPipeline& pipeline = make_pipeline();
    ASSERT_TRUE(pipeline.stop().is_ok());
    EXPECT_TRUE(pipeline.stop().is_ok());

    auto state = StateManager::instance().get_state(pipeline.get_id());
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::STOPPED);
    EXPECT_FALSE(StateManager::instance().is_healthy());

    auto refused = pipeline.evaluate(make_request());
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error()->code(), ErrorCode::NOT_INITIALIZED);

    ASSERT_TRUE(pipeline.initialize().is_ok());
    EXPECT_EQ(StateManager::instance().get_state(pipeline.get_id()).value().state,
              ComponentState::RUNNING);
    EXPECT_TRUE(StateManager::instance().is_healthy());
}

TEST_F(DecisionPipelineTest, AssetMismatchIsInvalidArgument) {
    DecisionPipeline& pipeline = make_pipeline();
    EvaluationRequest request = make_request();
    request.asset_id = "MSFT";

    auto result = pipeline.evaluate(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DecisionPipelineTest, ShortHistoryStopsBeforeTheAgent) {
    EXPECT_CALL(*agent_, generate(_)).Times(0);
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request(59));
    ASSERT_TRUE(result.is_ok());

    const PipelineOutcome& outcome = result.value();
    EXPECT_EQ(outcome.reason_code, ReasonCode::INSUFFICIENT_DATA);
    EXPECT_EQ(outcome.action, TradeAction::HOLD);
    EXPECT_DOUBLE_EQ(outcome.risk_fraction, 0.0);
    EXPECT_EQ(stages_of(outcome), (std::vector<PipelineStage>{PipelineStage::REGIME_CLASSIFIED,
                                                              PipelineStage::TERMINAL}));
    EXPECT_FALSE(outcome.audit_trail.regime.has_value());
}

TEST_F(DecisionPipelineTest, ApprovesGroundedTrade) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.75, {"Revenue grew 8%"})));
    EXPECT_CALL(*entailment_, classify(_, "Revenue grew 8%"))
        .WillOnce(respond(Verdict::ENTAILMENT, 0.93));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const PipelineOutcome& outcome = result.value();
    EXPECT_TRUE(outcome.is_approved());
    EXPECT_EQ(outcome.reason_code, ReasonCode::APPROVED);
    EXPECT_EQ(outcome.action, TradeAction::BUY);
    EXPECT_NEAR(outcome.risk_fraction, 0.015, 1e-12);

    EXPECT_EQ(stages_of(outcome),
              (std::vector<PipelineStage>{
                  PipelineStage::REGIME_CLASSIFIED, PipelineStage::SCHEMA_VALIDATION,
                  PipelineStage::FACT_VALIDATION, PipelineStage::RISK_GATE,
                  PipelineStage::TERMINAL}));

    const AuditTrail& audit = outcome.audit_trail;
    ASSERT_TRUE(audit.regime.has_value());
    EXPECT_EQ(audit.regime->regime, MarketRegime::TRENDING_UP);
    ASSERT_TRUE(audit.indicator_profile.has_value());
    EXPECT_EQ(audit.indicator_profile->strategy, "trend_following");
    ASSERT_TRUE(audit.risk.has_value());
    EXPECT_TRUE(audit.risk->reservation_id.has_value());
    EXPECT_EQ(audit.detail, "All gates passed");

    EXPECT_EQ(ledger_->pending_reservations(), 1u);
    EXPECT_NEAR(ledger_->portfolio_heat(), 0.015, 1e-12);
}

TEST_F(DecisionPipelineTest, AgentSeesRegimeAndProfile) {
    GenerationRequest seen;
    EXPECT_CALL(*agent_, generate(_)).WillOnce([&seen](const GenerationRequest& request) {
        seen = request;
        return Result<std::string>(decision_json("HOLD", 0.5, {"RSI is neutral"}));
    });
    EXPECT_CALL(*entailment_, classify(_, _)).WillRepeatedly(respond(Verdict::NEUTRAL, 0.5));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(seen.asset_id, "AAPL");
    EXPECT_EQ(seen.regime, MarketRegime::TRENDING_UP);
    EXPECT_EQ(seen.indicator_profile.strategy, "trend_following");
    EXPECT_EQ(seen.attempt, 1);
    EXPECT_EQ(result.value().action, TradeAction::HOLD);
    EXPECT_DOUBLE_EQ(result.value().risk_fraction, 0.0);
}

TEST_F(DecisionPipelineTest, FabricatedClaimFailsFactCheck) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.9, {"Revenue grew 500%"})));
    EXPECT_CALL(*entailment_, classify(_, _)).Times(0);
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());

    const PipelineOutcome& outcome = result.value();
    EXPECT_EQ(outcome.reason_code, ReasonCode::FACT_CHECK_FAILED);
    EXPECT_EQ(outcome.action, TradeAction::HOLD);
    EXPECT_DOUBLE_EQ(outcome.risk_fraction, 0.0);
    EXPECT_THAT(outcome.audit_trail.detail, HasSubstr("claimed 500% vs actual 8%"));
    EXPECT_FALSE(outcome.audit_trail.risk.has_value());
    EXPECT_DOUBLE_EQ(ledger_->portfolio_heat(), 0.0);
}

TEST_F(DecisionPipelineTest, OverlongNumberFailsFactCheck) {
    const std::string claim = "Revenue grew " + std::string(400, '9') + "%";
    EXPECT_CALL(*agent_, generate(_)).WillOnce(reply(decision_json("BUY", 0.9, {claim})));
    EXPECT_CALL(*entailment_, classify(_, _)).Times(0);
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const PipelineOutcome& outcome = result.value();
    EXPECT_EQ(outcome.reason_code, ReasonCode::FACT_CHECK_FAILED);
    EXPECT_EQ(outcome.action, TradeAction::HOLD);
    EXPECT_DOUBLE_EQ(outcome.risk_fraction, 0.0);
    EXPECT_THAT(outcome.audit_trail.detail, HasSubstr("Numeric mismatch on revenue_growth_yoy"));
    EXPECT_EQ(stages_of(outcome).back(), PipelineStage::TERMINAL);
    EXPECT_DOUBLE_EQ(ledger_->portfolio_heat(), 0.0);
}

TEST_F(DecisionPipelineTest, PersistentSchemaViolationHolds) {
    EXPECT_CALL(*agent_, generate(_))
        .Times(3)
        .WillRepeatedly(reply(R"({"action": "MAYBE", "confidence": 0.5, "key_claims": ["a"]})"));
    EXPECT_CALL(*entailment_, classify(_, _)).Times(0);
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());

    const PipelineOutcome& outcome = result.value();
    EXPECT_EQ(outcome.reason_code, ReasonCode::SCHEMA_INVALID);
    EXPECT_EQ(outcome.action, TradeAction::HOLD);
    ASSERT_TRUE(outcome.audit_trail.schema.has_value());
    EXPECT_EQ(outcome.audit_trail.schema->attempts, 3);
    EXPECT_FALSE(outcome.audit_trail.fact_check.has_value());
    EXPECT_THAT(outcome.audit_trail.detail, HasSubstr("Attempt 3:"));
}

TEST_F(DecisionPipelineTest, OnlyFinalOutputClaimsAreChecked) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply("Revenue grew 500%, so BUY"))
        .WillOnce(reply(decision_json("BUY", 1.0, {"Revenue grew 8%"})));
    EXPECT_CALL(*entailment_, classify(_, "Revenue grew 8%"))
        .WillOnce(respond(Verdict::ENTAILMENT, 0.9));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().is_approved());
    EXPECT_EQ(result.value().audit_trail.schema->envelope.retry_count, 1);
}

TEST_F(DecisionPipelineTest, SellWhileFlatIsInvalidTransition) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("SELL", 0.8, {"Revenue grew 8%"})));
    EXPECT_CALL(*entailment_, classify(_, _)).WillOnce(respond(Verdict::ENTAILMENT, 0.9));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());

    const PipelineOutcome& outcome = result.value();
    EXPECT_EQ(outcome.reason_code, ReasonCode::INVALID_POSITION_TRANSITION);
    EXPECT_EQ(outcome.action, TradeAction::HOLD);
    ASSERT_TRUE(outcome.audit_trail.proposal.has_value());
    EXPECT_EQ(outcome.audit_trail.proposal->action, TradeAction::SELL);
}

TEST_F(DecisionPipelineTest, HeatHeadroomShrinksApprovedRisk) {
    ASSERT_TRUE(ledger_->set_position("MSFT", {PositionSide::LONG, 0.2, 0.09}).is_ok());
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(
            R"({"action": "BUY", "confidence": 0.8, "key_claims": ["Revenue grew 8%"], "risk_fraction": 0.02})"));
    EXPECT_CALL(*entailment_, classify(_, _)).WillOnce(respond(Verdict::ENTAILMENT, 0.9));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());

    const PipelineOutcome& outcome = result.value();
    ASSERT_TRUE(outcome.is_approved());
    EXPECT_NEAR(outcome.risk_fraction, 0.01, 1e-9);
    EXPECT_LE(ledger_->portfolio_heat(), config_.portfolio_heat_max + 1e-12);
}

TEST_F(DecisionPipelineTest, CircuitBreakerBlocksNewEntries) {
    ASSERT_TRUE(ledger_->update_equity(1200000.0).is_ok());
    ASSERT_TRUE(ledger_->update_equity(1000000.0).is_ok());
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.8, {"Revenue grew 8%"})));
    EXPECT_CALL(*entailment_, classify(_, _)).WillOnce(respond(Verdict::ENTAILMENT, 0.9));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().reason_code, ReasonCode::CIRCUIT_BREAKER);
    EXPECT_EQ(result.value().action, TradeAction::HOLD);
}

TEST_F(DecisionPipelineTest, PublishesMetrics) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.75, {"Revenue grew 8%"})))
        .WillOnce(reply(decision_json("BUY", 0.75, {"Revenue grew 500%"})));
    EXPECT_CALL(*entailment_, classify(_, _)).WillOnce(respond(Verdict::ENTAILMENT, 0.9));
    DecisionPipeline& pipeline = make_pipeline();

    ASSERT_TRUE(pipeline.evaluate(make_request()).is_ok());
    ASSERT_TRUE(pipeline.evaluate(make_request()).is_ok());

    auto metrics = pipeline.get_metrics();
    EXPECT_DOUBLE_EQ(metrics["evaluations"], 2.0);
    EXPECT_DOUBLE_EQ(metrics["approvals"], 1.0);
    EXPECT_DOUBLE_EQ(metrics["rejections"], 1.0);
    EXPECT_DOUBLE_EQ(metrics["rejected_FACT_CHECK_FAILED"], 1.0);
    EXPECT_DOUBLE_EQ(metrics["model_invocations"], 1.0);
    EXPECT_DOUBLE_EQ(metrics["schema_first_try_successes"], 2.0);
    EXPECT_NEAR(metrics["portfolio_heat"], 0.015, 1e-12);

    auto state = StateManager::instance().get_state(pipeline.get_id());
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::RUNNING);
    EXPECT_DOUBLE_EQ(state.value().metrics.at("evaluations"), 2.0);
}

TEST_F(DecisionPipelineTest, OutcomeJsonCarriesAuditTrail) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.9, {"Revenue grew 500%"})));
    DecisionPipeline& pipeline = make_pipeline();

    auto result = pipeline.evaluate(make_request());
    ASSERT_TRUE(result.is_ok());

    nlohmann::json j = result.value().to_json();
    EXPECT_EQ(j["reason_code"], "FACT_CHECK_FAILED");
    EXPECT_EQ(j["action"], "HOLD");
    EXPECT_EQ(j["approved"], false);
    EXPECT_EQ(j["date"], "2024-03-20");
    ASSERT_EQ(j["audit_trail"]["stages"].size(), 4u);
    EXPECT_EQ(j["audit_trail"]["stages"][3]["stage"], "TERMINAL");
    EXPECT_TRUE(j["audit_trail"].contains("fact_check"));
    EXPECT_FALSE(j["audit_trail"].contains("risk"));
}
