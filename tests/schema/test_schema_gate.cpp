#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include "../core/test_base.hpp"
#include "decision_gate/schema/schema_gate.hpp"
#include "mock_generating_agent.hpp"

using namespace decision_gate;
using namespace decision_gate::testing;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::StrictMock;

class SchemaGateTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        agent_ = std::make_shared<StrictMock<MockGeneratingAgent>>();

        request_.asset_id = "AAPL";
        request_.date = std::chrono::system_clock::now();
        request_.regime = MarketRegime::TRENDING_UP;
        request_.indicator_profile = recommended_indicator_profile(MarketRegime::TRENDING_UP);
    }

    std::shared_ptr<StrictMock<MockGeneratingAgent>> agent_;
    GenerationRequest request_;
    SchemaGateConfig config_;
};

TEST_F(SchemaGateTest, FirstTrySuccess) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.8, {"Revenue grew 8%"})));
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);

    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.envelope.schema_valid);
    EXPECT_EQ(result.envelope.retry_count, 0);
    EXPECT_EQ(result.envelope.parsed_fields.action, TradeAction::BUY);

    RetryStats stats = gate.stats();
    EXPECT_EQ(stats.total_runs, 1u);
    EXPECT_EQ(stats.first_try_successes, 1u);
    EXPECT_DOUBLE_EQ(stats.first_try_success_rate(), 1.0);
}

TEST_F(SchemaGateTest, RetryCarriesPreviousOutputAndErrors) {
    std::vector<GenerationRequest> seen;
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce([&seen](const GenerationRequest& request) {
            seen.push_back(request);
            return Result<std::string>(std::string("I think we should buy"));
        })
        .WillOnce([&seen](const GenerationRequest& request) {
            seen.push_back(request);
            return Result<std::string>(decision_json("BUY", 0.7, {"Stock gained 3%"}));
        });
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);

    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.envelope.retry_count, 1);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_THAT(result.errors[0], HasSubstr("Attempt 1:"));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[0].is_retry());
    EXPECT_TRUE(seen[0].previous_output.empty());
    EXPECT_THAT(seen[0].contract, HasSubstr("trade_decision_v1"));
    EXPECT_TRUE(seen[1].is_retry());
    EXPECT_EQ(seen[1].attempt, 2);
    EXPECT_EQ(seen[1].previous_output, "I think we should buy");
    ASSERT_EQ(seen[1].validation_errors.size(), 1u);
    EXPECT_THAT(seen[1].validation_errors[0], HasSubstr("Attempt 1:"));

    EXPECT_EQ(gate.stats().successes_after_retry, 1u);
}

TEST_F(SchemaGateTest, ExhaustsRetriesOnPersistentlyInvalidOutput) {
    EXPECT_CALL(*agent_, generate(_))
        .Times(3)
        .WillRepeatedly(reply(R"({"action": "MAYBE", "confidence": 0.5, "key_claims": ["a"]})"));
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.envelope.retry_count, 2);
    EXPECT_FALSE(result.envelope.schema_valid);
    EXPECT_THAT(result.errors.back(), HasSubstr("Attempt 3:"));

    RetryStats stats = gate.stats();
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_DOUBLE_EQ(stats.failure_rate(), 1.0);
}

TEST_F(SchemaGateTest, AgentErrorsCountAsFailedAttempts) {
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(agent_failure())
        .WillOnce([](const GenerationRequest&) -> Result<std::string> {
            throw std::runtime_error("connection reset");
        })
        .WillOnce(reply(decision_json("HOLD", 0.4, {"RSI at 45"})));
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);

    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.attempts, 3);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_THAT(result.errors[0], HasSubstr("Upstream model returned 503"));
    EXPECT_THAT(result.errors[1], HasSubstr("connection reset"));
}

TEST_F(SchemaGateTest, ZeroRetriesMeansSingleAttempt) {
    config_.max_retries = 0;
    EXPECT_CALL(*agent_, generate(_)).WillOnce(reply("not json"));
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.attempts, 1);
}

TEST_F(SchemaGateTest, MissingAgentFailsWithoutAttempts) {
    SchemaGate gate(config_, nullptr);

    SchemaGateResult result = gate.run(request_);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.attempts, 0);
    EXPECT_EQ(gate.stats().failures, 1u);
}

TEST_F(SchemaGateTest, MaxKeyClaimsFlowsIntoContract) {
    config_.max_key_claims = 2;
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.8, {"a", "b", "c"})))
        .WillOnce(reply(decision_json("BUY", 0.8, {"a", "b"})));
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_THAT(result.errors[0], HasSubstr("between 1 and 2 entries"));
}

TEST_F(SchemaGateTest, ConfigValidation) {
    SchemaGateConfig config;
    EXPECT_TRUE(config.validate().empty());

    config.max_retries = -1;
    auto errors = config.validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].field, "schema_max_retries");
}

TEST_F(SchemaGateTest, OverlongClaimIsRetried) {
    const std::string runaway = "Revenue grew " + std::string(20000, '1') + " units";
    EXPECT_CALL(*agent_, generate(_))
        .WillOnce(reply(decision_json("BUY", 0.8, {runaway})))
        .WillOnce(reply(decision_json("BUY", 0.8, {"Revenue grew 8%"})));
    SchemaGate gate(config_, agent_);

    SchemaGateResult result = gate.run(request_);

    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.attempts, 2);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_THAT(result.errors[0], HasSubstr("at most 500 characters"));
    EXPECT_EQ(result.envelope.parsed_fields.key_claims[0], "Revenue grew 8%");
}
