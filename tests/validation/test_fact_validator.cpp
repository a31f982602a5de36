#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "../core/test_base.hpp"
#include "decision_gate/core/time_utils.hpp"
#include "decision_gate/validation/fact_validator.hpp"
#include "mock_entailment_client.hpp"

using namespace decision_gate;
using namespace decision_gate::testing;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::StrictMock;

class FactValidatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();

        date_ = core::make_utc_date(2024, 3, 15);
        add_fact("revenue_growth_yoy", 0.08, FactUnit::RATIO);
        add_fact("price_change_pct", -2.5, FactUnit::PERCENT);
        add_fact("current_price", 150.0, FactUnit::CURRENCY);
        add_fact("rsi", 45.2, FactUnit::POINTS);

        client_ = std::make_shared<StrictMock<MockEntailmentClient>>();
    }

    void add_fact(const std::string& name, double value, FactUnit unit) {
        facts_[name] = GroundTruthFact(name, value, unit, date_);
    }

    FactValidator make_validator(bool with_client = true) {
        return FactValidator(config_, with_client ? client_ : nullptr);
    }

    FactValidatorConfig config_;
    Timestamp date_;
    GroundTruthMap facts_;
    std::shared_ptr<StrictMock<MockEntailmentClient>> client_;
};

TEST_F(FactValidatorTest, FabricatedGrowthIsNumericContradiction) {
    EXPECT_CALL(*client_, classify(_, _)).Times(0);
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue grew 500%"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const FactCheckReport& report = result.value();
    EXPECT_FALSE(report.all_valid);
    ASSERT_EQ(report.results.size(), 1u);
    ASSERT_EQ(report.contradictions.size(), 1u);

    const ValidationResult& verdict = report.results[0];
    EXPECT_EQ(verdict.verdict, Verdict::CONTRADICTION);
    EXPECT_EQ(verdict.source, ValidationSource::NUMERIC);
    EXPECT_EQ(verdict.metric_name, "revenue_growth_yoy");
    EXPECT_DOUBLE_EQ(verdict.confidence, 1.0);
    EXPECT_THAT(verdict.evidence, HasSubstr("claimed 500% vs actual 8%"));
    EXPECT_THAT(verdict.evidence, HasSubstr("divergence 61.50"));
    EXPECT_EQ(report.model_invocations, 0u);
}

TEST_F(FactValidatorTest, NumericCheckRunsWithoutClient) {
    FactValidator validator = make_validator(false);

    auto result = validator.validate({"Revenue grew 500%"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const FactCheckReport& report = result.value();
    EXPECT_FALSE(report.all_valid);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].verdict, Verdict::CONTRADICTION);
    EXPECT_EQ(report.results[0].source, ValidationSource::NUMERIC);
    EXPECT_THAT(report.results[0].evidence, HasSubstr("claimed 500% vs actual 8%"));
    EXPECT_EQ(report.model_invocations, 0u);
    EXPECT_EQ(report.fallback_count, 0u);
}

TEST_F(FactValidatorTest, NumericCheckRunsWhileModelIsDown) {
    ON_CALL(*client_, classify(_, _)).WillByDefault(fail_with(ErrorCode::MODEL_UNAVAILABLE));
    EXPECT_CALL(*client_, classify(_, _)).Times(0);
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue grew 500%"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const FactCheckReport& report = result.value();
    EXPECT_FALSE(report.all_valid);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].verdict, Verdict::CONTRADICTION);
    EXPECT_EQ(report.results[0].source, ValidationSource::NUMERIC);
    EXPECT_EQ(report.model_invocations, 0u);
    EXPECT_EQ(report.fallback_count, 0u);
}

TEST_F(FactValidatorTest, WithinToleranceGoesToEntailmentModel) {
    EXPECT_CALL(*client_, classify("revenue growth yoy increased by 8.0%.", "Revenue grew 8.5%"))
        .WillOnce(respond(Verdict::ENTAILMENT, 0.95));
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue grew 8.5%"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const FactCheckReport& report = result.value();
    EXPECT_TRUE(report.all_valid);
    EXPECT_EQ(report.model_invocations, 1u);
    EXPECT_EQ(report.results[0].verdict, Verdict::ENTAILMENT);
    EXPECT_EQ(report.results[0].source, ValidationSource::SEMANTIC);
    EXPECT_DOUBLE_EQ(report.results[0].confidence, 0.95);
}

TEST_F(FactValidatorTest, SemanticContradictionFailsReport) {
    EXPECT_CALL(*client_, classify(_, "Revenue is collapsing"))
        .WillOnce(respond(Verdict::CONTRADICTION, 0.88));
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue is collapsing"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().all_valid);
    EXPECT_EQ(result.value().results[0].source, ValidationSource::SEMANTIC);
    EXPECT_THAT(result.value().contradictions[0], HasSubstr("contradicts ground truth"));
}

TEST_F(FactValidatorTest, DirectionSignsPercentClaims) {
    EXPECT_CALL(*client_, classify(_, "Price fell 2.5% this week"))
        .WillOnce(respond(Verdict::ENTAILMENT, 0.9));
    FactValidator validator = make_validator();

    auto consistent = validator.validate({"Price fell 2.5% this week"}, facts_, date_);
    ASSERT_TRUE(consistent.is_ok());
    EXPECT_TRUE(consistent.value().all_valid);

    auto reversed = validator.validate({"Price rose 2.5% this week"}, facts_, date_);
    ASSERT_TRUE(reversed.is_ok());
    EXPECT_FALSE(reversed.value().all_valid);
    EXPECT_EQ(reversed.value().results[0].source, ValidationSource::NUMERIC);
    EXPECT_EQ(reversed.value().results[0].metric_name, "price_change_pct");
}

TEST_F(FactValidatorTest, PlainNumberAgainstIndicatorLevel) {
    EXPECT_CALL(*client_, classify(_, _)).Times(0);
    FactValidator validator = make_validator();

    auto result = validator.validate({"RSI at 80 signals overbought"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const ValidationResult& verdict = result.value().results[0];
    EXPECT_EQ(verdict.verdict, Verdict::CONTRADICTION);
    EXPECT_EQ(verdict.metric_name, "rsi");
    EXPECT_DOUBLE_EQ(verdict.confidence, 0.9);
}

TEST_F(FactValidatorTest, ModelFailureFallsBackToDirectionKeywords) {
    EXPECT_CALL(*client_, classify(_, _))
        .Times(2)
        .WillRepeatedly(fail_with(ErrorCode::MODEL_UNAVAILABLE));
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue declined this year"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const ValidationResult& verdict = result.value().results[0];
    EXPECT_EQ(verdict.source, ValidationSource::FALLBACK);
    EXPECT_EQ(verdict.verdict, Verdict::CONTRADICTION);
    EXPECT_DOUBLE_EQ(verdict.confidence, 0.6);
    EXPECT_EQ(result.value().fallback_count, 1u);

    // Fallback verdicts are not memoized while a model is configured
    auto again = validator.validate({"Revenue declined this year"}, facts_, date_);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().cache_hits, 0u);
}

TEST_F(FactValidatorTest, ModelExceptionFallsBack) {
    EXPECT_CALL(*client_, classify(_, _))
        .WillOnce([](const std::string&, const std::string&) -> Result<EntailmentResponse> {
            throw std::runtime_error("socket closed");
        });
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue grew strongly"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().all_valid);
    EXPECT_EQ(result.value().results[0].source, ValidationSource::FALLBACK);
    EXPECT_EQ(result.value().results[0].verdict, Verdict::ENTAILMENT);
}

TEST_F(FactValidatorTest, NoClientUsesFallbackAndCaches) {
    FactValidator validator = make_validator(false);

    auto first = validator.validate({"Revenue grew strongly", "Management is excellent"}, facts_,
                                    date_);
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().all_valid);
    EXPECT_EQ(first.value().results[0].verdict, Verdict::ENTAILMENT);
    EXPECT_EQ(first.value().results[1].verdict, Verdict::NEUTRAL);
    EXPECT_DOUBLE_EQ(first.value().results[1].confidence, 0.5);
    EXPECT_EQ(first.value().fallback_count, 2u);

    auto second = validator.validate({"Revenue grew strongly"}, facts_, date_);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().cache_hits, 1u);
    EXPECT_TRUE(second.value().results[0].cached);
}

TEST_F(FactValidatorTest, RepeatedClaimHitsCacheWithinDay) {
    EXPECT_CALL(*client_, classify(_, "Revenue grew 8%"))
        .Times(2)
        .WillRepeatedly(respond(Verdict::ENTAILMENT, 0.97));
    FactValidator validator = make_validator();

    ASSERT_TRUE(validator.validate({"Revenue grew 8%"}, facts_, date_).is_ok());

    auto same_day = validator.validate({"Revenue grew 8%"}, facts_, date_);
    ASSERT_TRUE(same_day.is_ok());
    EXPECT_EQ(same_day.value().cache_hits, 1u);
    EXPECT_EQ(same_day.value().model_invocations, 0u);

    // A new trading day clears the cache and asks the model again
    auto next_day = validator.validate({"Revenue grew 8%"}, facts_,
                                       core::make_utc_date(2024, 3, 18));
    ASSERT_TRUE(next_day.is_ok());
    EXPECT_EQ(next_day.value().cache_hits, 0u);
    EXPECT_EQ(next_day.value().model_invocations, 1u);
}

TEST_F(FactValidatorTest, UnverifiableClaimWithoutFactsIsNeutral) {
    EXPECT_CALL(*client_, classify(_, _)).Times(0);
    FactValidator validator = make_validator();

    auto result = validator.validate({"Sentiment is improving"}, GroundTruthMap{}, date_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().all_valid);
    EXPECT_EQ(result.value().results[0].verdict, Verdict::NEUTRAL);
    EXPECT_EQ(result.value().results[0].source, ValidationSource::SEMANTIC);
}

TEST_F(FactValidatorTest, UnresolvedClaimUsesAllFactsAsPremise) {
    EXPECT_CALL(*client_, classify(HasSubstr("current price is $150.00."), "Outlook is bright"))
        .WillOnce(respond(Verdict::NEUTRAL, 0.7));
    FactValidator validator = make_validator();

    auto result = validator.validate({"Outlook is bright"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().all_valid);
    EXPECT_TRUE(result.value().results[0].metric_name.empty());
}

TEST_F(FactValidatorTest, ReportKeepsClaimOrder) {
    EXPECT_CALL(*client_, classify(_, _)).WillRepeatedly(respond(Verdict::ENTAILMENT, 0.9));
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue grew 8%", "Revenue grew 500%", "Stock is at $150"},
                                     facts_, date_);
    ASSERT_TRUE(result.is_ok());

    const auto& results = result.value().results;
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].claim, "Revenue grew 8%");
    EXPECT_EQ(results[1].verdict, Verdict::CONTRADICTION);
    EXPECT_EQ(results[2].claim, "Stock is at $150");
    EXPECT_EQ(result.value().contradictions.size(), 1u);
}

TEST_F(FactValidatorTest, SlowModelFlagsLatencyBudget) {
    config_.latency_budget_ms = 1;
    EXPECT_CALL(*client_, classify(_, _))
        .WillOnce([](const std::string&, const std::string&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return Result<EntailmentResponse>(EntailmentResponse{Verdict::ENTAILMENT, 0.9});
        });
    FactValidator validator = make_validator();

    auto result = validator.validate({"Revenue grew 8%"}, facts_, date_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().budget_exceeded);
    EXPECT_TRUE(result.value().all_valid);
}

TEST_F(FactValidatorTest, ConfigValidation) {
    FactValidatorConfig config;
    EXPECT_TRUE(config.validate().empty());

    config.numeric_tolerance = 0.0;
    config.fallback_confidence = 1.5;
    config.cache_capacity = 0;
    auto errors = config.validate();
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].field, "numeric_tolerance");
    EXPECT_EQ(errors[1].field, "fallback_confidence");
    EXPECT_EQ(errors[2].field, "validation_cache_capacity");
}
