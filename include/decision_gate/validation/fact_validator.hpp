// include/decision_gate/validation/fact_validator.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "decision_gate/core/config_base.hpp"
#include "decision_gate/core/error.hpp"
#include "decision_gate/validation/claim_extractor.hpp"
#include "decision_gate/validation/entailment_client.hpp"
#include "decision_gate/validation/validation_cache.hpp"
#include "decision_gate/validation/validation_types.hpp"

namespace decision_gate {

/**
 * @brief Configuration for claim validation
 */
struct FactValidatorConfig : public ConfigBase {
    double numeric_tolerance{0.10};       // Relative divergence tolerated by the numeric check
    double fallback_confidence{0.6};      // Confidence of keyword-fallback verdicts
    size_t cache_capacity{10000};         // Entries held for the trading day
    int latency_budget_ms{2000};          // Advisory, exceeding it is logged only

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["numeric_tolerance"] = numeric_tolerance;
        j["fallback_confidence"] = fallback_confidence;
        j["cache_capacity"] = cache_capacity;
        j["latency_budget_ms"] = latency_budget_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("numeric_tolerance"))
            numeric_tolerance = j.at("numeric_tolerance").get<double>();
        if (j.contains("fallback_confidence"))
            fallback_confidence = j.at("fallback_confidence").get<double>();
        if (j.contains("cache_capacity"))
            cache_capacity = j.at("cache_capacity").get<size_t>();
        if (j.contains("latency_budget_ms"))
            latency_budget_ms = j.at("latency_budget_ms").get<int>();
    }

    std::vector<ConfigValidationError> validate() const override;
};

/**
 * @brief Aggregate verdict over all claims of one decision
 */
struct FactCheckReport {
    std::vector<ValidationResult> results;  // Same order as the input claims
    bool all_valid{true};
    std::vector<std::string> contradictions;  // Evidence of every contradiction
    size_t cache_hits{0};
    size_t model_invocations{0};
    size_t fallback_count{0};
    double elapsed_ms{0.0};
    bool budget_exceeded{false};

    nlohmann::json to_json() const;
};

/**
 * @brief Two-layer checker for generated claims
 *
 * Layer one compares the claim's number against the matching fact and
 * rejects outright when they diverge beyond tolerance. Layer two asks the
 * entailment client, or falls back to directional keyword matching when the
 * client is absent or failing. Verdicts are memoized per trading day.
 */
class FactValidator {
public:
    /**
     * @brief Constructor
     * @param config Validation parameters
     * @param client Entailment classifier, may be null
     * @param cache Shared day-scoped cache, created from config when null
     */
    FactValidator(FactValidatorConfig config, std::shared_ptr<EntailmentClient> client,
                  std::shared_ptr<ValidationCache> cache = nullptr);

    /**
     * @brief Validate the claims of one decision
     * @param claims Claims of the final structured output, in order
     * @param facts Ground truth for the asset and date
     * @param as_of Evaluation date, scopes the cache
     * @return Result containing the report; only unexpected failures are errors
     */
    Result<FactCheckReport> validate(const std::vector<std::string>& claims,
                                     const GroundTruthMap& facts, Timestamp as_of);

    CacheStats cache_stats() const;

    bool has_entailment_client() const {
        return client_ != nullptr;
    }

    const FactValidatorConfig& get_config() const {
        return config_;
    }

private:
    FactValidatorConfig config_;
    std::shared_ptr<EntailmentClient> client_;
    std::shared_ptr<ValidationCache> cache_;
    ClaimExtractor extractor_;

    ValidationResult validate_claim(const std::string& claim, const GroundTruthMap& facts,
                                    size_t& model_invocations);

    /**
     * @brief Arithmetic comparison against the fact
     * @return A CONTRADICTION when divergence exceeds tolerance, nullopt otherwise
     */
    std::optional<ValidationResult> check_numeric(const ExtractedClaim& claim,
                                                  const GroundTruthFact& fact) const;

    ValidationResult check_semantic(const ExtractedClaim& claim, const GroundTruthMap& facts,
                                    const GroundTruthFact* fact, size_t& model_invocations);

    ValidationResult check_fallback(const ExtractedClaim& claim,
                                    const GroundTruthFact* fact) const;

    static std::string describe_fact(const GroundTruthFact& fact);
};

}  // namespace decision_gate
