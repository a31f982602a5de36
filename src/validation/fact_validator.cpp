// src/validation/fact_validator.cpp

#include "decision_gate/validation/fact_validator.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "decision_gate/core/logger.hpp"
#include "decision_gate/core/time_utils.hpp"

namespace decision_gate {

std::vector<ConfigValidationError> FactValidatorConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    if (!(numeric_tolerance > 0.0)) {
        errors.push_back({"numeric_tolerance", "Must be positive"});
    }
    if (fallback_confidence < 0.0 || fallback_confidence > 1.0) {
        errors.push_back({"fallback_confidence", "Must be in [0, 1]"});
    }
    if (cache_capacity == 0) {
        errors.push_back({"validation_cache_capacity", "Must be at least 1"});
    }
    if (latency_budget_ms <= 0) {
        errors.push_back({"fact_check_latency_budget_ms", "Must be positive"});
    }

    return errors;
}

nlohmann::json FactCheckReport::to_json() const {
    nlohmann::json j;
    j["all_valid"] = all_valid;
    j["contradictions"] = contradictions;
    j["cache_hits"] = cache_hits;
    j["model_invocations"] = model_invocations;
    j["fallback_count"] = fallback_count;
    j["elapsed_ms"] = elapsed_ms;
    j["budget_exceeded"] = budget_exceeded;

    nlohmann::json claims = nlohmann::json::array();
    for (const auto& result : results) {
        claims.push_back(result.to_json());
    }
    j["results"] = claims;
    return j;
}

FactValidator::FactValidator(FactValidatorConfig config, std::shared_ptr<EntailmentClient> client,
                             std::shared_ptr<ValidationCache> cache)
    : config_(std::move(config)), client_(std::move(client)), cache_(std::move(cache)) {
    if (!cache_) {
        cache_ = std::make_shared<ValidationCache>(config_.cache_capacity);
    }
}

Result<FactCheckReport> FactValidator::validate(const std::vector<std::string>& claims,
                                                const GroundTruthMap& facts, Timestamp as_of) {
    ScopedLogComponent log_scope("FactValidator");
    try {
        const auto start = std::chrono::steady_clock::now();
        const std::string date = core::to_date_string(as_of);

        cache_->rotate(date);

        FactCheckReport report;
        report.results.reserve(claims.size());

        for (const auto& claim : claims) {
            ValidationResult result;

            auto cached = cache_->get(claim, date);
            if (cached) {
                result = std::move(*cached);
                ++report.cache_hits;
            } else {
                result = validate_claim(claim, facts, report.model_invocations);

                // A fallback caused by a failing model is not memoized, so a
                // recovered model gets to see the claim again
                if (result.source != ValidationSource::FALLBACK || !client_) {
                    cache_->put(claim, date, result);
                }
                if (result.source == ValidationSource::FALLBACK) {
                    ++report.fallback_count;
                }
            }

            if (result.is_contradiction()) {
                report.all_valid = false;
                report.contradictions.push_back(result.evidence);
                DEBUG("Contradiction in claim '" << claim << "': " << result.evidence);
            }

            report.results.push_back(std::move(result));
        }

        report.elapsed_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - start)
                                .count();

        if (client_ && report.fallback_count > 0) {
            WARN("Entailment model unavailable for " << report.fallback_count << " of "
                                                     << claims.size()
                                                     << " claims, used keyword fallback");
        }

        if (report.elapsed_ms > static_cast<double>(config_.latency_budget_ms)) {
            report.budget_exceeded = true;
            WARN("Fact validation took " << report.elapsed_ms << " ms, budget is "
                                         << config_.latency_budget_ms << " ms");
        }

        return Result<FactCheckReport>(std::move(report));

    } catch (const std::exception& e) {
        return make_error<FactCheckReport>(ErrorCode::UNKNOWN_ERROR,
                                           std::string("Fact validation failed: ") + e.what(),
                                           "FactValidator");
    }
}

ValidationResult FactValidator::validate_claim(const std::string& claim,
                                               const GroundTruthMap& facts,
                                               size_t& model_invocations) {
    const ExtractedClaim extracted = extractor_.extract(claim);
    const auto metric = extractor_.resolve_metric(extracted, facts);

    const GroundTruthFact* fact = nullptr;
    if (metric) {
        fact = &facts.at(*metric);
        auto numeric = check_numeric(extracted, *fact);
        if (numeric) {
            return *numeric;
        }
    }

    return check_semantic(extracted, facts, fact, model_invocations);
}

std::optional<ValidationResult> FactValidator::check_numeric(const ExtractedClaim& claim,
                                                             const GroundTruthFact& fact) const {
    if (!claim.number || !ClaimExtractor::is_comparable(claim.number->kind, fact.unit)) {
        return std::nullopt;
    }

    const NumericKind kind = claim.number->kind;

    double truth = fact.value;
    if (kind == NumericKind::PERCENT && fact.unit == FactUnit::RATIO) {
        truth *= 100.0;
    }

    // Percentages describe changes, so the stated direction carries the sign
    double claimed = claim.number->value;
    if (kind == NumericKind::PERCENT) {
        if (claim.direction == ClaimDirection::UP)
            claimed = std::abs(claimed);
        else if (claim.direction == ClaimDirection::DOWN)
            claimed = -std::abs(claimed);
    }

    const double difference = std::abs(claimed - truth);
    const double divergence = std::abs(truth) > 0.0 ? difference / std::abs(truth) : difference;

    if (divergence <= config_.numeric_tolerance) {
        return std::nullopt;
    }

    const char* suffix = kind == NumericKind::PERCENT ? "%" : "";
    const char* prefix = kind == NumericKind::CURRENCY ? "$" : "";

    std::ostringstream evidence;
    evidence << "Numeric mismatch on " << fact.metric_name << ": claimed " << prefix << claimed
             << suffix << " vs actual " << prefix << truth << suffix << " (divergence "
             << std::fixed << std::setprecision(2) << divergence << " > tolerance "
             << config_.numeric_tolerance << ")";

    ValidationResult result;
    result.claim = claim.text;
    result.metric_name = fact.metric_name;
    result.verdict = Verdict::CONTRADICTION;
    result.confidence = kind == NumericKind::PLAIN ? 0.9 : 1.0;
    result.evidence = evidence.str();
    result.source = ValidationSource::NUMERIC;
    return result;
}

ValidationResult FactValidator::check_semantic(const ExtractedClaim& claim,
                                               const GroundTruthMap& facts,
                                               const GroundTruthFact* fact,
                                               size_t& model_invocations) {
    if (!client_) {
        return check_fallback(claim, fact);
    }

    std::string premise;
    if (fact) {
        premise = describe_fact(*fact);
    } else {
        // Unresolved claims are judged against everything that is known
        std::vector<std::string> names;
        names.reserve(facts.size());
        for (const auto& [name, _] : facts) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        for (const auto& name : names) {
            if (!premise.empty())
                premise += " ";
            premise += describe_fact(facts.at(name));
        }
    }

    ValidationResult result;
    result.claim = claim.text;
    result.metric_name = fact ? fact->metric_name : "";

    if (premise.empty()) {
        result.verdict = Verdict::NEUTRAL;
        result.confidence = 0.5;
        result.evidence = "No ground truth available to verify claim";
        result.source = ValidationSource::SEMANTIC;
        return result;
    }

    ++model_invocations;

    try {
        auto response = client_->classify(premise, claim.text);
        if (response.is_error()) {
            DEBUG("Entailment model failed for '" << claim.text
                                                   << "': " << response.error()->what());
            return check_fallback(claim, fact);
        }

        const auto& verdict = response.value();
        result.verdict = verdict.label;
        result.confidence = std::clamp(verdict.confidence, 0.0, 1.0);
        result.source = ValidationSource::SEMANTIC;

        switch (verdict.label) {
            case Verdict::ENTAILMENT:
                result.evidence = "Claim entailed by ground truth: " + premise;
                break;
            case Verdict::CONTRADICTION:
                result.evidence = "Claim contradicts ground truth: " + premise;
                break;
            case Verdict::NEUTRAL:
                result.evidence = "Claim neither entailed nor contradicted: " + premise;
                break;
        }
        return result;

    } catch (const std::exception& e) {
        DEBUG("Entailment model threw for '" << claim.text << "': " << e.what());
        return check_fallback(claim, fact);
    }
}

ValidationResult FactValidator::check_fallback(const ExtractedClaim& claim,
                                               const GroundTruthFact* fact) const {
    ValidationResult result;
    result.claim = claim.text;
    result.metric_name = fact ? fact->metric_name : "";
    result.source = ValidationSource::FALLBACK;
    result.verdict = Verdict::NEUTRAL;
    result.confidence = std::min(0.5, config_.fallback_confidence);

    // Only change-type facts carry a direction; a level such as RSI does not
    const bool directional =
        fact && (fact->unit == FactUnit::RATIO || fact->unit == FactUnit::PERCENT);

    if (!directional || claim.direction == ClaimDirection::NONE || fact->value == 0.0) {
        result.evidence = fact ? "Cannot determine entailment against " + fact->metric_name
                               : "Claim cannot be matched to any ground-truth metric";
        return result;
    }

    const ClaimDirection truth_direction =
        fact->value > 0.0 ? ClaimDirection::UP : ClaimDirection::DOWN;
    const std::string truth_name = ClaimExtractor::direction_to_string(truth_direction);
    const std::string claim_name = ClaimExtractor::direction_to_string(claim.direction);

    result.confidence = config_.fallback_confidence;
    if (truth_direction == claim.direction) {
        result.verdict = Verdict::ENTAILMENT;
        result.evidence = "Directions match on " + fact->metric_name + ": both " + truth_name;
    } else {
        result.verdict = Verdict::CONTRADICTION;
        result.evidence = "Direction mismatch on " + fact->metric_name + ": claimed " +
                          claim_name + ", actual " + truth_name;
    }
    return result;
}

std::string FactValidator::describe_fact(const GroundTruthFact& fact) {
    std::string label = fact.metric_name;
    std::replace(label.begin(), label.end(), '_', ' ');

    std::ostringstream os;
    os << std::fixed << std::setprecision(1);

    switch (fact.unit) {
        case FactUnit::RATIO:
        case FactUnit::PERCENT: {
            const double pct = fact.unit == FactUnit::RATIO ? fact.value * 100.0 : fact.value;
            if (pct > 0.0)
                os << label << " increased by " << pct << "%.";
            else if (pct < 0.0)
                os << label << " decreased by " << -pct << "%.";
            else
                os << label << " remained flat.";
            break;
        }
        case FactUnit::CURRENCY:
            os << std::setprecision(2) << label << " is $" << fact.value << ".";
            break;
        case FactUnit::POINTS:
            os << std::setprecision(2) << label << " is at " << fact.value << ".";
            break;
    }

    return os.str();
}

CacheStats FactValidator::cache_stats() const {
    return cache_->stats();
}

}  // namespace decision_gate
