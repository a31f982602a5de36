// src/schema/schema_gate.cpp

#include "decision_gate/schema/schema_gate.hpp"
#include <algorithm>
#include "decision_gate/core/logger.hpp"

namespace decision_gate {

std::vector<ConfigValidationError> SchemaGateConfig::validate() const {
    std::vector<ConfigValidationError> errors;
    if (max_retries < 0) {
        errors.push_back({"schema_max_retries", "Cannot be negative"});
    }
    if (max_key_claims == 0) {
        errors.push_back({"schema_max_key_claims", "Must be at least 1"});
    }
    if (max_claim_chars == 0) {
        errors.push_back({"schema_max_claim_chars", "Must be at least 1"});
    }
    return errors;
}

double RetryStats::first_try_success_rate() const {
    return total_runs > 0 ? static_cast<double>(first_try_successes) / total_runs : 0.0;
}

double RetryStats::overall_success_rate() const {
    return total_runs > 0
               ? static_cast<double>(first_try_successes + successes_after_retry) / total_runs
               : 0.0;
}

double RetryStats::failure_rate() const {
    return total_runs > 0 ? static_cast<double>(failures) / total_runs : 0.0;
}

nlohmann::json RetryStats::to_json() const {
    nlohmann::json j;
    j["total_runs"] = total_runs;
    j["first_try_successes"] = first_try_successes;
    j["successes_after_retry"] = successes_after_retry;
    j["failures"] = failures;
    j["first_try_success_rate"] = first_try_success_rate();
    j["overall_success_rate"] = overall_success_rate();
    j["failure_rate"] = failure_rate();
    return j;
}

nlohmann::json SchemaGateResult::to_json() const {
    nlohmann::json j;
    j["valid"] = valid;
    j["attempts"] = attempts;
    j["errors"] = errors;
    j["envelope"] = envelope.to_json();
    return j;
}

SchemaGate::SchemaGate(SchemaGateConfig config, std::shared_ptr<GeneratingAgent> agent)
    : config_(std::move(config)),
      agent_(std::move(agent)),
      contract_("trade_decision_v1", 1, config_.max_key_claims, config_.max_claim_chars) {}

SchemaGateResult SchemaGate::run(GenerationRequest request) {
    ScopedLogComponent log_scope("SchemaGate");
    ++total_runs_;

    SchemaGateResult result;
    const int max_attempts = std::max(config_.max_retries, 0) + 1;

    if (!agent_) {
        result.errors.push_back("No generating agent configured");
        ++failures_;
        return result;
    }

    request.contract = contract_.describe();
    request.previous_output.clear();
    request.validation_errors.clear();

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        request.attempt = attempt;
        result.attempts = attempt;

        if (attempt > 1) {
            ++result.envelope.retry_count;
            request.previous_output = result.envelope.raw_text;
            request.validation_errors = {result.errors.back()};
            DEBUG("Schema retry " << attempt - 1 << "/" << config_.max_retries << " for "
                                  << request.asset_id << ": " << result.errors.back());
        }

        // Every attempt replaces the previous output wholesale
        result.envelope.raw_text.clear();
        result.envelope.parsed_fields = AgentDecisionFields{};
        result.envelope.schema_valid = false;

        std::string error_message;
        try {
            auto generated = agent_->generate(request);
            if (generated.is_error()) {
                error_message = std::string("Agent error: ") + generated.error()->what();
            } else {
                result.envelope.raw_text = generated.value();
                auto parsed = contract_.parse(result.envelope.raw_text);
                if (parsed.is_error()) {
                    error_message = parsed.error()->what();
                } else {
                    result.envelope.parsed_fields = parsed.value();
                    result.envelope.schema_valid = true;
                }
            }
        } catch (const std::exception& e) {
            error_message = std::string("Agent error: ") + e.what();
        }

        if (result.envelope.schema_valid) {
            result.valid = true;
            if (attempt == 1) {
                ++first_try_successes_;
            } else {
                ++successes_after_retry_;
            }
            DEBUG("Schema valid for " << request.asset_id << " after " << attempt
                                      << " attempt(s)");
            return result;
        }

        result.errors.push_back("Attempt " + std::to_string(attempt) + ": " + error_message);
    }

    ++failures_;
    INFO("Schema gate exhausted " << max_attempts << " attempts for " << request.asset_id);
    return result;
}

RetryStats SchemaGate::stats() const {
    RetryStats stats;
    stats.total_runs = total_runs_.load();
    stats.first_try_successes = first_try_successes_.load();
    stats.successes_after_retry = successes_after_retry_.load();
    stats.failures = failures_.load();
    return stats;
}

}  // namespace decision_gate
