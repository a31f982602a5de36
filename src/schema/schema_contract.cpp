// src/schema/schema_contract.cpp

#include "decision_gate/schema/schema_contract.hpp"
#include <sstream>

namespace decision_gate {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            joined += separator;
        joined += parts[i];
    }
    return joined;
}

}  // namespace

SchemaContract::SchemaContract(std::string name, size_t min_claims, size_t max_claims,
                               size_t max_claim_chars)
    : name_(std::move(name)),
      min_claims_(min_claims),
      max_claims_(max_claims),
      max_claim_chars_(max_claim_chars) {}

std::string SchemaContract::extract_json(const std::string& raw_text) {
    const std::string json_fence = "```json";
    const std::string fence = "```";

    auto start = raw_text.find(json_fence);
    if (start != std::string::npos) {
        start += json_fence.size();
        const auto end = raw_text.find(fence, start);
        return trim(raw_text.substr(start, end == std::string::npos ? std::string::npos
                                                                    : end - start));
    }

    start = raw_text.find(fence);
    if (start != std::string::npos) {
        start += fence.size();
        const auto end = raw_text.find(fence, start);
        return trim(raw_text.substr(start, end == std::string::npos ? std::string::npos
                                                                    : end - start));
    }

    const auto open = raw_text.find('{');
    const auto close = raw_text.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        return raw_text.substr(open, close - open + 1);
    }

    return trim(raw_text);
}

Result<AgentDecisionFields> SchemaContract::parse(const std::string& raw_text) const {
    const std::string payload_text = extract_json(raw_text);
    if (payload_text.empty()) {
        return make_error<AgentDecisionFields>(ErrorCode::JSON_PARSE_ERROR,
                                               "Agent output contains no JSON payload",
                                               "SchemaContract");
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(payload_text);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<AgentDecisionFields>(ErrorCode::JSON_PARSE_ERROR,
                                               std::string("Invalid JSON: ") + e.what(),
                                               "SchemaContract");
    }

    if (!payload.is_object()) {
        return make_error<AgentDecisionFields>(
            ErrorCode::SCHEMA_VIOLATION,
            "Schema " + name_ + " violated: top-level value must be a JSON object",
            "SchemaContract");
    }

    AgentDecisionFields fields;
    const auto violations = check_fields(payload, fields);
    if (!violations.empty()) {
        return make_error<AgentDecisionFields>(
            ErrorCode::SCHEMA_VIOLATION,
            "Schema " + name_ + " violated: " + join(violations, "; "), "SchemaContract");
    }

    return Result<AgentDecisionFields>(std::move(fields));
}

std::vector<std::string> SchemaContract::check_fields(const nlohmann::json& payload,
                                                      AgentDecisionFields& fields) const {
    std::vector<std::string> violations;

    // action
    if (!payload.contains("action")) {
        violations.push_back("action: required field missing");
    } else if (!payload.at("action").is_string()) {
        violations.push_back("action: must be a string");
    } else {
        const auto action = action_from_string(payload.at("action").get<std::string>());
        if (action) {
            fields.action = *action;
        } else {
            violations.push_back("action: must be one of BUY, SELL, HOLD, got '" +
                                 payload.at("action").get<std::string>() + "'");
        }
    }

    // confidence
    if (!payload.contains("confidence")) {
        violations.push_back("confidence: required field missing");
    } else if (!payload.at("confidence").is_number()) {
        violations.push_back("confidence: must be a number");
    } else {
        const double confidence = payload.at("confidence").get<double>();
        if (confidence < 0.0 || confidence > 1.0) {
            violations.push_back("confidence: must be in [0, 1]");
        } else {
            fields.confidence = confidence;
        }
    }

    // key_claims
    if (!payload.contains("key_claims")) {
        violations.push_back("key_claims: required field missing");
    } else if (!payload.at("key_claims").is_array()) {
        violations.push_back("key_claims: must be an array of strings");
    } else {
        const auto& claims = payload.at("key_claims");
        if (claims.size() < min_claims_ || claims.size() > max_claims_) {
            violations.push_back("key_claims: must contain between " +
                                 std::to_string(min_claims_) + " and " +
                                 std::to_string(max_claims_) + " entries, got " +
                                 std::to_string(claims.size()));
        }
        for (size_t i = 0; i < claims.size(); ++i) {
            if (!claims[i].is_string() || trim(claims[i].get<std::string>()).empty()) {
                violations.push_back("key_claims[" + std::to_string(i) +
                                     "]: must be a non-empty string");
            } else if (claims[i].get_ref<const std::string&>().size() > max_claim_chars_) {
                violations.push_back("key_claims[" + std::to_string(i) + "]: must be at most " +
                                     std::to_string(max_claim_chars_) + " characters, got " +
                                     std::to_string(claims[i].get_ref<const std::string&>().size()));
            } else {
                fields.key_claims.push_back(claims[i].get<std::string>());
            }
        }
    }

    // risk_fraction, optional
    if (payload.contains("risk_fraction") && !payload.at("risk_fraction").is_null()) {
        if (!payload.at("risk_fraction").is_number()) {
            violations.push_back("risk_fraction: must be a number when present");
        } else {
            const double risk = payload.at("risk_fraction").get<double>();
            if (risk < 0.0 || risk > 1.0) {
                violations.push_back("risk_fraction: must be in [0, 1]");
            } else {
                fields.risk_fraction = risk;
            }
        }
    }

    return violations;
}

std::string SchemaContract::describe() const {
    std::ostringstream os;
    os << "Respond with a single JSON object (" << name_ << "): "
       << "\"action\" one of \"BUY\", \"SELL\", \"HOLD\"; "
       << "\"confidence\" a number in [0, 1]; "
       << "\"key_claims\" an array of " << min_claims_ << " to " << max_claims_
       << " non-empty strings of at most " << max_claim_chars_ << " characters; "
       << "optional \"risk_fraction\" a number in [0, 1].";
    return os.str();
}

}  // namespace decision_gate
