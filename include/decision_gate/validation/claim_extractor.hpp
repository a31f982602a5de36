// include/decision_gate/validation/claim_extractor.hpp
#pragma once

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>
#include "decision_gate/validation/validation_types.hpp"

namespace decision_gate {

enum class ClaimDirection { NONE, UP, DOWN };

/**
 * @brief Subject area of a claim, used when it does not name its metric
 */
enum class ClaimTopic { REVENUE, EARNINGS, PRICE, TECHNICAL, QUALITATIVE };

enum class NumericKind { PERCENT, CURRENCY, PLAIN };

struct NumericMention {
    double value{0.0};
    NumericKind kind{NumericKind::PLAIN};
};

/**
 * @brief Structured reading of one claim
 */
struct ExtractedClaim {
    std::string text;
    std::string normalized;                 // Lower-cased text
    std::optional<NumericMention> number;   // Percent preferred, then currency, then plain
    ClaimDirection direction{ClaimDirection::NONE};
    ClaimTopic topic{ClaimTopic::QUALITATIVE};
};

/**
 * @brief Pulls magnitudes, direction and subject out of free-text claims
 */
class ClaimExtractor {
public:
    /// Longer claims are kept as text only, with no number or direction read from them
    static constexpr size_t kMaxScannedChars = 2000;

    ClaimExtractor();

    /**
     * @brief Parse a claim
     * @param claim Claim text as produced by the agent
     * @return Extracted numeric value, direction and topic
     */
    ExtractedClaim extract(const std::string& claim) const;

    /**
     * @brief Find the ground-truth metric a claim refers to
     *
     * A metric named in the claim wins (longest name first); otherwise keyword
     * aliases are tried in order and the first alias whose metric is present
     * in the facts is used.
     *
     * @param claim Extracted claim
     * @param facts Available ground truth
     * @return Metric name, or nullopt when the claim is unverifiable
     */
    std::optional<std::string> resolve_metric(const ExtractedClaim& claim,
                                              const GroundTruthMap& facts) const;

    ClaimDirection detect_direction(const std::string& normalized) const;

    static ClaimTopic classify_topic(const std::string& normalized);

    /**
     * @brief Whether a number of this kind can be compared with a fact in this unit
     */
    static bool is_comparable(NumericKind kind, FactUnit unit);

    static std::string direction_to_string(ClaimDirection direction);

    static std::string topic_to_string(ClaimTopic topic);

private:
    std::regex percent_re_;
    std::regex currency_re_;
    std::regex plain_re_;
    std::regex up_re_;
    std::regex down_re_;

    static const std::vector<std::pair<std::string, std::string>>& metric_aliases();
};

}  // namespace decision_gate
