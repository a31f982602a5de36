// src/validation/claim_extractor.cpp

#include "decision_gate/validation/claim_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace decision_gate {

namespace {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Whole-word containment, so "up" does not match "support"
bool contains_word(const std::string& text, const std::string& word) {
    if (word.empty())
        return false;

    size_t pos = text.find(word);
    while (pos != std::string::npos) {
        const bool left_ok = pos == 0 || !is_word_char(text[pos - 1]);
        const size_t end = pos + word.size();
        const bool right_ok = end >= text.size() || !is_word_char(text[end]);
        if (left_ok && right_ok)
            return true;
        pos = text.find(word, pos + 1);
    }
    return false;
}

bool contains_any(const std::string& text, const std::vector<std::string>& words) {
    return std::any_of(words.begin(), words.end(),
                       [&text](const std::string& w) { return contains_word(text, w); });
}

// nullopt when the text does not fit a finite double
std::optional<double> parse_number(std::string digits) {
    digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(digits.c_str(), &end);
    if (end == digits.c_str() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool unit_matches(NumericKind kind, FactUnit unit) {
    switch (kind) {
        case NumericKind::PERCENT:
            return unit == FactUnit::RATIO || unit == FactUnit::PERCENT;
        case NumericKind::CURRENCY:
            return unit == FactUnit::CURRENCY;
        case NumericKind::PLAIN:
            return unit == FactUnit::POINTS || unit == FactUnit::CURRENCY;
    }
    return false;
}

}  // namespace

ClaimExtractor::ClaimExtractor()
    // Every repetition is bounded: std::regex recurses per repeated character
    : percent_re_(R"(([+-]?\d{1,18}(?:,\d{3}){0,6}(?:\.\d{1,12})?)\s{0,4}(?:%|percent\b))"),
      currency_re_(R"(([+-]?)\$\s{0,4}(\d{1,18}(?:,\d{3}){0,6}(?:\.\d{1,12})?))"),
      plain_re_(R"(\b\d{1,18}(?:\.\d{1,12})?\b)"),
      up_re_(R"(\b(increas\w{0,8}|grew|grow\w{0,8}|rose|rise|rises|rising|up|gain\w{0,8}|higher|climb\w{0,8}|jump\w{0,8}|surg\w{0,8}|expand\w{0,8}|beat)\b)"),
      down_re_(R"(\b(decreas\w{0,8}|fell|fall\w{0,8}|drop\w{0,8}|down|declin\w{0,8}|loss\w{0,8}|lose|losing|lower|slid\w{0,8}|slump\w{0,8}|plung\w{0,8}|contract\w{0,8}|shrank|shrink\w{0,8}|miss\w{0,8})\b)") {
}

ExtractedClaim ClaimExtractor::extract(const std::string& claim) const {
    ExtractedClaim extracted;
    extracted.text = claim;
    extracted.normalized = to_lower(claim);
    extracted.topic = classify_topic(extracted.normalized);
    if (claim.size() > kMaxScannedChars) {
        return extracted;
    }

    extracted.direction = detect_direction(extracted.normalized);

    const std::string& text = extracted.normalized;
    std::smatch match;

    if (std::regex_search(text, match, percent_re_)) {
        if (auto value = parse_number(match[1].str()))
            extracted.number = NumericMention{*value, NumericKind::PERCENT};
    } else if (std::regex_search(text, match, currency_re_)) {
        if (auto value = parse_number(match[2].str())) {
            extracted.number = NumericMention{match[1].str() == "-" ? -*value : *value,
                                              NumericKind::CURRENCY};
        }
    } else if (std::regex_search(text, match, plain_re_)) {
        if (auto value = parse_number(match[0].str()))
            extracted.number = NumericMention{*value, NumericKind::PLAIN};
    }

    return extracted;
}

ClaimDirection ClaimExtractor::detect_direction(const std::string& normalized) const {
    std::smatch up_match;
    std::smatch down_match;
    const bool has_up = std::regex_search(normalized, up_match, up_re_);
    const bool has_down = std::regex_search(normalized, down_match, down_re_);

    if (has_up && has_down) {
        // The first directional word governs the claim
        return up_match.position(0) < down_match.position(0) ? ClaimDirection::UP
                                                              : ClaimDirection::DOWN;
    }
    if (has_up)
        return ClaimDirection::UP;
    if (has_down)
        return ClaimDirection::DOWN;
    return ClaimDirection::NONE;
}

ClaimTopic ClaimExtractor::classify_topic(const std::string& normalized) {
    static const std::vector<std::string> technical = {"rsi", "macd", "sma", "ema",
                                                       "bollinger", "adx"};
    static const std::vector<std::string> revenue = {"revenue", "revenues", "sales",
                                                     "top line"};
    static const std::vector<std::string> earnings = {"earnings", "eps", "profit", "profits",
                                                      "income"};
    static const std::vector<std::string> price = {"price", "stock", "share", "shares"};

    if (contains_any(normalized, technical))
        return ClaimTopic::TECHNICAL;
    if (contains_any(normalized, revenue))
        return ClaimTopic::REVENUE;
    if (contains_any(normalized, earnings))
        return ClaimTopic::EARNINGS;
    if (contains_any(normalized, price))
        return ClaimTopic::PRICE;
    return ClaimTopic::QUALITATIVE;
}

const std::vector<std::pair<std::string, std::string>>& ClaimExtractor::metric_aliases() {
    static const std::vector<std::pair<std::string, std::string>> aliases = {
        {"rsi", "rsi"},
        {"macd", "macd"},
        {"sma", "sma"},
        {"ema", "ema"},
        {"adx", "adx"},
        {"revenue", "revenue_growth_yoy"},
        {"revenues", "revenue_growth_yoy"},
        {"sales", "revenue_growth_yoy"},
        {"earnings", "earnings_growth"},
        {"eps", "earnings_growth"},
        {"profit", "earnings_growth"},
        {"income", "earnings_growth"},
        {"margin", "profit_margin"},
        {"volatility", "volatility"},
        {"price", "price_change_pct"},
        {"stock", "price_change_pct"},
        {"share", "price_change_pct"},
        {"shares", "price_change_pct"},
        {"price", "current_price"},
        {"stock", "current_price"},
        {"trades", "current_price"},
    };
    return aliases;
}

std::optional<std::string> ClaimExtractor::resolve_metric(const ExtractedClaim& claim,
                                                          const GroundTruthMap& facts) const {
    std::vector<std::string> candidates;

    // Metrics named outright, longest name first so "price_change_pct" beats "price"
    std::vector<std::string> named;
    for (const auto& [name, fact] : facts) {
        std::string spaced = name;
        std::replace(spaced.begin(), spaced.end(), '_', ' ');
        if (contains_word(claim.normalized, to_lower(name)) ||
            contains_word(claim.normalized, to_lower(spaced))) {
            named.push_back(name);
        }
    }
    std::sort(named.begin(), named.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() > b.size() : a < b;
    });
    candidates.insert(candidates.end(), named.begin(), named.end());

    for (const auto& [keyword, metric] : metric_aliases()) {
        if (facts.count(metric) && contains_word(claim.normalized, keyword) &&
            std::find(candidates.begin(), candidates.end(), metric) == candidates.end()) {
            candidates.push_back(metric);
        }
    }

    if (candidates.empty())
        return std::nullopt;

    // Prefer a metric the extracted number can be compared with
    if (claim.number) {
        for (const auto& metric : candidates) {
            if (unit_matches(claim.number->kind, facts.at(metric).unit))
                return metric;
        }
    }

    return candidates.front();
}

bool ClaimExtractor::is_comparable(NumericKind kind, FactUnit unit) {
    return unit_matches(kind, unit);
}

std::string ClaimExtractor::direction_to_string(ClaimDirection direction) {
    switch (direction) {
        case ClaimDirection::NONE:
            return "NONE";
        case ClaimDirection::UP:
            return "UP";
        case ClaimDirection::DOWN:
            return "DOWN";
    }
    return "NONE";
}

std::string ClaimExtractor::topic_to_string(ClaimTopic topic) {
    switch (topic) {
        case ClaimTopic::REVENUE:
            return "REVENUE";
        case ClaimTopic::EARNINGS:
            return "EARNINGS";
        case ClaimTopic::PRICE:
            return "PRICE";
        case ClaimTopic::TECHNICAL:
            return "TECHNICAL";
        case ClaimTopic::QUALITATIVE:
            return "QUALITATIVE";
    }
    return "QUALITATIVE";
}

}  // namespace decision_gate
