// include/decision_gate/schema/generating_agent.hpp
#pragma once

#include <string>
#include <vector>
#include "decision_gate/core/error.hpp"
#include "decision_gate/core/types.hpp"
#include "decision_gate/regime/indicator_profile.hpp"

namespace decision_gate {

/**
 * @brief Everything the agent is told for one generation attempt
 */
struct GenerationRequest {
    std::string asset_id;
    Timestamp date;
    MarketRegime regime{MarketRegime::SIDEWAYS};
    IndicatorProfile indicator_profile;
    std::string contract;  // Description of the expected output format

    int attempt{1};  // 1 for the initial attempt
    std::string previous_output;
    std::vector<std::string> validation_errors;  // Errors of the previous attempt

    bool is_retry() const {
        return attempt > 1;
    }
};

/**
 * @brief Interface to the text-generating agent
 */
class GeneratingAgent {
public:
    virtual ~GeneratingAgent() = default;

    /**
     * @brief Produce a candidate decision as raw text
     * @param request Context of the attempt; retries carry the previous text
     *        and the errors it produced
     * @return Result containing the raw text, or an error such as AGENT_ERROR
     */
    virtual Result<std::string> generate(const GenerationRequest& request) = 0;
};

}  // namespace decision_gate
