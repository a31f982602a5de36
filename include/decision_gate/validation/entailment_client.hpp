// include/decision_gate/validation/entailment_client.hpp
#pragma once

#include <string>
#include "decision_gate/core/error.hpp"
#include "decision_gate/validation/validation_types.hpp"

namespace decision_gate {

/**
 * @brief Label and confidence returned by a natural-language inference model
 */
struct EntailmentResponse {
    Verdict label{Verdict::NEUTRAL};
    double confidence{0.0};
};

/**
 * @brief Interface to an external entailment classifier
 *
 * Calls are synchronous. Implementations report an unreachable or failing
 * model as MODEL_UNAVAILABLE and a slow one as TIMEOUT_ERROR; both send the
 * validator into its keyword fallback.
 */
class EntailmentClient {
public:
    virtual ~EntailmentClient() = default;

    /**
     * @brief Decide whether the premise entails, contradicts or is neutral to the hypothesis
     * @param premise Statement built from verified facts
     * @param hypothesis Claim text under test
     * @return Result containing the model verdict
     */
    virtual Result<EntailmentResponse> classify(const std::string& premise,
                                                const std::string& hypothesis) = 0;
};

}  // namespace decision_gate
