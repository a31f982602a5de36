// include/decision_gate/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "decision_gate/core/error.hpp"

namespace decision_gate {

/**
 * @brief Single problem found while validating a configuration
 */
struct ConfigValidationError {
    std::string field;
    std::string message;
};

/// "field: message; field: message"
std::string format_validation_errors(const std::vector<ConfigValidationError>& errors);

/**
 * @brief JSON-backed configuration with an optional validation hook
 *
 * Every gate configuration derives from this. Loading from disk runs validate()
 * after from_json(), so a file with out-of-range values is rejected instead of
 * reaching a gate.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration as indented JSON, creating parent directories
     * @return FILE_IO_ERROR when the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read, apply and validate a JSON file
     * @return FILE_IO_ERROR, JSON_PARSE_ERROR, or INVALID_ARGUMENT listing every
     *         validation problem. The fields read before validation stay applied.
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /// Missing keys keep their current values
    virtual void from_json(const nlohmann::json& j) = 0;

    virtual std::vector<ConfigValidationError> validate() const {
        return {};
    }
};

}  // namespace decision_gate
