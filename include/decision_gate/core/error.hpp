// include/decision_gate/core/error.hpp

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace decision_gate {

/**
 * @brief Failure categories reported by the gates and their collaborators
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Market data and ground truth
    INVALID_DATA = 4,
    INSUFFICIENT_DATA = 5,
    DATA_NOT_FOUND = 6,

    // Agent output
    JSON_PARSE_ERROR = 7,
    SCHEMA_VIOLATION = 8,
    AGENT_ERROR = 9,

    // Entailment
    CONTRADICTION_DETECTED = 10,
    MODEL_UNAVAILABLE = 11,

    // Risk
    INVALID_POSITION_TRANSITION = 12,
    RISK_LIMIT_EXCEEDED = 13,
    CIRCUIT_BREAKER_TRIPPED = 14,

    TIMEOUT_ERROR = 15,
    FILE_IO_ERROR = 16,

    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::SCHEMA_VIOLATION:
            return "SCHEMA_VIOLATION";
        case ErrorCode::AGENT_ERROR:
            return "AGENT_ERROR";
        case ErrorCode::CONTRADICTION_DETECTED:
            return "CONTRADICTION_DETECTED";
        case ErrorCode::MODEL_UNAVAILABLE:
            return "MODEL_UNAVAILABLE";
        case ErrorCode::INVALID_POSITION_TRANSITION:
            return "INVALID_POSITION_TRANSITION";
        case ErrorCode::RISK_LIMIT_EXCEEDED:
            return "RISK_LIMIT_EXCEEDED";
        case ErrorCode::CIRCUIT_BREAKER_TRIPPED:
            return "CIRCUIT_BREAKER_TRIPPED";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        default:
            return "CUSTOM_" + std::to_string(static_cast<int>(code));
    }
}

/**
 * @brief Failure raised by a gate, tagged with the code and the component that produced it
 *
 * Failed Results carry one of these. Result::value() rethrows it, so callers that
 * prefer exceptions can catch GateError directly.
 */
class GateError : public std::runtime_error {
public:
    GateError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /// "[component] CODE: message", the component tag omitted when empty
    std::string to_string() const {
        std::string out;
        if (!component_.empty()) {
            out += "[" + component_ + "] ";
        }
        return out + error_code_to_string(code_) + ": " + what();
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Either a value or the GateError explaining why there is none
 *
 * Move-only. The value is held in an optional so T needs no default constructor.
 * @tparam T Type of the successful value
 */
template <typename T>
class Result {
public:
    template <typename U = T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                          std::is_constructible_v<T, U&&>>>
    Result(U&& value) : value_(std::in_place, std::forward<U>(value)) {}

    Result(std::unique_ptr<GateError> error) : error_(std::move(error)) {}

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @throws GateError when the Result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return *value_;
    }

    /// Null on success
    const GateError* error() const {
        return error_.get();
    }

private:
    std::optional<T> value_;
    std::unique_ptr<GateError> error_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(std::unique_ptr<GateError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const GateError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<GateError> error_;
};

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<GateError>(code, message, component));
}

}  // namespace decision_gate
