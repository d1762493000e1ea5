#pragma once

#include <optional>
#include <string>

namespace nl2sql {

/**
 * @brief Error categories for internal results
 */
enum class ErrorCategory {
    NONE,
    INVALID_ARGUMENT,
    PARSE_ERROR,
    IO_ERROR,
    NOT_FOUND,
    COLLABORATOR_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return success_; }
    [[nodiscard]] bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    [[nodiscard]] ErrorCategory error_category() const { return error_category_; }
    [[nodiscard]] const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Caller-facing failure codes
// ============================================================================

/**
 * @brief Stable failure codes returned to callers of the engine.
 *
 * Internal diagnostics never leave the process; callers only ever see one
 * of these codes plus the fixed reason text from failure_reason().
 */
enum class FailureCode {
    NONE,
    INVALID_REQUEST,
    SESSION_BUSY,
    MAX_REGENERATIONS_EXCEEDED,
    MAX_CLARIFICATION_ROUNDS_EXCEEDED,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* failure_code_to_string(FailureCode code) {
    switch (code) {
        case FailureCode::NONE:                              return "NONE";
        case FailureCode::INVALID_REQUEST:                   return "INVALID_REQUEST";
        case FailureCode::SESSION_BUSY:                      return "SESSION_BUSY";
        case FailureCode::MAX_REGENERATIONS_EXCEEDED:        return "MAX_REGENERATIONS_EXCEEDED";
        case FailureCode::MAX_CLARIFICATION_ROUNDS_EXCEEDED: return "MAX_CLARIFICATION_ROUNDS_EXCEEDED";
        case FailureCode::INTERNAL_ERROR:                    return "INTERNAL_ERROR";
        default:                                             return "UNKNOWN";
    }
}

[[nodiscard]] inline const char* failure_reason(FailureCode code) {
    switch (code) {
        case FailureCode::NONE:
            return "";
        case FailureCode::INVALID_REQUEST:
            return "The question is empty or too long.";
        case FailureCode::SESSION_BUSY:
            return "This session is already processing a question.";
        case FailureCode::MAX_REGENERATIONS_EXCEEDED:
            return "Could not produce a valid, safe SQL query for this question after several attempts.";
        case FailureCode::MAX_CLARIFICATION_ROUNDS_EXCEEDED:
            return "The question is still ambiguous after the maximum number of clarifications.";
        case FailureCode::INTERNAL_ERROR:
        default:
            return "An internal error occurred while processing the question.";
    }
}

} // namespace nl2sql
