#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nl2sql {

// ============================================================================
// Intent
// ============================================================================

enum class QuestionType : uint8_t {
    UNKNOWN,
    LIST,
    COUNT,
    AGGREGATE,
    RANKING,
    TREND,
    DETAIL
};

[[nodiscard]] inline const char* question_type_to_string(QuestionType type) {
    switch (type) {
        case QuestionType::LIST:      return "list";
        case QuestionType::COUNT:     return "count";
        case QuestionType::AGGREGATE: return "aggregate";
        case QuestionType::RANKING:   return "ranking";
        case QuestionType::TREND:     return "trend";
        case QuestionType::DETAIL:    return "detail";
        default:                      return "unknown";
    }
}

/**
 * @brief Resolved time window mentioned in a question
 *
 * `label` is a normalized token ("this_year", "last_30_days", "year_2023"),
 * `phrase` is the text that produced it.
 */
struct TimeRange {
    std::string label;
    std::string phrase;
    bool relative = true;
};

struct Intent {
    QuestionType question_type = QuestionType::UNKNOWN;
    std::optional<uint32_t> row_limit;
    std::optional<TimeRange> time_range;
    bool is_default = false;        // parser fell back to the default intent
};

// ============================================================================
// Diagnostics (feed the critique loop)
// ============================================================================

enum class DiagnosticKind : uint8_t {
    SYNTAX_ERROR,
    SANDBOX_DENIED,
    JOIN_PATH_NOT_FOUND,
    EXECUTION_ERROR,
    COLLABORATOR_TIMEOUT,
    COLLABORATOR_ERROR,
    NO_SQL_PRODUCED
};

[[nodiscard]] inline const char* diagnostic_kind_to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::SYNTAX_ERROR:         return "syntax_error";
        case DiagnosticKind::SANDBOX_DENIED:       return "sandbox_denied";
        case DiagnosticKind::JOIN_PATH_NOT_FOUND:  return "join_path_not_found";
        case DiagnosticKind::EXECUTION_ERROR:      return "execution_error";
        case DiagnosticKind::COLLABORATOR_TIMEOUT: return "collaborator_timeout";
        case DiagnosticKind::COLLABORATOR_ERROR:   return "collaborator_error";
        case DiagnosticKind::NO_SQL_PRODUCED:      return "no_sql_produced";
        default:                                   return "unknown";
    }
}

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::SYNTAX_ERROR;
    std::string message;
    std::string fragment;
    std::optional<uint32_t> position;   // 1-based character offset
    std::string code;                   // sandbox reason code, when applicable

    Diagnostic() = default;
    Diagnostic(DiagnosticKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}
};

struct ValidationResult {
    bool valid = false;
    std::vector<Diagnostic> diagnostics;
    size_t statement_count = 0;
};

// ============================================================================
// Sandbox
// ============================================================================

enum class SandboxReason : uint8_t {
    NONE,
    EMPTY_SQL,
    MULTI_STATEMENT,
    FORBIDDEN_KEYWORD,
    UNPARSEABLE,
    NOT_READ_ONLY,
    UNKNOWN_IDENTIFIER,
    FORBIDDEN_SCHEMA,
    UNBOUNDED_LIMIT
};

[[nodiscard]] inline const char* sandbox_reason_to_string(SandboxReason reason) {
    switch (reason) {
        case SandboxReason::NONE:               return "NONE";
        case SandboxReason::EMPTY_SQL:          return "EMPTY_SQL";
        case SandboxReason::MULTI_STATEMENT:    return "MULTI_STATEMENT";
        case SandboxReason::FORBIDDEN_KEYWORD:  return "FORBIDDEN_KEYWORD";
        case SandboxReason::UNPARSEABLE:        return "UNPARSEABLE";
        case SandboxReason::NOT_READ_ONLY:      return "NOT_READ_ONLY";
        case SandboxReason::UNKNOWN_IDENTIFIER: return "UNKNOWN_IDENTIFIER";
        case SandboxReason::FORBIDDEN_SCHEMA:   return "FORBIDDEN_SCHEMA";
        case SandboxReason::UNBOUNDED_LIMIT:    return "UNBOUNDED_LIMIT";
        default:                                return "UNKNOWN";
    }
}

struct SandboxDecision {
    bool allowed = false;
    SandboxReason reason = SandboxReason::NONE;
    std::string detail;                             // offending keyword / identifier
    std::string normalized_sql;
    std::vector<std::string> referenced_identifiers; // sorted, lowercase
    std::chrono::milliseconds execution_budget{0};
    bool limit_injected = false;
    bool limit_clamped = false;
};

// ============================================================================
// Execution
// ============================================================================

using Row = std::vector<std::string>;

struct ExecutionResult {
    bool success = false;
    std::vector<std::string> columns;
    std::vector<Row> rows;
    std::string error_message;
    bool timed_out = false;
    bool truncated = false;         // row cap reached while fetching
    std::chrono::microseconds execution_time{0};
};

// ============================================================================
// Step Timing
// ============================================================================

/// Wall time of one workflow step, in run order.
struct StepTiming {
    std::string step;
    std::chrono::microseconds elapsed{0};
};

} // namespace nl2sql
