#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace nl2sql {

/// Execution outcome without the row data.
struct ExecutionSummary {
    bool attempted = false;
    bool success = false;
    size_t row_count = 0;
    size_t column_count = 0;
    bool truncated = false;
    bool timed_out = false;
    std::chrono::microseconds elapsed{0};

    [[nodiscard]] static ExecutionSummary from(const ExecutionResult& result) {
        ExecutionSummary s;
        s.attempted = true;
        s.success = result.success;
        s.row_count = result.rows.size();
        s.column_count = result.columns.size();
        s.truncated = result.truncated;
        s.timed_out = result.timed_out;
        s.elapsed = result.execution_time;
        return s;
    }
};

/**
 * @brief One completed turn, written as a single JSONL line
 */
struct TurnRecord {
    std::string session_id;
    std::chrono::system_clock::time_point timestamp;
    uint32_t turn_index = 0;

    std::string question;
    std::string working_question;
    Intent intent;
    std::vector<std::string> matched_tables;

    std::string candidate_sql;
    bool validation_passed = false;
    uint32_t regeneration_count = 0;
    uint32_t clarification_round_count = 0;

    bool sandbox_checked = false;
    SandboxDecision sandbox_decision;
    ExecutionSummary execution_summary;

    std::string state;              // final workflow state name
    FailureCode failure_code = FailureCode::NONE;
    std::string last_diagnostic;
    bool is_chat_reply = false;
    std::vector<StepTiming> step_timings;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Sandbox denial, written to the security log
 */
struct SecurityEvent {
    std::string session_id;
    std::chrono::system_clock::time_point timestamp;
    SandboxReason reason = SandboxReason::NONE;
    std::string detail;
    std::string sql_prefix;         // first 100 characters of the candidate

    static constexpr size_t kSqlPrefixLength = 100;
};

} // namespace nl2sql
