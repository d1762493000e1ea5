#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "intent/ambiguity_rules.hpp"
#include "orchestrator/workflow_state.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nl2sql {

/// Closed-form disambiguation question put to the user.
struct ClarificationQuestion {
    std::string question;
    std::vector<std::string> options;   // at most Clarifier::kMaxOptions
    std::string rule;                   // ambiguity rule that fired
    AmbiguityKind kind = AmbiguityKind::GENERAL;
};

/**
 * @brief Everything one question's run knows
 *
 * Owned by exactly one run; parked inside the orchestrator while the
 * session waits for a clarification answer and archived to the turn log
 * and context memory when the run ends.
 */
struct SessionState {
    std::string session_id;
    uint32_t turn_index = 0;

    std::string raw_question;
    std::string working_question;       // raw question plus merged answers

    Intent intent;
    std::vector<std::string> matched_tables;

    std::string candidate_sql;
    ValidationResult validation;
    bool validation_passed = false;

    uint32_t regeneration_count = 0;
    uint32_t clarification_round_count = 0;

    std::optional<SandboxDecision> sandbox_decision;
    std::optional<ExecutionResult> execution_result;

    std::string final_answer;
    bool is_chat_reply = false;

    WorkflowState state = WorkflowState::START;
    FailureCode failure_code = FailureCode::NONE;

    // Critique loop bookkeeping
    std::vector<Diagnostic> diagnostics;    // latest failure, first entry is the headline
    std::string critique_rationale;
    bool join_path_reported = false;        // JOIN_PATH_NOT_FOUND already raised this run

    std::optional<AmbiguityFinding> ambiguity;
    std::optional<ClarificationQuestion> pending_clarification;
    bool query_recorded = false;            // question already in context memory

    std::vector<StepTiming> step_timings;   // across clarification rounds

    std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now();
    std::chrono::steady_clock::time_point started_steady = std::chrono::steady_clock::now();
};

} // namespace nl2sql
