#pragma once

#include <cstdint>

namespace nl2sql {

enum class WorkflowState : uint8_t {
    START,
    INTENT_PARSED,
    GENERATED,
    CLARIFY_NEEDED,
    AWAITING_USER,
    VALIDATING,
    VALID,
    INVALID,
    CRITIQUING,
    SANDBOX_CHECK,
    EXECUTING,
    ANSWERING,
    DONE,
    FAILED
};

[[nodiscard]] inline const char* workflow_state_to_string(WorkflowState state) {
    switch (state) {
        case WorkflowState::START:          return "START";
        case WorkflowState::INTENT_PARSED:  return "INTENT_PARSED";
        case WorkflowState::GENERATED:      return "GENERATED";
        case WorkflowState::CLARIFY_NEEDED: return "CLARIFY_NEEDED";
        case WorkflowState::AWAITING_USER:  return "AWAITING_USER";
        case WorkflowState::VALIDATING:     return "VALIDATING";
        case WorkflowState::VALID:          return "VALID";
        case WorkflowState::INVALID:        return "INVALID";
        case WorkflowState::CRITIQUING:     return "CRITIQUING";
        case WorkflowState::SANDBOX_CHECK:  return "SANDBOX_CHECK";
        case WorkflowState::EXECUTING:      return "EXECUTING";
        case WorkflowState::ANSWERING:      return "ANSWERING";
        case WorkflowState::DONE:           return "DONE";
        case WorkflowState::FAILED:         return "FAILED";
        default:                            return "UNKNOWN";
    }
}

[[nodiscard]] inline bool is_terminal(WorkflowState state) {
    return state == WorkflowState::DONE || state == WorkflowState::FAILED;
}

/**
 * @brief Step outcomes that drive the state machine
 */
enum class WorkflowEvent : uint8_t {
    INTENT_READY,           // START -> INTENT_PARSED
    SQL_GENERATED,          // candidate SQL produced
    CHAT_REPLY,             // generator answered in prose
    GENERATION_FAILED,      // collaborator failure, no SQL, join path missing
    AMBIGUOUS,
    UNAMBIGUOUS,
    QUESTION_EMITTED,       // clarification question sent to the user
    USER_ANSWERED,
    SYNTAX_OK,
    SYNTAX_ERROR,
    SANDBOX_REQUESTED,
    SANDBOX_ALLOWED,
    SANDBOX_DENIED,
    EXECUTION_SUCCEEDED,
    EXECUTION_FAILED,
    REPAIR_REQUESTED,       // INVALID -> CRITIQUING or FAILED
    REGENERATED,            // CRITIQUING -> GENERATED
    ANSWER_READY,
    ABORT                   // internal error, any non-terminal state -> FAILED
};

[[nodiscard]] inline const char* workflow_event_to_string(WorkflowEvent event) {
    switch (event) {
        case WorkflowEvent::INTENT_READY:        return "INTENT_READY";
        case WorkflowEvent::SQL_GENERATED:       return "SQL_GENERATED";
        case WorkflowEvent::CHAT_REPLY:          return "CHAT_REPLY";
        case WorkflowEvent::GENERATION_FAILED:   return "GENERATION_FAILED";
        case WorkflowEvent::AMBIGUOUS:           return "AMBIGUOUS";
        case WorkflowEvent::UNAMBIGUOUS:         return "UNAMBIGUOUS";
        case WorkflowEvent::QUESTION_EMITTED:    return "QUESTION_EMITTED";
        case WorkflowEvent::USER_ANSWERED:       return "USER_ANSWERED";
        case WorkflowEvent::SYNTAX_OK:           return "SYNTAX_OK";
        case WorkflowEvent::SYNTAX_ERROR:        return "SYNTAX_ERROR";
        case WorkflowEvent::SANDBOX_REQUESTED:   return "SANDBOX_REQUESTED";
        case WorkflowEvent::SANDBOX_ALLOWED:     return "SANDBOX_ALLOWED";
        case WorkflowEvent::SANDBOX_DENIED:      return "SANDBOX_DENIED";
        case WorkflowEvent::EXECUTION_SUCCEEDED: return "EXECUTION_SUCCEEDED";
        case WorkflowEvent::EXECUTION_FAILED:    return "EXECUTION_FAILED";
        case WorkflowEvent::REPAIR_REQUESTED:    return "REPAIR_REQUESTED";
        case WorkflowEvent::REGENERATED:         return "REGENERATED";
        case WorkflowEvent::ANSWER_READY:        return "ANSWER_READY";
        case WorkflowEvent::ABORT:               return "ABORT";
        default:                                 return "UNKNOWN";
    }
}

} // namespace nl2sql
