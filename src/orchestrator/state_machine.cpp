#include "orchestrator/state_machine.hpp"

namespace nl2sql {

std::optional<WorkflowState> next_state(WorkflowState state,
                                        WorkflowEvent event,
                                        const WorkflowCounters& counters,
                                        const WorkflowLimits& limits) {
    using S = WorkflowState;
    using E = WorkflowEvent;

    if (is_terminal(state)) return std::nullopt;
    if (event == E::ABORT) return S::FAILED;

    switch (state) {
        case S::START:
            if (event == E::INTENT_READY) return S::INTENT_PARSED;
            break;

        case S::INTENT_PARSED:
            if (event == E::SQL_GENERATED) return S::GENERATED;
            if (event == E::CHAT_REPLY) return S::ANSWERING;
            if (event == E::GENERATION_FAILED) return S::INVALID;
            break;

        case S::GENERATED:
            if (event == E::UNAMBIGUOUS) return S::VALIDATING;
            if (event == E::AMBIGUOUS) {
                if (counters.clarification_round_count < limits.max_clarification_rounds) {
                    return S::CLARIFY_NEEDED;
                }
                return limits.fail_on_clarification_exhaustion ? S::FAILED : S::VALIDATING;
            }
            break;

        case S::CLARIFY_NEEDED:
            if (event == E::QUESTION_EMITTED) return S::AWAITING_USER;
            break;

        case S::AWAITING_USER:
            if (event == E::USER_ANSWERED) return S::INTENT_PARSED;
            break;

        case S::VALIDATING:
            if (event == E::SYNTAX_OK) return S::VALID;
            if (event == E::SYNTAX_ERROR) return S::INVALID;
            break;

        case S::VALID:
            if (event == E::SANDBOX_REQUESTED) return S::SANDBOX_CHECK;
            break;

        case S::SANDBOX_CHECK:
            if (event == E::SANDBOX_ALLOWED) return S::EXECUTING;
            if (event == E::SANDBOX_DENIED) return S::INVALID;
            break;

        case S::EXECUTING:
            if (event == E::EXECUTION_SUCCEEDED) return S::ANSWERING;
            if (event == E::EXECUTION_FAILED) return S::INVALID;
            break;

        case S::INVALID:
            if (event == E::REPAIR_REQUESTED) {
                return counters.regeneration_count < limits.max_regenerations
                    ? S::CRITIQUING : S::FAILED;
            }
            break;

        case S::CRITIQUING:
            if (event == E::REGENERATED) return S::GENERATED;
            if (event == E::GENERATION_FAILED) return S::INVALID;
            break;

        case S::ANSWERING:
            if (event == E::ANSWER_READY) return S::DONE;
            break;

        default:
            break;
    }
    return std::nullopt;
}

} // namespace nl2sql
