#pragma once

#include "orchestrator/workflow_state.hpp"

#include <cstdint>
#include <optional>

namespace nl2sql {

/// Bounded counters carried by a session.
struct WorkflowCounters {
    uint32_t regeneration_count = 0;
    uint32_t clarification_round_count = 0;
};

struct WorkflowLimits {
    uint32_t max_regenerations = 3;
    uint32_t max_clarification_rounds = 3;
    bool fail_on_clarification_exhaustion = false;
};

/**
 * @brief Pure transition function of the session workflow
 *
 * Routing depends only on the arguments. Counter-dependent edges:
 *   GENERATED  + AMBIGUOUS        -> CLARIFY_NEEDED while rounds remain,
 *                                    else VALIDATING (or FAILED when
 *                                    fail_on_clarification_exhaustion)
 *   INVALID    + REPAIR_REQUESTED -> CRITIQUING while regenerations remain,
 *                                    else FAILED
 *
 * @return Next state, or nullopt when the event is not accepted in `state`
 */
[[nodiscard]] std::optional<WorkflowState> next_state(WorkflowState state,
                                                      WorkflowEvent event,
                                                      const WorkflowCounters& counters,
                                                      const WorkflowLimits& limits);

} // namespace nl2sql
