#include "orchestrator/orchestrator.hpp"
#include "core/utils.hpp"
#include "schema/join_synthesizer.hpp"

#include <format>
#include <stdexcept>

namespace nl2sql {

// ============================================================================
// Busy Guard
// ============================================================================

class Orchestrator::BusyGuard {
public:
    BusyGuard(Orchestrator& owner, std::string session_id)
        : owner_(owner), session_id_(std::move(session_id)) {}
    ~BusyGuard() { owner_.release(session_id_); }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    Orchestrator& owner_;
    std::string session_id_;
};

namespace {

/// Step performed in a state; nullptr for pure routing states.
const char* step_name(WorkflowState state) {
    switch (state) {
        case WorkflowState::START:          return "parse_intent";
        case WorkflowState::INTENT_PARSED:  return "generate";
        case WorkflowState::GENERATED:      return "check_ambiguity";
        case WorkflowState::CLARIFY_NEEDED: return "clarify";
        case WorkflowState::VALIDATING:     return "validate";
        case WorkflowState::SANDBOX_CHECK:  return "sandbox";
        case WorkflowState::EXECUTING:      return "execute";
        case WorkflowState::INVALID:        return "repair";
        case WorkflowState::CRITIQUING:     return "critique";
        case WorkflowState::ANSWERING:      return "answer";
        default:                            return nullptr;
    }
}

/// Appends the wall time of the current step to the run's trace on scope exit.
class StepTimer {
public:
    explicit StepTimer(SessionState& st)
        : st_(st), step_(step_name(st.state)), start_(std::chrono::steady_clock::now()) {}

    ~StepTimer() {
        if (!step_) return;
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_);
        st_.step_timings.push_back(StepTiming{step_, elapsed});
        utils::log::debug(std::format("Session {}: {} took {} us", st_.session_id, step_,
                                      elapsed.count()));
    }

    StepTimer(const StepTimer&) = delete;
    StepTimer& operator=(const StepTimer&) = delete;

private:
    SessionState& st_;
    const char* step_;
    std::chrono::steady_clock::time_point start_;
};

} // anonymous namespace

std::string public_diagnostic(const Diagnostic& diagnostic) {
    switch (diagnostic.kind) {
        case DiagnosticKind::SYNTAX_ERROR:
            return diagnostic.position
                ? std::format("The generated SQL has a syntax error at position {}.",
                              *diagnostic.position)
                : std::string("The generated SQL has a syntax error.");
        case DiagnosticKind::SANDBOX_DENIED:
            return std::format("Query rejected by the security sandbox ({})", diagnostic.code);
        case DiagnosticKind::JOIN_PATH_NOT_FOUND:
            return diagnostic.message;
        case DiagnosticKind::EXECUTION_ERROR:
            return diagnostic.code == "timeout"
                ? "The query exceeded its execution time budget."
                : "The database rejected the query.";
        case DiagnosticKind::COLLABORATOR_TIMEOUT:
            return "The language model did not respond in time.";
        case DiagnosticKind::COLLABORATOR_ERROR:
            return "The language model could not be reached.";
        case DiagnosticKind::NO_SQL_PRODUCED:
            return "The language model did not produce a SQL query.";
        default:
            return "Unknown error.";
    }
}

Orchestrator::Orchestrator(OrchestratorComponents components, Config config)
    : c_(std::move(components)),
      config_(std::move(config)),
      generator_(c_.completer, config_.generation),
      critic_(c_.completer),
      clarifier_(c_.completer, config_.merge_template),
      answer_builder_(c_.completer) {
    if (!c_.catalog || !c_.completer || !c_.executor || !c_.memory) {
        throw std::invalid_argument(
            "Orchestrator requires catalog, completer, executor and memory components");
    }
    if (!c_.sandbox) c_.sandbox = std::make_shared<SqlSandbox>();
    if (!c_.ambiguity) c_.ambiguity = std::make_shared<AmbiguityDetector>();
}

// ============================================================================
// Session Bookkeeping
// ============================================================================

bool Orchestrator::try_acquire(const std::string& session_id) {
    std::lock_guard lock(sessions_mutex_);
    return busy_.insert(session_id).second;
}

void Orchestrator::release(const std::string& session_id) {
    std::lock_guard lock(sessions_mutex_);
    busy_.erase(session_id);
}

bool Orchestrator::is_awaiting_user(const std::string& session_id) const {
    std::lock_guard lock(sessions_mutex_);
    return parked_.contains(session_id);
}

size_t Orchestrator::tracked_sessions() const {
    std::lock_guard lock(sessions_mutex_);
    std::unordered_set<std::string> ids;
    for (const auto& [id, run] : parked_) ids.insert(id);
    for (const auto& [id, counter] : next_turn_) ids.insert(id);
    return ids.size();
}

void Orchestrator::evict_idle_sessions() {
    const auto ttl = c_.memory->config().ttl;
    const auto now = std::chrono::steady_clock::now();
    size_t evicted = 0;
    {
        std::lock_guard lock(sessions_mutex_);
        for (auto it = parked_.begin(); it != parked_.end();) {
            if (!busy_.contains(it->first) && now - it->second.parked_at > ttl) {
                utils::log::info(std::format("Session {}: parked clarification expired",
                                             it->first));
                it = parked_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
        for (auto it = next_turn_.begin(); it != next_turn_.end();) {
            if (!busy_.contains(it->first) && !parked_.contains(it->first) &&
                now - it->second.last_used > ttl) {
                it = next_turn_.erase(it);
            } else {
                ++it;
            }
        }
    }
    evicted += c_.memory->evict_expired();
    if (evicted > 0) {
        utils::log::debug(std::format("Evicted {} idle session entries", evicted));
    }
}

void Orchestrator::end_session(const std::string& session_id) {
    {
        std::lock_guard lock(sessions_mutex_);
        parked_.erase(session_id);
        next_turn_.erase(session_id);
    }
    c_.memory->end_session(session_id);
    utils::log::debug(std::format("Session {} ended", session_id));
}

// ============================================================================
// Public Entry Points
// ============================================================================

QueryResponse Orchestrator::run_query(const std::string& question, const std::string& session_id) {
    if (session_id.empty() || utils::trim(question).empty() ||
        question.size() > kMaxRequestLength) {
        return QueryResponse::rejected(session_id, FailureCode::INVALID_REQUEST);
    }
    if (!try_acquire(session_id)) {
        busy_rejections_.fetch_add(1, std::memory_order_relaxed);
        return QueryResponse::rejected(session_id, FailureCode::SESSION_BUSY);
    }
    BusyGuard guard(*this, session_id);
    evict_idle_sessions();

    std::optional<SessionState> parked;
    {
        std::lock_guard lock(sessions_mutex_);
        if (const auto it = parked_.find(session_id); it != parked_.end()) {
            parked = std::move(it->second.state);
            parked_.erase(it);
        }
    }
    if (parked) {
        return continue_run(std::move(*parked), question);
    }
    return start_run(question, session_id);
}

QueryResponse Orchestrator::resume(const std::string& session_id, const std::string& answer) {
    if (session_id.empty() || utils::trim(answer).empty() || answer.size() > kMaxRequestLength) {
        return QueryResponse::rejected(session_id, FailureCode::INVALID_REQUEST);
    }
    if (!try_acquire(session_id)) {
        busy_rejections_.fetch_add(1, std::memory_order_relaxed);
        return QueryResponse::rejected(session_id, FailureCode::SESSION_BUSY);
    }
    BusyGuard guard(*this, session_id);
    evict_idle_sessions();

    std::optional<SessionState> parked;
    {
        std::lock_guard lock(sessions_mutex_);
        if (const auto it = parked_.find(session_id); it != parked_.end()) {
            parked = std::move(it->second.state);
            parked_.erase(it);
        }
    }
    if (!parked) {
        utils::log::warn(std::format("Resume for session {} with no pending clarification",
                                     session_id));
        return QueryResponse::rejected(session_id, FailureCode::INVALID_REQUEST);
    }
    return continue_run(std::move(*parked), answer);
}

QueryResponse Orchestrator::start_run(const std::string& question, const std::string& session_id) {
    runs_started_.fetch_add(1, std::memory_order_relaxed);

    SessionState st;
    st.session_id = session_id;
    st.raw_question = utils::trim(question);
    st.working_question = st.raw_question;
    {
        std::lock_guard lock(sessions_mutex_);
        auto& counter = next_turn_[session_id];
        st.turn_index = counter.next++;
        counter.last_used = std::chrono::steady_clock::now();
    }
    utils::log::info(std::format("Session {} turn {}: {}", session_id, st.turn_index,
                                 utils::truncate_utf8(st.raw_question, 200)));
    return drive(st);
}

QueryResponse Orchestrator::continue_run(SessionState st, const std::string& answer) {
    auto memory = c_.memory->for_session(st.session_id);
    const auto catalog = c_.catalog->snapshot();

    const auto& options = st.pending_clarification
        ? st.pending_clarification->options : std::vector<std::string>{};
    const auto resolved = Clarifier::resolve_answer(answer, options);

    if (st.pending_clarification) {
        std::string asked = st.pending_clarification->question;
        for (size_t i = 0; i < options.size(); ++i) {
            asked += std::format("\n{}. {}", i + 1, options[i]);
        }
        memory->append({st.turn_index, EntryKind::CLARIFICATION, EntryRole::ASSISTANT,
                        std::move(asked), "", ""});
    }
    memory->append({st.turn_index, EntryKind::CLARIFICATION, EntryRole::USER, resolved, "", ""});

    st.working_question = clarifier_.merge(st.working_question, answer, options);
    ++st.clarification_round_count;
    st.pending_clarification.reset();
    st.ambiguity.reset();
    utils::log::info(std::format("Session {}: clarification {} merged: {}", st.session_id,
                                 st.clarification_round_count, st.working_question));

    refresh_intent(st, *catalog);
    advance(st, WorkflowEvent::USER_ANSWERED);
    return drive(st);
}

// ============================================================================
// Driver
// ============================================================================

void Orchestrator::advance(SessionState& st, WorkflowEvent event) const {
    const WorkflowCounters counters{st.regeneration_count, st.clarification_round_count};
    const auto next = next_state(st.state, event, counters, config_.limits);
    if (!next) {
        utils::log::error(std::format("Session {}: event {} not valid in state {}",
                                      st.session_id, workflow_event_to_string(event),
                                      workflow_state_to_string(st.state)));
        st.state = WorkflowState::FAILED;
        st.failure_code = FailureCode::INTERNAL_ERROR;
        return;
    }
    utils::log::debug(std::format("Session {}: {} --{}--> {}", st.session_id,
                                  workflow_state_to_string(st.state),
                                  workflow_event_to_string(event),
                                  workflow_state_to_string(*next)));
    st.state = *next;
}

QueryResponse Orchestrator::drive(SessionState& st) {
    // One snapshot for the whole run; a concurrent reload does not affect it
    const auto catalog = c_.catalog->snapshot();
    auto memory = c_.memory->for_session(st.session_id);

    try {
        while (!is_terminal(st.state) && st.state != WorkflowState::AWAITING_USER) {
            StepTimer timer(st);
            switch (st.state) {
                case WorkflowState::START:          step_parse_intent(st, *catalog); break;
                case WorkflowState::INTENT_PARSED:  step_generate(st, *catalog, *memory); break;
                case WorkflowState::GENERATED:      step_check_ambiguity(st, *memory); break;
                case WorkflowState::CLARIFY_NEEDED: step_clarify(st, *memory); break;
                case WorkflowState::VALIDATING:     step_validate(st); break;
                case WorkflowState::VALID:          advance(st, WorkflowEvent::SANDBOX_REQUESTED); break;
                case WorkflowState::SANDBOX_CHECK:  step_sandbox(st, *catalog); break;
                case WorkflowState::EXECUTING:      step_execute(st); break;
                case WorkflowState::INVALID:        step_repair(st); break;
                case WorkflowState::CRITIQUING:     step_critique(st, *catalog, *memory); break;
                case WorkflowState::ANSWERING:      step_answer(st); break;
                default:                            advance(st, WorkflowEvent::ABORT); break;
            }
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Session {}: step in state {} threw: {}", st.session_id,
                                      workflow_state_to_string(st.state), e.what()));
        st.state = WorkflowState::FAILED;
        st.failure_code = FailureCode::INTERNAL_ERROR;
    }

    if (st.state == WorkflowState::AWAITING_USER) {
        record_query(st, *memory);
        auto response = build_response(st);
        std::string session_id = st.session_id;
        std::lock_guard lock(sessions_mutex_);
        parked_.insert_or_assign(std::move(session_id),
                                 ParkedRun{std::move(st), std::chrono::steady_clock::now()});
        return response;
    }

    archive(st, *memory);
    return build_response(st);
}

// ============================================================================
// Steps
// ============================================================================

void Orchestrator::refresh_intent(SessionState& st, const CatalogSnapshot& catalog) const {
    st.intent = intent_parser_.parse(st.working_question);
    st.matched_tables = catalog.find_relevant_tables(st.working_question);
    if (st.intent.is_default) {
        utils::log::debug(std::format("Session {}: intent fell back to default", st.session_id));
    }
}

void Orchestrator::step_parse_intent(SessionState& st, const CatalogSnapshot& catalog) const {
    refresh_intent(st, catalog);
    utils::log::debug(std::format("Session {}: intent={} tables=[{}]", st.session_id,
                                  question_type_to_string(st.intent.question_type),
                                  utils::join(st.matched_tables, ",")));
    advance(st, WorkflowEvent::INTENT_READY);
}

std::optional<prompts::GenerationPrompt> Orchestrator::prepare_prompt(
        SessionState& st, const CatalogSnapshot& catalog) const {
    prompts::GenerationPrompt prompt;
    prompt.question = st.working_question;
    // Samples only for a narrowed schema; the full catalog goes without them
    prompt.schema = catalog.format_for_prompt(st.matched_tables, !st.matched_tables.empty());
    prompt.intent = &st.intent;

    if (st.matched_tables.size() >= 2) {
        const auto synthesis = JoinSynthesizer::synthesize(catalog.join_graph(), st.matched_tables);
        if (synthesis.found) {
            prompt.join_hint = JoinSynthesizer::format_join_hint(synthesis.path);
        } else if (!st.join_path_reported) {
            st.join_path_reported = true;
            Diagnostic diag(DiagnosticKind::JOIN_PATH_NOT_FOUND,
                            std::format("No foreign-key path connects the tables: {}",
                                        utils::join(st.matched_tables, ", ")));
            diag.fragment = utils::join(synthesis.unreachable, ", ");
            st.diagnostics = {std::move(diag)};
            return std::nullopt;
        } else {
            prompt.join_note = std::format(
                "no foreign-key path connects {}; the question may refer to different tables, "
                "so use only tables that can be joined through the listed columns",
                utils::join(synthesis.unreachable, ", "));
        }
    }
    return prompt;
}

void Orchestrator::step_generate(SessionState& st, const CatalogSnapshot& catalog,
                                 SessionMemory& memory) const {
    auto prompt = prepare_prompt(st, catalog);
    if (!prompt) {
        utils::log::warn(std::format("Session {}: {}", st.session_id, st.diagnostics.front().message));
        advance(st, WorkflowEvent::GENERATION_FAILED);
        return;
    }

    const auto result = generator_.generate(
        *prompt, memory.format_for_generation(config_.generation_window), true);

    switch (result.outcome) {
        case SqlGenerator::Outcome::SQL:
            st.candidate_sql = result.sql;
            advance(st, WorkflowEvent::SQL_GENERATED);
            break;
        case SqlGenerator::Outcome::CHAT:
            st.final_answer = result.chat_text;
            st.is_chat_reply = true;
            advance(st, WorkflowEvent::CHAT_REPLY);
            break;
        default:
            st.diagnostics = {result.diagnostic};
            advance(st, WorkflowEvent::GENERATION_FAILED);
            break;
    }
}

void Orchestrator::step_check_ambiguity(SessionState& st, const SessionMemory& memory) const {
    const auto lowered = utils::to_lower(st.working_question);
    const AmbiguityContext ctx{st.intent, lowered, &memory};
    const auto finding = c_.ambiguity->detect(ctx);
    if (!finding) {
        advance(st, WorkflowEvent::UNAMBIGUOUS);
        return;
    }

    st.ambiguity = finding;
    if (st.clarification_round_count >= config_.limits.max_clarification_rounds) {
        utils::log::warn(std::format(
            "Session {}: still ambiguous ({}) after {} clarification rounds", st.session_id,
            finding->rule, st.clarification_round_count));
    }
    advance(st, WorkflowEvent::AMBIGUOUS);

    if (st.state == WorkflowState::FAILED) {
        st.failure_code = FailureCode::MAX_CLARIFICATION_ROUNDS_EXCEEDED;
    }
}

void Orchestrator::step_clarify(SessionState& st, const SessionMemory& memory) {
    const AmbiguityFinding finding = st.ambiguity.value_or(
        AmbiguityFinding{"general", AmbiguityKind::GENERAL, "The question is ambiguous"});

    st.pending_clarification = clarifier_.ask(
        st.working_question, finding, memory.format_for_clarification(config_.clarification_window));
    clarifications_asked_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Session {}: asking for clarification ({})",
                                 st.session_id, finding.rule));
    advance(st, WorkflowEvent::QUESTION_EMITTED);
}

void Orchestrator::step_validate(SessionState& st) const {
    st.validation = validator_.validate(st.candidate_sql);
    st.validation_passed = st.validation.valid;
    if (st.validation.valid) {
        advance(st, WorkflowEvent::SYNTAX_OK);
        return;
    }
    st.diagnostics = st.validation.diagnostics;
    if (st.diagnostics.empty()) {
        st.diagnostics.emplace_back(DiagnosticKind::SYNTAX_ERROR, "Invalid SQL");
    }
    utils::log::info(std::format("Session {}: syntax check failed: {}",
                                 st.session_id, st.diagnostics.front().message));
    advance(st, WorkflowEvent::SYNTAX_ERROR);
}

void Orchestrator::step_sandbox(SessionState& st, const CatalogSnapshot& catalog) {
    st.sandbox_decision = c_.sandbox->check(st.candidate_sql, catalog);
    const auto& decision = *st.sandbox_decision;
    if (decision.allowed) {
        if (decision.limit_injected || decision.limit_clamped) {
            utils::log::debug(std::format("Session {}: normalized SQL: {}",
                                          st.session_id, decision.normalized_sql));
        }
        advance(st, WorkflowEvent::SANDBOX_ALLOWED);
        return;
    }

    sandbox_denials_.fetch_add(1, std::memory_order_relaxed);
    const char* reason = sandbox_reason_to_string(decision.reason);

    Diagnostic diag(DiagnosticKind::SANDBOX_DENIED,
                    decision.detail.empty()
                        ? std::format("Sandbox denied the query: {}", reason)
                        : std::format("Sandbox denied the query: {} ({})", reason, decision.detail));
    diag.code = reason;
    diag.fragment = decision.detail;
    st.diagnostics = {std::move(diag)};

    SecurityEvent event;
    event.session_id = st.session_id;
    event.timestamp = utils::now();
    event.reason = decision.reason;
    event.detail = decision.detail;
    event.sql_prefix = utils::truncate_utf8(st.candidate_sql, SecurityEvent::kSqlPrefixLength);
    if (c_.turn_log) {
        c_.turn_log->record_security_event(event);
    } else {
        utils::log::warn(std::format("Sandbox denied [{}] session={} detail={}",
                                     reason, st.session_id, decision.detail));
    }

    advance(st, WorkflowEvent::SANDBOX_DENIED);
}

void Orchestrator::step_execute(SessionState& st) const {
    const auto& decision = *st.sandbox_decision;
    auto result = c_.executor->execute(decision.normalized_sql, decision.execution_budget);

    if (result.success) {
        utils::log::info(std::format("Session {}: query returned {} rows in {}us",
                                     st.session_id, result.rows.size(),
                                     result.execution_time.count()));
        st.execution_result = std::move(result);
        advance(st, WorkflowEvent::EXECUTION_SUCCEEDED);
        return;
    }

    Diagnostic diag(DiagnosticKind::EXECUTION_ERROR,
                    result.timed_out
                        ? std::format("Query exceeded the execution budget of {} ms",
                                      decision.execution_budget.count())
                        : std::format("Execution failed: {}", result.error_message));
    if (result.timed_out) diag.code = "timeout";
    utils::log::warn(std::format("Session {}: {}", st.session_id, diag.message));
    st.diagnostics = {std::move(diag)};
    st.execution_result = std::move(result);
    advance(st, WorkflowEvent::EXECUTION_FAILED);
}

void Orchestrator::step_repair(SessionState& st) const {
    advance(st, WorkflowEvent::REPAIR_REQUESTED);
    if (st.state == WorkflowState::FAILED) {
        st.failure_code = FailureCode::MAX_REGENERATIONS_EXCEEDED;
        utils::log::warn(std::format("Session {}: giving up after {} regenerations",
                                     st.session_id, st.regeneration_count));
    }
}

void Orchestrator::step_critique(SessionState& st, const CatalogSnapshot& catalog,
                                 SessionMemory& memory) const {
    ++st.regeneration_count;

    const auto schema = catalog.format_for_prompt(st.matched_tables);
    st.critique_rationale = st.candidate_sql.empty()
        ? SqlCritic::fallback_rationale(st.diagnostics)
        : critic_.critique(st.working_question, st.candidate_sql, st.diagnostics, schema);

    auto prompt = prepare_prompt(st, catalog);
    if (!prompt) {
        advance(st, WorkflowEvent::GENERATION_FAILED);
        return;
    }
    prompt->previous_sql = st.candidate_sql;
    prompt->critique = st.critique_rationale;

    const auto result = generator_.generate(
        *prompt, memory.format_for_generation(config_.generation_window), false);
    if (result.outcome != SqlGenerator::Outcome::SQL) {
        st.diagnostics = {result.diagnostic};
        advance(st, WorkflowEvent::GENERATION_FAILED);
        return;
    }

    utils::log::info(std::format("Session {}: regeneration {} produced new SQL",
                                 st.session_id, st.regeneration_count));
    st.candidate_sql = result.sql;
    st.validation = {};
    st.validation_passed = false;
    st.sandbox_decision.reset();
    st.execution_result.reset();
    advance(st, WorkflowEvent::REGENERATED);
}

void Orchestrator::step_answer(SessionState& st) const {
    if (!st.is_chat_reply) {
        st.final_answer = answer_builder_.build(st.working_question,
                                                st.sandbox_decision->normalized_sql,
                                                *st.execution_result);
    }
    advance(st, WorkflowEvent::ANSWER_READY);
}

// ============================================================================
// Archive
// ============================================================================

void Orchestrator::record_query(SessionState& st, SessionMemory& memory) const {
    if (st.query_recorded) return;
    memory.append({st.turn_index, st.is_chat_reply ? EntryKind::CHAT : EntryKind::QUERY,
                   EntryRole::USER, st.raw_question, "", ""});
    st.query_recorded = true;
}

void Orchestrator::archive(SessionState& st, SessionMemory& memory) {
    if (st.state == WorkflowState::FAILED && st.failure_code == FailureCode::NONE) {
        st.failure_code = FailureCode::INTERNAL_ERROR;
    }

    record_query(st, memory);
    if (st.state == WorkflowState::DONE) {
        memory.append({st.turn_index, st.is_chat_reply ? EntryKind::CHAT : EntryKind::ANSWER,
                       EntryRole::ASSISTANT, st.final_answer, "", ""});
        runs_done_.fetch_add(1, std::memory_order_relaxed);
        if (st.is_chat_reply) chat_replies_.fetch_add(1, std::memory_order_relaxed);
    } else {
        runs_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Session {} turn {} failed: {}", st.session_id,
                                     st.turn_index, failure_code_to_string(st.failure_code)));
    }

    if (c_.turn_log) {
        c_.turn_log->record_turn(build_turn_record(st));
    }
}

TurnRecord Orchestrator::build_turn_record(const SessionState& st) const {
    TurnRecord r;
    r.session_id = st.session_id;
    r.timestamp = utils::now();
    r.turn_index = st.turn_index;
    r.question = st.raw_question;
    r.working_question = st.working_question;
    r.intent = st.intent;
    r.matched_tables = st.matched_tables;
    r.candidate_sql = st.candidate_sql;
    r.validation_passed = st.validation_passed;
    r.regeneration_count = st.regeneration_count;
    r.clarification_round_count = st.clarification_round_count;
    if (st.sandbox_decision) {
        r.sandbox_checked = true;
        r.sandbox_decision = *st.sandbox_decision;
    }
    if (st.execution_result) {
        r.execution_summary = ExecutionSummary::from(*st.execution_result);
    }
    r.state = workflow_state_to_string(st.state);
    r.failure_code = st.failure_code;
    if (!st.diagnostics.empty() && st.state == WorkflowState::FAILED) {
        r.last_diagnostic = st.diagnostics.front().message;
    }
    r.is_chat_reply = st.is_chat_reply;
    r.step_timings = st.step_timings;
    r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - st.started_steady);
    return r;
}

QueryResponse Orchestrator::build_response(const SessionState& st) const {
    QueryResponse r;
    r.session_id = st.session_id;
    r.candidate_sql = st.candidate_sql;
    r.validation_passed = st.validation_passed;
    r.regeneration_count = st.regeneration_count;
    r.clarification_round_count = st.clarification_round_count;
    r.sandbox_decision = st.sandbox_decision;
    r.is_chat_reply = st.is_chat_reply;
    r.final_state = st.state;
    r.step_timings = st.step_timings;

    if (st.state == WorkflowState::DONE) {
        r.answer = st.final_answer;
        if (st.execution_result && st.execution_result->success) {
            r.execution_result = st.execution_result;
        }
    } else if (st.state == WorkflowState::AWAITING_USER && st.pending_clarification) {
        r.needs_clarification = true;
        r.clarification_question = st.pending_clarification->question;
        r.clarification_options = st.pending_clarification->options;
    } else if (st.state == WorkflowState::FAILED) {
        r.failed = true;
        r.failure_code = st.failure_code;
        r.failure_reason = nl2sql::failure_reason(st.failure_code);
        if (!st.diagnostics.empty()) {
            r.last_diagnostic = public_diagnostic(st.diagnostics.front());
        } else if (st.ambiguity) {
            r.last_diagnostic = st.ambiguity->reason;
        }
    }
    return r;
}

Orchestrator::Stats Orchestrator::get_stats() const {
    return {
        runs_started_.load(std::memory_order_relaxed),
        runs_done_.load(std::memory_order_relaxed),
        runs_failed_.load(std::memory_order_relaxed),
        clarifications_asked_.load(std::memory_order_relaxed),
        chat_replies_.load(std::memory_order_relaxed),
        sandbox_denials_.load(std::memory_order_relaxed),
        busy_rejections_.load(std::memory_order_relaxed)
    };
}

} // namespace nl2sql
