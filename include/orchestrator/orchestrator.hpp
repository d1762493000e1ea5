#pragma once

#include "audit/turn_log.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "executor/query_executor.hpp"
#include "intent/ambiguity_rules.hpp"
#include "intent/intent_parser.hpp"
#include "llm/text_completer.hpp"
#include "memory/context_memory.hpp"
#include "orchestrator/answer_builder.hpp"
#include "orchestrator/clarifier.hpp"
#include "orchestrator/session_state.hpp"
#include "orchestrator/sql_critic.hpp"
#include "orchestrator/sql_generator.hpp"
#include "orchestrator/state_machine.hpp"
#include "parser/sql_validator.hpp"
#include "schema/schema_catalog.hpp"
#include "security/sql_sandbox.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nl2sql {

/**
 * @brief Collaborators and shared state the orchestrator is built from
 *
 * catalog, completer, executor and memory are required. A null sandbox or
 * ambiguity detector is replaced by the default one; a null turn log
 * disables turn records.
 */
struct OrchestratorComponents {
    std::shared_ptr<SchemaCatalog> catalog;
    std::shared_ptr<ITextCompleter> completer;
    std::shared_ptr<IQueryExecutor> executor;
    std::shared_ptr<ContextMemoryStore> memory;
    std::shared_ptr<TurnLog> turn_log;
    std::shared_ptr<SqlSandbox> sandbox;
    std::shared_ptr<AmbiguityDetector> ambiguity;
};

/**
 * @brief What the caller gets back from run_query() / resume()
 */
struct QueryResponse {
    std::string session_id;
    std::string candidate_sql;
    bool validation_passed = false;
    uint32_t regeneration_count = 0;
    uint32_t clarification_round_count = 0;
    std::optional<ExecutionResult> execution_result;   // set on success only
    std::optional<SandboxDecision> sandbox_decision;
    std::string answer;

    bool needs_clarification = false;
    std::string clarification_question;
    std::vector<std::string> clarification_options;

    bool is_chat_reply = false;
    bool failed = false;
    FailureCode failure_code = FailureCode::NONE;
    std::string failure_reason;         // fixed text for failure_code
    std::string last_diagnostic;        // caller-safe rendering of the last failure
    WorkflowState final_state = WorkflowState::START;
    std::vector<StepTiming> step_timings;

    [[nodiscard]] static QueryResponse rejected(std::string session_id, FailureCode code) {
        QueryResponse r;
        r.session_id = std::move(session_id);
        r.failed = true;
        r.failure_code = code;
        r.failure_reason = nl2sql::failure_reason(code);
        r.final_state = WorkflowState::FAILED;
        return r;
    }
};

/**
 * @brief Top-level session state machine
 *
 * Drives one question through intent, generation, clarification,
 * validation, sandbox, execution and answer. Routing goes through the pure
 * next_state() function; this class performs the step for each state and
 * feeds the outcome back as an event. Every loop is bounded by the limits
 * in Config, so a run always ends in DONE, FAILED or AWAITING_USER.
 *
 * Sessions parked at AWAITING_USER are kept here until resumed, ended, or
 * idle for longer than the context memory TTL.
 *
 * Thread-safety: distinct sessions run concurrently; a second call for a
 * session that is still running is rejected with SESSION_BUSY.
 */
class Orchestrator {
public:
    struct Config {
        WorkflowLimits limits;
        size_t generation_window = 5;
        size_t clarification_window = 3;
        std::string merge_template = std::string(Clarifier::kDefaultMergeTemplate);
        SqlGenerator::Options generation;
    };

    /// Questions longer than this are rejected outright (longer than the intent cap).
    static constexpr size_t kMaxRequestLength = 16 * 1024;

    Orchestrator(OrchestratorComponents components, Config config);

    /**
     * @brief Answer a question
     *
     * If the session is parked waiting for a clarification, `question` is
     * taken as the answer to it.
     */
    [[nodiscard]] QueryResponse run_query(const std::string& question,
                                          const std::string& session_id);

    /// Continue a parked session with the user's clarification answer.
    [[nodiscard]] QueryResponse resume(const std::string& session_id, const std::string& answer);

    /// Drop any parked run and the session's context memory.
    void end_session(const std::string& session_id);

    [[nodiscard]] bool is_awaiting_user(const std::string& session_id) const;

    /// Sessions with a parked run or a turn counter.
    [[nodiscard]] size_t tracked_sessions() const;

    struct Stats {
        uint64_t runs_started = 0;
        uint64_t runs_done = 0;
        uint64_t runs_failed = 0;
        uint64_t clarifications_asked = 0;
        uint64_t chat_replies = 0;
        uint64_t sandbox_denials = 0;
        uint64_t busy_rejections = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    /// Releases the busy mark of a session on scope exit.
    class BusyGuard;

    [[nodiscard]] bool try_acquire(const std::string& session_id);
    void release(const std::string& session_id);

    /// Drop parked runs and turn counters idle for longer than the memory TTL.
    void evict_idle_sessions();

    [[nodiscard]] QueryResponse start_run(const std::string& question,
                                          const std::string& session_id);
    [[nodiscard]] QueryResponse continue_run(SessionState state, const std::string& answer);

    /// Run steps until the state is terminal or AWAITING_USER.
    [[nodiscard]] QueryResponse drive(SessionState& st);

    void advance(SessionState& st, WorkflowEvent event) const;

    // ===== Steps =====
    void step_parse_intent(SessionState& st, const CatalogSnapshot& catalog) const;
    void step_generate(SessionState& st, const CatalogSnapshot& catalog, SessionMemory& memory) const;
    void step_check_ambiguity(SessionState& st, const SessionMemory& memory) const;
    void step_clarify(SessionState& st, const SessionMemory& memory);
    void step_validate(SessionState& st) const;
    void step_sandbox(SessionState& st, const CatalogSnapshot& catalog);
    void step_execute(SessionState& st) const;
    void step_repair(SessionState& st) const;
    void step_critique(SessionState& st, const CatalogSnapshot& catalog, SessionMemory& memory) const;
    void step_answer(SessionState& st) const;

    /// Prompt for (re)generation; nullopt when the join path check raised a diagnostic.
    [[nodiscard]] std::optional<prompts::GenerationPrompt> prepare_prompt(
        SessionState& st, const CatalogSnapshot& catalog) const;

    void refresh_intent(SessionState& st, const CatalogSnapshot& catalog) const;
    void record_query(SessionState& st, SessionMemory& memory) const;
    void archive(SessionState& st, SessionMemory& memory);

    [[nodiscard]] QueryResponse build_response(const SessionState& st) const;
    [[nodiscard]] TurnRecord build_turn_record(const SessionState& st) const;

    OrchestratorComponents c_;
    Config config_;

    IntentParser intent_parser_;
    SqlValidator validator_;
    SqlGenerator generator_;
    SqlCritic critic_;
    Clarifier clarifier_;
    AnswerBuilder answer_builder_;

    struct ParkedRun {
        SessionState state;
        std::chrono::steady_clock::time_point parked_at;
    };
    struct TurnCounter {
        uint32_t next = 0;
        std::chrono::steady_clock::time_point last_used;
    };

    // Parked sessions, busy marks and per-session turn counters
    std::unordered_map<std::string, ParkedRun> parked_;
    std::unordered_set<std::string> busy_;
    std::unordered_map<std::string, TurnCounter> next_turn_;
    mutable std::mutex sessions_mutex_;

    // Stats
    std::atomic<uint64_t> runs_started_{0};
    std::atomic<uint64_t> runs_done_{0};
    std::atomic<uint64_t> runs_failed_{0};
    std::atomic<uint64_t> clarifications_asked_{0};
    std::atomic<uint64_t> chat_replies_{0};
    std::atomic<uint64_t> sandbox_denials_{0};
    std::atomic<uint64_t> busy_rejections_{0};
};

/**
 * @brief Caller-safe text for a diagnostic
 *
 * Parser and database messages never reach the caller: syntax errors keep
 * only their position, sandbox denials their reason code, and execution and
 * collaborator failures become a fixed sentence.
 */
[[nodiscard]] std::string public_diagnostic(const Diagnostic& diagnostic);

} // namespace nl2sql
