#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "orchestrator/orchestrator.hpp"
#include "audit/memory_sink.hpp"
#include "core/json.hpp"
#include "fixtures/chinook_catalog.hpp"
#include "mocks/mock_query_executor.hpp"
#include "mocks/mock_text_completer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace nl2sql;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

constexpr auto kGen = CompletionUseCase::SQL_GENERATION;
constexpr auto kCritique = CompletionUseCase::SQL_CRITIQUE;
constexpr auto kAnswer = CompletionUseCase::ANSWER;

std::string fenced(const std::string& sql) {
    return "```sql\n" + sql + "\n```";
}

struct Harness {
    std::shared_ptr<testing::MockTextCompleter> completer =
        std::make_shared<testing::MockTextCompleter>();
    std::shared_ptr<testing::MockQueryExecutor> executor =
        std::make_shared<testing::MockQueryExecutor>();
    std::shared_ptr<ContextMemoryStore> memory;
    std::shared_ptr<MemorySink> turns = std::make_shared<MemorySink>();
    std::shared_ptr<MemorySink> security = std::make_shared<MemorySink>();
    std::unique_ptr<Orchestrator> orchestrator;

    explicit Harness(Orchestrator::Config config = {},
                     std::shared_ptr<IQueryExecutor> executor_override = nullptr,
                     ContextMemoryStore::Config memory_config = {})
        : memory(std::make_shared<ContextMemoryStore>(memory_config)) {
        auto turn_log = std::make_shared<TurnLog>();
        turn_log->add_sink(turns);
        turn_log->set_security_sink(security);

        OrchestratorComponents components;
        components.catalog = testing::make_chinook_catalog();
        components.completer = completer;
        components.executor = executor_override ? executor_override : executor;
        components.memory = memory;
        components.turn_log = turn_log;
        orchestrator = std::make_unique<Orchestrator>(std::move(components), std::move(config));
    }

    [[nodiscard]] std::vector<MemoryEntry> history(const std::string& session_id) const {
        const auto session = memory->find(session_id);
        return session ? session->all() : std::vector<MemoryEntry>{};
    }
};

Orchestrator::Config no_retries() {
    Orchestrator::Config config;
    config.limits.max_regenerations = 0;
    return config;
}

/// Blocks inside execute() until released, so a run can be held in flight.
class BlockingExecutor : public IQueryExecutor {
public:
    [[nodiscard]] ExecutionResult execute(const std::string&, std::chrono::milliseconds) override {
        entered_.set_value();
        release_future_.wait();
        ExecutionResult r;
        r.success = true;
        r.columns = {"n"};
        r.rows = {{"1"}};
        return r;
    }

    void wait_entered() { entered_future_.wait(); }
    void release() { release_.set_value(); }

private:
    std::promise<void> entered_;
    std::future<void> entered_future_ = entered_.get_future();
    std::promise<void> release_;
    std::shared_future<void> release_future_ = release_.get_future().share();
};

} // anonymous namespace

// ============================================================================
// Construction and Request Checks
// ============================================================================

TEST_CASE("Orchestrator: missing components are rejected", "[orchestrator]") {
    OrchestratorComponents components;
    components.catalog = testing::make_chinook_catalog();
    components.completer = std::make_shared<testing::MockTextCompleter>();
    components.memory = std::make_shared<ContextMemoryStore>();
    CHECK_THROWS_AS(Orchestrator(components, {}), std::invalid_argument);

    components.executor = std::make_shared<testing::MockQueryExecutor>();
    components.memory.reset();
    CHECK_THROWS_AS(Orchestrator(components, {}), std::invalid_argument);
}

TEST_CASE("Orchestrator: invalid requests", "[orchestrator]") {
    Harness h;

    SECTION("empty session id") {
        const auto r = h.orchestrator->run_query("查询客户", "");
        CHECK(r.failed);
        CHECK(r.failure_code == FailureCode::INVALID_REQUEST);
        CHECK(r.final_state == WorkflowState::FAILED);
    }

    SECTION("blank question") {
        const auto r = h.orchestrator->run_query("   \n ", "s1");
        CHECK(r.failure_code == FailureCode::INVALID_REQUEST);
        CHECK_FALSE(r.failure_reason.empty());
    }

    SECTION("oversized question") {
        const std::string huge(Orchestrator::kMaxRequestLength + 1, 'a');
        CHECK(h.orchestrator->run_query(huge, "s1").failure_code == FailureCode::INVALID_REQUEST);
    }

    SECTION("resume with nothing pending") {
        const auto r = h.orchestrator->resume("s1", "1");
        CHECK(r.failure_code == FailureCode::INVALID_REQUEST);
    }

    CHECK(h.completer->requests().empty());
    CHECK(h.executor->execute_count() == 0);
    CHECK(h.orchestrator->get_stats().runs_started == 0);
}

// ============================================================================
// Happy Path
// ============================================================================

TEST_CASE("Orchestrator: question answered end to end", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced("SELECT first_name, email FROM customer LIMIT 5;"));
    h.completer->push(kAnswer, "Here are the first five customers.");
    h.executor->push_rows({"first_name", "email"},
                          {{"Luís", "luisg@embraer.com.br"}, {"Leonie", "leonekohler@surfeu.de"}});

    const auto r = h.orchestrator->run_query("查询前5个客户的名字和邮箱", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK_FALSE(r.failed);
    CHECK_FALSE(r.needs_clarification);
    CHECK_FALSE(r.is_chat_reply);
    CHECK(r.answer == "Here are the first five customers.");
    CHECK(r.candidate_sql == "SELECT first_name, email FROM customer LIMIT 5");
    CHECK(r.validation_passed);
    CHECK(r.regeneration_count == 0);
    REQUIRE(r.sandbox_decision.has_value());
    CHECK(r.sandbox_decision->allowed);
    REQUIRE(r.execution_result.has_value());
    CHECK(r.execution_result->rows.size() == 2);

    SECTION("executor receives the sandbox-normalized statement and budget") {
        REQUIRE(h.executor->statements().size() == 1);
        CHECK(h.executor->statements()[0] == r.sandbox_decision->normalized_sql);
        CHECK(h.executor->budgets()[0] == std::chrono::milliseconds(30000));
    }

    SECTION("generation prompt carries the matched schema and row limit") {
        const auto gen = h.completer->requests_for(kGen);
        REQUIRE(gen.size() == 1);
        CHECK_THAT(gen[0].user_prompt, ContainsSubstring("customer"));
        CHECK_THAT(gen[0].user_prompt, ContainsSubstring("use LIMIT 5"));
        CHECK(gen[0].context.empty());
        CHECK(h.completer->count(kCritique) == 0);
    }

    SECTION("turn is archived to memory and the turn log") {
        const auto entries = h.history("s1");
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].kind == EntryKind::QUERY);
        CHECK(entries[0].role == EntryRole::USER);
        CHECK(entries[0].content == "查询前5个客户的名字和邮箱");
        CHECK(entries[1].kind == EntryKind::ANSWER);
        CHECK(entries[1].content == r.answer);

        REQUIRE(h.turns->size() == 1);
        const auto doc = JsonValue::parse(h.turns->lines()[0]);
        CHECK(doc["state"].get<std::string>() == "DONE");
        CHECK(doc["session_id"].get<std::string>() == "s1");
        CHECK(h.security->size() == 0);

        const auto steps = doc["step_timings"];
        REQUIRE(steps.size() == 7);
        CHECK(steps[size_t{0}]["step"].get<std::string>() == "parse_intent");
        CHECK(steps[size_t{6}]["step"].get<std::string>() == "answer");
        CHECK(doc["slowest_step"].is_string());
    }

    SECTION("each step is timed in run order") {
        std::vector<std::string> steps;
        for (const auto& t : r.step_timings) steps.push_back(t.step);
        CHECK(steps == std::vector<std::string>{"parse_intent", "generate", "check_ambiguity",
                                                "validate", "sandbox", "execute", "answer"});
    }

    const auto stats = h.orchestrator->get_stats();
    CHECK(stats.runs_started == 1);
    CHECK(stats.runs_done == 1);
    CHECK(stats.runs_failed == 0);
}

TEST_CASE("Orchestrator: missing LIMIT is injected before execution", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced("SELECT name FROM genre"));
    h.completer->push(kAnswer, "Genres listed.");

    const auto r = h.orchestrator->run_query("list all genres", "s1");

    REQUIRE(r.final_state == WorkflowState::DONE);
    REQUIRE(r.sandbox_decision.has_value());
    CHECK(r.sandbox_decision->limit_injected);
    REQUIRE(h.executor->statements().size() == 1);
    CHECK(h.executor->statements()[0] == "SELECT name FROM genre LIMIT 200");
}

TEST_CASE("Orchestrator: answer builder failure falls back to a summary", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced("SELECT name FROM genre LIMIT 3"));
    h.completer->push_failure(kAnswer);

    const auto r = h.orchestrator->run_query("list three genres", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK(r.answer == "Query succeeded and returned 1 rows.");
}

// ============================================================================
// Chat Replies
// ============================================================================

TEST_CASE("Orchestrator: conversational reply skips the database", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, "你好！我可以帮你查询音乐商店的数据。");

    const auto r = h.orchestrator->run_query("你好", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK(r.is_chat_reply);
    CHECK(r.answer == "你好！我可以帮你查询音乐商店的数据。");
    CHECK(r.candidate_sql.empty());
    CHECK_FALSE(r.execution_result.has_value());
    CHECK(h.executor->execute_count() == 0);
    CHECK(h.completer->count(kAnswer) == 0);

    const auto entries = h.history("s1");
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].kind == EntryKind::CHAT);
    CHECK(entries[1].kind == EntryKind::CHAT);
    CHECK(entries[1].role == EntryRole::ASSISTANT);

    CHECK(h.orchestrator->get_stats().chat_replies == 1);
}

// ============================================================================
// Clarification
// ============================================================================

TEST_CASE("Orchestrator: ambiguous question parks for clarification", "[orchestrator]") {
    Harness h;
    h.completer->set_default(kGen, fenced("SELECT name FROM genre LIMIT 1"));
    h.completer->set_default(kAnswer, "Rock");

    const auto first = h.orchestrator->run_query("Which is the most popular genre?", "s1");

    REQUIRE(first.needs_clarification);
    CHECK(first.final_state == WorkflowState::AWAITING_USER);
    CHECK_FALSE(first.failed);
    CHECK_FALSE(first.clarification_question.empty());
    CHECK(first.clarification_options ==
          std::vector<std::string>{"This year", "Last year", "Past 30 days", "All time"});
    CHECK(h.orchestrator->is_awaiting_user("s1"));
    CHECK(h.executor->execute_count() == 0);
    CHECK(h.turns->size() == 0);
    CHECK(h.orchestrator->get_stats().clarifications_asked == 1);

    // The question is already in memory while parked
    REQUIRE(h.history("s1").size() == 1);
    CHECK(h.history("s1")[0].kind == EntryKind::QUERY);

    SECTION("resume with an option number") {
        const auto r = h.orchestrator->resume("s1", "1");

        CHECK(r.final_state == WorkflowState::DONE);
        CHECK(r.answer == "Rock");
        CHECK(r.clarification_round_count == 1);
        CHECK_FALSE(h.orchestrator->is_awaiting_user("s1"));

        // The trace spans both halves of the run
        REQUIRE_FALSE(r.step_timings.empty());
        CHECK(r.step_timings.front().step == "parse_intent");
        CHECK(std::any_of(r.step_timings.begin(), r.step_timings.end(),
                          [](const StepTiming& t) { return t.step == "clarify"; }));
        CHECK(r.step_timings.back().step == "answer");

        const auto gen = h.completer->requests_for(kGen);
        REQUIRE(gen.size() == 2);
        CHECK_THAT(gen[1].user_prompt,
                   ContainsSubstring("Which is the most popular genre? (This year)"));
        CHECK(gen[1].context == "User: Which is the most popular genre?\n");

        const auto entries = h.history("s1");
        REQUIRE(entries.size() == 4);
        CHECK(entries[1].kind == EntryKind::CLARIFICATION);
        CHECK(entries[1].role == EntryRole::ASSISTANT);
        CHECK_THAT(entries[1].content, ContainsSubstring("\n1. This year"));
        CHECK(entries[2].kind == EntryKind::CLARIFICATION);
        CHECK(entries[2].role == EntryRole::USER);
        CHECK(entries[2].content == "This year");
        CHECK(entries[3].kind == EntryKind::ANSWER);

        REQUIRE(h.turns->size() == 1);
        const auto doc = JsonValue::parse(h.turns->lines()[0]);
        CHECK(doc["question"].get<std::string>() == "Which is the most popular genre?");
    }

    SECTION("next question on a parked session is taken as the answer") {
        const auto r = h.orchestrator->run_query("Last year", "s1");

        CHECK(r.final_state == WorkflowState::DONE);
        CHECK(r.clarification_round_count == 1);
        CHECK(h.orchestrator->get_stats().runs_started == 1);
    }

    SECTION("ending the session drops the parked run") {
        h.orchestrator->end_session("s1");
        CHECK_FALSE(h.orchestrator->is_awaiting_user("s1"));
        CHECK(h.memory->find("s1") == nullptr);
        CHECK(h.orchestrator->resume("s1", "1").failure_code == FailureCode::INVALID_REQUEST);
    }
}

TEST_CASE("Orchestrator: idle sessions are evicted after the memory TTL", "[orchestrator]") {
    ContextMemoryStore::Config memory_config;
    memory_config.ttl = std::chrono::seconds{0};
    Harness h({}, nullptr, memory_config);
    h.completer->set_default(kGen, fenced("SELECT name FROM genre LIMIT 1"));
    h.completer->set_default(kAnswer, "Rock");

    const auto parked = h.orchestrator->run_query("Which is the most popular genre?", "idle");
    REQUIRE(parked.needs_clarification);
    REQUIRE(h.orchestrator->is_awaiting_user("idle"));
    CHECK(h.orchestrator->tracked_sessions() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    const auto other = h.orchestrator->run_query("List every genre name", "active");
    CHECK(other.final_state == WorkflowState::DONE);

    CHECK_FALSE(h.orchestrator->is_awaiting_user("idle"));
    CHECK(h.memory->find("idle") == nullptr);
    CHECK(h.orchestrator->tracked_sessions() == 1);
    CHECK(h.orchestrator->resume("idle", "1").failure_code == FailureCode::INVALID_REQUEST);

    SECTION("sessions within the TTL are kept") {
        Harness fresh;
        fresh.completer->set_default(kGen, fenced("SELECT name FROM genre LIMIT 1"));
        fresh.completer->set_default(kAnswer, "Rock");
        REQUIRE(fresh.orchestrator->run_query("Which is the most popular genre?", "a")
                    .needs_clarification);
        (void)fresh.orchestrator->run_query("List every genre name", "b");
        CHECK(fresh.orchestrator->is_awaiting_user("a"));
        CHECK(fresh.orchestrator->tracked_sessions() == 2);
    }
}

TEST_CASE("Orchestrator: clarification rounds are bounded", "[orchestrator]") {
    SECTION("exhaustion proceeds with the best-effort query") {
        Orchestrator::Config config;
        config.limits.max_clarification_rounds = 0;
        Harness h(config);
        h.completer->set_default(kGen, fenced("SELECT name FROM genre LIMIT 1"));
        h.completer->set_default(kAnswer, "Rock");

        const auto r = h.orchestrator->run_query("Which is the most popular genre?", "s1");
        CHECK(r.final_state == WorkflowState::DONE);
        CHECK_FALSE(r.needs_clarification);
        CHECK(h.orchestrator->get_stats().clarifications_asked == 0);
    }

    SECTION("exhaustion fails when configured to") {
        Orchestrator::Config config;
        config.limits.max_clarification_rounds = 0;
        config.limits.fail_on_clarification_exhaustion = true;
        Harness h(config);
        h.completer->set_default(kGen, fenced("SELECT name FROM genre LIMIT 1"));

        const auto r = h.orchestrator->run_query("Which is the most popular genre?", "s1");
        CHECK(r.failed);
        CHECK(r.failure_code == FailureCode::MAX_CLARIFICATION_ROUNDS_EXCEEDED);
        CHECK(r.last_diagnostic == "A ranking question has no time range");
        CHECK(h.executor->execute_count() == 0);
    }
}

// ============================================================================
// Critique and Regeneration
// ============================================================================

TEST_CASE("Orchestrator: sandbox denial is repaired by regeneration", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced("DROP TABLE customer"));
    h.completer->push(kCritique, "The query must only read data.");
    h.completer->push(kGen, fenced("SELECT first_name FROM customer LIMIT 5"));
    h.completer->push(kAnswer, "Five customers.");

    const auto r = h.orchestrator->run_query("查询前5个客户的名字", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK(r.regeneration_count == 1);
    CHECK(r.candidate_sql == "SELECT first_name FROM customer LIMIT 5");
    CHECK(h.executor->execute_count() == 1);

    const auto gen = h.completer->requests_for(kGen);
    REQUIRE(gen.size() == 2);
    CHECK_THAT(gen[1].user_prompt, ContainsSubstring("DROP TABLE customer"));
    CHECK_THAT(gen[1].user_prompt, ContainsSubstring("The query must only read data."));

    const auto critique = h.completer->requests_for(kCritique);
    REQUIRE(critique.size() == 1);
    CHECK_THAT(critique[0].user_prompt, ContainsSubstring("FORBIDDEN_KEYWORD (drop)"));

    REQUIRE(h.security->size() == 1);
    const auto event = JsonValue::parse(h.security->lines()[0]);
    CHECK(event["session_id"].get<std::string>() == "s1");
    CHECK(h.orchestrator->get_stats().sandbox_denials == 1);
}

TEST_CASE("Orchestrator: regeneration budget is enforced", "[orchestrator]") {
    Harness h;
    h.completer->set_default(kGen, fenced("SELECT * FORM customer"));

    const auto r = h.orchestrator->run_query("list customers", "s1");

    CHECK(r.failed);
    CHECK(r.final_state == WorkflowState::FAILED);
    CHECK(r.failure_code == FailureCode::MAX_REGENERATIONS_EXCEEDED);
    CHECK(r.failure_reason == failure_reason(FailureCode::MAX_REGENERATIONS_EXCEEDED));
    CHECK_THAT(r.last_diagnostic, StartsWith("The generated SQL has a syntax error"));
    CHECK_THAT(r.last_diagnostic, !ContainsSubstring("FORM"));
    CHECK_THAT(r.last_diagnostic, !ContainsSubstring("at or near"));
    CHECK(r.regeneration_count == 3);
    CHECK_FALSE(r.validation_passed);
    CHECK_FALSE(r.execution_result.has_value());

    // One initial generation plus one per regeneration
    CHECK(h.completer->count(kGen) == 4);
    CHECK(h.completer->count(kCritique) == 3);
    CHECK(h.executor->execute_count() == 0);

    REQUIRE(h.turns->size() == 1);
    const auto doc = JsonValue::parse(h.turns->lines()[0]);
    CHECK(doc["state"].get<std::string>() == "FAILED");
    CHECK(doc["failure_code"].get<std::string>() == "MAX_REGENERATIONS_EXCEEDED");
    CHECK(doc["regeneration_count"].get<int>() == 3);

    const auto stats = h.orchestrator->get_stats();
    CHECK(stats.runs_failed == 1);
    CHECK(stats.runs_done == 0);
}

TEST_CASE("Orchestrator: failures are reported without internal detail", "[orchestrator]") {
    SECTION("execution timeout") {
        Harness h(no_retries());
        h.completer->push(kGen, fenced("SELECT name FROM genre LIMIT 3"));
        h.executor->push_error("canceling statement due to statement timeout", true);

        const auto r = h.orchestrator->run_query("list three genres", "s1");
        CHECK(r.failure_code == FailureCode::MAX_REGENERATIONS_EXCEEDED);
        CHECK(r.last_diagnostic == "The query exceeded its execution time budget.");
        CHECK_FALSE(r.execution_result.has_value());
    }

    SECTION("database error") {
        Harness h(no_retries());
        h.completer->push(kGen, fenced("SELECT name FROM genre LIMIT 3"));
        h.executor->push_error("relation \"genre\" is locked by pid 4711");

        const auto r = h.orchestrator->run_query("list three genres", "s1");
        CHECK(r.last_diagnostic == "The database rejected the query.");
        CHECK_THAT(r.last_diagnostic, !ContainsSubstring("4711"));
    }

    SECTION("collaborator timeout") {
        Harness h(no_retries());
        h.completer->push_failure(kGen, true);

        const auto r = h.orchestrator->run_query("list three genres", "s1");
        CHECK(r.failed);
        CHECK(r.last_diagnostic == "The language model did not respond in time.");
    }

    SECTION("sandbox denial") {
        Harness h(no_retries());
        h.completer->push(kGen, fenced("SELECT * FROM pg_catalog.pg_user"));

        const auto r = h.orchestrator->run_query("list three genres", "s1");
        CHECK(r.failed);
        CHECK_THAT(r.last_diagnostic, StartsWith("Query rejected by the security sandbox"));
        REQUIRE(r.sandbox_decision.has_value());
        CHECK_FALSE(r.sandbox_decision->allowed);
        CHECK(h.security->size() == 1);
    }
}

TEST_CASE("Orchestrator: public diagnostics hide parser and database text", "[orchestrator]") {
    Diagnostic syntax(DiagnosticKind::SYNTAX_ERROR, "syntax error at or near \"FORM\"");
    syntax.fragment = "FORM customer";
    syntax.position = 10;
    CHECK(public_diagnostic(syntax) == "The generated SQL has a syntax error at position 10.");

    syntax.position.reset();
    CHECK(public_diagnostic(syntax) == "The generated SQL has a syntax error.");

    Diagnostic denied(DiagnosticKind::SANDBOX_DENIED, "pg_catalog.pg_authid");
    denied.code = "FORBIDDEN_SCHEMA";
    CHECK(public_diagnostic(denied) == "Query rejected by the security sandbox (FORBIDDEN_SCHEMA)");

    Diagnostic db(DiagnosticKind::EXECUTION_ERROR, "relation \"secret\" does not exist");
    CHECK(public_diagnostic(db) == "The database rejected the query.");
}

TEST_CASE("Orchestrator: execution error is retried with a new query", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced("SELECT name FROM genre LIMIT 3"));
    h.completer->push(kGen, fenced("SELECT genre_id, name FROM genre LIMIT 3"));
    h.completer->set_default(kAnswer, "Three genres.");
    h.executor->push_error("statement timeout", true);

    const auto r = h.orchestrator->run_query("list three genres", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK(r.regeneration_count == 1);
    CHECK(h.executor->execute_count() == 2);
    CHECK(h.executor->statements()[1] == "SELECT genre_id, name FROM genre LIMIT 3");
}

TEST_CASE("Orchestrator: unjoinable tables are reported once then noted", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced("SELECT first_name FROM customer LIMIT 3"));
    h.completer->set_default(kAnswer, "Three customers.");

    const auto r = h.orchestrator->run_query("Show customers and app_setting", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK(r.regeneration_count == 1);

    // The first attempt never reaches the completer; no SQL means no critique call
    CHECK(h.completer->count(kCritique) == 0);
    const auto gen = h.completer->requests_for(kGen);
    REQUIRE(gen.size() == 1);
    CHECK_THAT(gen[0].user_prompt, ContainsSubstring("Note: no foreign-key path connects"));
}

TEST_CASE("Orchestrator: multi-table question gets a join hint", "[orchestrator]") {
    Harness h;
    h.completer->push(kGen, fenced(
        "SELECT c.first_name, g.name FROM customer c "
        "JOIN invoice i ON i.customer_id = c.customer_id "
        "JOIN invoice_line il ON il.invoice_id = i.invoice_id "
        "JOIN track t ON t.track_id = il.track_id "
        "LEFT JOIN genre g ON g.genre_id = t.genre_id LIMIT 10"));
    h.completer->set_default(kAnswer, "Done.");

    const auto r = h.orchestrator->run_query("list customers and genres", "s1");

    CHECK(r.final_state == WorkflowState::DONE);
    CHECK(r.regeneration_count == 0);
    const auto gen = h.completer->requests_for(kGen);
    REQUIRE(gen.size() == 1);
    CHECK_THAT(gen[0].user_prompt, ContainsSubstring("Join path (derived from foreign keys):"));
    CHECK_THAT(gen[0].user_prompt,
               ContainsSubstring("invoice.customer_id = customer.customer_id"));
}

// ============================================================================
// Sessions
// ============================================================================

TEST_CASE("Orchestrator: follow-up questions see earlier turns", "[orchestrator]") {
    Harness h;
    h.completer->set_default(kGen, fenced("SELECT first_name FROM customer LIMIT 5"));
    h.completer->set_default(kAnswer, "Five customers.");

    REQUIRE(h.orchestrator->run_query("查询前5个客户的名字", "s1").final_state == WorkflowState::DONE);
    REQUIRE(h.orchestrator->run_query("查询前5个客户的邮箱", "s1").final_state == WorkflowState::DONE);
    REQUIRE(h.orchestrator->run_query("查询前5个客户的名字", "s2").final_state == WorkflowState::DONE);

    const auto gen = h.completer->requests_for(kGen);
    REQUIRE(gen.size() == 3);
    CHECK(gen[1].context == "User: 查询前5个客户的名字\nAssistant: Five customers.\n");
    CHECK(gen[2].context.empty());

    REQUIRE(h.turns->size() == 3);
    CHECK(JsonValue::parse(h.turns->lines()[1])["turn_index"].get<int>() == 1);
    CHECK(JsonValue::parse(h.turns->lines()[2])["turn_index"].get<int>() == 0);
}

TEST_CASE("Orchestrator: concurrent call on a running session is rejected", "[orchestrator]") {
    auto blocking = std::make_shared<BlockingExecutor>();
    Harness h({}, blocking);
    h.completer->set_default(kGen, fenced("SELECT name FROM genre LIMIT 1"));
    h.completer->set_default(kAnswer, "Rock");

    auto first = std::async(std::launch::async, [&] {
        return h.orchestrator->run_query("list one genre", "s1");
    });
    blocking->wait_entered();

    const auto busy = h.orchestrator->run_query("list one genre", "s1");
    CHECK(busy.failure_code == FailureCode::SESSION_BUSY);
    CHECK(h.orchestrator->resume("s1", "1").failure_code == FailureCode::SESSION_BUSY);

    blocking->release();
    CHECK(first.get().final_state == WorkflowState::DONE);
    CHECK(h.orchestrator->get_stats().busy_rejections == 2);
}
