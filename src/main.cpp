#include "audit/file_sink.hpp"
#include "audit/turn_log.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "executor/query_executor.hpp"
#include "intent/ambiguity_rules.hpp"
#include "llm/llm_client.hpp"
#include "memory/context_memory.hpp"
#include "orchestrator/orchestrator.hpp"
#include "schema/catalog_loader.hpp"
#include "schema/schema_catalog.hpp"
#include "security/sql_sandbox.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace nl2sql;

// =========================================================================
// Component Construction
// =========================================================================

static SchemaCatalog::LoaderFunc make_catalog_loader(const EngineConfig& cfg) {
    return [cfg]() -> Result<std::vector<TableSchema>> {
        CatalogLoader::IntrospectionOptions introspection;
        introspection.row_counts = cfg.catalog.row_counts;
        introspection.sample_limit = cfg.catalog.sample_limit;
        const auto loaded = cfg.catalog.from_database
            ? CatalogLoader::load_from_database(cfg.database.connection_string, cfg.catalog.schema,
                                                introspection)
            : CatalogLoader::load_from_file(cfg.catalog.path);
        if (!loaded.success) {
            return Result<std::vector<TableSchema>>::error(ErrorCategory::IO_ERROR,
                                                           loaded.error_message);
        }
        return Result<std::vector<TableSchema>>::ok(loaded.tables);
    };
}

static std::shared_ptr<ITextCompleter> make_completer(const LlmConfig& cfg) {
    LlmClient::Config llm;
    llm.provider = cfg.provider;
    llm.base_url = cfg.base_url;
    llm.api_key = cfg.api_key;
    llm.model = cfg.model;
    llm.timeout_ms = cfg.timeout_ms;
    llm.max_retries = cfg.max_retries;
    llm.retry_backoff_ms = cfg.retry_backoff_ms;
    llm.max_requests_per_minute = cfg.max_requests_per_minute;
    llm.cache_enabled = cfg.cache_enabled;
    llm.cache_max_entries = cfg.cache_max_entries;
    llm.cache_ttl_seconds = cfg.cache_ttl_seconds;
    return std::make_shared<LlmClient>(std::move(llm));
}

static std::shared_ptr<SqlSandbox> make_sandbox(const SandboxConfig& cfg) {
    SqlSandbox::Config sandbox;
    sandbox.default_limit = cfg.default_limit;
    sandbox.max_rows = cfg.max_rows;
    sandbox.max_execution_ms = cfg.max_execution_ms;
    if (!cfg.forbidden_keywords.empty()) sandbox.forbidden_keywords = cfg.forbidden_keywords;
    if (!cfg.reserved_schemas.empty()) sandbox.reserved_schemas = cfg.reserved_schemas;
    if (!cfg.forbidden_functions.empty()) sandbox.forbidden_functions = cfg.forbidden_functions;
    return std::make_shared<SqlSandbox>(std::move(sandbox));
}

static std::shared_ptr<AmbiguityDetector> make_detector(const ClarificationConfig& cfg) {
    auto detector = std::make_shared<AmbiguityDetector>();
    if (!cfg.rules.empty()) {
        for (const auto& unknown : detector->enable_only(cfg.rules)) {
            utils::log::warn(std::format("Unknown ambiguity rule in config: {}", unknown));
        }
    }
    return detector;
}

static FileSink::Config file_sink_config(const TurnLogConfig& cfg, const std::string& path) {
    FileSink::Config sink;
    sink.output_file = path;
    sink.max_file_size_bytes = cfg.max_file_size_mb * 1024 * 1024;
    sink.max_files = cfg.max_files;
    sink.rotation_interval = std::chrono::hours(cfg.rotation_interval_hours);
    return sink;
}

static std::shared_ptr<TurnLog> make_turn_log(const TurnLogConfig& cfg) {
    if (!cfg.enabled) {
        return nullptr;
    }
    auto turn_log = std::make_shared<TurnLog>();
    try {
        turn_log->add_sink(std::make_shared<FileSink>(file_sink_config(cfg, cfg.output_file)));
        if (!cfg.security_log_file.empty()) {
            turn_log->set_security_sink(
                std::make_shared<FileSink>(file_sink_config(cfg, cfg.security_log_file)));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Turn log disabled: {}", e.what()));
        return nullptr;
    }
    return turn_log;
}

// =========================================================================
// Output
// =========================================================================

static void print_response(const QueryResponse& r) {
    if (r.needs_clarification) {
        std::cout << r.clarification_question << "\n";
        for (size_t i = 0; i < r.clarification_options.size(); ++i) {
            std::cout << std::format("  {}. {}\n", i + 1, r.clarification_options[i]);
        }
        return;
    }
    if (r.failed) {
        std::cout << std::format("[{}] {}\n", failure_code_to_string(r.failure_code),
                                 r.failure_reason);
        if (!r.last_diagnostic.empty()) {
            std::cout << "  " << r.last_diagnostic << "\n";
        }
        return;
    }
    if (!r.is_chat_reply && r.sandbox_decision) {
        std::cout << "SQL: " << r.sandbox_decision->normalized_sql << "\n";
    }
    std::cout << r.answer << "\n";
}

// =========================================================================
// Main
// =========================================================================

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "nl2sql.toml";
    const std::string session_id = (argc > 2) ? argv[2] : utils::generate_uuid();

    const auto loaded = ConfigLoader::load_from_file(config_path);
    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return EXIT_FAILURE;
    }
    const EngineConfig& cfg = loaded.config;
    utils::log::set_level(utils::log::parse_level(cfg.logging.level));

    auto catalog = std::make_shared<SchemaCatalog>(make_catalog_loader(cfg));
    if (!catalog->reload()) {
        utils::log::error("Schema catalog could not be loaded");
        return EXIT_FAILURE;
    }
    const auto snapshot = catalog->snapshot();
    utils::log::info(std::format("Catalog loaded: {} tables (version {})",
                                 snapshot->tables().size(), snapshot->version()));

    PgQueryExecutor::Config exec_cfg;
    exec_cfg.connection_string = cfg.database.connection_string;
    exec_cfg.connect_timeout_s = cfg.database.connect_timeout_s;
    exec_cfg.max_result_rows = cfg.database.max_result_rows;

    ContextMemoryStore::Config mem_cfg;
    mem_cfg.max_history = cfg.memory.max_history;
    mem_cfg.ttl = std::chrono::seconds(cfg.memory.session_ttl_seconds);

    OrchestratorComponents components;
    components.catalog = catalog;
    components.completer = make_completer(cfg.llm);
    components.executor = std::make_shared<PgQueryExecutor>(std::move(exec_cfg));
    components.memory = std::make_shared<ContextMemoryStore>(mem_cfg);
    components.turn_log = make_turn_log(cfg.turn_log);
    components.sandbox = make_sandbox(cfg.sandbox);
    components.ambiguity = make_detector(cfg.clarification);

    Orchestrator::Config orch_cfg;
    orch_cfg.limits.max_regenerations = cfg.orchestrator.max_regenerations;
    orch_cfg.limits.max_clarification_rounds = cfg.orchestrator.max_clarification_rounds;
    orch_cfg.limits.fail_on_clarification_exhaustion =
        cfg.orchestrator.fail_on_clarification_exhaustion;
    orch_cfg.generation_window = cfg.memory.generation_window;
    orch_cfg.clarification_window = cfg.memory.clarification_window;
    orch_cfg.merge_template = cfg.clarification.merge_template;
    orch_cfg.generation.temperature = cfg.llm.temperature;
    orch_cfg.generation.max_tokens = cfg.llm.max_tokens;

    Orchestrator orchestrator(std::move(components), std::move(orch_cfg));

    utils::log::info(std::format("nl2sql ready (session {}). Type a question, or :quit.",
                                 session_id));

    std::string line;
    while (true) {
        std::cout << (orchestrator.is_awaiting_user(session_id) ? "answer> " : "question> ")
                  << std::flush;
        if (!std::getline(std::cin, line)) break;

        const auto input = utils::trim(line);
        if (input.empty()) continue;
        if (input == ":quit" || input == ":q") break;
        if (input == ":reset") {
            orchestrator.end_session(session_id);
            std::cout << "Session cleared.\n";
            continue;
        }
        if (input == ":reload") {
            std::cout << (catalog->reload() ? "Catalog reloaded.\n" : "Catalog reload failed.\n");
            continue;
        }

        print_response(orchestrator.run_query(input, session_id));
    }

    const auto stats = orchestrator.get_stats();
    utils::log::info(std::format("Shutting down: {} runs, {} done, {} failed, {} clarifications",
                                 stats.runs_started, stats.runs_done, stats.runs_failed,
                                 stats.clarifications_asked));
    return EXIT_SUCCESS;
}
