#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nl2sql {

// ============================================================================
// Config sections (mirror the TOML hierarchy of nl2sql.toml)
// ============================================================================

struct LlmConfig {
    std::string provider = "deepseek";
    std::string api_key;
    std::string base_url;               // empty: provider default
    std::string model;                  // empty: provider default
    double temperature = 0.0;
    int max_tokens = 2000;
    uint32_t timeout_ms = 30000;
    uint32_t max_retries = 2;
    uint32_t retry_backoff_ms = 1000;
    uint32_t max_requests_per_minute = 60;
    bool cache_enabled = true;
    size_t cache_max_entries = 1000;
    uint32_t cache_ttl_seconds = 3600;
};

struct DatabaseConfig {
    std::string connection_string;
    uint32_t connect_timeout_s = 10;
    uint32_t max_result_rows = 1000;
};

struct CatalogConfig {
    std::string path;                   // JSON catalog document
    bool from_database = false;         // introspect instead of reading `path`
    std::string schema = "public";
    bool row_counts = false;            // introspection: count(*) per table
    uint32_t sample_limit = 0;          // introspection: sample values per column
};

struct SandboxConfig {
    uint32_t default_limit = 200;
    uint32_t max_rows = 1000;
    uint32_t max_execution_ms = 30000;
    std::vector<std::string> forbidden_keywords;    // empty: built-in list
    std::vector<std::string> reserved_schemas;      // empty: built-in list
    std::vector<std::string> forbidden_functions;   // empty: built-in list
};

struct OrchestratorConfig {
    uint32_t max_regenerations = 3;
    uint32_t max_clarification_rounds = 3;
    bool fail_on_clarification_exhaustion = false;
};

struct MemoryConfig {
    size_t max_history = 10;
    uint32_t session_ttl_seconds = 3600;
    size_t generation_window = 5;
    size_t clarification_window = 3;
};

struct ClarificationConfig {
    std::string merge_template = "{question} ({answer})";
    std::vector<std::string> rules;     // enabled rule names; empty: all built-in
};

struct TurnLogConfig {
    bool enabled = true;
    std::string output_file = "logs/turns.jsonl";
    std::string security_log_file = "logs/security.jsonl";
    size_t max_file_size_mb = 100;
    int max_files = 10;
    uint32_t rotation_interval_hours = 24;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// EngineConfig - Complete parsed configuration
// ============================================================================

struct EngineConfig {
    LlmConfig llm;
    DatabaseConfig database;
    CatalogConfig catalog;
    SandboxConfig sandbox;
    OrchestratorConfig orchestrator;
    MemoryConfig memory;
    ClarificationConfig clarification;
    TurnLogConfig turn_log;
    LoggingConfig logging;
};

} // namespace nl2sql
