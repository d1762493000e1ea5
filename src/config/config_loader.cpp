#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace nl2sql {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;
constexpr uint32_t kMaxWorkflowRetries = 3;

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto&& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        if (val.is_table() && base.contains(key.str()) && base[key.str()].is_table()) {
            merge_tables(*base[key.str()].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (auto&& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path().string(), visited, depth + 1);

        // Included file is the base, the including file is the overlay
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path().string(), visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (auto&& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/**
 * @brief Read a non-negative integer setting
 * @throws std::runtime_error if the value is negative or does not fit T
 */
template <typename T>
T read_count(const toml::table& sec, std::string_view section, std::string_view key, T fallback) {
    const int64_t value = sec[key].value_or(static_cast<int64_t>(fallback));
    if (value < 0) {
        throw std::runtime_error(std::format("{}.{} must be >= 0, got {}", section, key, value));
    }
    if (static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::format("{}.{} is out of range: {}", section, key, value));
    }
    return static_cast<T>(value);
}

LlmConfig extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* sec = root["llm"].as_table();
    if (!sec) return cfg;
    cfg.provider = (*sec)["provider"].value_or(cfg.provider);
    cfg.api_key = (*sec)["api_key"].value_or(std::string());
    cfg.base_url = (*sec)["base_url"].value_or(std::string());
    cfg.model = (*sec)["model"].value_or(std::string());
    cfg.temperature = (*sec)["temperature"].value_or(cfg.temperature);
    cfg.max_tokens = static_cast<int>((*sec)["max_tokens"].value_or(int64_t{cfg.max_tokens}));
    cfg.timeout_ms = read_count<uint32_t>(*sec, "llm", "timeout_ms", cfg.timeout_ms);
    cfg.max_retries = read_count<uint32_t>(*sec, "llm", "max_retries", cfg.max_retries);
    cfg.retry_backoff_ms =
        read_count<uint32_t>(*sec, "llm", "retry_backoff_ms", cfg.retry_backoff_ms);
    cfg.max_requests_per_minute =
        read_count<uint32_t>(*sec, "llm", "max_requests_per_minute", cfg.max_requests_per_minute);
    cfg.cache_enabled = (*sec)["cache_enabled"].value_or(cfg.cache_enabled);
    cfg.cache_max_entries =
        read_count<size_t>(*sec, "llm", "cache_max_entries", cfg.cache_max_entries);
    cfg.cache_ttl_seconds =
        read_count<uint32_t>(*sec, "llm", "cache_ttl_seconds", cfg.cache_ttl_seconds);
    return cfg;
}

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* sec = root["database"].as_table();
    if (!sec) return cfg;
    cfg.connection_string = (*sec)["connection_string"].value_or(std::string());
    cfg.connect_timeout_s =
        read_count<uint32_t>(*sec, "database", "connect_timeout_s", cfg.connect_timeout_s);
    cfg.max_result_rows =
        read_count<uint32_t>(*sec, "database", "max_result_rows", cfg.max_result_rows);
    return cfg;
}

CatalogConfig extract_catalog(const toml::table& root) {
    CatalogConfig cfg;
    const auto* sec = root["catalog"].as_table();
    if (!sec) return cfg;
    cfg.path = (*sec)["path"].value_or(std::string());
    cfg.from_database = (*sec)["from_database"].value_or(cfg.from_database);
    cfg.schema = (*sec)["schema"].value_or(cfg.schema);
    cfg.row_counts = (*sec)["row_counts"].value_or(cfg.row_counts);
    cfg.sample_limit = read_count<uint32_t>(*sec, "catalog", "sample_limit", cfg.sample_limit);
    return cfg;
}

SandboxConfig extract_sandbox(const toml::table& root) {
    SandboxConfig cfg;
    const auto* sec = root["sandbox"].as_table();
    if (!sec) return cfg;
    cfg.default_limit = read_count<uint32_t>(*sec, "sandbox", "default_limit", cfg.default_limit);
    cfg.max_rows = read_count<uint32_t>(*sec, "sandbox", "max_rows", cfg.max_rows);
    cfg.max_execution_ms =
        read_count<uint32_t>(*sec, "sandbox", "max_execution_ms", cfg.max_execution_ms);
    cfg.forbidden_keywords = toml_string_array(*sec, "forbidden_keywords");
    cfg.reserved_schemas = toml_string_array(*sec, "reserved_schemas");
    cfg.forbidden_functions = toml_string_array(*sec, "forbidden_functions");
    return cfg;
}

OrchestratorConfig extract_orchestrator(const toml::table& root) {
    OrchestratorConfig cfg;
    const auto* sec = root["orchestrator"].as_table();
    if (!sec) return cfg;
    cfg.max_regenerations =
        read_count<uint32_t>(*sec, "orchestrator", "max_regenerations", cfg.max_regenerations);
    cfg.max_clarification_rounds =
        read_count<uint32_t>(*sec, "orchestrator", "max_clarification_rounds", cfg.max_clarification_rounds);
    cfg.fail_on_clarification_exhaustion =
        (*sec)["fail_on_clarification_exhaustion"].value_or(cfg.fail_on_clarification_exhaustion);
    return cfg;
}

MemoryConfig extract_memory(const toml::table& root) {
    MemoryConfig cfg;
    const auto* sec = root["memory"].as_table();
    if (!sec) return cfg;
    cfg.max_history = read_count<size_t>(*sec, "memory", "max_history", cfg.max_history);
    cfg.session_ttl_seconds =
        read_count<uint32_t>(*sec, "memory", "session_ttl_seconds", cfg.session_ttl_seconds);
    cfg.generation_window =
        read_count<size_t>(*sec, "memory", "generation_window", cfg.generation_window);
    cfg.clarification_window =
        read_count<size_t>(*sec, "memory", "clarification_window", cfg.clarification_window);
    return cfg;
}

ClarificationConfig extract_clarification(const toml::table& root) {
    ClarificationConfig cfg;
    const auto* sec = root["clarification"].as_table();
    if (!sec) return cfg;
    cfg.merge_template = (*sec)["merge_template"].value_or(cfg.merge_template);
    cfg.rules = toml_string_array(*sec, "rules");
    return cfg;
}

TurnLogConfig extract_turn_log(const toml::table& root) {
    TurnLogConfig cfg;
    const auto* sec = root["turn_log"].as_table();
    if (!sec) return cfg;
    cfg.enabled = (*sec)["enabled"].value_or(cfg.enabled);
    cfg.output_file = (*sec)["output_file"].value_or(cfg.output_file);
    cfg.security_log_file = (*sec)["security_log_file"].value_or(cfg.security_log_file);
    cfg.max_file_size_mb =
        read_count<size_t>(*sec, "turn_log", "max_file_size_mb", cfg.max_file_size_mb);
    cfg.max_files = static_cast<int>((*sec)["max_files"].value_or(int64_t{cfg.max_files}));
    cfg.rotation_interval_hours =
        read_count<uint32_t>(*sec, "turn_log", "rotation_interval_hours", cfg.rotation_interval_hours);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;
    cfg.level = (*sec)["level"].value_or(cfg.level);
    return cfg;
}

EngineConfig extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    config.llm = extract_llm(tbl);
    config.database = extract_database(tbl);
    config.catalog = extract_catalog(tbl);
    config.sandbox = extract_sandbox(tbl);
    config.orchestrator = extract_orchestrator(tbl);
    config.memory = extract_memory(tbl);
    config.clarification = extract_clarification(tbl);
    config.turn_log = extract_turn_log(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(EngineConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    static constexpr std::string_view kProviders[] = {"deepseek", "qwen", "openai", "anthropic"};
    const auto provider = utils::to_lower(config.llm.provider);
    if (std::find(std::begin(kProviders), std::end(kProviders), provider) == std::end(kProviders)) {
        errors.push_back(std::format("llm.provider '{}' is not one of deepseek, qwen, openai, anthropic",
                                     config.llm.provider));
    }
    if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
        errors.push_back(std::format("llm.temperature must be 0.0-2.0, got {}", config.llm.temperature));
    }
    if (config.llm.max_tokens <= 0) {
        errors.push_back("llm.max_tokens must be > 0");
    }
    if (config.llm.timeout_ms == 0) {
        errors.push_back("llm.timeout_ms must be > 0");
    }

    if (!config.catalog.from_database && config.catalog.path.empty()) {
        errors.push_back("catalog.path required unless catalog.from_database is true");
    }
    if (config.catalog.from_database && config.database.connection_string.empty()) {
        errors.push_back("database.connection_string required when catalog.from_database is true");
    }

    if (config.sandbox.default_limit == 0) {
        errors.push_back("sandbox.default_limit must be > 0");
    }
    if (config.sandbox.default_limit > config.sandbox.max_rows) {
        errors.push_back(std::format("sandbox.default_limit ({}) > sandbox.max_rows ({})",
                                     config.sandbox.default_limit, config.sandbox.max_rows));
    }
    if (config.sandbox.max_execution_ms == 0) {
        errors.push_back("sandbox.max_execution_ms must be > 0");
    }

    if (config.orchestrator.max_regenerations > kMaxWorkflowRetries) {
        errors.push_back(std::format("orchestrator.max_regenerations must be between 0 and {}, got {}",
                                     kMaxWorkflowRetries, config.orchestrator.max_regenerations));
    }
    if (config.orchestrator.max_clarification_rounds > kMaxWorkflowRetries) {
        errors.push_back(std::format(
            "orchestrator.max_clarification_rounds must be between 0 and {}, got {}",
            kMaxWorkflowRetries, config.orchestrator.max_clarification_rounds));
    }

    if (config.memory.max_history == 0) {
        errors.push_back("memory.max_history must be > 0");
    }

    if (config.clarification.merge_template.find("{question}") == std::string::npos ||
        config.clarification.merge_template.find("{answer}") == std::string::npos) {
        errors.push_back("clarification.merge_template must contain {question} and {answer}");
    }

    if (config.turn_log.enabled && config.turn_log.output_file.empty()) {
        errors.push_back("turn_log.output_file required when the turn log is enabled");
    }
    if (config.turn_log.max_files <= 0) {
        errors.push_back("turn_log.max_files must be > 0");
    }

    return errors;
}

} // namespace nl2sql
