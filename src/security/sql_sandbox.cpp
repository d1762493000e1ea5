#include "security/sql_sandbox.hpp"
#include "parser/query_analyzer.hpp"
#include "parser/sql_text.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>
#include <unordered_map>

namespace nl2sql {

static constexpr std::string_view kSelectStmt = "SelectStmt";
static constexpr std::string_view kSystemRelationPrefix = "pg_";

namespace sandbox_defaults {

std::vector<std::string> forbidden_keywords() {
    return {
        "insert", "update", "delete", "drop", "alter", "truncate", "create",
        "grant", "revoke", "rename", "replace", "merge", "copy",
        "into outfile", "load data",
        "sleep", "pg_sleep", "benchmark",
        "exec", "execute", "call", "procedure", "function",
        "lock", "unlock", "flush", "kill", "shutdown",
        "vacuum", "reindex", "listen", "notify"
    };
}

std::vector<std::string> forbidden_functions() {
    return {
        "set_config", "current_setting",
        "nextval", "setval",
        "query_to_xml", "query_to_xml_and_xmlschema", "cursor_to_xml",
        "table_to_xml", "schema_to_xml", "database_to_xml",
        "inet_server_addr", "inet_server_port", "inet_client_addr",
        "txid_current", "txid_current_snapshot"
    };
}

std::vector<std::string> forbidden_function_prefixes() {
    return {"pg_", "lo_", "dblink"};
}

std::vector<std::string> reserved_schemas() {
    return {"pg_catalog", "information_schema", "pg_toast",
            "mysql", "sys", "performance_schema"};
}

} // namespace sandbox_defaults

namespace {

SandboxDecision deny(SandboxReason reason, std::string detail) {
    SandboxDecision decision;
    decision.allowed = false;
    decision.reason = reason;
    decision.detail = std::move(detail);
    return decision;
}

/**
 * Replace the LIMIT literal starting at `location` with `value`.
 * The literal is an optional '-', optional spaces, then digits.
 */
std::optional<std::string> replace_limit_literal(const std::string& sql, int location,
                                                 uint32_t value) {
    if (location < 0 || static_cast<size_t>(location) >= sql.size()) return std::nullopt;
    size_t pos = static_cast<size_t>(location);
    size_t end = pos;
    if (sql[end] == '-') {
        ++end;
        while (end < sql.size() && std::isspace(static_cast<unsigned char>(sql[end]))) ++end;
    }
    const size_t digits_start = end;
    while (end < sql.size() && std::isdigit(static_cast<unsigned char>(sql[end]))) ++end;
    if (end == digits_start) return std::nullopt;

    std::string out = sql.substr(0, pos);
    out += std::to_string(value);
    out += sql.substr(end);
    return out;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

SqlSandbox::SqlSandbox() = default;

SqlSandbox::SqlSandbox(Config config)
    : config_(std::move(config)) {
    for (auto& kw : config_.forbidden_keywords) kw = utils::to_lower(kw);
    for (auto& schema : config_.reserved_schemas) schema = utils::to_lower(schema);
    for (auto& fn : config_.forbidden_functions) fn = utils::to_lower(fn);
    for (auto& prefix : config_.forbidden_function_prefixes) prefix = utils::to_lower(prefix);
}

bool SqlSandbox::is_system_function(const std::string& name) const {
    for (const auto& prefix : config_.forbidden_function_prefixes) {
        if (name.starts_with(prefix)) return true;
    }
    return std::find(config_.forbidden_functions.begin(), config_.forbidden_functions.end(), name)
        != config_.forbidden_functions.end();
}

bool SqlSandbox::is_reserved_schema(const std::string& schema) const {
    return std::find(config_.reserved_schemas.begin(), config_.reserved_schemas.end(), schema)
        != config_.reserved_schemas.end();
}

// ============================================================================
// Check
// ============================================================================

SandboxDecision SqlSandbox::check(std::string_view sql, const CatalogSnapshot& catalog) const {
    // ---- 1. Keywords, comments, statement count and shape ----

    const auto lowered = utils::to_lower(sql);
    for (const auto& keyword : config_.forbidden_keywords) {
        if (utils::contains_word(lowered, keyword)) {
            return deny(SandboxReason::FORBIDDEN_KEYWORD, keyword);
        }
    }

    const std::string stripped = sql_text::strip_terminator(sql_text::strip_comments(sql));
    if (stripped.empty()) {
        return deny(SandboxReason::EMPTY_SQL, "");
    }

    const auto statements = QueryAnalyzer::count_statements(stripped);
    if (!statements) {
        return deny(SandboxReason::UNPARSEABLE, "scanner error");
    }
    if (*statements > 1) {
        return deny(SandboxReason::MULTI_STATEMENT, std::format("{} statements", *statements));
    }

    const auto analysis = QueryAnalyzer::analyze(stripped);
    if (!analysis.success) {
        return deny(SandboxReason::UNPARSEABLE, analysis.error_message);
    }
    const QueryShape& shape = analysis.shape;

    if (shape.statement_count != 1) {
        return deny(SandboxReason::MULTI_STATEMENT,
                    std::format("{} statements", shape.statement_count));
    }
    if (shape.statement_kind != kSelectStmt) {
        return deny(SandboxReason::NOT_READ_ONLY, shape.statement_kind);
    }
    if (shape.has_into) {
        return deny(SandboxReason::NOT_READ_ONLY, "SELECT INTO");
    }

    // ---- 2. Identifier allow-list ----

    const auto is_system_relation = [&](const RelationRef& rel) {
        if (!rel.schema.empty()) return is_reserved_schema(rel.schema);
        return rel.name.starts_with(kSystemRelationPrefix) && !catalog.has_table(rel.name);
    };

    std::unordered_map<std::string, std::string> qualifiers;   // alias or name -> table
    std::set<std::string> system_qualifiers;
    std::set<std::string> tables;
    bool touches_system = false;

    for (const auto& rel : shape.relations) {
        if (is_system_relation(rel)) {
            touches_system = true;
            system_qualifiers.insert(rel.alias.empty() ? rel.name : rel.alias);
            continue;
        }
        if (rel.schema.empty() && shape.cte_names.contains(rel.name)) {
            continue;
        }
        if (!catalog.has_table(rel.name)) {
            return deny(SandboxReason::UNKNOWN_IDENTIFIER, rel.name);
        }
        tables.insert(rel.name);
        qualifiers[rel.name] = rel.name;
        if (!rel.alias.empty()) qualifiers[rel.alias] = rel.name;
    }

    std::set<std::string> identifiers(tables.begin(), tables.end());

    const auto table_with_column = [&](const std::string& column) -> std::string {
        for (const auto& table : tables) {
            if (catalog.has_column(table, column)) return table;
        }
        return "";
    };

    for (const auto& ref : shape.columns) {
        if (ref.parts.empty()) continue;   // bare *

        if (ref.parts.size() == 1) {
            const auto& column = ref.parts[0];
            if (ref.star) continue;
            const auto owner = table_with_column(column);
            if (!owner.empty()) {
                identifiers.insert(std::format("{}.{}", owner, column));
                continue;
            }
            if (shape.output_names.contains(column) || touches_system) continue;
            return deny(SandboxReason::UNKNOWN_IDENTIFIER, column);
        }

        if (ref.parts.size() == 2) {
            const auto& qualifier = ref.parts[0];
            const auto& column = ref.parts[1];
            if (system_qualifiers.contains(qualifier)) continue;

            if (shape.cte_names.contains(qualifier) || shape.derived_aliases.contains(qualifier)) {
                if (ref.star || shape.output_names.contains(column) ||
                    !table_with_column(column).empty()) {
                    continue;
                }
                return deny(SandboxReason::UNKNOWN_IDENTIFIER,
                            std::format("{}.{}", qualifier, column));
            }

            const auto it = qualifiers.find(qualifier);
            if (it == qualifiers.end()) {
                return deny(SandboxReason::UNKNOWN_IDENTIFIER, qualifier);
            }
            if (ref.star) continue;
            if (!catalog.has_column(it->second, column)) {
                return deny(SandboxReason::UNKNOWN_IDENTIFIER,
                            std::format("{}.{}", qualifier, column));
            }
            identifiers.insert(std::format("{}.{}", it->second, column));
            continue;
        }

        // schema.table.column
        const auto& schema = ref.parts[ref.parts.size() - 3];
        const auto& table = ref.parts[ref.parts.size() - 2];
        const auto& column = ref.parts.back();
        if (is_reserved_schema(schema)) continue;
        if (!catalog.has_table(table)) {
            return deny(SandboxReason::UNKNOWN_IDENTIFIER, table);
        }
        if (!ref.star && !catalog.has_column(table, column)) {
            return deny(SandboxReason::UNKNOWN_IDENTIFIER, std::format("{}.{}", table, column));
        }
        if (!ref.star) identifiers.insert(std::format("{}.{}", table, column));
    }

    // ---- 3. Reserved schemas ----

    for (const auto& rel : shape.relations) {
        if (is_system_relation(rel)) {
            return deny(SandboxReason::FORBIDDEN_SCHEMA,
                        rel.schema.empty() ? rel.name : std::format("{}.{}", rel.schema, rel.name));
        }
    }
    for (const auto& fn : shape.functions) {
        if (!fn.schema.empty()) {
            if (is_reserved_schema(fn.schema)) {
                return deny(SandboxReason::FORBIDDEN_SCHEMA, std::format("{}.{}", fn.schema, fn.name));
            }
            continue;
        }
        // Unqualified calls resolve through pg_catalog
        if (is_system_function(fn.name)) {
            return deny(SandboxReason::FORBIDDEN_SCHEMA, fn.name);
        }
    }
    for (const auto& ref : shape.columns) {
        if (ref.parts.size() >= 3 && is_reserved_schema(ref.parts[ref.parts.size() - 3])) {
            return deny(SandboxReason::FORBIDDEN_SCHEMA, ref.parts[ref.parts.size() - 3]);
        }
    }

    // ---- 4. Row limit ----

    SandboxDecision decision;
    decision.normalized_sql = stripped;

    const auto& limit = shape.limit;
    if (!limit.present) {
        decision.normalized_sql = std::format("{} LIMIT {}", stripped, config_.default_limit);
        decision.limit_injected = true;
    } else if (!limit.constant) {
        return deny(SandboxReason::UNBOUNDED_LIMIT, "LIMIT is not an integer constant");
    } else if (limit.value < 0 || limit.value > static_cast<int64_t>(config_.max_rows)) {
        auto clamped = replace_limit_literal(stripped, limit.location, config_.max_rows);
        if (!clamped) {
            return deny(SandboxReason::UNBOUNDED_LIMIT,
                        std::format("LIMIT {} cannot be clamped", limit.value));
        }
        decision.normalized_sql = std::move(*clamped);
        decision.limit_clamped = true;
    }

    // ---- 5. Execution budget ----

    decision.allowed = true;
    decision.reason = SandboxReason::NONE;
    decision.execution_budget = std::chrono::milliseconds(config_.max_execution_ms);
    decision.referenced_identifiers.assign(identifiers.begin(), identifiers.end());
    return decision;
}

} // namespace nl2sql
