#pragma once

#include "core/types.hpp"
#include "schema/schema_catalog.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

namespace sandbox_defaults {
/// Statement and function keywords that never appear in an allowed query.
[[nodiscard]] std::vector<std::string> forbidden_keywords();
/// Server administration and side-effecting functions callable without a schema.
[[nodiscard]] std::vector<std::string> forbidden_functions();
/// Name prefixes of unqualified calls that resolve to system functions.
[[nodiscard]] std::vector<std::string> forbidden_function_prefixes();
/// System schemas (PostgreSQL and MySQL) that queries may not touch.
[[nodiscard]] std::vector<std::string> reserved_schemas();
} // namespace sandbox_defaults

/**
 * @brief Static read-only gate in front of the database
 *
 * Checks run in a fixed order and the first failure decides the reason:
 *   1. forbidden keyword anywhere in the raw text (comments included),
 *      then comment stripping, emptiness, statement count, statement shape
 *   2. every table and column resolves against the catalog
 *   3. no reference into a reserved/system schema, including unqualified
 *      system functions (pg_*, lo_*, dblink*, admin list)
 *   4. row limit: injected when absent, clamped when above max_rows
 *   5. execution budget attached
 *
 * check() depends only on its arguments and the immutable Config, so the
 * same (sql, catalog) pair always yields the same decision.
 */
class SqlSandbox {
public:
    struct Config {
        uint32_t default_limit = 200;
        uint32_t max_rows = 1000;
        uint32_t max_execution_ms = 30000;
        std::vector<std::string> forbidden_keywords = sandbox_defaults::forbidden_keywords();
        std::vector<std::string> reserved_schemas = sandbox_defaults::reserved_schemas();
        std::vector<std::string> forbidden_functions = sandbox_defaults::forbidden_functions();
        std::vector<std::string> forbidden_function_prefixes =
            sandbox_defaults::forbidden_function_prefixes();
    };

    SqlSandbox();
    explicit SqlSandbox(Config config);

    [[nodiscard]] SandboxDecision check(std::string_view sql,
                                        const CatalogSnapshot& catalog) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] bool is_reserved_schema(const std::string& schema) const;
    [[nodiscard]] bool is_system_function(const std::string& name) const;

    Config config_;
};

} // namespace nl2sql
