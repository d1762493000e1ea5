#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

struct RelationRef {
    std::string schema;
    std::string name;
    std::string alias;
};

/// Column reference as written: [col], [qualifier, col] or [schema, table, col].
struct ColumnRef {
    std::vector<std::string> parts;
    bool star = false;      // trailing * (t.* or *)
};

/// Function call as written; schema is empty when unqualified.
struct FunctionRef {
    std::string schema;
    std::string name;
};

struct LimitClause {
    bool present = false;
    bool constant = false;      // integer literal
    int64_t value = 0;
    int location = -1;          // 0-based byte offset of the literal
};

/**
 * @brief Identifier and shape facts pulled from a libpg_query parse tree
 */
struct QueryShape {
    size_t statement_count = 0;
    std::string statement_kind;                 // first statement node, e.g. "SelectStmt"
    bool has_into = false;                      // SELECT ... INTO
    std::vector<RelationRef> relations;
    std::vector<ColumnRef> columns;
    std::set<std::string> cte_names;
    std::set<std::string> derived_aliases;      // subquery / function / join aliases
    std::set<std::string> output_names;         // select-list aliases, CTE column names
    std::vector<FunctionRef> functions;         // calls, excluding grammar-generated ones
    LimitClause limit;                          // top-level statement only
};

/**
 * @brief Walks the libpg_query JSON parse tree of a statement
 *
 * Accepts both the older ({"String":{"str"}}, A_Const.val) and newer
 * ({"String":{"sval"}}, A_Const.ival) node encodings.
 */
class QueryAnalyzer {
public:
    struct AnalysisResult {
        bool success = false;
        std::string error_message;
        QueryShape shape;

        static AnalysisResult ok(QueryShape s) {
            AnalysisResult r;
            r.success = true;
            r.shape = std::move(s);
            return r;
        }

        static AnalysisResult error(std::string message) {
            AnalysisResult r;
            r.error_message = std::move(message);
            return r;
        }
    };

    [[nodiscard]] static AnalysisResult analyze(std::string_view sql);

    /**
     * @brief Count non-empty statements using the scanner only
     *
     * Works on text the grammar rejects. nullopt when even the scanner fails
     * (e.g. unterminated quoted string).
     */
    [[nodiscard]] static std::optional<size_t> count_statements(std::string_view sql);
};

} // namespace nl2sql
