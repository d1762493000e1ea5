#include "parser/query_analyzer.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <format>

namespace nl2sql {

// Constexpr AST node and field keys
static constexpr std::string_view kRangeVar       = "RangeVar";
static constexpr std::string_view kColumnRef      = "ColumnRef";
static constexpr std::string_view kResTarget      = "ResTarget";
static constexpr std::string_view kCte            = "CommonTableExpr";
static constexpr std::string_view kFuncCall       = "FuncCall";
static constexpr std::string_view kIntoClause     = "intoClause";
static constexpr std::string_view kSelectStmt     = "SelectStmt";
static constexpr std::string_view kAliasFld       = "alias";
static constexpr std::string_view kAlias          = "Alias";
static constexpr std::string_view kAliasname      = "aliasname";
static constexpr std::string_view kColnames       = "colnames";
static constexpr std::string_view kFields         = "fields";
static constexpr std::string_view kString         = "String";
static constexpr std::string_view kAConst         = "A_Const";

static constexpr std::string_view kDerivedNodes[] = {"RangeSubselect", "RangeFunction", "JoinExpr"};

// ============================================================================
// Node Helpers
// ============================================================================

namespace {

/// {"String":{"sval":"x"}} (PG15+) or {"String":{"str":"x"}} (older)
std::optional<std::string> string_node(const JsonValue& node) {
    const auto s = node[kString];
    if (!s.is_object()) return std::nullopt;
    if (s["sval"].is_string()) return s["sval"].get<std::string>();
    if (s["str"].is_string()) return s["str"].get<std::string>();
    return std::string();   // empty strings are omitted by the protobuf JSON encoder
}

/// Alias may be wrapped ({"Alias":{...}}) or inline ({"aliasname":...}).
JsonValue unwrap_alias(const JsonValue& alias_field) {
    if (alias_field.contains(kAlias)) return alias_field[kAlias];
    return alias_field;
}

void collect_colnames(const JsonValue& list, std::set<std::string>& out) {
    for (const auto& elem : list.elements()) {
        if (auto s = string_node(elem)) out.insert(utils::to_lower(*s));
    }
}

LimitClause read_limit(const JsonValue& limit_node) {
    LimitClause limit;
    if (limit_node.is_null()) return limit;

    limit.present = true;
    const auto aconst = limit_node[kAConst];
    if (!aconst.is_object()) return limit;             // expression, parameter, ...
    if (aconst.value("isnull", false)) return limit;   // LIMIT ALL / LIMIT NULL

    limit.location = aconst.value("location", -1);

    if (aconst.contains("ival")) {
        // {"ival":{"ival":5}}; zero is encoded as {"ival":{}}
        limit.value = aconst["ival"].value("ival", int64_t{0});
        limit.constant = true;
    } else if (aconst["val"]["Integer"].is_object()) {
        limit.value = aconst["val"]["Integer"].value("ival", int64_t{0});
        limit.constant = true;
    }
    return limit;
}

// ============================================================================
// Tree Walk
// ============================================================================

void walk(const JsonValue& node, QueryShape& shape) {
    if (node.is_array()) {
        for (const auto& elem : node.elements()) walk(elem, shape);
        return;
    }
    if (!node.is_object()) return;

    if (node.contains(kRangeVar)) {
        const auto rv = node[kRangeVar];
        RelationRef rel;
        rel.name = utils::to_lower(rv.value("relname", ""));
        rel.schema = utils::to_lower(rv.value("schemaname", ""));
        if (rv.contains(kAliasFld)) {
            rel.alias = utils::to_lower(unwrap_alias(rv[kAliasFld]).value(kAliasname, ""));
        }
        if (!rel.name.empty()) shape.relations.push_back(std::move(rel));
    }

    if (node.contains(kColumnRef)) {
        ColumnRef ref;
        for (const auto& field : node[kColumnRef][kFields].elements()) {
            if (field.contains("A_Star")) {
                ref.star = true;
            } else if (auto s = string_node(field)) {
                ref.parts.push_back(utils::to_lower(*s));
            }
        }
        shape.columns.push_back(std::move(ref));
    }

    if (node.contains(kResTarget)) {
        const auto name = node[kResTarget].value("name", "");
        if (!name.empty()) shape.output_names.insert(utils::to_lower(name));
    }

    if (node.contains(kCte)) {
        const auto cte = node[kCte];
        const auto name = cte.value("ctename", "");
        if (!name.empty()) shape.cte_names.insert(utils::to_lower(name));
        collect_colnames(cte["aliascolnames"], shape.output_names);
    }

    for (const auto kind : kDerivedNodes) {
        if (!node.contains(kind)) continue;
        const auto derived = node[kind];
        if (derived.contains(kAliasFld)) {
            const auto alias = unwrap_alias(derived[kAliasFld]);
            const auto name = alias.value(kAliasname, "");
            if (!name.empty()) shape.derived_aliases.insert(utils::to_lower(name));
            collect_colnames(alias[kColnames], shape.output_names);
        }
    }

    if (node.contains(kFuncCall)) {
        const auto call = node[kFuncCall];
        const auto names = call["funcname"].elements();
        // Grammar-generated pg_catalog names (EXTRACT, TRIM, ...) are marked SQL syntax
        const bool sql_syntax = call.value("funcformat", "") == "COERCE_SQL_SYNTAX";
        if (!sql_syntax && !names.empty()) {
            FunctionRef fn;
            if (auto name = string_node(names.back())) fn.name = utils::to_lower(*name);
            if (names.size() >= 2) {
                if (auto schema = string_node(names[names.size() - 2])) {
                    fn.schema = utils::to_lower(*schema);
                }
            }
            if (!fn.name.empty()) shape.functions.push_back(std::move(fn));
        }
    }

    if (node.contains(kIntoClause)) {
        shape.has_into = true;
    }

    for (const auto& [key, child] : node.items()) {
        walk(child, shape);
    }
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

QueryAnalyzer::AnalysisResult QueryAnalyzer::analyze(std::string_view sql) {
    const std::string text(sql);
    PgQueryParseResult parse_result = pg_query_parse(text.c_str());

    if (parse_result.error) {
        std::string msg = parse_result.error->message ? parse_result.error->message
                                                      : "Unknown parse error";
        pg_query_free_parse_result(parse_result);
        return AnalysisResult::error(std::move(msg));
    }

    JsonValue tree;
    try {
        tree = JsonValue::parse(parse_result.parse_tree ? parse_result.parse_tree : "{}");
    } catch (const JsonValue::parse_error& e) {
        pg_query_free_parse_result(parse_result);
        return AnalysisResult::error(std::format("Unreadable parse tree: {}", e.what()));
    }
    pg_query_free_parse_result(parse_result);

    QueryShape shape;
    const auto stmts = tree["stmts"].elements();
    shape.statement_count = stmts.size();

    if (!stmts.empty()) {
        const auto first = stmts.front()["stmt"];
        const auto items = first.items();
        if (!items.empty()) {
            shape.statement_kind = items.front().first;
        }
        if (shape.statement_kind == kSelectStmt) {
            const auto select = first[kSelectStmt];
            shape.limit = read_limit(select["limitCount"]);
        }
    }

    walk(tree["stmts"], shape);
    return AnalysisResult::ok(std::move(shape));
}

std::optional<size_t> QueryAnalyzer::count_statements(std::string_view sql) {
    const std::string text(sql);
    PgQuerySplitResult split = pg_query_split_with_scanner(text.c_str());

    if (split.error) {
        pg_query_free_split_result(split);
        return std::nullopt;
    }

    size_t count = 0;
    for (int i = 0; i < split.n_stmts; ++i) {
        const auto* stmt = split.stmts[i];
        if (stmt->stmt_location < 0 || stmt->stmt_len < 0) continue;
        const size_t loc = static_cast<size_t>(stmt->stmt_location);
        if (loc >= text.size()) continue;
        // stmt_len == 0 means "to end of input"
        const size_t len = stmt->stmt_len == 0 ? text.size() - loc
                                               : static_cast<size_t>(stmt->stmt_len);
        if (!utils::trim(std::string_view(text).substr(loc, len)).empty()) {
            ++count;
        }
    }
    pg_query_free_split_result(split);
    return count;
}

} // namespace nl2sql
