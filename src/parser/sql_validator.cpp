#include "parser/sql_validator.hpp"
#include "parser/sql_text.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <algorithm>
#include <format>

namespace nl2sql {

static constexpr std::string_view kStmts = "stmts";

std::string SqlValidator::fragment_at(std::string_view sql, size_t position) {
    if (sql.empty()) return "";
    const size_t pos = position == 0 ? 0 : std::min(position - 1, sql.size() - 1);
    size_t start = pos > kFragmentRadius ? pos - kFragmentRadius : 0;
    size_t end = std::min(sql.size(), pos + kFragmentRadius);
    // Widen to UTF-8 character boundaries
    while (start > 0 && (static_cast<unsigned char>(sql[start]) & 0xC0) == 0x80) --start;
    while (end < sql.size() && (static_cast<unsigned char>(sql[end]) & 0xC0) == 0x80) ++end;
    return utils::trim(sql.substr(start, end - start));
}

ValidationResult SqlValidator::validate(std::string_view sql) const {
    ValidationResult result;

    const std::string text(sql);
    if (sql_text::strip_terminator(sql_text::strip_comments(text)).empty()) {
        result.diagnostics.emplace_back(DiagnosticKind::SYNTAX_ERROR, "Empty SQL statement");
        return result;
    }

    PgQueryParseResult parse_result = pg_query_parse(text.c_str());

    if (parse_result.error) {
        Diagnostic diag(DiagnosticKind::SYNTAX_ERROR,
                        parse_result.error->message ? parse_result.error->message
                                                    : "Unknown parse error");
        if (parse_result.error->cursorpos > 0) {
            diag.position = static_cast<uint32_t>(parse_result.error->cursorpos);
            diag.fragment = fragment_at(text, static_cast<size_t>(parse_result.error->cursorpos));
        }
        pg_query_free_parse_result(parse_result);
        result.diagnostics.push_back(std::move(diag));
        return result;
    }

    if (parse_result.parse_tree) {
        try {
            const auto tree = JsonValue::parse(parse_result.parse_tree);
            result.statement_count = tree[kStmts].size();
        } catch (const JsonValue::parse_error&) {
            // libpg_query produced unreadable JSON; syntax itself was accepted
            utils::log::warn("Validator: could not read libpg_query parse tree");
            result.statement_count = 1;
        }
    }
    pg_query_free_parse_result(parse_result);

    if (result.statement_count == 0) {
        result.diagnostics.emplace_back(DiagnosticKind::SYNTAX_ERROR, "No SQL statement found");
        return result;
    }

    result.valid = true;
    return result;
}

std::string SqlValidator::fingerprint(std::string_view sql) {
    const std::string text(sql);
    PgQueryFingerprintResult fp = pg_query_fingerprint(text.c_str());
    std::string out;
    if (!fp.error && fp.fingerprint_str) {
        out = fp.fingerprint_str;
    }
    pg_query_free_fingerprint_result(fp);
    return out;
}

} // namespace nl2sql
