#include "parser/sql_text.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>

namespace nl2sql::sql_text {

namespace {

// Returns the end (exclusive) of a dollar-quote tag starting at `pos`, or npos.
size_t dollar_tag_end(std::string_view sql, size_t pos) {
    size_t i = pos + 1;
    while (i < sql.size() && (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '_')) {
        ++i;
    }
    if (i < sql.size() && sql[i] == '$') return i + 1;
    return std::string_view::npos;
}

constexpr std::array<std::string_view, 19> kStatementKeywords = {
    "select", "with", "values", "table", "insert", "update", "delete",
    "drop", "alter", "create", "truncate", "grant", "revoke", "explain",
    "show", "set", "copy", "call", "merge"
};

bool is_statement_keyword(std::string_view word) {
    for (const auto kw : kStatementKeywords) {
        if (word == kw) return true;
    }
    return false;
}

} // anonymous namespace

std::string strip_comments(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];
        const char next = i + 1 < sql.size() ? sql[i + 1] : '\0';

        if (c == '\'' || c == '"') {
            // Quoted literal or identifier; doubled quote is an escape
            const char quote = c;
            out += c;
            ++i;
            while (i < sql.size()) {
                out += sql[i];
                if (sql[i] == quote) {
                    if (i + 1 < sql.size() && sql[i + 1] == quote) {
                        out += sql[++i];
                    } else {
                        ++i;
                        break;
                    }
                }
                ++i;
            }
            continue;
        }

        if (c == '$') {
            const size_t tag_end = dollar_tag_end(sql, i);
            if (tag_end != std::string_view::npos) {
                const auto tag = sql.substr(i, tag_end - i);
                const size_t close = sql.find(tag, tag_end);
                const size_t stop = close == std::string_view::npos ? sql.size() : close + tag.size();
                out.append(sql.substr(i, stop - i));
                i = stop;
                continue;
            }
        }

        if (c == '-' && next == '-') {
            while (i < sql.size() && sql[i] != '\n') ++i;
            out += ' ';
            continue;
        }

        if (c == '/' && next == '*') {
            int depth = 1;
            i += 2;
            while (i < sql.size() && depth > 0) {
                if (sql[i] == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
                    ++depth;
                    i += 2;
                } else if (sql[i] == '*' && i + 1 < sql.size() && sql[i + 1] == '/') {
                    --depth;
                    i += 2;
                } else {
                    ++i;
                }
            }
            out += ' ';
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

std::string strip_terminator(std::string_view sql) {
    std::string out = utils::trim(sql);
    while (!out.empty() && out.back() == ';') {
        out.pop_back();
        out = utils::trim(out);
    }
    return out;
}

ExtractedSql extract_sql(std::string_view response) {
    const std::string lower = utils::to_lower(response);

    const size_t sql_fence = lower.find("```sql");
    if (sql_fence != std::string::npos) {
        const size_t body = sql_fence + 6;
        const size_t close = lower.find("```", body);
        const auto inner = response.substr(body, close == std::string::npos ? std::string_view::npos
                                                                            : close - body);
        return {utils::trim(inner), true};
    }

    const size_t fence = lower.find("```");
    if (fence != std::string::npos) {
        size_t body = fence + 3;
        // Skip an info string such as ```postgresql, but not ```SELECT
        const size_t eol = lower.find('\n', body);
        if (eol != std::string::npos && lower.find_first_of(" \t", body) > eol) {
            const auto info = utils::trim(std::string_view(lower).substr(body, eol - body));
            if (!is_statement_keyword(info)) body = eol + 1;
        }
        const size_t close = lower.find("```", body);
        const auto inner = response.substr(body, close == std::string::npos ? std::string_view::npos
                                                                            : close - body);
        return {utils::trim(inner), false};
    }

    return {utils::trim(response), false};
}

bool looks_like_sql(const ExtractedSql& extracted) {
    if (extracted.fenced_as_sql) return true;

    const std::string body = strip_comments(extracted.text);
    size_t i = 0;
    while (i < body.size() &&
           (std::isspace(static_cast<unsigned char>(body[i])) || body[i] == '(')) {
        ++i;
    }
    size_t end = i;
    while (end < body.size() && std::isalpha(static_cast<unsigned char>(body[end]))) {
        ++end;
    }
    if (end == i) return false;

    return is_statement_keyword(utils::to_lower(body.substr(i, end - i)));
}

} // namespace nl2sql::sql_text
