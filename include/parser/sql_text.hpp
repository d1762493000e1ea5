#pragma once

#include <string>
#include <string_view>

namespace nl2sql::sql_text {

/**
 * @brief Remove -- and (nested) block comments.
 *
 * String literals, quoted identifiers and dollar-quoted bodies are copied
 * through untouched. Each comment is replaced by a single space so adjacent
 * tokens never fuse.
 */
[[nodiscard]] std::string strip_comments(std::string_view sql);

/// Trim whitespace and trailing semicolons.
[[nodiscard]] std::string strip_terminator(std::string_view sql);

struct ExtractedSql {
    std::string text;
    bool fenced_as_sql = false;   // came from a ```sql block
};

/**
 * @brief Pull SQL out of a completion response.
 *
 * Takes the body of the first ```sql fence, else the first generic ``` fence,
 * else the whole trimmed response.
 */
[[nodiscard]] ExtractedSql extract_sql(std::string_view response);

/**
 * @brief Chat-vs-SQL classification of a completion response
 *
 * SQL-shaped means fenced as SQL, or the first significant token (after
 * comments and opening parentheses) is a statement keyword. Mutating
 * statements count as SQL so they reach the sandbox instead of the user.
 */
[[nodiscard]] bool looks_like_sql(const ExtractedSql& extracted);

} // namespace nl2sql::sql_text
