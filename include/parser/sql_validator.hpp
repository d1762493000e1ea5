#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace nl2sql {

/**
 * @brief Syntax checker backed by libpg_query (PostgreSQL's own grammar)
 *
 * Reports only whether the text parses. Table/column existence and
 * statement shape are the sandbox's business.
 *
 * Thread-safety: stateless; libpg_query keeps its memory contexts per thread.
 */
class SqlValidator {
public:
    /// Characters of context kept on each side of the error position.
    static constexpr size_t kFragmentRadius = 24;

    [[nodiscard]] ValidationResult validate(std::string_view sql) const;

    /**
     * @brief Normalized fingerprint of a statement (libpg_query fingerprint)
     * @return Hex fingerprint, or empty string when the text does not parse
     */
    [[nodiscard]] static std::string fingerprint(std::string_view sql);

    /// Text surrounding a 1-based position, clipped to kFragmentRadius.
    [[nodiscard]] static std::string fragment_at(std::string_view sql, size_t position);
};

} // namespace nl2sql
