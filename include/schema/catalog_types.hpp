#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

struct ColumnSchema {
    std::string name;
    std::string type;
    bool nullable = true;
    bool is_primary_key = false;
    std::vector<std::string> aliases;   // natural-language synonyms
    std::vector<std::string> sample_values;

    ColumnSchema() = default;
    ColumnSchema(std::string n, std::string t, bool null_ok, bool pk)
        : name(std::move(n)), type(std::move(t)), nullable(null_ok), is_primary_key(pk) {}
};

struct ForeignKey {
    std::string column;
    std::string ref_table;
    std::string ref_column;
    bool nullable = true;
    bool inferred = false;   // derived from the column name, not declared
};

struct TableSchema {
    std::string name;
    std::string description;
    std::vector<ColumnSchema> columns;
    std::vector<ForeignKey> foreign_keys;
    std::vector<std::string> aliases;
    std::optional<uint64_t> row_count;

    /// Case-insensitive column lookup
    [[nodiscard]] const ColumnSchema* find_column(std::string_view column) const {
        const auto lower = utils::to_lower(column);
        for (const auto& col : columns) {
            if (utils::to_lower(col.name) == lower) return &col;
        }
        return nullptr;
    }
};

} // namespace nl2sql
