#pragma once

#include "schema/catalog_types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

/**
 * @brief Builds catalog table lists from a JSON document or a live database
 *
 * Document shape:
 *   {"infer_foreign_keys"?: bool,
 *    "tables": [{"name", "description"?, "aliases"?, "row_count"?,
 *                "columns": [{"name", "type", "nullable", "primary_key", "aliases"?,
 *                             "sample_values"?}],
 *                "foreign_keys": [{"column", "ref_table", "ref_column", "nullable"?}]}]}
 *
 * A foreign key without "nullable" inherits the nullability of its column.
 * Tables that declare no foreign keys get inferred ones (see
 * infer_foreign_keys) unless "infer_foreign_keys" is false.
 */
class CatalogLoader {
public:
    struct IntrospectionOptions {
        bool row_counts = false;    // count(*) per table
        size_t sample_limit = 0;    // distinct non-null values per column; 0 disables
    };

    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<TableSchema> tables;

        static LoadResult ok(std::vector<TableSchema> t) {
            LoadResult result;
            result.success = true;
            result.tables = std::move(t);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_string(std::string_view json_content);
    [[nodiscard]] static LoadResult load_from_file(const std::string& path);

    /**
     * @brief Introspect tables, primary keys and foreign keys via libpq
     * @param conn_string libpq connection string
     * @param schema Database schema to read (e.g. "public")
     * @param options Optional row counts and sample values
     */
    [[nodiscard]] static LoadResult load_from_database(const std::string& conn_string,
                                                       const std::string& schema,
                                                       const IntrospectionOptions& options = {});

    /**
     * @brief Add foreign keys implied by column names to tables that declare none
     *
     * A non-key column named `<table>_id` or `<Table>Id` references the
     * primary key of that table. The table may also be named in the plural
     * or with different underscores (`InvoiceLineId` -> `invoice_line`).
     * `support_rep_id` references `employee`. Self references are skipped.
     *
     * @return Number of foreign keys added
     */
    static size_t infer_foreign_keys(std::vector<TableSchema>& tables);
};

} // namespace nl2sql
