#include "schema/catalog_loader.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "db/pg_handles.hpp"
#include "schema/name_aliases.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace nl2sql {

// Document keys
static constexpr std::string_view kTables      = "tables";
static constexpr std::string_view kName        = "name";
static constexpr std::string_view kColumns     = "columns";
static constexpr std::string_view kForeignKeys = "foreign_keys";
static constexpr std::string_view kAliases     = "aliases";
static constexpr std::string_view kSamples     = "sample_values";

// ============================================================================
// JSON Document
// ============================================================================

namespace {

std::vector<std::string> string_list(const JsonValue& node) {
    std::vector<std::string> out;
    for (const auto& elem : node.elements()) {
        if (elem.is_string()) out.push_back(elem.get<std::string>());
    }
    return out;
}

/// Sample values are shown as text whatever their JSON type.
std::vector<std::string> sample_list(const JsonValue& node) {
    std::vector<std::string> out;
    for (const auto& elem : node.elements()) {
        if (elem.is_string()) {
            out.push_back(elem.get<std::string>());
        } else if (elem.is_boolean()) {
            out.emplace_back(utils::booltostr(elem.get<bool>()));
        } else if (elem.is_number_integer()) {
            out.push_back(std::to_string(elem.get<int64_t>()));
        } else if (elem.is_number()) {
            out.push_back(std::format("{}", elem.get<double>()));
        }
    }
    return out;
}

/// Lowercase snake_case with the underscores removed: "InvoiceLine" -> "invoiceline".
std::string squashed(std::string_view name) {
    auto key = name_aliases::to_snake_case(name);
    std::erase(key, '_');
    return key;
}

std::vector<std::string> validate_tables(const std::vector<TableSchema>& tables) {
    std::vector<std::string> errors;
    std::unordered_set<std::string> names;
    for (const auto& t : tables) {
        if (!names.insert(utils::to_lower(t.name)).second) {
            errors.push_back(std::format("duplicate table '{}'", t.name));
        }
    }

    for (const auto& t : tables) {
        for (const auto& fk : t.foreign_keys) {
            if (!t.find_column(fk.column)) {
                errors.push_back(std::format("{}: foreign key column '{}' is not a column of the table",
                                             t.name, fk.column));
            }
            if (!names.contains(utils::to_lower(fk.ref_table))) {
                errors.push_back(std::format("{}.{}: referenced table '{}' not found",
                                             t.name, fk.column, fk.ref_table));
            }
        }
    }
    return errors;
}

} // anonymous namespace

CatalogLoader::LoadResult CatalogLoader::load_from_string(std::string_view json_content) {
    JsonValue root;
    try {
        root = JsonValue::parse(json_content);
    } catch (const JsonValue::parse_error& e) {
        return LoadResult::error(std::format("Catalog document is not valid JSON: {}", e.what()));
    }

    const auto tables_node = root[kTables];
    if (!tables_node.is_array()) {
        return LoadResult::error("Catalog document must contain a 'tables' array");
    }

    std::vector<TableSchema> tables;
    std::vector<std::string> errors;

    for (const auto& tnode : tables_node.elements()) {
        TableSchema table;
        table.name = tnode.value(kName, "");
        if (table.name.empty()) {
            errors.push_back(std::format("tables[{}]: missing name", tables.size()));
            continue;
        }
        table.description = tnode.value("description", "");
        table.aliases = string_list(tnode[kAliases]);
        if (const auto rows = tnode["row_count"]; rows.is_number_integer()) {
            if (rows.get<double>() < 0) {
                errors.push_back(std::format("{}: row_count must be >= 0", table.name));
            } else {
                table.row_count = rows.get<uint64_t>();
            }
        }

        for (const auto& cnode : tnode[kColumns].elements()) {
            ColumnSchema col;
            col.name = cnode.value(kName, "");
            if (col.name.empty()) {
                errors.push_back(std::format("{}: column without name", table.name));
                continue;
            }
            col.type = cnode.value("type", "");
            col.nullable = cnode.value("nullable", true);
            col.is_primary_key = cnode.value("primary_key", false);
            col.aliases = string_list(cnode[kAliases]);
            col.sample_values = sample_list(cnode[kSamples]);
            table.columns.push_back(std::move(col));
        }

        for (const auto& fnode : tnode[kForeignKeys].elements()) {
            ForeignKey fk;
            fk.column = fnode.value("column", "");
            fk.ref_table = fnode.value("ref_table", "");
            fk.ref_column = fnode.value("ref_column", "");
            if (fk.column.empty() || fk.ref_table.empty() || fk.ref_column.empty()) {
                errors.push_back(std::format("{}: incomplete foreign key", table.name));
                continue;
            }
            const auto* col = table.find_column(fk.column);
            fk.nullable = fnode.value("nullable", col ? col->nullable : true);
            table.foreign_keys.push_back(std::move(fk));
        }

        tables.push_back(std::move(table));
    }

    auto consistency = validate_tables(tables);
    errors.insert(errors.end(), consistency.begin(), consistency.end());

    if (!errors.empty()) {
        std::string combined = "Catalog validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }

    if (root.value("infer_foreign_keys", true)) {
        if (const size_t inferred = infer_foreign_keys(tables); inferred > 0) {
            utils::log::info(std::format("Catalog: inferred {} foreign keys from column names",
                                         inferred));
        }
    }
    return LoadResult::ok(std::move(tables));
}

CatalogLoader::LoadResult CatalogLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open catalog file: {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

// ============================================================================
// Foreign Key Inference
// ============================================================================

size_t CatalogLoader::infer_foreign_keys(std::vector<TableSchema>& tables) {
    // Column prefixes that name a role rather than a table
    static const std::unordered_map<std::string, std::string> kRoleTables = {
        {"supportrep", "employee"},
    };

    std::unordered_map<std::string, size_t> by_key;   // squashed name or singular -> index
    for (size_t i = 0; i < tables.size(); ++i) {
        const auto key = squashed(tables[i].name);
        by_key.try_emplace(key, i);
        if (key.size() > 3 && key.ends_with('s') && !key.ends_with("ss")) {
            by_key.try_emplace(key.substr(0, key.size() - 1), i);
        }
    }

    size_t added = 0;
    for (size_t ti = 0; ti < tables.size(); ++ti) {
        auto& table = tables[ti];
        if (!table.foreign_keys.empty()) continue;

        for (const auto& col : table.columns) {
            if (col.is_primary_key) continue;
            const auto snake = name_aliases::to_snake_case(col.name);
            if (snake.size() <= 3 || !snake.ends_with("_id")) continue;

            auto base = squashed(snake.substr(0, snake.size() - 3));
            if (const auto role = kRoleTables.find(base); role != kRoleTables.end()) {
                base = role->second;
            }
            const auto target = by_key.find(base);
            if (target == by_key.end() || target->second == ti) continue;

            const auto& ref = tables[target->second];
            const auto pk = std::find_if(ref.columns.begin(), ref.columns.end(),
                                         [](const ColumnSchema& c) { return c.is_primary_key; });
            if (pk == ref.columns.end()) continue;

            ForeignKey fk;
            fk.column = col.name;
            fk.ref_table = ref.name;
            fk.ref_column = pk->name;
            fk.nullable = col.nullable;
            fk.inferred = true;
            utils::log::debug(std::format("Catalog: inferred {}.{} -> {}.{}", table.name,
                                          fk.column, fk.ref_table, fk.ref_column));
            table.foreign_keys.push_back(std::move(fk));
            ++added;
        }
    }
    return added;
}

// ============================================================================
// Database Introspection (libpq)
// ============================================================================

namespace {

constexpr const char* kColumnsQuery =
    "SELECT table_name, column_name, data_type, is_nullable "
    "FROM information_schema.columns "
    "WHERE table_schema = $1 "
    "ORDER BY table_name, ordinal_position";

constexpr const char* kPrimaryKeyQuery =
    "SELECT kcu.table_name, kcu.column_name "
    "FROM information_schema.table_constraints tc "
    "JOIN information_schema.key_column_usage kcu "
    "  ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
    "WHERE tc.constraint_type = 'PRIMARY KEY' AND tc.table_schema = $1";

constexpr const char* kForeignKeyQuery =
    "SELECT kcu.table_name, kcu.column_name, ccu.table_name, ccu.column_name "
    "FROM information_schema.table_constraints tc "
    "JOIN information_schema.key_column_usage kcu "
    "  ON tc.constraint_name = kcu.constraint_name AND tc.table_schema = kcu.table_schema "
    "JOIN information_schema.constraint_column_usage ccu "
    "  ON tc.constraint_name = ccu.constraint_name AND tc.table_schema = ccu.table_schema "
    "WHERE tc.constraint_type = 'FOREIGN KEY' AND tc.table_schema = $1 "
    "ORDER BY kcu.table_name, kcu.column_name";

PGResultPtr query_with_schema(PGconn* conn, const char* sql, const std::string& schema) {
    const char* params[1] = {schema.c_str()};
    return PGResultPtr(PQexecParams(conn, sql, 1, nullptr, params, nullptr, nullptr, 0));
}

/// Quoted identifier, or nullopt when libpq cannot escape it.
std::optional<std::string> quote_ident(PGconn* conn, const std::string& name) {
    char* escaped = PQescapeIdentifier(conn, name.c_str(), name.size());
    if (!escaped) return std::nullopt;
    std::string out(escaped);
    PQfreemem(escaped);
    return out;
}

/// Row counts and sample values for one table; failures only log.
void read_table_stats(PGconn* conn, const std::string& schema, TableSchema& table,
                      const CatalogLoader::IntrospectionOptions& options) {
    const auto qschema = quote_ident(conn, schema);
    const auto qtable = quote_ident(conn, table.name);
    if (!qschema || !qtable) {
        utils::log::warn(std::format("Catalog introspection: cannot quote {}.{}", schema, table.name));
        return;
    }
    const std::string relation = *qschema + "." + *qtable;

    if (options.row_counts) {
        PGResultPtr res(PQexec(conn, std::format("SELECT count(*) FROM {}", relation).c_str()));
        if (res && PQresultStatus(res.get()) == PGRES_TUPLES_OK && PQntuples(res.get()) == 1) {
            table.row_count = utils::try_parse_int<uint64_t>(pg_cell(res.get(), 0, 0));
        } else {
            utils::log::warn(std::format("Catalog introspection: row count for {} failed: {}",
                                         table.name, PQerrorMessage(conn)));
        }
    }

    if (options.sample_limit == 0) return;
    for (auto& col : table.columns) {
        const auto qcol = quote_ident(conn, col.name);
        if (!qcol) continue;
        const auto sql = std::format("SELECT DISTINCT {0}::text FROM {1} WHERE {0} IS NOT NULL LIMIT {2}",
                                     *qcol, relation, options.sample_limit);
        PGResultPtr res(PQexec(conn, sql.c_str()));
        if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
            utils::log::warn(std::format("Catalog introspection: samples for {}.{} failed: {}",
                                         table.name, col.name, PQerrorMessage(conn)));
            continue;
        }
        for (int row = 0; row < PQntuples(res.get()); ++row) {
            col.sample_values.push_back(pg_cell(res.get(), row, 0));
        }
    }
}

} // anonymous namespace

CatalogLoader::LoadResult CatalogLoader::load_from_database(const std::string& conn_string,
                                                            const std::string& schema,
                                                            const IntrospectionOptions& options) {
    PGConnPtr conn(PQconnectdb(conn_string.c_str()));
    if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
        const std::string msg = conn ? PQerrorMessage(conn.get()) : "out of memory";
        utils::log::error(std::format("Catalog introspection: connection failed: {}", msg));
        return LoadResult::error("Cannot connect to database for catalog introspection");
    }

    std::vector<TableSchema> tables;
    std::unordered_map<std::string, size_t> index;

    PGResultPtr cols = query_with_schema(conn.get(), kColumnsQuery, schema);
    if (!cols || PQresultStatus(cols.get()) != PGRES_TUPLES_OK) {
        utils::log::error(std::format("Catalog introspection: column query failed: {}",
                                      PQerrorMessage(conn.get())));
        return LoadResult::error("Column introspection query failed");
    }

    for (int row = 0; row < PQntuples(cols.get()); ++row) {
        const auto table_name = utils::to_lower(pg_cell(cols.get(), row, 0));
        auto [it, inserted] = index.try_emplace(table_name, tables.size());
        if (inserted) {
            TableSchema t;
            t.name = table_name;
            tables.push_back(std::move(t));
        }
        tables[it->second].columns.emplace_back(
            utils::to_lower(pg_cell(cols.get(), row, 1)),
            utils::to_lower(pg_cell(cols.get(), row, 2)),
            pg_cell(cols.get(), row, 3) == "YES",
            false);
    }

    PGResultPtr pks = query_with_schema(conn.get(), kPrimaryKeyQuery, schema);
    if (pks && PQresultStatus(pks.get()) == PGRES_TUPLES_OK) {
        for (int row = 0; row < PQntuples(pks.get()); ++row) {
            const auto it = index.find(utils::to_lower(pg_cell(pks.get(), row, 0)));
            if (it == index.end()) continue;
            for (auto& col : tables[it->second].columns) {
                if (col.name == utils::to_lower(pg_cell(pks.get(), row, 1))) col.is_primary_key = true;
            }
        }
    } else {
        utils::log::warn("Catalog introspection: primary key query failed, continuing without");
    }

    PGResultPtr fks = query_with_schema(conn.get(), kForeignKeyQuery, schema);
    if (fks && PQresultStatus(fks.get()) == PGRES_TUPLES_OK) {
        for (int row = 0; row < PQntuples(fks.get()); ++row) {
            const auto it = index.find(utils::to_lower(pg_cell(fks.get(), row, 0)));
            if (it == index.end()) continue;
            auto& table = tables[it->second];

            ForeignKey fk;
            fk.column = utils::to_lower(pg_cell(fks.get(), row, 1));
            fk.ref_table = utils::to_lower(pg_cell(fks.get(), row, 2));
            fk.ref_column = utils::to_lower(pg_cell(fks.get(), row, 3));
            const auto* col = table.find_column(fk.column);
            fk.nullable = col ? col->nullable : true;
            table.foreign_keys.push_back(std::move(fk));
        }
    } else {
        utils::log::warn("Catalog introspection: foreign key query failed, join graph will be empty");
    }

    if (const size_t inferred = infer_foreign_keys(tables); inferred > 0) {
        utils::log::info(std::format("Catalog introspection: inferred {} foreign keys from column names",
                                     inferred));
    }

    if (options.row_counts || options.sample_limit > 0) {
        for (auto& table : tables) {
            read_table_stats(conn.get(), schema, table, options);
        }
    }

    utils::log::info(std::format("Catalog introspection: {} tables in schema '{}'",
                                 tables.size(), schema));
    return LoadResult::ok(std::move(tables));
}

} // namespace nl2sql
