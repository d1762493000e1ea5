#pragma once

#include "core/error.hpp"
#include "schema/catalog_types.hpp"
#include "schema/join_graph.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nl2sql {

/**
 * @brief Immutable catalog contents plus the join graph derived from them
 *
 * Lookups are case-insensitive. A snapshot is never modified after
 * construction, so it can be shared freely between sessions.
 */
class CatalogSnapshot {
public:
    CatalogSnapshot(std::vector<TableSchema> tables, uint64_t version);

    [[nodiscard]] const TableSchema* find_table(std::string_view name) const;
    [[nodiscard]] bool has_table(std::string_view name) const { return find_table(name) != nullptr; }
    [[nodiscard]] bool has_column(std::string_view table, std::string_view column) const;

    /// True if any table has a column with this name.
    [[nodiscard]] bool any_table_has_column(std::string_view column) const;

    [[nodiscard]] const std::vector<TableSchema>& tables() const { return tables_; }
    [[nodiscard]] const JoinGraph& join_graph() const { return graph_; }
    [[nodiscard]] uint64_t version() const { return version_; }
    [[nodiscard]] size_t table_count() const { return tables_.size(); }

    /**
     * @brief Tables mentioned by name, alias, column name or column alias
     *
     * Generated terms (snake_case and spaced forms of camelCase names,
     * singular and plural forms) count as aliases.
     * @return Lowercase table names in catalog order
     */
    [[nodiscard]] std::vector<std::string> find_relevant_tables(std::string_view question) const;

    /**
     * @brief Schema description for prompts
     * @param tables Tables to describe; all tables when empty
     * @param include_samples Append up to 3 sample values per column
     */
    [[nodiscard]] std::string format_for_prompt(const std::vector<std::string>& tables,
                                                bool include_samples = false) const;

private:
    std::vector<TableSchema> tables_;
    std::unordered_map<std::string, size_t> index_;   // lowercase name -> position
    JoinGraph graph_;
    uint64_t version_;
};

/**
 * @brief Shared schema catalog with RCU snapshot replacement
 *
 * Readers take a shared_ptr to the current snapshot (wait-free) and keep
 * using it for the whole run, even if a reload happens meanwhile. Reload
 * builds a complete new snapshot off to the side and swaps the pointer.
 *
 * Thread-safety: any number of readers plus one reloader at a time.
 */
class SchemaCatalog {
public:
    /// Produces the table list for a (re)load. Injected so tests can avoid I/O.
    using LoaderFunc = std::function<Result<std::vector<TableSchema>>()>;

    SchemaCatalog();
    explicit SchemaCatalog(LoaderFunc loader);

    /// Current snapshot; never null (empty catalog before the first load).
    [[nodiscard]] std::shared_ptr<const CatalogSnapshot> snapshot() const;

    /**
     * @brief Re-run the loader and swap in the result
     * @return false if no loader is set or the loader failed (old snapshot kept)
     */
    bool reload();

    /// Install tables directly (bypasses the loader).
    void install(std::vector<TableSchema> tables);

    [[nodiscard]] uint64_t version() const {
        return version_.load(std::memory_order_acquire);
    }

    void set_loader(LoaderFunc loader) {
        std::lock_guard lock(reload_mutex_);
        loader_ = std::move(loader);
    }

private:
    void swap_in(std::vector<TableSchema> tables);

    std::shared_ptr<const CatalogSnapshot> snapshot_ptr_;
    std::atomic<uint64_t> version_{0};
    mutable std::mutex reload_mutex_;
    LoaderFunc loader_;
};

} // namespace nl2sql
