#include "schema/schema_catalog.hpp"
#include "core/utils.hpp"
#include "schema/name_aliases.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace nl2sql {

// ============================================================================
// Name Matching Helpers
// ============================================================================

namespace {

constexpr size_t kPromptSamples = 3;
constexpr size_t kPromptSampleChars = 20;

bool mentions(std::string_view question, std::string_view name) {
    for (const auto& term : name_aliases::for_table(name)) {
        if (utils::contains_phrase(question, term)) return true;
    }
    return false;
}

/// Declared aliases plus generated terms, lowercase, unique.
std::vector<std::string> column_terms(const ColumnSchema& col) {
    auto terms = name_aliases::for_column(col.name);
    std::erase_if(terms, [](const std::string& t) { return t.size() < 3; });
    for (const auto& a : col.aliases) {
        auto lower = utils::to_lower(a);
        if (std::find(terms.begin(), terms.end(), lower) == terms.end()) {
            terms.push_back(std::move(lower));
        }
    }
    return terms;
}

} // anonymous namespace

// ============================================================================
// CatalogSnapshot
// ============================================================================

CatalogSnapshot::CatalogSnapshot(std::vector<TableSchema> tables, uint64_t version)
    : tables_(std::move(tables)),
      graph_(tables_),
      version_(version) {
    for (size_t i = 0; i < tables_.size(); ++i) {
        index_.emplace(utils::to_lower(tables_[i].name), i);
    }
}

const TableSchema* CatalogSnapshot::find_table(std::string_view name) const {
    const auto it = index_.find(utils::to_lower(name));
    return it != index_.end() ? &tables_[it->second] : nullptr;
}

bool CatalogSnapshot::has_column(std::string_view table, std::string_view column) const {
    const auto* t = find_table(table);
    return t && t->find_column(column) != nullptr;
}

bool CatalogSnapshot::any_table_has_column(std::string_view column) const {
    for (const auto& t : tables_) {
        if (t.find_column(column)) return true;
    }
    return false;
}

std::vector<std::string> CatalogSnapshot::find_relevant_tables(std::string_view question) const {
    const auto q = utils::to_lower(question);

    // Column terms only count when they identify a single table
    std::vector<std::vector<std::string>> terms_by_table;
    std::unordered_map<std::string, size_t> column_owners;
    for (const auto& t : tables_) {
        std::unordered_set<std::string> seen;
        for (const auto& col : t.columns) {
            for (auto& term : column_terms(col)) seen.insert(std::move(term));
        }
        for (const auto& key : seen) ++column_owners[key];
        terms_by_table.emplace_back(seen.begin(), seen.end());
    }

    std::vector<std::string> matched;
    for (size_t ti = 0; ti < tables_.size(); ++ti) {
        const auto& t = tables_[ti];
        bool hit = mentions(q, t.name);
        for (size_t i = 0; !hit && i < t.aliases.size(); ++i) {
            hit = mentions(q, t.aliases[i]);
        }
        for (const auto& term : terms_by_table[ti]) {
            if (hit) break;
            hit = column_owners[term] == 1 && mentions(q, term);
        }
        if (hit) matched.push_back(utils::to_lower(t.name));
    }
    return matched;
}

std::string CatalogSnapshot::format_for_prompt(const std::vector<std::string>& tables,
                                               bool include_samples) const {
    std::vector<const TableSchema*> selected;
    if (tables.empty()) {
        for (const auto& t : tables_) selected.push_back(&t);
    } else {
        for (const auto& name : tables) {
            if (const auto* t = find_table(name)) selected.push_back(t);
        }
    }

    std::string out;
    for (const auto* t : selected) {
        out += "Table " + t->name;
        if (t->row_count) out += std::format(" [{} rows]", *t->row_count);
        if (!t->aliases.empty()) out += " (" + utils::join(t->aliases, ", ") + ")";
        if (!t->description.empty()) out += ": " + t->description;
        out += "\n";

        for (const auto& col : t->columns) {
            out += std::format("  - {} {}{}{}", col.name, col.type,
                               col.is_primary_key ? " PRIMARY KEY" : "",
                               col.nullable ? "" : " NOT NULL");
            for (const auto& fk : t->foreign_keys) {
                if (utils::to_lower(fk.column) == utils::to_lower(col.name)) {
                    out += std::format(" REFERENCES {}({})", fk.ref_table, fk.ref_column);
                }
            }
            if (!col.aliases.empty()) out += "  -- " + utils::join(col.aliases, ", ");
            if (include_samples && !col.sample_values.empty()) {
                std::vector<std::string> shown;
                for (size_t i = 0; i < col.sample_values.size() && i < kPromptSamples; ++i) {
                    shown.push_back(utils::truncate_utf8(col.sample_values[i], kPromptSampleChars));
                }
                out += " e.g. [" + utils::join(shown, ", ") + "]";
            }
            out += "\n";
        }
    }
    return out;
}

// ============================================================================
// SchemaCatalog (RCU)
// ============================================================================

SchemaCatalog::SchemaCatalog()
    : snapshot_ptr_(std::make_shared<const CatalogSnapshot>(std::vector<TableSchema>{}, 0)) {}

SchemaCatalog::SchemaCatalog(LoaderFunc loader)
    : SchemaCatalog() {
    loader_ = std::move(loader);
}

std::shared_ptr<const CatalogSnapshot> SchemaCatalog::snapshot() const {
    return std::atomic_load_explicit(&snapshot_ptr_, std::memory_order_acquire);
}

bool SchemaCatalog::reload() {
    std::lock_guard lock(reload_mutex_);

    if (!loader_) {
        utils::log::warn("Schema catalog reload requested without a loader");
        return false;
    }

    auto loaded = loader_();
    if (loaded.is_error()) {
        utils::log::error(std::format("Schema catalog reload failed: {}",
                                      loaded.error_message()));
        return false;
    }

    swap_in(std::move(loaded.value()));
    return true;
}

void SchemaCatalog::install(std::vector<TableSchema> tables) {
    std::lock_guard lock(reload_mutex_);
    swap_in(std::move(tables));
}

void SchemaCatalog::swap_in(std::vector<TableSchema> tables) {
    const uint64_t next = version_.load(std::memory_order_relaxed) + 1;
    const size_t count = tables.size();
    auto fresh = std::make_shared<const CatalogSnapshot>(std::move(tables), next);
    std::atomic_store_explicit(&snapshot_ptr_,
                               std::shared_ptr<const CatalogSnapshot>(std::move(fresh)),
                               std::memory_order_release);
    version_.store(next, std::memory_order_release);
    utils::log::info(std::format("Schema catalog loaded: {} tables (version {})", count, next));
}

} // namespace nl2sql
