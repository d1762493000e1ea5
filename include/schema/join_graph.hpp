#pragma once

#include "schema/catalog_types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

/**
 * @brief One foreign-key relation. Table and column names are lowercase.
 */
struct JoinEdge {
    std::string fk_table;
    std::string fk_column;
    std::string ref_table;
    std::string ref_column;
    bool nullable = true;

    [[nodiscard]] std::string condition() const {
        return fk_table + "." + fk_column + " = " + ref_table + "." + ref_column;
    }
};

/**
 * @brief Undirected table-relationship graph derived from a catalog
 *
 * Nodes are every catalog table (including isolated ones); there is one edge
 * per foreign key whose referenced table exists. Self-references are kept in
 * the edge list but never appear as neighbors. Neighbor lists are sorted by
 * (neighbor name, fk table, fk column) so traversal order is deterministic.
 *
 * Immutable after construction; rebuilt together with the catalog snapshot.
 */
class JoinGraph {
public:
    struct Neighbor {
        std::string table;
        size_t edge_index;
    };

    JoinGraph() = default;
    explicit JoinGraph(const std::vector<TableSchema>& tables);

    [[nodiscard]] bool has_table(std::string_view table) const;

    /// Sorted neighbor list; empty for unknown tables.
    [[nodiscard]] const std::vector<Neighbor>& neighbors(std::string_view table) const;

    [[nodiscard]] const JoinEdge& edge(size_t index) const { return edges_[index]; }
    [[nodiscard]] const std::vector<JoinEdge>& edges() const { return edges_; }
    [[nodiscard]] size_t table_count() const { return adjacency_.size(); }

private:
    std::map<std::string, std::vector<Neighbor>, std::less<>> adjacency_;
    std::vector<JoinEdge> edges_;
};

} // namespace nl2sql
