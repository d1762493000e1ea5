#include "schema/join_graph.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <tuple>

namespace nl2sql {

JoinGraph::JoinGraph(const std::vector<TableSchema>& tables) {
    for (const auto& table : tables) {
        adjacency_.try_emplace(utils::to_lower(table.name));
    }

    for (const auto& table : tables) {
        const auto fk_table = utils::to_lower(table.name);
        for (const auto& fk : table.foreign_keys) {
            const auto ref_table = utils::to_lower(fk.ref_table);
            if (!adjacency_.contains(ref_table)) {
                utils::log::warn(std::format(
                    "Join graph: {}.{} references unknown table '{}', edge skipped",
                    fk_table, fk.column, fk.ref_table));
                continue;
            }

            const size_t idx = edges_.size();
            edges_.push_back(JoinEdge{
                fk_table,
                utils::to_lower(fk.column),
                ref_table,
                utils::to_lower(fk.ref_column),
                fk.nullable});

            if (fk_table == ref_table) continue;   // self-reference
            adjacency_[fk_table].push_back({ref_table, idx});
            adjacency_[ref_table].push_back({fk_table, idx});
        }
    }

    for (auto& [name, list] : adjacency_) {
        std::sort(list.begin(), list.end(), [this](const Neighbor& a, const Neighbor& b) {
            const auto& ea = edges_[a.edge_index];
            const auto& eb = edges_[b.edge_index];
            return std::tie(a.table, ea.fk_table, ea.fk_column)
                 < std::tie(b.table, eb.fk_table, eb.fk_column);
        });
    }
}

bool JoinGraph::has_table(std::string_view table) const {
    return adjacency_.find(utils::to_lower(table)) != adjacency_.end();
}

const std::vector<JoinGraph::Neighbor>& JoinGraph::neighbors(std::string_view table) const {
    static const std::vector<Neighbor> kEmpty;
    const auto it = adjacency_.find(utils::to_lower(table));
    return it != adjacency_.end() ? it->second : kEmpty;
}

} // namespace nl2sql
