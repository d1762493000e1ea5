#include "schema/join_synthesizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <set>
#include <unordered_map>

namespace nl2sql {

bool JoinPath::contains(const std::string& table) const {
    const auto lower = utils::to_lower(table);
    return std::find(tables.begin(), tables.end(), lower) != tables.end();
}

// ============================================================================
// Synthesis
// ============================================================================

namespace {

struct BfsTree {
    std::unordered_map<std::string, std::string> parent;
    std::unordered_map<std::string, size_t> parent_edge;
    std::unordered_map<std::string, size_t> order;   // discovery index
};

BfsTree bfs_from(const JoinGraph& graph, const std::string& anchor) {
    BfsTree tree;
    std::deque<std::string> queue;
    tree.order.emplace(anchor, 0);
    queue.push_back(anchor);

    while (!queue.empty()) {
        const std::string current = std::move(queue.front());
        queue.pop_front();

        for (const auto& nb : graph.neighbors(current)) {
            if (tree.order.contains(nb.table)) continue;
            tree.order.emplace(nb.table, tree.order.size());
            tree.parent.emplace(nb.table, current);
            tree.parent_edge.emplace(nb.table, nb.edge_index);
            queue.push_back(nb.table);
        }
    }
    return tree;
}

} // anonymous namespace

JoinSynthesizer::SynthesisResult JoinSynthesizer::synthesize(
    const JoinGraph& graph,
    const std::vector<std::string>& required) {

    std::set<std::string> targets;
    for (const auto& t : required) {
        targets.insert(utils::to_lower(t));
    }
    if (targets.empty()) {
        return SynthesisResult::no_path({}, "No tables requested");
    }

    std::vector<std::string> unknown;
    for (const auto& t : targets) {
        if (!graph.has_table(t)) unknown.push_back(t);
    }
    if (!unknown.empty()) {
        return SynthesisResult::no_path(unknown, std::format(
            "Tables not present in catalog: {}", utils::join(unknown, ", ")));
    }

    const std::string anchor = *targets.begin();
    const BfsTree tree = bfs_from(graph, anchor);

    std::vector<std::string> unreachable;
    for (const auto& t : targets) {
        if (!tree.order.contains(t)) unreachable.push_back(t);
    }
    if (!unreachable.empty()) {
        return SynthesisResult::no_path(unreachable, std::format(
            "No foreign-key path from '{}' to: {}", anchor, utils::join(unreachable, ", ")));
    }

    // Union of tree paths anchor -> target
    std::set<std::string> members{anchor};
    for (const auto& t : targets) {
        std::string node = t;
        while (node != anchor && members.insert(node).second) {
            node = tree.parent.at(node);
        }
    }

    std::vector<std::string> ordered(members.begin(), members.end());
    std::sort(ordered.begin(), ordered.end(), [&tree](const std::string& a, const std::string& b) {
        return tree.order.at(a) < tree.order.at(b);
    });

    JoinPath path;
    path.anchor = anchor;
    for (const auto& table : ordered) {
        path.tables.push_back(table);
        if (!targets.contains(table)) {
            path.waypoints.push_back(table);
        }
        if (table == anchor) continue;

        const auto& edge = graph.edge(tree.parent_edge.at(table));
        path.steps.push_back(JoinStep{
            tree.parent.at(table),
            table,
            edge.nullable ? JoinType::LEFT : JoinType::INNER,
            edge});
    }

    return SynthesisResult::ok(std::move(path));
}

// ============================================================================
// Rendering
// ============================================================================

std::string JoinSynthesizer::render_join_clause(const JoinPath& path) {
    std::string out = "FROM " + path.anchor;
    for (const auto& step : path.steps) {
        out += std::format("\n  {} {} ON {}",
                           join_type_to_string(step.type), step.table, step.edge.condition());
    }
    return out;
}

std::string JoinSynthesizer::format_join_hint(const JoinPath& path) {
    if (path.steps.empty()) return "";

    std::string out = "Join path (derived from foreign keys):\n";
    for (const auto& step : path.steps) {
        out += std::format("- {} -> {}: {} ON {}\n",
                           step.from_table, step.table,
                           join_type_to_string(step.type), step.edge.condition());
    }
    if (!path.waypoints.empty()) {
        out += std::format("Intermediate tables required: {}\n",
                           utils::join(path.waypoints, ", "));
    }
    out += "Suggested clause:\n" + render_join_clause(path) + "\n";
    return out;
}

} // namespace nl2sql
