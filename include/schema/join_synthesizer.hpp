#pragma once

#include "schema/join_graph.hpp"

#include <string>
#include <vector>

namespace nl2sql {

enum class JoinType : uint8_t { INNER, LEFT };

[[nodiscard]] inline const char* join_type_to_string(JoinType type) {
    return type == JoinType::LEFT ? "LEFT JOIN" : "INNER JOIN";
}

struct JoinStep {
    std::string from_table;     // already joined
    std::string table;          // joined by this step
    JoinType type = JoinType::INNER;
    JoinEdge edge;
};

struct JoinPath {
    std::string anchor;
    std::vector<JoinStep> steps;
    std::vector<std::string> tables;     // join order, anchor first
    std::vector<std::string> waypoints;  // tables on the path that were not required

    [[nodiscard]] bool contains(const std::string& table) const;
};

/**
 * @brief Computes deterministic join paths over a JoinGraph
 *
 * Anchor is the lexicographically first required table. A single BFS from
 * the anchor (neighbors visited in sorted order) yields a shortest-path tree;
 * the union of the tree paths to each required table forms the join.
 * Non-required tables on those paths become waypoints.
 *
 * Stateless; safe for concurrent use.
 */
class JoinSynthesizer {
public:
    struct SynthesisResult {
        bool found = false;
        JoinPath path;
        std::vector<std::string> unreachable;
        std::string error_message;

        static SynthesisResult ok(JoinPath p) {
            SynthesisResult r;
            r.found = true;
            r.path = std::move(p);
            return r;
        }

        static SynthesisResult no_path(std::vector<std::string> missing, std::string message) {
            SynthesisResult r;
            r.found = false;
            r.unreachable = std::move(missing);
            r.error_message = std::move(message);
            return r;
        }
    };

    /**
     * @brief Connect every table in `required` (order and case are irrelevant)
     * @return Path, or NO_PATH listing the unreachable tables. Never partial.
     */
    [[nodiscard]] static SynthesisResult synthesize(const JoinGraph& graph,
                                                    const std::vector<std::string>& required);

    /// "FROM a\n  INNER JOIN b ON b.x = a.y\n..."
    [[nodiscard]] static std::string render_join_clause(const JoinPath& path);

    /// Prompt hint block describing the path for the generation collaborator.
    [[nodiscard]] static std::string format_join_hint(const JoinPath& path);
};

} // namespace nl2sql
