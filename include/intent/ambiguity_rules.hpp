#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

class SessionMemory;

enum class AmbiguityKind : uint8_t {
    REFERENCE,          // pronoun with nothing to refer to
    TIME_RANGE,
    METRIC,             // "best", "重要" without a measurable field
    AGGREGATION,
    GENERAL
};

[[nodiscard]] inline const char* ambiguity_kind_to_string(AmbiguityKind kind) {
    switch (kind) {
        case AmbiguityKind::REFERENCE:   return "reference";
        case AmbiguityKind::TIME_RANGE:  return "time_range";
        case AmbiguityKind::METRIC:      return "metric";
        case AmbiguityKind::AGGREGATION: return "aggregation";
        default:                         return "general";
    }
}

/// Inputs visible to an ambiguity predicate.
struct AmbiguityContext {
    const Intent& intent;
    std::string_view question;          // lowercased working question
    const SessionMemory* memory = nullptr;
};

struct AmbiguityRule {
    std::string name;
    uint32_t specificity = 0;           // higher is evaluated first
    AmbiguityKind kind = AmbiguityKind::GENERAL;
    std::function<bool(const AmbiguityContext&)> predicate;
    std::string reason;
};

struct AmbiguityFinding {
    std::string rule;
    AmbiguityKind kind = AmbiguityKind::GENERAL;
    std::string reason;
};

/**
 * @brief Ordered, first-match-wins list of ambiguity predicates
 *
 * Rules are kept sorted by descending specificity; equal specificity keeps
 * insertion order. The list is replaceable at runtime (add/remove/enable),
 * since the exact rule set is expected to change.
 */
class AmbiguityDetector {
public:
    /// Built-in rules, see default_rules().
    AmbiguityDetector();
    explicit AmbiguityDetector(std::vector<AmbiguityRule> rules);

    [[nodiscard]] std::optional<AmbiguityFinding> detect(const AmbiguityContext& ctx) const;

    void add_rule(AmbiguityRule rule);
    bool remove_rule(std::string_view name);

    /**
     * @brief Keep only the named rules
     * @return Names that match no known rule
     */
    std::vector<std::string> enable_only(const std::vector<std::string>& names);

    [[nodiscard]] std::vector<std::string> rule_names() const;

    /**
     * @brief Built-in rules, most specific first:
     *   pronoun_without_antecedent (40), relative_time_unresolved (30),
     *   superlative_without_metric (20), superlative_without_time_range (10),
     *   vague_aggregation (5)
     */
    [[nodiscard]] static std::vector<AmbiguityRule> default_rules();

private:
    void sort_rules();

    std::vector<AmbiguityRule> rules_;
};

} // namespace nl2sql
