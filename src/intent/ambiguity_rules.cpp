#include "intent/ambiguity_rules.hpp"
#include "memory/context_memory.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace nl2sql {

static constexpr std::string_view kPronouns[] = {
    "他们", "她们", "它们", "这些", "那些", "上述", "刚才",
    "they", "them", "those", "these"
};

static constexpr std::string_view kRelativeTimeWords[] = {
    "最近", "近期", "近来", "以前", "之前", "前段时间",
    "recently", "lately", "recent"
};

static constexpr std::string_view kVagueMetricWords[] = {
    "最好", "最差", "重要", "主要",
    "best", "worst", "important", "main"
};

static constexpr std::string_view kMeasureWords[] = {
    "金额", "销售额", "收入", "数量", "次数", "销量", "评分", "时长",
    "amount", "sales", "revenue", "quantity", "count", "number of", "total",
    "rating", "duration", "spend", "spent"
};

static constexpr std::string_view kVagueAggregationWords[] = {
    "统计", "汇总", "分析", "情况",
    "summarize", "summary", "statistics", "analyze", "analysis", "overview"
};

static constexpr std::string_view kExplicitAggregationWords[] = {
    "总数", "总和", "总金额", "平均", "数量", "金额", "销售额", "最大", "最小",
    "count", "sum", "avg", "average", "total", "max", "min", "number of", "how many"
};

/// Entries scanned for an antecedent.
static constexpr size_t kAntecedentWindow = 5;

namespace {

template <size_t N>
bool mentions(std::string_view question, const std::string_view (&words)[N]) {
    return std::any_of(std::begin(words), std::end(words),
                       [&](std::string_view w) { return utils::contains_phrase(question, w); });
}

} // anonymous namespace

// ============================================================================
// Built-in Rules
// ============================================================================

std::vector<AmbiguityRule> AmbiguityDetector::default_rules() {
    std::vector<AmbiguityRule> rules;

    rules.push_back({
        "pronoun_without_antecedent", 40, AmbiguityKind::REFERENCE,
        [](const AmbiguityContext& ctx) {
            if (!mentions(ctx.question, kPronouns)) return false;
            return ctx.memory == nullptr || !ctx.memory->has_recent_subject(kAntecedentWindow);
        },
        "The question refers to something not mentioned earlier in the conversation"
    });

    rules.push_back({
        "relative_time_unresolved", 30, AmbiguityKind::TIME_RANGE,
        [](const AmbiguityContext& ctx) {
            return !ctx.intent.time_range && mentions(ctx.question, kRelativeTimeWords);
        },
        "A relative time word is used without a concrete time range"
    });

    rules.push_back({
        "superlative_without_metric", 20, AmbiguityKind::METRIC,
        [](const AmbiguityContext& ctx) {
            return mentions(ctx.question, kVagueMetricWords) &&
                   !mentions(ctx.question, kMeasureWords);
        },
        "An evaluative word is used without saying how it is measured"
    });

    rules.push_back({
        "superlative_without_time_range", 10, AmbiguityKind::TIME_RANGE,
        [](const AmbiguityContext& ctx) {
            return ctx.intent.question_type == QuestionType::RANKING && !ctx.intent.time_range;
        },
        "A ranking question has no time range"
    });

    rules.push_back({
        "vague_aggregation", 5, AmbiguityKind::AGGREGATION,
        [](const AmbiguityContext& ctx) {
            if (ctx.intent.question_type == QuestionType::COUNT ||
                ctx.intent.question_type == QuestionType::AGGREGATE) {
                return false;
            }
            return mentions(ctx.question, kVagueAggregationWords) &&
                   !mentions(ctx.question, kExplicitAggregationWords);
        },
        "A summary is requested without naming the aggregation"
    });

    return rules;
}

// ============================================================================
// Detector
// ============================================================================

AmbiguityDetector::AmbiguityDetector()
    : AmbiguityDetector(default_rules()) {}

AmbiguityDetector::AmbiguityDetector(std::vector<AmbiguityRule> rules)
    : rules_(std::move(rules)) {
    sort_rules();
}

void AmbiguityDetector::sort_rules() {
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const AmbiguityRule& a, const AmbiguityRule& b) {
                         return a.specificity > b.specificity;
                     });
}

std::optional<AmbiguityFinding> AmbiguityDetector::detect(const AmbiguityContext& ctx) const {
    for (const auto& rule : rules_) {
        if (rule.predicate && rule.predicate(ctx)) {
            return AmbiguityFinding{rule.name, rule.kind, rule.reason};
        }
    }
    return std::nullopt;
}

void AmbiguityDetector::add_rule(AmbiguityRule rule) {
    remove_rule(rule.name);
    rules_.push_back(std::move(rule));
    sort_rules();
}

bool AmbiguityDetector::remove_rule(std::string_view name) {
    const auto before = rules_.size();
    std::erase_if(rules_, [&](const AmbiguityRule& r) { return r.name == name; });
    return rules_.size() != before;
}

std::vector<std::string> AmbiguityDetector::enable_only(const std::vector<std::string>& names) {
    const std::set<std::string> wanted(names.begin(), names.end());
    std::vector<std::string> unknown;
    for (const auto& name : wanted) {
        const bool known = std::any_of(rules_.begin(), rules_.end(),
                                       [&](const AmbiguityRule& r) { return r.name == name; });
        if (!known) unknown.push_back(name);
    }
    std::erase_if(rules_, [&](const AmbiguityRule& r) { return !wanted.contains(r.name); });
    return unknown;
}

std::vector<std::string> AmbiguityDetector::rule_names() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) names.push_back(rule.name);
    return names;
}

} // namespace nl2sql
