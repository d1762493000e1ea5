#include "intent/intent_parser.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace nl2sql {

// ============================================================================
// Vocabulary
// ============================================================================

static constexpr std::string_view kRankingTerms[] = {
    "最多", "最少", "最高", "最低", "最大", "最小", "最好", "最差",
    "最受欢迎", "最热门", "最常", "排名", "排行",
    "most", "least", "highest", "lowest", "largest", "smallest",
    "best", "worst", "top", "rank", "ranking"
};

static constexpr std::string_view kTrendTerms[] = {
    "趋势", "按月", "每月", "按年", "每年", "按天", "每天", "变化", "增长",
    "trend", "over time", "monthly", "yearly", "per month", "per year",
    "by month", "by year", "growth"
};

static constexpr std::string_view kCountTerms[] = {
    "多少个", "多少条", "多少位", "有多少", "几个", "总数", "数量", "计数",
    "how many", "count", "number of"
};

static constexpr std::string_view kAggregateTerms[] = {
    "总和", "合计", "总计", "总额", "总金额", "平均", "求和",
    "sum", "total", "average", "avg", "mean"
};

static constexpr std::string_view kDetailTerms[] = {
    "详情", "详细", "明细", "detail", "details"
};

static constexpr std::pair<std::string_view, std::string_view> kTimePhrases[] = {
    {"最近一周", "last_7_days"},
    {"最近一个月", "last_30_days"},
    {"最近三个月", "last_90_days"},
    {"最近一年", "last_365_days"},
    {"今天", "today"},
    {"昨天", "yesterday"},
    {"本周", "this_week"},
    {"这周", "this_week"},
    {"上周", "last_week"},
    {"本月", "this_month"},
    {"这个月", "this_month"},
    {"上个月", "last_month"},
    {"上月", "last_month"},
    {"今年", "this_year"},
    {"去年", "last_year"},
    {"today", "today"},
    {"yesterday", "yesterday"},
    {"this week", "this_week"},
    {"last week", "last_week"},
    {"past week", "last_7_days"},
    {"this month", "this_month"},
    {"last month", "last_month"},
    {"past month", "last_30_days"},
    {"this year", "this_year"},
    {"last year", "last_year"},
    {"past year", "last_365_days"}
};

static constexpr std::pair<std::string_view, uint32_t> kChineseDigits[] = {
    {"一", 1}, {"二", 2}, {"两", 2}, {"三", 3}, {"四", 4},
    {"五", 5}, {"六", 6}, {"七", 7}, {"八", 8}, {"九", 9}
};
static constexpr std::string_view kChineseTen = "十";

// Alternation, not a bracket class: std::regex brackets match single bytes
static constexpr std::string_view kChineseNumberGroup = "((?:一|二|两|三|四|五|六|七|八|九|十)+)";

namespace {

template <size_t N>
bool contains_any(std::string_view lowered, const std::string_view (&terms)[N]) {
    for (const auto term : terms) {
        if (utils::contains_phrase(lowered, term)) return true;
    }
    return false;
}

const std::regex& digit_limit_regex() {
    static const std::regex re(R"((?:前|\btop|\bfirst|\blimit)\s*([0-9]+))");
    return re;
}

const std::regex& chinese_limit_regex() {
    static const std::regex re(std::format("前\\s*{}", kChineseNumberGroup));
    return re;
}

const std::regex& recent_days_regex() {
    static const std::regex re(R"((?:最近|过去|近|past|last)\s*([0-9]+)\s*(?:天|days?))");
    return re;
}

const std::regex& chinese_recent_days_regex() {
    static const std::regex re(std::format("(?:最近|过去|近){}天", kChineseNumberGroup));
    return re;
}

const std::regex& year_regex() {
    static const std::regex re(R"((?:^|[^0-9])((?:19|20)[0-9]{2})(?![0-9]))");
    return re;
}

std::optional<uint32_t> positive(std::optional<uint32_t> v) {
    if (v && *v == 0) return std::nullopt;
    return v;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

Intent IntentParser::default_intent() {
    Intent intent;
    intent.question_type = QuestionType::LIST;
    intent.is_default = true;
    return intent;
}

Intent IntentParser::parse(std::string_view question) const {
    const auto trimmed = utils::trim(question);
    if (trimmed.empty() || trimmed.size() > kMaxQuestionLength) {
        utils::log::debug("Intent: falling back to default intent");
        return default_intent();
    }

    const auto lowered = utils::to_lower(trimmed);
    Intent intent;
    intent.question_type = classify(lowered);
    intent.row_limit = extract_row_limit(lowered);
    intent.time_range = extract_time_range(lowered);
    return intent;
}

QuestionType IntentParser::classify(std::string_view lowered) {
    if (contains_any(lowered, kRankingTerms))   return QuestionType::RANKING;
    if (contains_any(lowered, kTrendTerms))     return QuestionType::TREND;
    if (contains_any(lowered, kCountTerms))     return QuestionType::COUNT;
    if (contains_any(lowered, kAggregateTerms)) return QuestionType::AGGREGATE;
    if (contains_any(lowered, kDetailTerms))    return QuestionType::DETAIL;
    return QuestionType::LIST;
}

std::optional<uint32_t> IntentParser::extract_row_limit(std::string_view lowered) {
    const std::string text(lowered);
    std::smatch m;
    if (std::regex_search(text, m, digit_limit_regex())) {
        return positive(utils::try_parse_int<uint32_t>(m[1].str()));
    }
    if (std::regex_search(text, m, chinese_limit_regex())) {
        return positive(parse_chinese_number(m[1].str()));
    }
    return std::nullopt;
}

std::optional<TimeRange> IntentParser::extract_time_range(std::string_view lowered) {
    const std::string text(lowered);
    std::smatch m;

    if (std::regex_search(text, m, recent_days_regex())) {
        if (auto days = positive(utils::try_parse_int<uint32_t>(m[1].str()))) {
            return TimeRange{std::format("last_{}_days", *days), m[0].str(), true};
        }
    }
    if (std::regex_search(text, m, chinese_recent_days_regex())) {
        if (auto days = positive(parse_chinese_number(m[1].str()))) {
            return TimeRange{std::format("last_{}_days", *days), m[0].str(), true};
        }
    }

    for (const auto& [phrase, label] : kTimePhrases) {
        if (utils::contains_phrase(lowered, phrase)) {
            return TimeRange{std::string(label), std::string(phrase), true};
        }
    }

    if (std::regex_search(text, m, year_regex())) {
        return TimeRange{std::format("year_{}", m[1].str()), m[1].str(), false};
    }
    return std::nullopt;
}

std::optional<uint32_t> IntentParser::parse_chinese_number(std::string_view text) {
    constexpr uint32_t kTen = 10;
    std::vector<uint32_t> tokens;
    size_t pos = 0;
    while (pos < text.size()) {
        bool matched = false;
        if (text.substr(pos).starts_with(kChineseTen)) {
            tokens.push_back(kTen);
            pos += kChineseTen.size();
            continue;
        }
        for (const auto& [glyph, value] : kChineseDigits) {
            if (text.substr(pos).starts_with(glyph)) {
                tokens.push_back(value);
                pos += glyph.size();
                matched = true;
                break;
            }
        }
        if (!matched) return std::nullopt;
    }

    switch (tokens.size()) {
        case 1:
            return tokens[0];                                   // 五 / 十
        case 2:
            if (tokens[0] == kTen && tokens[1] != kTen) return kTen + tokens[1];   // 十五
            if (tokens[0] != kTen && tokens[1] == kTen) return tokens[0] * kTen;   // 二十
            return std::nullopt;
        case 3:
            if (tokens[0] != kTen && tokens[1] == kTen && tokens[2] != kTen) {
                return tokens[0] * kTen + tokens[2];            // 二十五
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

} // namespace nl2sql
