#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace nl2sql {

/**
 * @brief Pattern-based question classifier (Chinese and English)
 *
 * Never fails: empty or over-long questions yield the default intent
 * (LIST, no limit, no time range, is_default = true).
 */
class IntentParser {
public:
    static constexpr size_t kMaxQuestionLength = 2000;

    [[nodiscard]] Intent parse(std::string_view question) const;

    [[nodiscard]] static Intent default_intent();

    // Exposed for tests; all take the lowercased question.

    [[nodiscard]] static QuestionType classify(std::string_view lowered);

    /// 前N / 前五 / top N / first N / limit N
    [[nodiscard]] static std::optional<uint32_t> extract_row_limit(std::string_view lowered);

    /// Relative phrases (今年, last month, 最近7天, past 30 days) or a four-digit year.
    [[nodiscard]] static std::optional<TimeRange> extract_time_range(std::string_view lowered);

    /// 一..九十九 (including 两 and 十N / N十 / N十M forms); nullopt otherwise.
    [[nodiscard]] static std::optional<uint32_t> parse_chinese_number(std::string_view text);
};

} // namespace nl2sql
