#include "orchestrator/answer_builder.hpp"
#include "core/utils.hpp"
#include "orchestrator/prompts.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace nl2sql {

namespace {

std::string format_table(const std::vector<std::string>& columns,
                         const std::vector<Row>& rows, size_t limit) {
    std::string out = "| " + utils::join(columns, " | ") + " |\n|";
    for (size_t i = 0; i < columns.size(); ++i) out += " --- |";
    out += '\n';
    const size_t n = std::min(limit, rows.size());
    for (size_t r = 0; r < n; ++r) {
        out += "| " + utils::join(rows[r], " | ") + " |\n";
    }
    return out;
}

} // anonymous namespace

AnswerBuilder::AnswerBuilder(std::shared_ptr<ITextCompleter> completer)
    : completer_(std::move(completer)) {}

// ============================================================================
// Data Summary
// ============================================================================

std::vector<ColumnStats> AnswerBuilder::key_statistics(const ExecutionResult& result) {
    std::vector<ColumnStats> stats;
    stats.reserve(result.columns.size());

    for (size_t col = 0; col < result.columns.size(); ++col) {
        ColumnStats s;
        s.column = result.columns[col];

        std::vector<double> numbers;
        std::unordered_set<std::string> unique;
        for (const auto& row : result.rows) {
            if (col >= row.size() || row[col].empty()) continue;
            ++s.total_count;
            unique.insert(row[col]);
            if (const auto v = utils::try_parse_double(row[col])) {
                numbers.push_back(*v);
            }
        }
        if (s.total_count == 0) continue;

        if (!numbers.empty()) {
            s.numeric = true;
            s.count = numbers.size();
            const auto [lo, hi] = std::minmax_element(numbers.begin(), numbers.end());
            s.min = *lo;
            s.max = *hi;
            for (const double v : numbers) s.sum += v;
            s.avg = s.sum / static_cast<double>(s.count);
        } else {
            s.unique_count = unique.size();
        }
        stats.push_back(std::move(s));
    }
    return stats;
}

std::string AnswerBuilder::format_data_summary(const ExecutionResult& result) {
    if (result.rows.empty()) {
        return std::string(kEmptyResultText);
    }

    const size_t total = result.rows.size();
    if (total <= kFullTableMaxRows) {
        return std::format("{} rows:\n{}", total,
                           format_table(result.columns, result.rows, total));
    }

    std::string out = std::format("{} rows{}. First {} rows:\n{}", total,
                                  result.truncated ? " (truncated)" : "", kSampleRows,
                                  format_table(result.columns, result.rows, kSampleRows));
    out += "Key statistics:\n";
    for (const auto& s : key_statistics(result)) {
        if (s.numeric) {
            out += std::format("- {}: max={}, min={}, avg={:.2f}, sum={}, count={}\n",
                               s.column, s.max, s.min, s.avg, s.sum, s.count);
        } else {
            out += std::format("- {}: {} unique of {} values\n",
                               s.column, s.unique_count, s.total_count);
        }
    }
    return out;
}

std::string AnswerBuilder::fallback_answer(const ExecutionResult& result) {
    if (result.rows.empty()) {
        return std::string(kEmptyResultText);
    }
    return std::format("Query succeeded and returned {} rows.", result.rows.size());
}

// ============================================================================
// Answer
// ============================================================================

std::string AnswerBuilder::build(std::string_view question,
                                 std::string_view sql,
                                 const ExecutionResult& result) const {
    CompletionRequest request;
    request.use_case = CompletionUseCase::ANSWER;
    request.system_prompt = std::string(prompts::kAnswerSystem);
    request.user_prompt = prompts::answer_user_prompt(question, sql, format_data_summary(result));
    request.temperature = 0.3;

    const auto response = completer_->complete(request);
    if (!response.success) {
        utils::log::warn(std::format("Answer: text completion failed ({}), using fallback",
                                     response.error));
        return fallback_answer(result);
    }
    auto answer = utils::trim(response.content);
    return answer.empty() ? fallback_answer(result) : answer;
}

} // namespace nl2sql
