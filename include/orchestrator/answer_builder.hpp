#pragma once

#include "core/types.hpp"
#include "llm/text_completer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

/**
 * @brief Per-column key statistics of a large result
 *
 * Numeric columns (at least one cell parses as a number) get
 * max/min/avg/sum over their numeric cells; other columns get
 * unique/total counts over their non-empty cells.
 */
struct ColumnStats {
    std::string column;
    bool numeric = false;
    double max = 0.0;
    double min = 0.0;
    double avg = 0.0;
    double sum = 0.0;
    size_t count = 0;
    size_t unique_count = 0;
    size_t total_count = 0;
};

/**
 * @brief Natural-language answer from an execution result
 */
class AnswerBuilder {
public:
    static constexpr size_t kFullTableMaxRows = 10;
    static constexpr size_t kSampleRows = 5;
    static constexpr std::string_view kEmptyResultText = "The query returned no matching data.";

    explicit AnswerBuilder(std::shared_ptr<ITextCompleter> completer);

    /// Collaborator answer grounded in the data summary, or fallback_answer().
    [[nodiscard]] std::string build(std::string_view question,
                                    std::string_view sql,
                                    const ExecutionResult& result) const;

    /// Empty text, full table (<= 10 rows) or 5-row sample plus key statistics.
    [[nodiscard]] static std::string format_data_summary(const ExecutionResult& result);

    [[nodiscard]] static std::vector<ColumnStats> key_statistics(const ExecutionResult& result);

    [[nodiscard]] static std::string fallback_answer(const ExecutionResult& result);

private:
    std::shared_ptr<ITextCompleter> completer_;
};

} // namespace nl2sql
