#include "orchestrator/prompts.hpp"

#include <format>

namespace nl2sql::prompts {

namespace {

std::string intent_hints(const Intent& intent) {
    std::string out;
    if (intent.question_type != QuestionType::UNKNOWN) {
        out += std::format("Question type: {}\n", question_type_to_string(intent.question_type));
    }
    if (intent.row_limit) {
        out += std::format("Return at most {} rows (use LIMIT {}).\n",
                           *intent.row_limit, *intent.row_limit);
    }
    if (intent.time_range) {
        out += std::format("Time range: {} (\"{}\")\n",
                           intent.time_range->label, intent.time_range->phrase);
    }
    return out;
}

} // anonymous namespace

std::string generation_user_prompt(const GenerationPrompt& p) {
    std::string out = std::format("Schema:\n{}\n", p.schema);
    if (!p.join_hint.empty()) {
        out += p.join_hint;
        out += '\n';
    } else if (!p.join_note.empty()) {
        out += std::format("Note: {}\n", p.join_note);
    }
    if (p.intent) {
        out += intent_hints(*p.intent);
    }
    if (!p.previous_sql.empty()) {
        out += std::format("\nThe previous attempt was:\n```sql\n{}\n```\n", p.previous_sql);
    }
    if (!p.critique.empty()) {
        out += std::format("Review of the previous attempt:\n{}\n", p.critique);
    }
    out += std::format("\nQuestion: {}", p.question);
    return out;
}

std::string critique_user_prompt(std::string_view question,
                                 std::string_view sql,
                                 std::string_view diagnostics,
                                 std::string_view schema) {
    return std::format(
        "Schema:\n{}\n\nQuestion: {}\n\nSQL:\n```sql\n{}\n```\n\nProblems:\n{}",
        schema, question, sql, diagnostics);
}

std::string clarification_user_prompt(std::string_view question, std::string_view reason) {
    return std::format("Question: {}\nWhy it is ambiguous: {}", question, reason);
}

std::string answer_user_prompt(std::string_view question,
                               std::string_view sql,
                               std::string_view data_summary) {
    return std::format("Question: {}\n\nSQL:\n{}\n\nData summary:\n{}",
                       question, sql, data_summary);
}

std::string format_diagnostics(const std::vector<Diagnostic>& diagnostics) {
    std::string out;
    for (const auto& d : diagnostics) {
        if (!out.empty()) out += '\n';
        out += std::format("- [{}] {}", diagnostic_kind_to_string(d.kind), d.message);
        if (d.position) {
            out += std::format(" (position {})", *d.position);
        }
        if (!d.fragment.empty()) {
            out += std::format(" near \"{}\"", d.fragment);
        }
    }
    return out;
}

} // namespace nl2sql::prompts
