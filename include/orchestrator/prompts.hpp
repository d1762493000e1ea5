#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace nl2sql::prompts {

// ============================================================================
// System prompts
// ============================================================================

inline constexpr std::string_view kGenerationSystem =
    "You translate questions about a PostgreSQL database into one read-only SELECT "
    "statement. Use only the tables and columns listed in the schema. Reply with the "
    "SQL inside a ```sql fence and nothing else. If the message is small talk or "
    "cannot be answered from the database, reply in plain prose without SQL. "
    "Answer in the language of the question.";

inline constexpr std::string_view kCritiqueSystem =
    "You review a SQL statement that failed. Explain in a few sentences what is wrong "
    "and how to fix it, using only the listed schema. Do not write the full query.";

inline constexpr std::string_view kClarificationSystem =
    "The user's question is ambiguous. Ask exactly one short closed question that "
    "resolves the ambiguity. Format:\nQuestion: <question>\n1. <option>\n2. <option>\n"
    "Give between 2 and 5 options. Ask in the language of the user's question.";

inline constexpr std::string_view kAnswerSystem =
    "You summarize SQL query results for the user. Answer the question directly from "
    "the data summary in a few sentences, in the language of the question. Do not "
    "invent numbers that are not in the summary.";

// ============================================================================
// User prompt builders
// ============================================================================

struct GenerationPrompt {
    std::string question;
    std::string schema;                 // CatalogSnapshot::format_for_prompt
    std::string join_hint;              // JoinSynthesizer::format_join_hint, may be empty
    std::string join_note;              // replaces the hint once no path was found
    const Intent* intent = nullptr;
    std::string previous_sql;           // regeneration only
    std::string critique;               // regeneration only
};

[[nodiscard]] std::string generation_user_prompt(const GenerationPrompt& p);

[[nodiscard]] std::string critique_user_prompt(std::string_view question,
                                               std::string_view sql,
                                               std::string_view diagnostics,
                                               std::string_view schema);

[[nodiscard]] std::string clarification_user_prompt(std::string_view question,
                                                    std::string_view reason);

[[nodiscard]] std::string answer_user_prompt(std::string_view question,
                                             std::string_view sql,
                                             std::string_view data_summary);

/// "line 1\nline 2" rendering of diagnostics for prompts and logs.
[[nodiscard]] std::string format_diagnostics(const std::vector<Diagnostic>& diagnostics);

} // namespace nl2sql::prompts
