#pragma once

#include "core/types.hpp"
#include "llm/text_completer.hpp"
#include "orchestrator/prompts.hpp"

#include <memory>
#include <string>

namespace nl2sql {

/**
 * @brief Turns a question into candidate SQL through the text-completion collaborator
 *
 * The response is treated as opaque text: fences are stripped and the
 * chat-vs-SQL signal decides the outcome. Collaborator failures become
 * diagnostics; the raw error is logged only.
 */
class SqlGenerator {
public:
    enum class Outcome : uint8_t { SQL, CHAT, FAILED };

    struct GenerationResult {
        Outcome outcome = Outcome::FAILED;
        std::string sql;
        std::string chat_text;
        Diagnostic diagnostic;
    };

    struct Options {
        double temperature = 0.0;
        int max_tokens = 2000;
    };

    SqlGenerator(std::shared_ptr<ITextCompleter> completer, Options options);

    /**
     * @param prompt Question, schema and hints
     * @param memory_context Formatted recent session history
     * @param allow_chat False during regeneration: prose is then NO_SQL_PRODUCED
     */
    [[nodiscard]] GenerationResult generate(const prompts::GenerationPrompt& prompt,
                                            const std::string& memory_context,
                                            bool allow_chat) const;

private:
    std::shared_ptr<ITextCompleter> completer_;
    Options options_;
};

/// Diagnostic for a failed completion; the raw error text stays out of it.
[[nodiscard]] Diagnostic collaborator_diagnostic(const CompletionResponse& response,
                                                 std::string_view step);

} // namespace nl2sql
