#include "orchestrator/sql_generator.hpp"
#include "core/utils.hpp"
#include "parser/sql_text.hpp"

#include <format>

namespace nl2sql {

Diagnostic collaborator_diagnostic(const CompletionResponse& response, std::string_view step) {
    utils::log::error(std::format("{}: text completion failed: {}", step, response.error));
    if (response.timed_out) {
        return {DiagnosticKind::COLLABORATOR_TIMEOUT,
                std::format("{} timed out waiting for the language model", step)};
    }
    return {DiagnosticKind::COLLABORATOR_ERROR,
            std::format("{} could not reach the language model", step)};
}

SqlGenerator::SqlGenerator(std::shared_ptr<ITextCompleter> completer, Options options)
    : completer_(std::move(completer)), options_(options) {}

SqlGenerator::GenerationResult SqlGenerator::generate(const prompts::GenerationPrompt& prompt,
                                                      const std::string& memory_context,
                                                      bool allow_chat) const {
    GenerationResult result;

    CompletionRequest request;
    request.use_case = CompletionUseCase::SQL_GENERATION;
    request.system_prompt = std::string(prompts::kGenerationSystem);
    request.user_prompt = prompts::generation_user_prompt(prompt);
    request.context = memory_context;
    request.temperature = options_.temperature;
    request.max_tokens = options_.max_tokens;

    const auto response = completer_->complete(request);
    if (!response.success) {
        result.diagnostic = collaborator_diagnostic(response, "SQL generation");
        return result;
    }

    const auto extracted = sql_text::extract_sql(response.content);
    if (extracted.text.empty()) {
        result.diagnostic = {DiagnosticKind::NO_SQL_PRODUCED, "The model returned an empty response"};
        return result;
    }

    if (sql_text::looks_like_sql(extracted)) {
        result.outcome = Outcome::SQL;
        result.sql = sql_text::strip_terminator(extracted.text);
        utils::log::debug(std::format("Generated SQL: {}", result.sql));
        return result;
    }

    if (allow_chat) {
        result.outcome = Outcome::CHAT;
        result.chat_text = utils::trim(response.content);
        return result;
    }

    result.diagnostic = {DiagnosticKind::NO_SQL_PRODUCED,
                         "The model answered in prose instead of producing SQL"};
    return result;
}

} // namespace nl2sql
