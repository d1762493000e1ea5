#include "orchestrator/sql_critic.hpp"
#include "core/utils.hpp"
#include "orchestrator/prompts.hpp"

#include <format>

namespace nl2sql {

SqlCritic::SqlCritic(std::shared_ptr<ITextCompleter> completer)
    : completer_(std::move(completer)) {}

std::string SqlCritic::fallback_rationale(const std::vector<Diagnostic>& diagnostics) {
    if (diagnostics.empty()) {
        return "The previous query failed. Rewrite it using only the listed tables and columns.";
    }
    return std::format("The previous query failed. Fix these problems and use only the listed "
                       "tables and columns:\n{}", prompts::format_diagnostics(diagnostics));
}

std::string SqlCritic::critique(std::string_view question,
                                std::string_view sql,
                                const std::vector<Diagnostic>& diagnostics,
                                std::string_view schema) const {
    const auto problems = prompts::format_diagnostics(diagnostics);

    CompletionRequest request;
    request.use_case = CompletionUseCase::SQL_CRITIQUE;
    request.system_prompt = std::string(prompts::kCritiqueSystem);
    request.user_prompt = prompts::critique_user_prompt(question, sql, problems, schema);

    const auto response = completer_->complete(request);
    if (!response.success) {
        utils::log::warn(std::format("SQL critique: text completion failed ({}), using fallback",
                                     response.error));
        return fallback_rationale(diagnostics);
    }

    auto rationale = utils::trim(response.content);
    if (rationale.empty()) {
        return fallback_rationale(diagnostics);
    }
    // Raw diagnostics travel with the rationale
    if (!problems.empty()) {
        rationale += std::format("\n\nReported problems:\n{}", problems);
    }
    return rationale;
}

} // namespace nl2sql
