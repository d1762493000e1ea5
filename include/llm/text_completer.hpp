#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nl2sql {

// Text-completion use cases
enum class CompletionUseCase : uint8_t {
    SQL_GENERATION,
    SQL_CRITIQUE,
    CLARIFICATION,
    ANSWER
};

[[nodiscard]] inline const char* completion_use_case_to_string(CompletionUseCase uc) {
    switch (uc) {
        case CompletionUseCase::SQL_GENERATION: return "sql_generation";
        case CompletionUseCase::SQL_CRITIQUE:   return "sql_critique";
        case CompletionUseCase::CLARIFICATION:  return "clarification";
        case CompletionUseCase::ANSWER:         return "answer";
        default:                                return "unknown";
    }
}

struct CompletionRequest {
    CompletionUseCase use_case = CompletionUseCase::SQL_GENERATION;
    std::string system_prompt;
    std::string user_prompt;
    std::string context;
    double temperature = 0.0;
    int max_tokens = 2000;
};

struct CompletionResponse {
    bool success = false;
    std::string content;
    std::string error;              // logged only, never shown to the end user
    bool timed_out = false;
    std::string model_used;
    std::chrono::milliseconds latency{0};
    bool from_cache = false;

    static CompletionResponse ok(std::string text) {
        CompletionResponse r;
        r.success = true;
        r.content = std::move(text);
        return r;
    }

    static CompletionResponse failure(std::string message, bool timeout = false) {
        CompletionResponse r;
        r.error = std::move(message);
        r.timed_out = timeout;
        return r;
    }
};

/**
 * @brief Capability interface of the text-completion collaborator
 *
 * complete() is synchronous and bounded by the implementation's wall-clock
 * timeout. Implementations must not throw; failures come back as
 * success == false (timed_out set when the deadline was hit).
 */
class ITextCompleter {
public:
    virtual ~ITextCompleter() = default;

    [[nodiscard]] virtual CompletionResponse complete(const CompletionRequest& request) = 0;
};

} // namespace nl2sql
