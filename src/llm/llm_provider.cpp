#include "llm/llm_provider.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace nl2sql {

namespace {

std::string user_message(const CompletionRequest& request) {
    if (request.context.empty()) return request.user_prompt;
    return std::format("{}\n\nContext:\n{}", request.user_prompt, request.context);
}

std::optional<JsonValue> parse_body(std::string_view body) {
    try {
        return JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return std::nullopt;
    }
}

} // anonymous namespace

std::pair<std::string, std::string> split_base_url(std::string_view url) {
    const auto scheme_end = url.find("://");
    const size_t host_start = scheme_end == std::string_view::npos ? 0 : scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == std::string_view::npos) {
        return {std::string(url), ""};
    }
    std::string path(url.substr(path_start));
    while (!path.empty() && path.back() == '/') path.pop_back();
    return {std::string(url.substr(0, path_start)), std::move(path)};
}

// ============================================================================
// OpenAI-compatible
// ============================================================================

OpenAiCompatibleProvider::OpenAiCompatibleProvider(std::string name, std::string base_url,
                                                   std::string model)
    : name_(std::move(name)), base_url_(std::move(base_url)), model_(std::move(model)) {}

std::string OpenAiCompatibleProvider::path(std::string_view base_path) const {
    return std::format("{}/chat/completions", base_path);
}

HeaderList OpenAiCompatibleProvider::headers(const std::string& api_key) const {
    return {
        {"Authorization", "Bearer " + api_key},
        {"content-type", "application/json"}
    };
}

std::string OpenAiCompatibleProvider::build_body(const CompletionRequest& request,
                                                 const std::string& model) const {
    return std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(model), request.temperature, request.max_tokens,
        utils::escape_json(request.system_prompt),
        utils::escape_json(user_message(request)));
}

std::optional<std::string> OpenAiCompatibleProvider::extract_content(std::string_view body) const {
    // {"choices":[{"message":{"content":"..."}}]}
    const auto doc = parse_body(body);
    if (!doc) return std::nullopt;
    const auto content = (*doc)["choices"][size_t{0}]["message"]["content"];
    if (!content.is_string()) return std::nullopt;
    return content.get<std::string>();
}

// ============================================================================
// Anthropic
// ============================================================================

std::string AnthropicProvider::path(std::string_view base_path) const {
    return std::format("{}/v1/messages", base_path);
}

HeaderList AnthropicProvider::headers(const std::string& api_key) const {
    return {
        {"x-api-key", api_key},
        {"anthropic-version", std::string(kApiVersion)},
        {"content-type", "application/json"}
    };
}

std::string AnthropicProvider::build_body(const CompletionRequest& request,
                                          const std::string& model) const {
    return std::format(
        R"({{"model":"{}","max_tokens":{},"temperature":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(model), request.max_tokens, request.temperature,
        utils::escape_json(request.system_prompt),
        utils::escape_json(user_message(request)));
}

std::optional<std::string> AnthropicProvider::extract_content(std::string_view body) const {
    // {"content":[{"type":"text","text":"..."}, ...]}
    const auto doc = parse_body(body);
    if (!doc || !(*doc)["content"].is_array()) return std::nullopt;
    std::string text;
    bool found = false;
    for (const auto& block : (*doc)["content"].elements()) {
        if (block.value("type", "") != "text") continue;
        text += block.value("text", "");
        found = true;
    }
    if (!found) return std::nullopt;
    return text;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<ILlmProvider> make_llm_provider(std::string_view name) {
    const auto lower = utils::to_lower(name);
    if (lower == "deepseek") {
        return std::make_unique<OpenAiCompatibleProvider>(
            "deepseek", "https://api.deepseek.com", "deepseek-chat");
    }
    if (lower == "qwen") {
        return std::make_unique<OpenAiCompatibleProvider>(
            "qwen", "https://dashscope.aliyuncs.com/compatible-mode/v1", "qwen-plus");
    }
    if (lower == "openai") {
        return std::make_unique<OpenAiCompatibleProvider>(
            "openai", "https://api.openai.com/v1", "gpt-4");
    }
    if (lower == "anthropic") {
        return std::make_unique<AnthropicProvider>();
    }
    return nullptr;
}

} // namespace nl2sql
