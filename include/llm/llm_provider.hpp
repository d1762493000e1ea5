#pragma once

#include "llm/text_completer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nl2sql {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Wire format of one LLM vendor API
 *
 * Providers only build requests and read responses; transport, retry and
 * caching live in LlmClient.
 */
class ILlmProvider {
public:
    virtual ~ILlmProvider() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual std::string default_base_url() const = 0;
    [[nodiscard]] virtual std::string default_model() const = 0;

    /// Request path, appended to the path part of the base URL.
    [[nodiscard]] virtual std::string path(std::string_view base_path) const = 0;

    [[nodiscard]] virtual HeaderList headers(const std::string& api_key) const = 0;

    [[nodiscard]] virtual std::string build_body(const CompletionRequest& request,
                                                 const std::string& model) const = 0;

    /// Completion text from a 200 response body; nullopt when the shape is unexpected.
    [[nodiscard]] virtual std::optional<std::string> extract_content(std::string_view body) const = 0;
};

/**
 * @brief OpenAI chat-completions format (deepseek, qwen, openai)
 */
class OpenAiCompatibleProvider final : public ILlmProvider {
public:
    OpenAiCompatibleProvider(std::string name, std::string base_url, std::string model);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] std::string default_base_url() const override { return base_url_; }
    [[nodiscard]] std::string default_model() const override { return model_; }
    [[nodiscard]] std::string path(std::string_view base_path) const override;
    [[nodiscard]] HeaderList headers(const std::string& api_key) const override;
    [[nodiscard]] std::string build_body(const CompletionRequest& request,
                                         const std::string& model) const override;
    [[nodiscard]] std::optional<std::string> extract_content(std::string_view body) const override;

private:
    std::string name_;
    std::string base_url_;
    std::string model_;
};

/**
 * @brief Anthropic messages format
 */
class AnthropicProvider final : public ILlmProvider {
public:
    static constexpr std::string_view kApiVersion = "2023-06-01";

    [[nodiscard]] std::string_view name() const override { return "anthropic"; }
    [[nodiscard]] std::string default_base_url() const override { return "https://api.anthropic.com"; }
    [[nodiscard]] std::string default_model() const override { return "claude-3-5-sonnet-latest"; }
    [[nodiscard]] std::string path(std::string_view base_path) const override;
    [[nodiscard]] HeaderList headers(const std::string& api_key) const override;
    [[nodiscard]] std::string build_body(const CompletionRequest& request,
                                         const std::string& model) const override;
    [[nodiscard]] std::optional<std::string> extract_content(std::string_view body) const override;
};

/// deepseek | qwen | openai | anthropic; nullptr for anything else.
[[nodiscard]] std::unique_ptr<ILlmProvider> make_llm_provider(std::string_view name);

/// "https://host/a/b" -> {"https://host", "/a/b"}; path has no trailing slash.
[[nodiscard]] std::pair<std::string, std::string> split_base_url(std::string_view url);

} // namespace nl2sql
