#pragma once

#include "llm/llm_provider.hpp"
#include "llm/text_completer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace nl2sql {

/**
 * @brief HTTP text-completion client.
 *
 * Implements ITextCompleter over cpp-httplib, with the vendor wire format
 * supplied by an ILlmProvider.
 * Features:
 * - Connection and read timeouts (reported as timed_out)
 * - Retry with linear backoff on HTTP 429 and connection errors
 * - Per-minute request budget
 * - Response cache keyed by use case and prompt
 */
class LlmClient final : public ITextCompleter {
public:
    struct Config {
        std::string provider = "deepseek";
        std::string base_url;               // empty: provider default
        std::string api_key;
        std::string model;                  // empty: provider default
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
        uint32_t retry_backoff_ms = 1000;
        uint32_t max_requests_per_minute = 60;
        bool cache_enabled = true;
        size_t cache_max_entries = 1000;
        uint32_t cache_ttl_seconds = 3600;
    };

    explicit LlmClient(Config config);
    LlmClient(Config config, std::unique_ptr<ILlmProvider> provider);

    [[nodiscard]] CompletionResponse complete(const CompletionRequest& request) override;

    [[nodiscard]] const ILlmProvider* provider() const { return provider_.get(); }
    [[nodiscard]] const std::string& model() const { return model_; }

    // Cache key generation (for testing)
    [[nodiscard]] static std::string cache_key(const CompletionRequest& request);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t cache_hits = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
        uint64_t timeouts = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] CompletionResponse call_api(const CompletionRequest& request);

    [[nodiscard]] bool check_rate_limit();

    void store_in_cache(const std::string& key, const CompletionResponse& response);

    Config config_;
    std::unique_ptr<ILlmProvider> provider_;
    std::string model_;
    std::string origin_;
    std::string base_path_;

    // Response cache
    struct CacheEntry {
        CompletionResponse response;
        std::chrono::steady_clock::time_point expires_at;
    };
    std::unordered_map<std::string, CacheEntry> cache_;
    mutable std::shared_mutex cache_mutex_;

    // Rate limiting
    uint32_t requests_this_minute_ = 0;
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace nl2sql
