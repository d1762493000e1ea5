#include "llm/llm_client.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <functional>
#include <thread>
#include <tuple>

namespace nl2sql {

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient(Config config)
    : LlmClient(config, make_llm_provider(config.provider)) {}

LlmClient::LlmClient(Config config, std::unique_ptr<ILlmProvider> provider)
    : config_(std::move(config)),
      provider_(std::move(provider)) {
    if (!provider_) {
        utils::log::error(std::format("LLM: unknown provider '{}'", config_.provider));
        return;
    }
    model_ = config_.model.empty() ? provider_->default_model() : config_.model;
    const auto base = config_.base_url.empty() ? provider_->default_base_url() : config_.base_url;
    std::tie(origin_, base_path_) = split_base_url(base);
    utils::log::info(std::format("LLM: provider={} model={} endpoint={}",
                                 provider_->name(), model_, base));
}

// ============================================================================
// Cache Key Generation
// ============================================================================

std::string LlmClient::cache_key(const CompletionRequest& request) {
    // std::hash is enough for a process-local cache
    const auto hash = std::hash<std::string>{}(
        std::format("{}\x1f{}\x1f{}", request.system_prompt, request.user_prompt, request.context));
    return std::format("{}:{:016x}", completion_use_case_to_string(request.use_case), hash);
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - minute_start_);

    if (elapsed.count() >= 60) {
        minute_start_ = now;
        requests_this_minute_ = 0;
    }

    if (requests_this_minute_ >= config_.max_requests_per_minute) {
        return false;
    }
    ++requests_this_minute_;
    return true;
}

// ============================================================================
// Core API
// ============================================================================

CompletionResponse LlmClient::complete(const CompletionRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!provider_) {
        return CompletionResponse::failure("No LLM provider configured");
    }

    const auto key = config_.cache_enabled ? cache_key(request) : std::string();

    // Check cache (read path, shared lock)
    if (config_.cache_enabled) {
        std::shared_lock lock(cache_mutex_);
        const auto it = cache_.find(key);
        if (it != cache_.end() && std::chrono::steady_clock::now() < it->second.expires_at) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            auto response = it->second.response;
            response.from_cache = true;
            return response;
        }
    }

    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return CompletionResponse::failure("Rate limited: too many LLM API requests");
    }

    auto response = call_api(request);

    if (response.success && config_.cache_enabled) {
        store_in_cache(key, response);
    }
    return response;
}

void LlmClient::store_in_cache(const std::string& key, const CompletionResponse& response) {
    const auto expires = std::chrono::steady_clock::now() +
                         std::chrono::seconds(config_.cache_ttl_seconds);

    std::unique_lock lock(cache_mutex_);

    // Evict the entry closest to expiry when full
    if (cache_.size() >= config_.cache_max_entries && !cache_.empty()) {
        auto oldest_it = cache_.begin();
        for (auto it = cache_.begin(); it != cache_.end(); ++it) {
            if (it->second.expires_at < oldest_it->second.expires_at) {
                oldest_it = it;
            }
        }
        cache_.erase(oldest_it);
    }

    cache_[key] = {response, expires};
}

// ============================================================================
// API Call
// ============================================================================

CompletionResponse LlmClient::call_api(const CompletionRequest& request) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();
    const auto finish = [&](CompletionResponse r) {
        r.model_used = model_;
        r.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (!r.success) api_errors_.fetch_add(1, std::memory_order_relaxed);
        if (r.timed_out) timeouts_.fetch_add(1, std::memory_order_relaxed);
        return r;
    };

    if (config_.api_key.empty()) {
        return finish(CompletionResponse::failure("No API key configured"));
    }
    if (origin_.empty()) {
        return finish(CompletionResponse::failure("No endpoint configured"));
    }

    const auto body = provider_->build_body(request, model_);
    const auto path = provider_->path(base_path_);

    httplib::Client cli(origin_);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    for (const auto& [name, value] : provider_->headers(config_.api_key)) {
        headers.emplace(name, value);
    }

    // Retry loop
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        const auto res = cli.Post(path, headers, body, "application/json");

        if (!res) {
            const auto err = res.error();
            const bool timeout = err == httplib::Error::ConnectionTimeout ||
                                 err == httplib::Error::Read;
            if (attempt < config_.max_retries && !timeout) continue;
            return finish(CompletionResponse::failure(
                std::format("HTTP request failed: {}", httplib::to_string(err)), timeout));
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429 &&
            attempt < config_.max_retries) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.retry_backoff_ms * (attempt + 1)));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            return finish(CompletionResponse::failure(
                std::format("API error: HTTP {} - {}", res->status,
                            utils::truncate_utf8(res->body, 200))));
        }

        auto content = provider_->extract_content(res->body);
        if (!content) {
            return finish(CompletionResponse::failure("Unexpected response body"));
        }
        return finish(CompletionResponse::ok(std::move(*content)));
    }

    return finish(CompletionResponse::failure("Max retries exceeded"));
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        cache_hits_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed),
        timeouts_.load(std::memory_order_relaxed)
    };
}

} // namespace nl2sql
