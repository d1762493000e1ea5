#pragma once

#include "audit/log_sink.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace nl2sql {

/**
 * @brief In-memory sink; keeps every line (newline stripped)
 */
class MemorySink : public ITurnLogSink {
public:
    [[nodiscard]] bool write(std::string_view json_line) override {
        std::lock_guard lock(mutex_);
        if (!json_line.empty() && json_line.back() == '\n') {
            json_line.remove_suffix(1);
        }
        lines_.emplace_back(json_line);
        return true;
    }

    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return lines_.size();
    }

private:
    std::vector<std::string> lines_;
    mutable std::mutex mutex_;
};

} // namespace nl2sql
