#pragma once

#include "audit/log_sink.hpp"

#include <chrono>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace nl2sql {

/**
 * @brief JSONL file sink with size and time-based rotation
 *
 * Rotated files get numeric suffixes: turns.jsonl.1, turns.jsonl.2, ...
 * Files beyond max_files are deleted. The constructor throws
 * std::runtime_error when the file cannot be opened.
 */
class FileSink : public ITurnLogSink {
public:
    struct Config {
        std::string output_file = "turns.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /// Number of rotations performed (for stats/testing)
    [[nodiscard]] size_t rotation_count() const;

    /// Current file size in bytes
    [[nodiscard]] size_t current_file_size() const;

private:
    void check_rotation_locked();
    void rotate_file_locked();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    std::chrono::system_clock::time_point last_rotation_time_;
    mutable std::mutex mutex_;
};

} // namespace nl2sql
