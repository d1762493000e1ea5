#pragma once

#include <string>
#include <string_view>

namespace nl2sql {

/**
 * @brief Abstract interface for turn-log output destinations
 *
 * Each sink receives one serialized JSON record per call, newline included.
 * Sessions complete on different threads, so implementations lock
 * internally.
 */
class ITurnLogSink {
public:
    virtual ~ITurnLogSink() = default;

    /// Write a single JSON-serialized record. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:logs/turns.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace nl2sql
