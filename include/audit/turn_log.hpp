#pragma once

#include "audit/log_sink.hpp"
#include "audit/turn_record.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace nl2sql {

/**
 * @brief Append-only turn log and security event log
 *
 * Every completed turn is serialized once and handed to all turn sinks;
 * sandbox denials go to the separate security sink. Writes are synchronous
 * so a turn is on record before run_query() returns.
 *
 * A sink failure is counted and logged, never propagated to the caller.
 */
class TurnLog {
public:
    TurnLog() = default;
    ~TurnLog();

    TurnLog(const TurnLog&) = delete;
    TurnLog& operator=(const TurnLog&) = delete;

    void add_sink(std::shared_ptr<ITurnLogSink> sink);
    void set_security_sink(std::shared_ptr<ITurnLogSink> sink);

    void record_turn(const TurnRecord& record);
    void record_security_event(const SecurityEvent& event);

    void flush();
    void shutdown();

    [[nodiscard]] static std::string to_json(const TurnRecord& record);
    [[nodiscard]] static std::string to_json(const SecurityEvent& event);

    struct Stats {
        uint64_t turns_written = 0;
        uint64_t security_events_written = 0;
        uint64_t sink_write_failures = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    std::vector<std::shared_ptr<ITurnLogSink>> sinks_;
    std::shared_ptr<ITurnLogSink> security_sink_;
    mutable std::mutex sinks_mutex_;

    std::atomic<uint64_t> turns_written_{0};
    std::atomic<uint64_t> security_events_written_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
};

} // namespace nl2sql
