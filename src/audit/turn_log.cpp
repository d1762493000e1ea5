#include "audit/turn_log.hpp"
#include "core/utils.hpp"

#include <format>

namespace nl2sql {

TurnLog::~TurnLog() {
    shutdown();
}

void TurnLog::add_sink(std::shared_ptr<ITurnLogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(sinks_mutex_);
    utils::log::info(std::format("Turn log: added sink {}", sink->name()));
    sinks_.push_back(std::move(sink));
}

void TurnLog::set_security_sink(std::shared_ptr<ITurnLogSink> sink) {
    std::lock_guard lock(sinks_mutex_);
    security_sink_ = std::move(sink);
}

void TurnLog::record_turn(const TurnRecord& record) {
    const auto line = to_json(record) + '\n';
    std::lock_guard lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        if (!sink->write(line)) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Turn log: write to {} failed", sink->name()));
        }
    }
    turns_written_.fetch_add(1, std::memory_order_relaxed);
}

void TurnLog::record_security_event(const SecurityEvent& event) {
    utils::log::warn(std::format("Sandbox denied [{}] session={} detail={}",
                                 sandbox_reason_to_string(event.reason),
                                 event.session_id, event.detail));
    std::lock_guard lock(sinks_mutex_);
    if (!security_sink_) return;
    if (!security_sink_->write(to_json(event) + '\n')) {
        sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Security log: write to {} failed", security_sink_->name()));
        return;
    }
    security_events_written_.fetch_add(1, std::memory_order_relaxed);
}

void TurnLog::flush() {
    std::lock_guard lock(sinks_mutex_);
    for (const auto& sink : sinks_) sink->flush();
    if (security_sink_) security_sink_->flush();
}

void TurnLog::shutdown() {
    std::lock_guard lock(sinks_mutex_);
    for (const auto& sink : sinks_) sink->shutdown();
    if (security_sink_) security_sink_->shutdown();
}

TurnLog::Stats TurnLog::get_stats() const {
    return {
        turns_written_.load(std::memory_order_relaxed),
        security_events_written_.load(std::memory_order_relaxed),
        sink_write_failures_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// JSON Serialization: Section Builders
// ============================================================================

namespace {

void append_string_array(std::string& out, std::string_view key,
                         const std::vector<std::string>& items) {
    out += '"';
    out += key;
    out += "\":[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(items[i]));
    }
    out += "],";
}

void append_identity(std::string& out, const TurnRecord& r) {
    out += std::format("\"session_id\":\"{}\",\"timestamp\":\"{}\",\"turn_index\":{},",
                       utils::escape_json(r.session_id),
                       utils::format_timestamp(r.timestamp), r.turn_index);
    out += std::format("\"question\":\"{}\",\"working_question\":\"{}\",",
                       utils::escape_json(r.question), utils::escape_json(r.working_question));
}

void append_intent(std::string& out, const TurnRecord& r) {
    out += std::format("\"intent\":{{\"question_type\":\"{}\",\"is_default\":{}",
                       question_type_to_string(r.intent.question_type),
                       utils::booltostr(r.intent.is_default));
    if (r.intent.row_limit) {
        out += std::format(",\"row_limit\":{}", *r.intent.row_limit);
    } else {
        out += ",\"row_limit\":null";
    }
    if (r.intent.time_range) {
        out += std::format(",\"time_range\":\"{}\"", utils::escape_json(r.intent.time_range->label));
    } else {
        out += ",\"time_range\":null";
    }
    out += "},";
    append_string_array(out, "matched_tables", r.matched_tables);
}

void append_generation(std::string& out, const TurnRecord& r) {
    out += std::format("\"candidate_sql\":\"{}\",\"validation_passed\":{},"
                       "\"regeneration_count\":{},\"clarification_round_count\":{},",
                       utils::escape_json(r.candidate_sql),
                       utils::booltostr(r.validation_passed),
                       r.regeneration_count, r.clarification_round_count);
}

void append_sandbox(std::string& out, const TurnRecord& r) {
    if (!r.sandbox_checked) {
        out += "\"sandbox_decision\":null,";
        return;
    }
    const auto& d = r.sandbox_decision;
    out += std::format("\"sandbox_decision\":{{\"allowed\":{},\"reason_code\":\"{}\",",
                       utils::booltostr(d.allowed), sandbox_reason_to_string(d.reason));
    if (d.allowed) {
        out += std::format("\"normalized_sql\":\"{}\",\"execution_budget_ms\":{},"
                           "\"limit_injected\":{},\"limit_clamped\":{},",
                           utils::escape_json(d.normalized_sql), d.execution_budget.count(),
                           utils::booltostr(d.limit_injected),
                           utils::booltostr(d.limit_clamped));
    } else {
        out += std::format("\"detail\":\"{}\",", utils::escape_json(d.detail));
    }
    append_string_array(out, "referenced_identifiers", d.referenced_identifiers);
    out.back() = '}';
    out += ',';
}

void append_execution(std::string& out, const TurnRecord& r) {
    const auto& e = r.execution_summary;
    if (!e.attempted) {
        out += "\"execution_summary\":null,";
        return;
    }
    out += std::format("\"execution_summary\":{{\"success\":{},\"row_count\":{},\"column_count\":{},"
                       "\"truncated\":{},\"timed_out\":{},\"elapsed_us\":{}}},",
                       utils::booltostr(e.success), e.row_count, e.column_count,
                       utils::booltostr(e.truncated), utils::booltostr(e.timed_out),
                       e.elapsed.count());
}

void append_timings(std::string& out, const TurnRecord& r) {
    out += "\"step_timings\":[";
    const StepTiming* slowest = nullptr;
    for (size_t i = 0; i < r.step_timings.size(); ++i) {
        const auto& t = r.step_timings[i];
        if (i > 0) out += ',';
        out += std::format("{{\"step\":\"{}\",\"elapsed_us\":{}}}",
                           utils::escape_json(t.step), t.elapsed.count());
        if (!slowest || t.elapsed > slowest->elapsed) slowest = &t;
    }
    out += "],";
    if (slowest) {
        out += std::format("\"slowest_step\":\"{}\",", utils::escape_json(slowest->step));
    } else {
        out += "\"slowest_step\":null,";
    }
}

void append_outcome(std::string& out, const TurnRecord& r) {
    out += std::format("\"state\":\"{}\",\"failure_code\":\"{}\",",
                       r.state, failure_code_to_string(r.failure_code));
    if (!r.last_diagnostic.empty()) {
        out += std::format("\"last_diagnostic\":\"{}\",", utils::escape_json(r.last_diagnostic));
    }
    out += std::format("\"is_chat_reply\":{},\"duration_ms\":{}",
                       utils::booltostr(r.is_chat_reply), r.duration.count());
}

} // anonymous namespace

std::string TurnLog::to_json(const TurnRecord& record) {
    std::string result;
    result.reserve(512);
    result += '{';
    append_identity(result, record);
    append_intent(result, record);
    append_generation(result, record);
    append_sandbox(result, record);
    append_execution(result, record);
    append_timings(result, record);
    append_outcome(result, record);
    result += '}';
    return result;
}

std::string TurnLog::to_json(const SecurityEvent& event) {
    return std::format(
        "{{\"type\":\"sandbox_denied\",\"session_id\":\"{}\",\"timestamp\":\"{}\","
        "\"reason_code\":\"{}\",\"detail\":\"{}\",\"sql\":\"{}\"}}",
        utils::escape_json(event.session_id), utils::format_timestamp(event.timestamp),
        sandbox_reason_to_string(event.reason), utils::escape_json(event.detail),
        utils::escape_json(utils::truncate_utf8(event.sql_prefix, SecurityEvent::kSqlPrefixLength)));
}

} // namespace nl2sql
