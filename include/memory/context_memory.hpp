#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nl2sql {

enum class EntryKind : uint8_t {
    QUERY,
    CLARIFICATION,
    ANSWER,
    CHAT
};

enum class EntryRole : uint8_t {
    USER,
    ASSISTANT
};

[[nodiscard]] inline const char* entry_kind_to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::QUERY:         return "query";
        case EntryKind::CLARIFICATION: return "clarification";
        case EntryKind::ANSWER:        return "answer";
        case EntryKind::CHAT:          return "chat";
        default:                       return "unknown";
    }
}

[[nodiscard]] inline const char* entry_role_to_string(EntryRole role) {
    return role == EntryRole::USER ? "user" : "assistant";
}

[[nodiscard]] std::optional<EntryKind> parse_entry_kind(std::string_view s);

struct MemoryEntry {
    uint32_t turn_index = 0;
    EntryKind kind = EntryKind::QUERY;
    EntryRole role = EntryRole::USER;
    std::string content;
    std::string timestamp;          // ISO-8601 with milliseconds
    std::string session_id;
};

/**
 * @brief Bounded, ordered history of one session
 *
 * Holds at most `max_history` entries, oldest first. Every append trims, so
 * the bound holds after every public call. Stores text only; reference
 * resolution is left to the generation collaborator, which receives the
 * formatted window.
 *
 * Thread-safety: all methods lock; a session normally advances one step at
 * a time so contention is nil.
 */
class SessionMemory {
public:
    SessionMemory(std::string session_id, size_t max_history);

    /// Appends, stamping session_id and (when empty) the timestamp, then trims.
    void append(MemoryEntry entry);

    /// Last `n` entries, oldest first.
    [[nodiscard]] std::vector<MemoryEntry> recent(size_t n) const;
    [[nodiscard]] std::vector<MemoryEntry> all() const;

    /// Drop oldest entries until size <= max_history.
    void trim();
    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t max_history() const { return max_history_; }
    [[nodiscard]] const std::string& session_id() const { return session_id_; }

    /// True when any of the last `n` entries is a query, an answer or a user clarification answer.
    [[nodiscard]] bool has_recent_subject(size_t n) const;

    // ===== Serialization =====

    /// {"session_id":"...","entries":[{...}]}
    [[nodiscard]] std::string export_json() const;

    /**
     * @brief Replace the history with an exported document
     *
     * The session id of the document is ignored; imported entries are
     * re-stamped with this session's id and trimmed.
     */
    Result<size_t> import_json(std::string_view json);

    // ===== Prompt Context =====

    /// Query/answer/chat entries among the last `window`, as "User:"/"Assistant:" lines.
    [[nodiscard]] std::string format_for_generation(size_t window) const;

    /// Last `window` entries of any kind, as "User:"/"Assistant:" lines.
    [[nodiscard]] std::string format_for_clarification(size_t window) const;

    [[nodiscard]] std::chrono::steady_clock::time_point last_access() const;

private:
    void trim_locked();
    void touch_locked() const;

    const std::string session_id_;
    const size_t max_history_;
    std::deque<MemoryEntry> entries_;
    mutable std::chrono::steady_clock::time_point last_access_;
    mutable std::mutex mutex_;
};

/**
 * @brief Owner of all per-session memories, keyed by session id
 *
 * A session's memory is created on first use, removed by end_session(), and
 * evicted after `ttl` without access. Sessions never see each other's
 * entries.
 */
class ContextMemoryStore {
public:
    struct Config {
        size_t max_history = 10;
        std::chrono::seconds ttl{3600};
    };

    ContextMemoryStore();
    explicit ContextMemoryStore(Config config);

    /// Get or create the memory for a session. Evicts expired sessions first.
    [[nodiscard]] std::shared_ptr<SessionMemory> for_session(const std::string& session_id);

    /// Existing memory or nullptr.
    [[nodiscard]] std::shared_ptr<SessionMemory> find(const std::string& session_id) const;

    void end_session(const std::string& session_id);

    /// @return Number of sessions evicted
    size_t evict_expired();

    [[nodiscard]] size_t session_count() const;
    [[nodiscard]] const Config& config() const { return config_; }

private:
    size_t evict_expired_locked(std::chrono::steady_clock::time_point now);

    Config config_;
    std::unordered_map<std::string, std::shared_ptr<SessionMemory>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace nl2sql
