#include "memory/context_memory.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace nl2sql {

std::optional<EntryKind> parse_entry_kind(std::string_view s) {
    if (s == "query")         return EntryKind::QUERY;
    if (s == "clarification") return EntryKind::CLARIFICATION;
    if (s == "answer")        return EntryKind::ANSWER;
    if (s == "chat")          return EntryKind::CHAT;
    return std::nullopt;
}

namespace {

std::string format_line(const MemoryEntry& entry) {
    return std::format("{}: {}", entry.role == EntryRole::USER ? "User" : "Assistant",
                       entry.content);
}

} // anonymous namespace

// ============================================================================
// SessionMemory
// ============================================================================

SessionMemory::SessionMemory(std::string session_id, size_t max_history)
    : session_id_(std::move(session_id)),
      max_history_(max_history),
      last_access_(std::chrono::steady_clock::now()) {}

void SessionMemory::append(MemoryEntry entry) {
    entry.session_id = session_id_;
    if (entry.timestamp.empty()) {
        entry.timestamp = utils::format_timestamp(utils::now());
    }
    std::lock_guard lock(mutex_);
    entries_.push_back(std::move(entry));
    trim_locked();
    touch_locked();
}

std::vector<MemoryEntry> SessionMemory::recent(size_t n) const {
    std::lock_guard lock(mutex_);
    touch_locked();
    const size_t count = std::min(n, entries_.size());
    return {entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end()};
}

std::vector<MemoryEntry> SessionMemory::all() const {
    std::lock_guard lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

void SessionMemory::trim() {
    std::lock_guard lock(mutex_);
    trim_locked();
}

void SessionMemory::trim_locked() {
    while (entries_.size() > max_history_) {
        entries_.pop_front();
    }
}

void SessionMemory::touch_locked() const {
    last_access_ = std::chrono::steady_clock::now();
}

void SessionMemory::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

size_t SessionMemory::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::chrono::steady_clock::time_point SessionMemory::last_access() const {
    std::lock_guard lock(mutex_);
    return last_access_;
}

bool SessionMemory::has_recent_subject(size_t n) const {
    for (const auto& entry : recent(n)) {
        if (entry.kind == EntryKind::QUERY || entry.kind == EntryKind::ANSWER) return true;
        // A user's clarification answer names the subject as well
        if (entry.kind == EntryKind::CLARIFICATION && entry.role == EntryRole::USER) return true;
    }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

std::string SessionMemory::export_json() const {
    std::lock_guard lock(mutex_);
    std::string out = std::format(R"({{"session_id":"{}","entries":[)",
                                  utils::escape_json(session_id_));
    bool first = true;
    for (const auto& e : entries_) {
        if (!first) out += ',';
        first = false;
        out += std::format(
            R"({{"turn_index":{},"kind":"{}","role":"{}","content":"{}","timestamp":"{}"}})",
            e.turn_index, entry_kind_to_string(e.kind), entry_role_to_string(e.role),
            utils::escape_json(e.content), utils::escape_json(e.timestamp));
    }
    out += "]}";
    return out;
}

Result<size_t> SessionMemory::import_json(std::string_view json) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(json);
    } catch (const JsonValue::parse_error& e) {
        return Result<size_t>::error(ErrorCategory::PARSE_ERROR,
                                     std::format("Memory import: {}", e.what()));
    }

    if (!doc["entries"].is_array()) {
        return Result<size_t>::error(ErrorCategory::INVALID_ARGUMENT,
                                     "Memory import: 'entries' must be an array");
    }

    std::deque<MemoryEntry> imported;
    for (const auto& item : doc["entries"].elements()) {
        if (!item.is_object()) {
            return Result<size_t>::error(ErrorCategory::INVALID_ARGUMENT,
                                         "Memory import: entry is not an object");
        }
        const auto kind = parse_entry_kind(item.value("kind", ""));
        if (!kind) {
            return Result<size_t>::error(
                ErrorCategory::INVALID_ARGUMENT,
                std::format("Memory import: unknown entry kind '{}'", item.value("kind", "")));
        }
        MemoryEntry entry;
        entry.kind = *kind;
        entry.role = item.value("role", "user") == "assistant" ? EntryRole::ASSISTANT
                                                                : EntryRole::USER;
        entry.turn_index = item.value("turn_index", uint32_t{0});
        entry.content = item.value("content", "");
        entry.timestamp = item.value("timestamp", "");
        entry.session_id = session_id_;
        imported.push_back(std::move(entry));
    }

    std::lock_guard lock(mutex_);
    entries_ = std::move(imported);
    trim_locked();
    touch_locked();
    return Result<size_t>::ok(entries_.size());
}

// ============================================================================
// Prompt Context
// ============================================================================

std::string SessionMemory::format_for_generation(size_t window) const {
    std::string out;
    for (const auto& entry : recent(window)) {
        if (entry.kind == EntryKind::CLARIFICATION) continue;
        out += format_line(entry);
        out += '\n';
    }
    return out;
}

std::string SessionMemory::format_for_clarification(size_t window) const {
    std::string out;
    for (const auto& entry : recent(window)) {
        out += format_line(entry);
        out += '\n';
    }
    return out;
}

// ============================================================================
// ContextMemoryStore
// ============================================================================

ContextMemoryStore::ContextMemoryStore() = default;

ContextMemoryStore::ContextMemoryStore(Config config)
    : config_(config) {}

std::shared_ptr<SessionMemory> ContextMemoryStore::for_session(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    evict_expired_locked(std::chrono::steady_clock::now());

    auto& slot = sessions_[session_id];
    if (!slot) {
        slot = std::make_shared<SessionMemory>(session_id, config_.max_history);
        utils::log::debug(std::format("Memory: created session {}", session_id));
    }
    return slot;
}

std::shared_ptr<SessionMemory> ContextMemoryStore::find(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    const auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void ContextMemoryStore::end_session(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    sessions_.erase(session_id);
}

size_t ContextMemoryStore::evict_expired() {
    std::lock_guard lock(mutex_);
    return evict_expired_locked(std::chrono::steady_clock::now());
}

size_t ContextMemoryStore::evict_expired_locked(std::chrono::steady_clock::time_point now) {
    size_t evicted = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second->last_access() > config_.ttl) {
            utils::log::info(std::format("Memory: session {} expired", it->first));
            it = sessions_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

size_t ContextMemoryStore::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

} // namespace nl2sql
