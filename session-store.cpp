#include "session-store.h"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

SessionStore::SessionStore(const std::string& system_directive)
    : system_directive_(system_directive) {
}

SessionStore::~SessionStore() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
}

std::string SessionStore::generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);
    // version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << "-"
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
       << std::setw(4) << (hi & 0xFFFF) << "-"
       << std::setw(4) << (lo >> 48) << "-"
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

std::string SessionStore::create_session() {
    auto entry = std::make_shared<Entry>();
    entry->session.history.push_back({"system", system_directive_});
    entry->session.last_activity = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::string id;
    do {
        id = generate_session_id();
    } while (sessions_.count(id));
    entry->session.id = id;
    sessions_[id] = std::move(entry);
    return id;
}

bool SessionStore::destroy_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.erase(session_id) > 0;
}

bool SessionStore::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.count(session_id) > 0;
}

size_t SessionStore::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::shared_ptr<SessionStore::Entry> SessionStore::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::optional<Session> SessionStore::get(const std::string& session_id) const {
    auto entry = find(session_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->session;
}

std::optional<std::vector<ChatMessage>> SessionStore::history(const std::string& session_id) const {
    auto entry = find(session_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->session.history;
}

bool SessionStore::append_user_turn(const std::string& session_id, const std::string& text) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.history.push_back({"user", text});
    entry->session.turn_counter++;
    entry->session.last_activity = std::chrono::steady_clock::now();
    return true;
}

bool SessionStore::append_assistant_turn(const std::string& session_id, const std::string& text) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.history.push_back({"assistant", text});
    entry->session.turn_counter++;
    entry->session.last_activity = std::chrono::steady_clock::now();
    return true;
}

bool SessionStore::store_audio(const std::string& session_id, const std::string& payload, AudioFrameMode mode) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (mode == AudioFrameMode::Append) {
        entry->session.pending_audio += payload;
    } else {
        entry->session.pending_audio = payload;
    }
    return true;
}

std::optional<std::string> SessionStore::take_pending_audio(const std::string& session_id) {
    auto entry = find(session_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    std::string audio;
    audio.swap(entry->session.pending_audio);
    return audio;
}

BeginTurnResult SessionStore::begin_turn(const std::string& session_id, uint64_t& turn_serial) {
    auto entry = find(session_id);
    if (!entry) return BeginTurnResult::NotFound;

    uint64_t serial;
    {
        std::lock_guard<std::mutex> lock(serial_mutex_);
        serial = next_turn_serial_++;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    Session& s = entry->session;
    if (s.is_processing) {
        return BeginTurnResult::Busy;
    }
    s.is_processing = true;
    s.active_turn = serial;
    s.first_audio_sent = false;
    s.latency.reset();
    s.latency.record(Checkpoint::TurnStart, latency_now());
    turn_serial = serial;
    return BeginTurnResult::Started;
}

bool SessionStore::finish_turn(const std::string& session_id, uint64_t turn_serial) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    Session& s = entry->session;
    if (!s.is_processing || s.active_turn != turn_serial) {
        return false;
    }
    s.is_processing = false;
    s.active_turn = 0;
    s.first_audio_sent = false;
    return true;
}

bool SessionStore::interrupt_turn(const std::string& session_id, uint64_t& turn_serial) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    Session& s = entry->session;
    if (!s.is_processing) {
        return false;
    }
    turn_serial = s.active_turn;
    s.is_processing = false;
    s.active_turn = 0;
    return true;
}

bool SessionStore::set_processing(const std::string& session_id, bool processing) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.is_processing = processing;
    if (!processing) {
        entry->session.active_turn = 0;
    }
    return true;
}

bool SessionStore::mark_first_audio(const std::string& session_id, uint64_t turn_serial) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    Session& s = entry->session;
    if (s.active_turn != turn_serial || s.first_audio_sent) {
        return false;
    }
    s.first_audio_sent = true;
    return true;
}

bool SessionStore::reset_latency(const std::string& session_id) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.latency.reset();
    return true;
}

bool SessionStore::record_checkpoint(const std::string& session_id, Checkpoint checkpoint, double seconds) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.latency.record(checkpoint, seconds);
    return true;
}

bool SessionStore::record_turn_checkpoint(const std::string& session_id, uint64_t turn_serial,
                                          Checkpoint checkpoint, double seconds) {
    auto entry = find(session_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->session.active_turn != turn_serial) {
        return false;
    }
    entry->session.latency.record(checkpoint, seconds);
    return true;
}

std::optional<LatencyMetrics> SessionStore::derive_metrics(const std::string& session_id) const {
    auto entry = find(session_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return derive_latency_metrics(entry->session.latency);
}

size_t SessionStore::evict_idle(std::chrono::steady_clock::duration max_age) {
    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    size_t deferred = 0;

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        bool evict = false;
        {
            std::lock_guard<std::mutex> entry_lock(it->second->mutex);
            const Session& s = it->second->session;
            if (now - s.last_activity > max_age) {
                if (s.is_processing) {
                    deferred++;
                } else {
                    evict = true;
                }
            }
        }
        if (evict) {
            it = sessions_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0 || deferred > 0) {
        std::cout << "🧹 Evicted " << removed << " idle session(s)";
        if (deferred > 0) {
            std::cout << ", deferred " << deferred << " with a turn in flight";
        }
        std::cout << std::endl;
    }
    return removed;
}
