#pragma once

#include "latency-tracker.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ChatMessage {
    std::string role;    // "system", "user" or "assistant"
    std::string content;
};

// How inbound audio frames are buffered until the next stop_recording
enum class AudioFrameMode {
    Replace,  // each frame replaces the pending utterance
    Append    // frames accumulate into one utterance
};

// Snapshot of one conversation's state
struct Session {
    std::string id;
    std::vector<ChatMessage> history;
    uint64_t turn_counter = 0;
    std::string pending_audio;
    bool is_processing = false;
    bool first_audio_sent = false;
    uint64_t active_turn = 0;  // serial of the turn owning is_processing, 0 when idle
    LatencyCheckpoints latency;
    std::chrono::steady_clock::time_point last_activity;
};

enum class BeginTurnResult {
    Started,
    Busy,
    NotFound
};

// Owns every live conversation. The map lock is only held to find an entry;
// each session is guarded by its own mutex so sessions never contend.
class SessionStore {
public:
    explicit SessionStore(const std::string& system_directive);
    ~SessionStore();

    std::string create_session();
    bool destroy_session(const std::string& session_id);
    bool contains(const std::string& session_id) const;
    size_t session_count() const;

    std::optional<Session> get(const std::string& session_id) const;
    std::optional<std::vector<ChatMessage>> history(const std::string& session_id) const;

    // History
    bool append_user_turn(const std::string& session_id, const std::string& text);
    bool append_assistant_turn(const std::string& session_id, const std::string& text);

    // Pending utterance
    bool store_audio(const std::string& session_id, const std::string& payload, AudioFrameMode mode);
    std::optional<std::string> take_pending_audio(const std::string& session_id);

    // Turn ownership. begin_turn atomically checks the session is idle, marks it
    // processing, resets first_audio_sent and the latency checkpoints.
    BeginTurnResult begin_turn(const std::string& session_id, uint64_t& turn_serial);
    // Clears is_processing only if turn_serial still owns it. Returns true when
    // this call performed the transition.
    bool finish_turn(const std::string& session_id, uint64_t turn_serial);
    // Clears is_processing for whichever turn owns it and reports that turn
    bool interrupt_turn(const std::string& session_id, uint64_t& turn_serial);
    bool set_processing(const std::string& session_id, bool processing);
    // True exactly once per turn, for the turn currently owning the session
    bool mark_first_audio(const std::string& session_id, uint64_t turn_serial);

    // Latency
    bool reset_latency(const std::string& session_id);
    bool record_checkpoint(const std::string& session_id, Checkpoint checkpoint, double seconds);
    // Records only while turn_serial still owns the session
    bool record_turn_checkpoint(const std::string& session_id, uint64_t turn_serial,
                                Checkpoint checkpoint, double seconds);
    std::optional<LatencyMetrics> derive_metrics(const std::string& session_id) const;

    // Housekeeping: removes sessions idle longer than max_age. Sessions with a
    // turn in flight are skipped until the turn reaches a terminal state.
    size_t evict_idle(std::chrono::steady_clock::duration max_age);

private:
    struct Entry {
        mutable std::mutex mutex;
        Session session;
    };

    std::shared_ptr<Entry> find(const std::string& session_id) const;
    std::string generate_session_id();

    std::string system_directive_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
    mutable std::mutex sessions_mutex_;
    uint64_t next_turn_serial_ = 1;
    std::mutex serial_mutex_;
};
