#include "session-store.h"
#include "sim-doubles.h"

#include <cmath>

using namespace std;

static bool near(const optional<double>& v, double expected) {
    return v && std::fabs(*v - expected) < 1e-9;
}

static void sim_latency() {
    cout << "--- latency derivation ---\n";
    LatencyCheckpoints cp;
    cp.record(Checkpoint::TurnStart, 0);
    cp.record(Checkpoint::SttStart, 0);
    cp.record(Checkpoint::SttEnd, 2);
    cp.record(Checkpoint::LlmStart, 2);
    cp.record(Checkpoint::LlmFirstToken, 3);
    cp.record(Checkpoint::LlmFirstSentence, 4);
    cp.record(Checkpoint::TtsStart, 4);
    cp.record(Checkpoint::TtsEnd, 6);
    cp.record(Checkpoint::FirstAudioResponse, 4.5);

    LatencyMetrics m = derive_latency_metrics(cp);
    check(near(m.stt_duration, 2), "stt_duration = 2");
    check(near(m.llm_time_to_first_token, 1), "llm_time_to_first_token = 1");
    check(near(m.llm_time_to_first_sentence, 2), "llm_time_to_first_sentence = 2");
    check(near(m.tts_duration, 2), "tts_duration = 2");
    check(near(m.total_voice_to_voice, 4.5), "total_voice_to_voice = 4.5");

    nlohmann::json j = latency_metrics_json(m);
    check(j.contains("total_voice_to_voice") && j.contains("srt_duration") && j.contains("llm_ttft") &&
          j.contains("llm_ttfs") && j.contains("tts_duration"), "all five metrics serialized");

    LatencyCheckpoints partial;
    partial.record(Checkpoint::TurnStart, 10);
    partial.record(Checkpoint::SttStart, 10);
    partial.record(Checkpoint::SttEnd, 11);
    partial.record(Checkpoint::TtsEnd, 12);
    LatencyMetrics p = derive_latency_metrics(partial);
    check(near(p.stt_duration, 1), "stt_duration present when both ends recorded");
    check(!p.tts_duration && !p.total_voice_to_voice && !p.llm_time_to_first_token,
          "metrics with a missing checkpoint are absent, not zero");
    check(!latency_metrics_json(p).contains("tts_duration"), "absent metric omitted from JSON");

    LatencyCheckpoints backwards;
    backwards.record(Checkpoint::SttStart, 5);
    backwards.record(Checkpoint::SttEnd, 4);
    check(!derive_latency_metrics(backwards).stt_duration, "negative interval reported as absent");
}

static void sim_turns() {
    cout << "--- turn ownership ---\n";
    SessionStore store("You are a test directive.");
    string id = store.create_session();
    auto s = store.get(id);
    check(s && s->history.size() == 1 && s->history[0].role == "system", "new session seeded with system directive");
    check(s && !s->is_processing && s->turn_counter == 0, "new session idle");

    uint64_t serial = 0, other = 0;
    check(store.begin_turn(id, serial) == BeginTurnResult::Started, "first begin_turn starts");
    check(store.begin_turn(id, other) == BeginTurnResult::Busy, "second begin_turn is busy");
    check(store.get(id)->latency.has(Checkpoint::TurnStart), "turn start recorded on begin");

    check(store.mark_first_audio(id, serial), "first audio marked once");
    check(!store.mark_first_audio(id, serial), "first audio not marked twice");

    uint64_t interrupted = 0;
    check(store.interrupt_turn(id, interrupted) && interrupted == serial, "interrupt reports the owning turn");
    check(!store.interrupt_turn(id, interrupted), "nothing left to interrupt");
    check(!store.finish_turn(id, serial), "finish after interrupt does not transition again");

    uint64_t next = 0;
    check(store.begin_turn(id, next) == BeginTurnResult::Started && next != serial, "new turn gets a new serial");
    check(!store.get(id)->first_audio_sent, "first_audio_sent reset with the new turn");
    check(!store.finish_turn(id, serial), "stale turn cannot clear the new turn");
    check(store.get(id)->is_processing, "new turn still processing");
    check(!store.record_turn_checkpoint(id, serial, Checkpoint::SttEnd, 5.0) &&
          !store.get(id)->latency.has(Checkpoint::SttEnd), "interrupted turn cannot stamp the new turn's latency");
    check(store.record_turn_checkpoint(id, next, Checkpoint::SttEnd, 5.0) &&
          store.get(id)->latency.has(Checkpoint::SttEnd), "owning turn records its checkpoint");
    check(store.finish_turn(id, next), "owning turn finishes");
    check(!store.get(id)->is_processing, "idle after finish");

    check(store.append_user_turn(id, "hi") && store.append_assistant_turn(id, "hello"), "turns appended");
    auto h = store.history(id);
    check(h && h->size() == 3 && (*h)[1].role == "user" && (*h)[2].role == "assistant",
          "history is system, user, assistant");

    check(store.record_checkpoint(id, Checkpoint::SttStart, 1.0) && store.get(id)->latency.has(Checkpoint::SttStart),
          "checkpoint recorded");
    check(store.reset_latency(id) && !store.get(id)->latency.has(Checkpoint::SttStart), "reset clears checkpoints");
    check(store.set_processing(id, true) && store.get(id)->is_processing, "set_processing raises the flag");
    check(store.set_processing(id, false) && !store.get(id)->is_processing, "set_processing clears the flag");

    cout << "--- pending audio ---\n";
    store.store_audio(id, "AAA", AudioFrameMode::Replace);
    store.store_audio(id, "BBB", AudioFrameMode::Replace);
    check(store.take_pending_audio(id).value_or("") == "BBB", "replace mode keeps the last frame");
    store.store_audio(id, "AAA", AudioFrameMode::Append);
    store.store_audio(id, "BBB", AudioFrameMode::Append);
    check(store.take_pending_audio(id).value_or("") == "AAABBB", "append mode accumulates frames");
    check(store.take_pending_audio(id).value_or("x").empty(), "take clears the buffer");

    cout << "--- unknown session ---\n";
    string missing = "00000000-0000-4000-8000-000000000000";
    uint64_t unused = 0;
    check(!store.get(missing), "get on unknown id is empty");
    check(!store.append_user_turn(missing, "x"), "append on unknown id fails");
    check(store.begin_turn(missing, unused) == BeginTurnResult::NotFound, "begin_turn on unknown id is NotFound");
    check(!store.record_checkpoint(missing, Checkpoint::SttStart, 1.0), "checkpoint on unknown id fails");
    check(!store.derive_metrics(missing), "metrics on unknown id are empty");
}

static void sim_eviction() {
    cout << "--- idle eviction ---\n";
    SessionStore store("directive");
    string stale = store.create_session();
    string busy = store.create_session();
    uint64_t serial = 0;
    store.begin_turn(busy, serial);

    this_thread::sleep_for(chrono::milliseconds(120));
    string fresh = store.create_session();

    size_t removed = store.evict_idle(chrono::milliseconds(80));
    check(removed == 1, "one session evicted");
    check(!store.contains(stale), "idle session removed");
    check(store.contains(fresh), "recently active session retained");
    check(store.contains(busy), "session with a turn in flight retained");

    store.finish_turn(busy, serial);
    check(store.evict_idle(chrono::milliseconds(80)) == 1 && !store.contains(busy),
          "session evicted once its turn finished");

    check(store.destroy_session(fresh) && !store.destroy_session(fresh), "destroy is idempotent");
    check(store.session_count() == 0, "store empty");
}

static void sim_concurrent_begin() {
    cout << "--- concurrent begin_turn ---\n";
    SessionStore store("directive");
    string id = store.create_session();
    atomic<int> started{0};
    vector<thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            uint64_t s = 0;
            if (store.begin_turn(id, s) == BeginTurnResult::Started) started++;
        });
    }
    for (auto& t : threads) t.join();
    check(started.load() == 1, "exactly one of 16 racing begin_turn calls starts");
}

int main() {
    cout << "=== session store simulation ===\n";
    sim_latency();
    sim_turns();
    sim_eviction();
    sim_concurrent_begin();
    return finish_sim("session_store_sim");
}
