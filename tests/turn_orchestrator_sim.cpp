#include "turn-orchestrator.h"
#include "sim-doubles.h"

#include <algorithm>

using namespace std;

// One session wired to in-process collaborators
struct Harness {
    SessionStore store{default_system_directive()};
    RecordingChannel channel;
    shared_ptr<ScriptedTranscriber> stt = make_shared<ScriptedTranscriber>();
    shared_ptr<ScriptedCompletion> llm = make_shared<ScriptedCompletion>();
    shared_ptr<ControlledSynthesizer> tts = make_shared<ControlledSynthesizer>();
    shared_ptr<ScriptedLookup> lookup = make_shared<ScriptedLookup>();
    OrchestratorConfig config;
    string id;
    unique_ptr<TurnOrchestrator> orchestrator;

    Harness() {
        id = store.create_session();
        config.synthesis.timeout = chrono::milliseconds(2000);
    }

    void start() {
        Collaborators c;
        c.transcriber = stt;
        c.completion = llm;
        c.synthesizer = tts;
        c.lookup = lookup;
        orchestrator.reset(new TurnOrchestrator(store, id, channel, c, config));
    }

    bool turn(const string& audio = "RIFF....WAVEfmt fake utterance") {
        if (!audio.empty()) orchestrator->on_audio_frame(audio);
        bool ok = orchestrator->on_stop_recording();
        orchestrator->wait_idle();
        return ok;
    }

    size_t history_size() { return store.history(id).value_or(vector<ChatMessage>()).size(); }
};

static long index_of(const vector<string>& v, const string& what) {
    auto it = find(v.begin(), v.end(), what);
    return it == v.end() ? -1 : static_cast<long>(it - v.begin());
}

static string joined_text(RecordingChannel& channel) {
    string out;
    for (const auto& e : channel.events_of("text")) out += e["content"].get<string>();
    return out;
}

static void sim_happy_path() {
    cout << "--- successful turn ---\n";
    Harness h;
    h.llm->scripts = {{ScriptedCompletion::text("Hello"), ScriptedCompletion::text(" there."),
                       ScriptedCompletion::text(" How can I help?")}};
    h.start();
    check(h.turn(), "stop_recording accepted");

    vector<string> t = h.channel.types();
    check(!t.empty() && t.front() == "transcription", "transcription echoed first");
    check(h.channel.events_of("transcription").size() == 1 &&
          h.channel.events_of("transcription")[0]["content"] == h.stt->text, "transcription carries the text");
    check(joined_text(h.channel) == "Hello there. How can I help?", "text fragments forwarded as generated");
    check(h.channel.audio() == vector<string>({"AUDIO:Hello there.", "AUDIO:How can I help?"}),
          "one audio payload per sentence, in order");
    check(h.channel.count("first_audio_response") == 1, "first_audio_response sent once");
    check(index_of(t, "first_audio_response") >= 0 && index_of(t, "first_audio_response") < index_of(t, "<audio>"),
          "first_audio_response precedes the first audio");
    check(t.size() >= 2 && t[t.size() - 2] == "latency_metrics" && t.back() == "processing_complete",
          "turn ends with latency_metrics then processing_complete");
    check(h.channel.count("error") == 0 && h.channel.count("processing_complete") == 1, "no error, one completion");

    auto metrics = h.channel.events_of("latency_metrics");
    check(!metrics.empty() && metrics[0]["metrics"].contains("total_voice_to_voice") &&
          metrics[0]["metrics"].contains("srt_duration") && metrics[0]["metrics"].contains("llm_ttft"),
          "latency metrics include voice-to-voice, stt and first token");

    check(h.llm->request_count() == 1 && h.llm->requests[0].messages.size() == 2 &&
          h.llm->requests[0].messages.back().content == h.stt->text, "model saw system directive and user text");
    check(h.llm->requests[0].allow_function_calls, "function calls offered at depth 0");

    auto history = h.store.history(h.id);
    check(history && history->size() == 3 && (*history)[2].role == "assistant" &&
          (*history)[2].content == "Hello there. How can I help?", "assistant reply appended to history");
    check(!h.store.get(h.id)->is_processing, "session idle after the turn");
    check(h.orchestrator->state() == TurnState::Listening, "orchestrator back to listening");
}

static void sim_history_grows_per_turn() {
    cout << "--- history over several turns ---\n";
    Harness h;
    h.llm->scripts = {{ScriptedCompletion::text("One.")},
                      {ScriptedCompletion::text("Two.")},
                      {ScriptedCompletion::text("Three.")}};
    h.start();
    for (int i = 1; i <= 3; ++i) {
        h.turn();
        check(h.history_size() == static_cast<size_t>(2 * i + 1), "history holds 2n+1 messages after turn " + to_string(i));
    }
    check(h.llm->requests[2].messages.size() == 6, "third request carries the earlier turns");
    check(h.channel.count("processing_complete") == 3, "one processing_complete per turn");
}

static void sim_no_audio() {
    cout << "--- stop without audio ---\n";
    Harness h;
    h.start();
    h.turn("");
    check(h.channel.types() == vector<string>({"error", "processing_complete"}), "error then processing_complete");
    auto err = h.channel.events_of("error");
    check(!err.empty() && err[0]["message"] == "No audio was received for this turn", "error explains missing audio");
    check(h.stt->calls.load() == 0 && h.llm->request_count() == 0, "no collaborator called");
    check(h.history_size() == 1, "history untouched");
}

static void sim_empty_transcription() {
    cout << "--- empty transcription ---\n";
    Harness h;
    h.stt->text = "   \n ";
    h.start();
    h.turn();
    auto err = h.channel.events_of("error");
    check(!err.empty() && err[0]["message"] == "Transcription resulted in empty text", "empty transcription reported");
    check(h.channel.count("transcription") == 0 && h.llm->request_count() == 0, "generation bypassed");
    check(h.channel.types().back() == "processing_complete", "turn still completes");
    check(!h.store.get(h.id)->is_processing, "session not left processing");
}

static void sim_stt_outage() {
    cout << "--- speech-to-text outage ---\n";
    Harness h;
    h.stt->fail = true;
    h.start();
    h.turn();
    check(h.channel.types() == vector<string>({"error", "processing_complete"}), "error then processing_complete");
    auto err = h.channel.events_of("error");
    check(!err.empty() && err[0]["message"].get<string>().find("Transcription failed") == 0, "outage surfaced to client");
    check(h.history_size() == 1, "no user turn recorded");

    h.channel.clear();
    h.stt->fail = false;
    h.llm->scripts = {{ScriptedCompletion::text("Back again.")}};
    h.turn();
    check(h.channel.count("latency_metrics") == 1, "next turn succeeds once the service recovers");
}

static void sim_stt_timeout() {
    cout << "--- speech-to-text timeout ---\n";
    Harness h;
    h.stt->delay = chrono::milliseconds(600);
    h.config.stt_timeout = chrono::milliseconds(100);
    h.start();
    auto t0 = chrono::steady_clock::now();
    h.turn();
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - t0);
    check(h.channel.count("error") == 1 && h.channel.count("processing_complete") == 1, "timeout finalizes the turn");
    check(elapsed.count() < 500, "turn did not wait for the stalled service");
}

static void sim_llm_outage() {
    cout << "--- language model outage ---\n";
    Harness h;
    h.llm->fail_before_first = true;
    h.start();
    h.turn();
    vector<string> t = h.channel.types();
    check(t == vector<string>({"transcription", "error", "processing_complete"}), "transcription, error, processing_complete");
    check(h.channel.audio().empty(), "no audio sent");

    auto failed = h.store.history(h.id);
    check(failed && failed->size() == 3 && (*failed)[2].role == "assistant" && (*failed)[2].content.empty(),
          "failed turn still closed with an (empty) assistant reply");

    h.channel.clear();
    h.llm->fail_before_first = false;
    h.llm->scripts = {{}, {ScriptedCompletion::text("Recovered.")}};
    h.turn();
    auto history = h.store.history(h.id);
    bool alternating = history && history->size() == 5;
    for (size_t i = 1; alternating && i < history->size(); ++i) {
        alternating = (*history)[i].role == (i % 2 == 1 ? "user" : "assistant");
    }
    check(alternating, "history alternates user and assistant after a failed turn");
    check(h.channel.count("latency_metrics") == 1, "turn after the outage completes");
}

static void sim_interrupt() {
    cout << "--- interrupt with synthesis in flight ---\n";
    Harness h;
    h.tts->gated = true;
    h.llm->chunk_delay = chrono::milliseconds(120);
    h.llm->scripts = {{ScriptedCompletion::text("First sentence."), ScriptedCompletion::text(" Second sentence."),
                       ScriptedCompletion::text(" Third sentence."), ScriptedCompletion::text(" Fourth sentence.")},
                      {ScriptedCompletion::text("Fresh start.")}};
    h.start();

    h.orchestrator->on_audio_frame("RIFF....utterance");
    check(h.orchestrator->on_stop_recording(), "turn started");
    check(h.tts->wait_started(2, chrono::milliseconds(2000)), "two sentences dispatched to synthesis");

    check(h.orchestrator->on_stop_recording(), "second stop_recording interrupts");
    check(!h.store.get(h.id)->is_processing, "processing cleared on interrupt");
    h.tts->release();
    h.orchestrator->wait_idle();

    vector<string> t = h.channel.types();
    check(h.tts->started_count() == 2, "no sentence dispatched after the interrupt");
    check(h.channel.audio().size() <= 2, "at most the two in-flight audio payloads reached the client");
    check(h.channel.count("interrupted") == 1, "exactly one interrupted event");
    check(h.channel.count("processing_complete") == 1, "exactly one processing_complete");
    check(index_of(t, "interrupted") < index_of(t, "processing_complete") && t.back() == "processing_complete",
          "interrupted precedes processing_complete");
    check(h.channel.count("latency_metrics") == 0 && h.channel.count("error") == 0, "interrupted turn reports no metrics or error");

    auto history = h.store.history(h.id);
    check(history && history->size() == 3 && (*history)[2].content == "First sentence. Second sentence.",
          "partial reply kept in history");

    h.channel.clear();
    h.tts->gated = false;
    h.turn();
    check(h.channel.audio() == vector<string>({"AUDIO:Fresh start."}), "a new turn runs after the interrupt");
    check(h.channel.count("processing_complete") == 1 && h.channel.count("latency_metrics") == 1, "new turn completes");
}

static void sim_function_call() {
    cout << "--- lookup function call ---\n";
    Harness h;
    const string record = "Patient P-1: blood pressure stable, follow-up in two weeks.";
    h.lookup->records["P-1"] = record;
    h.llm->scripts = {{ScriptedCompletion::call("get_patient_info", "{\"patient_code\":"),
                       ScriptedCompletion::call("", " \"P-1\"}")},
                      {ScriptedCompletion::text("The patient is stable."),
                       ScriptedCompletion::text(" Follow up in two weeks.")}};
    h.start();
    h.turn();

    check(h.lookup->queries.size() == 1 && h.lookup->queries[0].code == "P-1" &&
          h.lookup->queries[0].kind == LookupKind::FetchSummaryByCode, "lookup queried with the typed code");
    check(h.llm->request_count() == 2, "summary requested in a sub-turn");
    const CompletionRequest& sub = h.llm->requests[1];
    check(sub.messages.size() == 3 && sub.messages.back().role == "user" &&
          sub.messages.back().content == h.config.summarize_prefix + record, "sub-turn carries the lookup result");

    vector<string> audio = h.channel.audio();
    check(audio.size() == 3 && audio[0] == "AUDIO:" + h.config.filler_phrase, "filler phrase spoken first");
    check(audio.size() == 3 && audio[1] == "AUDIO:The patient is stable." && audio[2] == "AUDIO:Follow up in two weeks.",
          "summary spoken after the filler");
    check(h.channel.count("latency_metrics") == 1 && h.channel.count("error") == 0, "turn completes");

    auto history = h.store.history(h.id);
    check(history && history->size() == 3 &&
          (*history)[2].content == "The patient is stable. Follow up in two weeks.", "summary recorded as the reply");
}

static void sim_lookup_failure() {
    cout << "--- lookup failure ---\n";
    Harness h;
    h.llm->scripts = {{ScriptedCompletion::text("Let me check."),
                       ScriptedCompletion::call("get_patient_info", "{\"patient_code\": \"P-404\"}")}};
    h.start();
    h.turn();

    vector<string> audio = h.channel.audio();
    check(audio.size() == 3, "three audio payloads");
    check(audio.size() == 3 && audio[1] == "AUDIO:" + h.config.filler_phrase &&
          audio[2] == "AUDIO:" + h.config.apology_phrase, "filler then apology spoken");
    check(h.llm->request_count() == 1, "no summary requested");
    check(h.channel.count("error") == 0 && h.channel.count("latency_metrics") == 1, "turn completes without an error event");
    check(h.channel.count("processing_complete") == 1, "one processing_complete");
}

static void sim_malformed_directive() {
    cout << "--- malformed directive ---\n";
    Harness h;
    h.lookup->records["P-1"] = "unused";
    h.llm->scripts = {{ScriptedCompletion::call("get_patient_info", "{\"patient_code\": \"P-1' OR 1=1 --\"}")}};
    h.start();
    h.turn();
    check(h.lookup->queries.empty(), "invalid code never reaches the lookup");
    check(!h.channel.audio().empty() && h.channel.audio().back() == "AUDIO:" + h.config.apology_phrase,
          "apology spoken");
    check(h.channel.types().back() == "processing_complete", "turn completes");

    Harness other;
    other.llm->scripts = {{ScriptedCompletion::call("drop_tables", "{}")}};
    other.start();
    other.turn();
    check(other.lookup->queries.empty() && other.channel.count("processing_complete") == 1, "unknown function rejected");
}

static void sim_session_gone() {
    cout << "--- session destroyed ---\n";
    Harness h;
    h.start();
    h.store.destroy_session(h.id);
    check(!h.orchestrator->on_audio_frame("x"), "audio for a destroyed session refused");
    check(!h.orchestrator->on_stop_recording(), "stop_recording for a destroyed session refused");
    check(h.channel.snapshot().empty(), "nothing sent");
}

static void sim_stalled_synthesis() {
    cout << "--- stalled synthesis does not stall the reply ---\n";
    Harness h;
    for (const char* s : {"One.", "Two.", "Three."}) h.tts->delay_ms[s] = 3000;
    h.config.synthesis.timeout = chrono::milliseconds(100);
    h.config.synthesis.max_in_flight = 1;
    h.llm->scripts = {{ScriptedCompletion::text("One."), ScriptedCompletion::text(" Two."),
                       ScriptedCompletion::text(" Three.")}};
    h.start();

    auto t0 = chrono::steady_clock::now();
    h.turn();
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - t0);

    check(h.channel.count("text") == 3, "every text fragment forwarded");
    check(elapsed.count() < 1500, "turn bounded by the synthesis timeout, not the stalled backend");
    check(h.channel.audio().empty(), "timed-out sentences produce no audio");
    check(h.channel.count("processing_complete") == 1 && h.channel.count("error") == 0, "turn still completes");
}

int main() {
    cout << "=== turn orchestrator simulation ===\n";
    sim_happy_path();
    sim_history_grows_per_turn();
    sim_no_audio();
    sim_empty_transcription();
    sim_stt_outage();
    sim_stt_timeout();
    sim_llm_outage();
    sim_interrupt();
    sim_stalled_synthesis();
    sim_function_call();
    sim_lookup_failure();
    sim_malformed_directive();
    sim_session_gone();
    return finish_sim("turn_orchestrator_sim");
}
