#pragma once

#include "client-events.h"
#include "collaborators.h"
#include "function-directive.h"
#include "session-store.h"
#include "synthesis-pipeline.h"
#include "turn-status.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class TurnState {
    Idle,
    Listening,
    Transcribing,
    Generating,
    Interrupted,
    Completed,
    Failed
};

const char* turn_state_name(TurnState state);

struct Collaborators {
    std::shared_ptr<Transcriber> transcriber;
    std::shared_ptr<CompletionService> completion;
    std::shared_ptr<SpeechSynthesizer> synthesizer;
    std::shared_ptr<RecordLookup> lookup;
};

struct OrchestratorConfig {
    std::string filler_phrase = "Please wait while I get the patient details...";
    std::string apology_phrase = "I am sorry, I am unable to get the patient details at this time. "
                                 "Please make sure the patient code is correct.";
    std::string summarize_prefix = "Summarize this result in simple language, keep it brief: ";

    std::chrono::milliseconds stt_timeout{30000};
    std::chrono::milliseconds llm_timeout{60000};
    std::chrono::milliseconds lookup_timeout{10000};
    SynthesisPipelineConfig synthesis;  // tts timeout and concurrency

    int max_function_depth = 2;
    AudioFrameMode audio_frames = AudioFrameMode::Replace;
    std::string audio_dump_dir;  // write each utterance here when set
    bool verbose = false;
};

// System directive every session history starts with
std::string default_system_directive();

// Drives the conversational turns of one session. Inbound events arrive on the
// connection's reader thread; each turn runs on its own worker thread so the
// reader stays free to receive pings and interrupts.
class TurnOrchestrator {
public:
    TurnOrchestrator(SessionStore& store,
                     const std::string& session_id,
                     ClientChannel& channel,
                     const Collaborators& collaborators,
                     const OrchestratorConfig& config);
    ~TurnOrchestrator();

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    // Inbound events. Both return false when the session no longer exists.
    bool on_audio_frame(const std::string& payload);
    bool on_stop_recording();

    // Cancels any turn in flight and waits for it to finalize
    void shutdown();
    // Waits for the current turn (if any) to finalize
    void wait_idle();

    TurnState state() const { return state_.load(); }
    const std::string& session_id() const { return session_id_; }

private:
    struct TurnControl;
    class TurnScope;

    // Milestones already recorded in this turn, across function-call sub-turns
    struct TurnProgress {
        bool first_token = false;
        bool first_sentence = false;
        bool tts_started = false;
    };

    void run_turn(std::shared_ptr<TurnControl> control, std::thread previous);
    TurnStatus transcribe(TurnControl& control, std::string& text);
    TurnStatus generate(TurnControl& control, SynthesisPipeline& pipeline,
                        const std::vector<ChatMessage>& messages, int depth,
                        std::string& response, TurnProgress& progress);
    TurnStatus run_function_call(TurnControl& control, SynthesisPipeline& pipeline,
                                 const std::vector<ChatMessage>& messages, int depth,
                                 const FunctionCall& call, const std::string& spoken_so_far,
                                 std::string& response, TurnProgress& progress);

    void speak_sentence(TurnControl& control, SynthesisPipeline& pipeline,
                        const std::string& sentence, TurnProgress& progress);
    void speak_phrase(TurnControl& control, SynthesisPipeline& pipeline,
                      const std::string& phrase, TurnProgress& progress);
    void deliver_audio(uint64_t turn_serial, const std::string& audio);
    void finalize_turn(TurnControl& control, TurnState outcome, const TurnStatus& status);

    void checkpoint(uint64_t turn_serial, Checkpoint checkpoint);
    bool send(const std::string& event);
    void dump_utterance(const std::string& audio);
    std::string tag(uint64_t turn_serial) const;

    SessionStore& store_;
    std::string session_id_;
    ClientChannel& channel_;
    Collaborators collaborators_;
    OrchestratorConfig config_;

    std::atomic<TurnState> state_;

    // Serializes turn finalization against interruption so "interrupted" always
    // precedes the interrupted turn's "processing_complete"
    std::mutex finalize_mutex_;

    std::mutex turn_mutex_;
    std::shared_ptr<TurnControl> current_;
    std::thread turn_thread_;
};
