#include "turn-orchestrator.h"
#include "collaborator-call.h"
#include "speech-text.h"

#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "idle";
        case TurnState::Listening: return "listening";
        case TurnState::Transcribing: return "transcribing";
        case TurnState::Generating: return "generating";
        case TurnState::Interrupted: return "interrupted";
        case TurnState::Completed: return "completed";
        case TurnState::Failed: return "failed";
    }
    return "unknown";
}

std::string default_system_directive() {
    return "You are a helpful AI voice assistant which can answer patient details to the doctor. "
           "You can also look up patient records by patient code to get patient details. "
           "Do not make up any information, only answer based on the information you have. "
           "Do not entertain any other questions.";
}

struct TurnOrchestrator::TurnControl {
    explicit TurnControl(uint64_t s) : serial(s) {}

    const uint64_t serial;
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    SynthesisPipeline* pipeline = nullptr;

    void cancel() {
        cancelled.store(true);
        std::lock_guard<std::mutex> lock(mutex);
        if (pipeline) pipeline->cancel();
    }
    void attach(SynthesisPipeline* p) {
        std::lock_guard<std::mutex> lock(mutex);
        pipeline = p;
        if (cancelled.load()) p->cancel();
    }
    void detach() {
        std::lock_guard<std::mutex> lock(mutex);
        pipeline = nullptr;
    }
};

// Finalizes the turn exactly once, whichever way run_turn exits
class TurnOrchestrator::TurnScope {
public:
    TurnScope(TurnOrchestrator& owner, TurnControl& control)
        : owner_(owner), control_(control) {}
    ~TurnScope() { owner_.finalize_turn(control_, outcome_, status_); }

    void complete() { outcome_ = TurnState::Completed; status_ = TurnStatus::success(); }
    void interrupted() { outcome_ = TurnState::Interrupted; status_ = TurnStatus::failure(TurnError::Interrupted, "interrupted"); }
    void fail(const TurnStatus& status) { outcome_ = TurnState::Failed; status_ = status; }

private:
    TurnOrchestrator& owner_;
    TurnControl& control_;
    TurnState outcome_ = TurnState::Failed;
    TurnStatus status_ = TurnStatus::failure(TurnError::CollaboratorUnavailable, "Turn ended unexpectedly");
};

TurnOrchestrator::TurnOrchestrator(SessionStore& store,
                                   const std::string& session_id,
                                   ClientChannel& channel,
                                   const Collaborators& collaborators,
                                   const OrchestratorConfig& config)
    : store_(store), session_id_(session_id), channel_(channel),
      collaborators_(collaborators), config_(config), state_(TurnState::Listening) {
}

TurnOrchestrator::~TurnOrchestrator() {
    shutdown();
}

std::string TurnOrchestrator::tag(uint64_t turn_serial) const {
    std::string t = "[" + session_id_.substr(0, 8);
    if (turn_serial) t += "/turn" + std::to_string(turn_serial);
    return t + "]";
}

bool TurnOrchestrator::send(const std::string& event) {
    if (!channel_.send_text(event)) {
        std::cout << "⚠️ " << tag(0) << " Client channel closed, dropped event " << event << std::endl;
        return false;
    }
    return true;
}

void TurnOrchestrator::checkpoint(uint64_t turn_serial, Checkpoint cp) {
    if (!store_.record_turn_checkpoint(session_id_, turn_serial, cp, latency_now()) && config_.verbose) {
        std::cout << "⚠️ " << tag(turn_serial) << " Turn no longer current, skipped " << checkpoint_name(cp) << std::endl;
    }
}

bool TurnOrchestrator::on_audio_frame(const std::string& payload) {
    if (!store_.store_audio(session_id_, payload, config_.audio_frames)) {
        return false;
    }
    if (config_.verbose) {
        std::cout << "🎙️ " << tag(0) << " Received audio frame: " << payload.size() << " bytes" << std::endl;
    }
    return true;
}

bool TurnOrchestrator::on_stop_recording() {
    {
        std::lock_guard<std::mutex> finalize_lock(finalize_mutex_);
        uint64_t interrupted_serial = 0;
        if (store_.interrupt_turn(session_id_, interrupted_serial)) {
            std::shared_ptr<TurnControl> control;
            {
                std::lock_guard<std::mutex> lock(turn_mutex_);
                control = current_;
            }
            if (control && control->serial == interrupted_serial) {
                control->cancel();
            }
            state_ = TurnState::Interrupted;
            std::cout << "✋ " << tag(interrupted_serial) << " Interrupting ongoing processing" << std::endl;
            send(make_event("interrupted"));
            return true;
        }
    }

    uint64_t serial = 0;
    switch (store_.begin_turn(session_id_, serial)) {
        case BeginTurnResult::NotFound:
            std::cout << "❌ " << tag(0) << " Session no longer exists, ignoring stop_recording" << std::endl;
            return false;
        case BeginTurnResult::Busy:
            std::cout << "⚠️ " << tag(0) << " Turn already in flight, ignoring stop_recording" << std::endl;
            return true;
        case BeginTurnResult::Started:
            break;
    }

    std::cout << "🛑 " << tag(serial) << " Stop recording received, processing audio..." << std::endl;

    auto control = std::make_shared<TurnControl>(serial);
    std::lock_guard<std::mutex> lock(turn_mutex_);
    std::thread previous = std::move(turn_thread_);
    current_ = control;
    turn_thread_ = std::thread(&TurnOrchestrator::run_turn, this, control, std::move(previous));
    return true;
}

void TurnOrchestrator::shutdown() {
    std::shared_ptr<TurnControl> control;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        control = current_;
    }
    if (control) {
        control->cancel();
    }
    wait_idle();
}

void TurnOrchestrator::wait_idle() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        t = std::move(turn_thread_);
    }
    if (t.joinable()) {
        t.join();
    }
}

void TurnOrchestrator::run_turn(std::shared_ptr<TurnControl> control, std::thread previous) {
    // The previous turn may still be winding down after an interrupt
    if (previous.joinable()) {
        previous.join();
    }

    const uint64_t serial = control->serial;
    TurnScope scope(*this, *control);

    if (control->cancelled.load()) {
        scope.interrupted();
        return;
    }

    state_ = TurnState::Transcribing;
    std::string text;
    TurnStatus status = transcribe(*control, text);
    if (!status.ok()) {
        scope.fail(status);
        return;
    }
    std::cout << "📝 " << tag(serial) << " Transcription result: " << text << std::endl;

    if (control->cancelled.load()) {
        scope.interrupted();
        return;
    }

    if (!store_.append_user_turn(session_id_, text)) {
        scope.fail(TurnStatus::failure(TurnError::SessionNotFound, "session not found"));
        return;
    }
    send(make_content_event("transcription", text));

    std::optional<std::vector<ChatMessage>> history = store_.history(session_id_);
    if (!history) {
        scope.fail(TurnStatus::failure(TurnError::SessionNotFound, "session not found"));
        return;
    }

    state_ = TurnState::Generating;
    checkpoint(serial, Checkpoint::LlmStart);

    std::string response;
    TurnProgress progress;
    {
        SynthesisPipeline pipeline(
            collaborators_.synthesizer, config_.synthesis,
            [this, serial](const std::string&, const std::string& audio) { deliver_audio(serial, audio); },
            tag(serial));
        control->attach(&pipeline);
        status = generate(*control, pipeline, *history, 0, response, progress);
        pipeline.finish();
        control->detach();

        SynthesisPipeline::Stats stats = pipeline.stats();
        std::cout << "🔊 " << tag(serial) << " Synthesis: " << stats.delivered << "/" << stats.dispatched
                  << " delivered, " << stats.failed << " failed, " << stats.timed_out << " timed out" << std::endl;
    }
    checkpoint(serial, Checkpoint::TtsEnd);

    if (control->cancelled.load() || status.error == TurnError::Interrupted) {
        if (!store_.append_assistant_turn(session_id_, response)) {
            scope.fail(TurnStatus::failure(TurnError::SessionNotFound, "session not found"));
            return;
        }
        scope.interrupted();
        return;
    }

    if (!status.ok()) {
        if (!store_.append_assistant_turn(session_id_, response)) {
            scope.fail(TurnStatus::failure(TurnError::SessionNotFound, "session not found"));
            return;
        }
        scope.fail(status);
        return;
    }

    if (!store_.append_assistant_turn(session_id_, response)) {
        scope.fail(TurnStatus::failure(TurnError::SessionNotFound, "session not found"));
        return;
    }
    if (config_.verbose) {
        std::cout << "💬 " << tag(serial) << " Response: " << response << std::endl;
    }
    scope.complete();
}

void TurnOrchestrator::dump_utterance(const std::string& audio) {
    std::optional<Session> s = store_.get(session_id_);
    if (!s) return;
    std::string path = config_.audio_dump_dir + "/" + session_id_ + "-" + std::to_string(s->turn_counter) + ".wav";
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        std::cout << "⚠️ " << tag(0) << " Could not write utterance to " << path << std::endl;
        return;
    }
    out.write(audio.data(), static_cast<std::streamsize>(audio.size()));
}

TurnStatus TurnOrchestrator::transcribe(TurnControl& control, std::string& text) {
    std::optional<std::string> audio = store_.take_pending_audio(session_id_);
    if (!audio) {
        return TurnStatus::failure(TurnError::SessionNotFound, "session not found");
    }
    if (audio->empty()) {
        return TurnStatus::failure(TurnError::EmptyTranscription, "No audio was received for this turn");
    }
    std::cout << "🎧 " << tag(control.serial) << " Processing audio data. Size: " << audio->size() << " bytes" << std::endl;

    if (!config_.audio_dump_dir.empty()) {
        dump_utterance(*audio);
    }

    std::shared_ptr<Transcriber> transcriber = collaborators_.transcriber;
    if (!transcriber) {
        return TurnStatus::failure(TurnError::CollaboratorUnavailable, "Transcription service is not configured");
    }

    checkpoint(control.serial, Checkpoint::SttStart);
    std::string payload = std::move(*audio);
    std::string error;
    bool ok = call_with_timeout<std::string>(
        [transcriber, payload](std::string& out, std::string& err) {
            return transcriber->transcribe(payload, out, err);
        },
        config_.stt_timeout, text, error);
    checkpoint(control.serial, Checkpoint::SttEnd);

    if (!ok) {
        std::cout << "❌ " << tag(control.serial) << " Transcription error: " << error << std::endl;
        return TurnStatus::failure(TurnError::CollaboratorUnavailable, "Transcription failed: " + error);
    }

    text = trim_whitespace(text);
    if (text.empty()) {
        return TurnStatus::failure(TurnError::EmptyTranscription, "Transcription resulted in empty text");
    }
    return TurnStatus::success();
}

void TurnOrchestrator::speak_sentence(TurnControl& control, SynthesisPipeline& pipeline,
                                      const std::string& sentence, TurnProgress& progress) {
    if (control.cancelled.load()) return;

    std::string clean = sanitize_for_speech(sentence);
    if (clean.empty()) return;

    if (!progress.first_sentence) {
        progress.first_sentence = true;
        checkpoint(control.serial, Checkpoint::LlmFirstSentence);
    }
    if (!progress.tts_started) {
        progress.tts_started = true;
        checkpoint(control.serial, Checkpoint::TtsStart);
    }
    if (!pipeline.dispatch(clean)) {
        std::cout << "✋ " << tag(control.serial) << " Not dispatching after cancel: \"" << clean << "\"" << std::endl;
    }
}

void TurnOrchestrator::speak_phrase(TurnControl& control, SynthesisPipeline& pipeline,
                                    const std::string& phrase, TurnProgress& progress) {
    if (control.cancelled.load() || phrase.empty()) return;
    if (!progress.tts_started) {
        progress.tts_started = true;
        checkpoint(control.serial, Checkpoint::TtsStart);
    }
    if (!pipeline.dispatch(sanitize_for_speech(phrase))) {
        std::cout << "✋ " << tag(control.serial) << " Not dispatching after cancel: \"" << phrase << "\"" << std::endl;
    }
}

void TurnOrchestrator::deliver_audio(uint64_t turn_serial, const std::string& audio) {
    if (store_.mark_first_audio(session_id_, turn_serial)) {
        checkpoint(turn_serial, Checkpoint::FirstAudioResponse);
        send(make_event("first_audio_response"));
    }
    if (!channel_.send_binary(audio)) {
        std::cout << "⚠️ " << tag(turn_serial) << " Client channel closed, dropped " << audio.size() << " bytes of audio" << std::endl;
    }
}

static void join_text(std::string& into, const std::string& part) {
    if (part.empty()) return;
    if (!into.empty() && !std::isspace(static_cast<unsigned char>(into.back())) &&
        !std::isspace(static_cast<unsigned char>(part.front()))) {
        into += " ";
    }
    into += part;
}

TurnStatus TurnOrchestrator::generate(TurnControl& control, SynthesisPipeline& pipeline,
                                      const std::vector<ChatMessage>& messages, int depth,
                                      std::string& response, TurnProgress& progress) {
    std::shared_ptr<CompletionService> completion = collaborators_.completion;
    if (!completion) {
        return TurnStatus::failure(TurnError::CollaboratorUnavailable, "Language model is not configured");
    }

    CompletionRequest request;
    request.messages = messages;
    request.allow_function_calls = depth < config_.max_function_depth && collaborators_.lookup != nullptr;
    request.deadline = std::chrono::steady_clock::now() + config_.llm_timeout;

    SentenceSegmenter segmenter;
    FunctionCall call;
    std::string text;
    bool received_any = false;
    bool timed_out = false;

    auto on_chunk = [&](const CompletionChunk& chunk) -> bool {
        if (control.cancelled.load()) {
            return false;
        }
        if (std::chrono::steady_clock::now() > request.deadline) {
            timed_out = true;
            return false;
        }
        received_any = true;

        if (!chunk.content.empty()) {
            if (!progress.first_token) {
                progress.first_token = true;
                checkpoint(control.serial, Checkpoint::LlmFirstToken);
            }
            text += chunk.content;
            send(make_content_event("text", chunk.content));
            for (const std::string& sentence : segmenter.feed(chunk.content)) {
                speak_sentence(control, pipeline, sentence, progress);
            }
        }
        if (!chunk.function_name.empty() || !chunk.function_arguments.empty()) {
            call.append(chunk);
        }
        return true;
    };

    std::string error;
    bool ok = false;
    try {
        ok = completion->stream(request, on_chunk, error);
    } catch (const std::exception& e) {
        error = e.what();
        ok = false;
    }
    if (timed_out) {
        ok = false;
        error = "timed out after " + std::to_string(config_.llm_timeout.count()) + " ms";
    }

    if (control.cancelled.load()) {
        join_text(response, text);
        return TurnStatus::failure(TurnError::Interrupted, "interrupted");
    }

    if (!ok) {
        if (!received_any) {
            std::cout << "❌ " << tag(control.serial) << " LLM error: " << error << std::endl;
            return TurnStatus::failure(TurnError::CollaboratorUnavailable, "Language model unavailable: " + error);
        }
        std::cout << "⚠️ " << tag(control.serial) << " LLM stream ended early (" << error
                  << "), finishing with the text received so far" << std::endl;
    }

    std::string rest = segmenter.flush();
    if (!rest.empty()) {
        if (config_.verbose) {
            std::cout << "📝 " << tag(control.serial) << " Remaining text: " << rest << std::endl;
        }
        speak_sentence(control, pipeline, rest, progress);
    }
    join_text(response, text);

    if (!call.empty()) {
        if (depth >= config_.max_function_depth || !collaborators_.lookup) {
            std::cout << "⚠️ " << tag(control.serial) << " Ignoring function call '" << call.name
                      << "' at depth " << depth << std::endl;
            return TurnStatus::success();
        }
        return run_function_call(control, pipeline, messages, depth, call, text, response, progress);
    }
    return TurnStatus::success();
}

TurnStatus TurnOrchestrator::run_function_call(TurnControl& control, SynthesisPipeline& pipeline,
                                               const std::vector<ChatMessage>& messages, int depth,
                                               const FunctionCall& call, const std::string& spoken_so_far,
                                               std::string& response, TurnProgress& progress) {
    std::cout << "🔧 " << tag(control.serial) << " Function call: " << call.name << " " << call.arguments << std::endl;
    speak_phrase(control, pipeline, config_.filler_phrase, progress);

    LookupQuery query;
    std::string error;
    if (!parse_lookup_query(call, query, error)) {
        std::cout << "❌ " << tag(control.serial) << " " << turn_error_name(TurnError::MalformedFunctionDirective)
                  << ": " << error << std::endl;
        speak_phrase(control, pipeline, config_.apology_phrase, progress);
        return TurnStatus::success();
    }

    std::shared_ptr<RecordLookup> lookup = collaborators_.lookup;
    std::string result;
    bool ok = call_with_timeout<std::string>(
        [lookup, query](std::string& out, std::string& err) {
            return lookup->lookup(query, out, err);
        },
        config_.lookup_timeout, result, error);
    if (!ok) {
        std::cout << "❌ " << tag(control.serial) << " " << turn_error_name(TurnError::LookupFailure)
                  << ": " << error << std::endl;
        speak_phrase(control, pipeline, config_.apology_phrase, progress);
        return TurnStatus::success();
    }

    if (control.cancelled.load()) {
        return TurnStatus::failure(TurnError::Interrupted, "interrupted");
    }
    if (config_.verbose) {
        std::cout << "📇 " << tag(control.serial) << " Lookup result: " << result << std::endl;
    }

    std::vector<ChatMessage> sub_turn = messages;
    if (!spoken_so_far.empty()) {
        sub_turn.push_back({"assistant", spoken_so_far});
    }
    sub_turn.push_back({"user", config_.summarize_prefix + result});

    std::string summary;
    TurnStatus status = generate(control, pipeline, sub_turn, depth + 1, summary, progress);
    join_text(response, summary);

    if (status.error == TurnError::CollaboratorUnavailable) {
        std::cout << "⚠️ " << tag(control.serial) << " Summary generation failed: " << status.message << std::endl;
        speak_phrase(control, pipeline, config_.apology_phrase, progress);
        return TurnStatus::success();
    }
    return status;
}

void TurnOrchestrator::finalize_turn(TurnControl& control, TurnState outcome, const TurnStatus& status) {
    std::lock_guard<std::mutex> lock(finalize_mutex_);

    bool owned = store_.finish_turn(session_id_, control.serial);

    if (status.error == TurnError::SessionNotFound || !store_.contains(session_id_)) {
        std::cout << "❌ " << tag(control.serial) << " Session not found, abandoning turn" << std::endl;
        state_ = TurnState::Idle;
        return;
    }

    if (control.cancelled.load() || !owned) {
        outcome = TurnState::Interrupted;
    }

    state_ = outcome;
    if (outcome == TurnState::Failed) {
        std::cout << "❌ " << tag(control.serial) << " Turn failed (" << turn_error_name(status.error)
                  << "): " << status.message << std::endl;
        send(make_error_event(status.message));
    } else if (outcome == TurnState::Completed) {
        std::optional<LatencyMetrics> metrics = store_.derive_metrics(session_id_);
        if (metrics) {
            std::cout << "⏱️ " << tag(control.serial) << " " << format_latency_summary(*metrics) << std::endl;
            send(make_latency_event(*metrics));
        }
    } else {
        std::cout << "✋ " << tag(control.serial) << " Turn interrupted" << std::endl;
    }

    send(make_event("processing_complete"));
    state_ = TurnState::Listening;
}
