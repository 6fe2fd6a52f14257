#pragma once

#include "collaborators.h"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

struct WhisperConfig {
    std::string model_path = "models/ggml-base.en.bin";
    int n_threads = 8;
    bool use_gpu = true;
    std::string language = "en";
    std::chrono::milliseconds max_inference{30000};  // whisper_full is aborted past this
    bool verbose = false;
};

// Speech-to-text on a preloaded whisper.cpp model. The context is loaded once
// and shared by every session; inference is serialized on it.
class WhisperTranscriber : public Transcriber {
public:
    WhisperTranscriber();
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    bool load(const WhisperConfig& config);
    void unload();
    bool is_loaded() const { return ctx_ != nullptr; }

    // `audio` is a WAV PCM16 payload
    bool transcribe(const std::string& audio, std::string& text, std::string& error) override;

private:
    bool run_inference(const std::vector<float>& pcm16k, std::string& text, std::string& error);

    WhisperConfig config_;
    whisper_context* ctx_ = nullptr;
    std::mutex ctx_mutex_;
};

// Cleans up whisper output: drops bracketed markers like [BLANK_AUDIO], removes
// doubled words at segment seams and capitalizes sentence starts.
std::string post_process_transcription(const std::string& text);
