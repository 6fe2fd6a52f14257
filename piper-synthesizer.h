#pragma once

#include "collaborators.h"

#include <mutex>
#include <string>

// Forward declarations for Piper C API
struct piper_synthesizer;

struct PiperConfig {
    std::string model_path = "models/voice.onnx";
    std::string config_path = "";  // model_path + ".json" when empty
    std::string espeak_data_path = "espeak-ng-data";
    int speaker_id = 0;
    float length_scale = 0.90f;
    float noise_scale = 0.667f;
    float noise_w_scale = 0.8f;
    bool verbose = false;
};

// Text-to-speech on one preloaded piper voice. Returns each sentence as a mono
// PCM16 WAV payload. Calls are serialized on the voice.
class PiperSynthesizer : public SpeechSynthesizer {
public:
    PiperSynthesizer();
    ~PiperSynthesizer() override;

    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    bool load(const PiperConfig& config);
    void unload();
    bool is_loaded() const { return synthesizer_ != nullptr; }

    bool synthesize(const std::string& text, std::string& audio, std::string& error) override;

private:
    PiperConfig config_;
    piper_synthesizer* synthesizer_ = nullptr;
    std::mutex synthesis_mutex_;
};
