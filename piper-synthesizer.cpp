#include "piper-synthesizer.h"
#include "wav-audio.h"

#include <chrono>
#include <exception>
#include <iostream>
#include <vector>
#include <sys/stat.h>

// Include Piper C API
extern "C" {
#include "piper.h"
}

PiperSynthesizer::PiperSynthesizer() = default;

PiperSynthesizer::~PiperSynthesizer() {
    unload();
}

bool PiperSynthesizer::load(const PiperConfig& config) {
    config_ = config;
    auto t0 = std::chrono::steady_clock::now();
    std::string cfg = config_.config_path.empty() ? (config_.model_path + ".json") : config_.config_path;

    // libpiper fails inside its JSON parser on a missing or empty config
    struct stat st{};
    if (stat(cfg.c_str(), &st) != 0 || st.st_size == 0) {
        std::cout << "❌ Piper config JSON missing or empty: " << cfg << std::endl;
        return false;
    }

    try {
        synthesizer_ = piper_create(config_.model_path.c_str(), cfg.c_str(), config_.espeak_data_path.c_str());
    } catch (const std::exception& e) {
        std::cout << "❌ Exception during Piper synthesizer preload: " << e.what() << std::endl;
        return false;
    }
    if (!synthesizer_) {
        std::cout << "❌ Failed to preload Piper synthesizer" << std::endl;
        return false;
    }

    std::cout << "✅ Piper synthesizer preloaded in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count()
              << " ms" << std::endl;
    return true;
}

void PiperSynthesizer::unload() {
    std::lock_guard<std::mutex> lock(synthesis_mutex_);
    if (synthesizer_) {
        piper_free(synthesizer_);
        synthesizer_ = nullptr;
    }
}

bool PiperSynthesizer::synthesize(const std::string& text, std::string& audio, std::string& error) {
    std::lock_guard<std::mutex> lock(synthesis_mutex_);
    if (!synthesizer_) {
        error = "piper voice not loaded";
        return false;
    }
    if (text.empty()) {
        error = "nothing to synthesize";
        return false;
    }

    piper_synthesize_options options = piper_default_synthesize_options(synthesizer_);
    options.speaker_id = config_.speaker_id;
    options.length_scale = config_.length_scale;
    options.noise_scale = config_.noise_scale;
    options.noise_w_scale = config_.noise_w_scale;

    auto t0 = std::chrono::steady_clock::now();
    if (piper_synthesize_start(synthesizer_, text.c_str(), &options) != PIPER_OK) {
        error = "failed to start piper synthesis";
        return false;
    }

    std::vector<float> samples;
    int sample_rate = 22050;
    for (;;) {
        piper_audio_chunk chunk{};
        int result = piper_synthesize_next(synthesizer_, &chunk);
        if (result != PIPER_OK && result != PIPER_DONE) {
            error = "piper synthesis failed with code " + std::to_string(result);
            return false;
        }
        if (chunk.num_samples > 0) {
            samples.insert(samples.end(), chunk.samples, chunk.samples + chunk.num_samples);
            sample_rate = chunk.sample_rate;
        }
        if (result == PIPER_DONE || chunk.is_last) {
            break;
        }
    }

    if (samples.empty()) {
        error = "piper produced no audio";
        return false;
    }
    audio = encode_wav_pcm16(samples, sample_rate);

    if (config_.verbose) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        std::cout << "🔊 Synthesized " << samples.size() << " samples @" << sample_rate << "Hz in " << ms
                  << " ms: \"" << text << "\"" << std::endl;
    }
    return true;
}
