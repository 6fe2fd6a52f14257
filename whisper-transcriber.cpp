#include "whisper-transcriber.h"
#include "speech-text.h"
#include "wav-audio.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sys/stat.h>

#include "whisper.h"

struct AbortDeadline {
    std::chrono::steady_clock::time_point deadline;
};

static bool abort_past_deadline(void* user_data) {
    auto* d = static_cast<AbortDeadline*>(user_data);
    return std::chrono::steady_clock::now() > d->deadline;
}

WhisperTranscriber::WhisperTranscriber() = default;

WhisperTranscriber::~WhisperTranscriber() {
    unload();
}

bool WhisperTranscriber::load(const WhisperConfig& config) {
    config_ = config;

    struct stat file_stat;
    if (stat(config_.model_path.c_str(), &file_stat) != 0) {
        std::cout << "❌ Model file not found: " << config_.model_path << std::endl;
        return false;
    }

    // Eager load so the first turn does not pay for it
    std::cout << "⏳ Preloading Whisper model: " << config_.model_path << std::endl;
    auto t0 = std::chrono::steady_clock::now();
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.use_gpu;
    cparams.flash_attn = true;
    cparams.gpu_device = 0;
    cparams.dtw_token_timestamps = false;
    ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
    if (!ctx_) {
        std::cout << "❌ Whisper preload failed for model: " << config_.model_path << std::endl;
        return false;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "✅ Whisper model preloaded in " << ms << " ms" << std::endl;

    // Warm-up inference to allocate compute graphs
    std::vector<float> silence(16000, 0.0f);
    whisper_full_params wp = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wp.no_timestamps = true;
    wp.print_progress = false;
    wp.print_realtime = false;
    if (whisper_full(ctx_, wp, silence.data(), static_cast<int>(silence.size())) == 0) {
        std::cout << "✅ Whisper warm-up inference completed" << std::endl;
    } else {
        std::cout << "⚠️ Whisper warm-up failed (non-fatal)" << std::endl;
    }
    return true;
}

void WhisperTranscriber::unload() {
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperTranscriber::transcribe(const std::string& audio, std::string& text, std::string& error) {
    WavData wav;
    if (!decode_wav_pcm16(audio, wav, error)) {
        error = "cannot decode audio: " + error;
        return false;
    }
    std::vector<float> pcm16k = (wav.sample_rate == 16000) ? wav.samples
                                                            : resample_linear(wav.samples, wav.sample_rate, 16000);
    if (pcm16k.empty()) {
        text.clear();
        return true;
    }
    if (!run_inference(pcm16k, text, error)) {
        return false;
    }
    text = post_process_transcription(text);
    return true;
}

bool WhisperTranscriber::run_inference(const std::vector<float>& pcm16k, std::string& text, std::string& error) {
    auto t_mutex_start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (!ctx_) {
        error = "whisper model not loaded";
        return false;
    }
    auto mutex_wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_mutex_start).count();
    if (mutex_wait_ms > 10) {
        std::cout << "⏳ Whisper mutex wait: " << mutex_wait_ms << "ms" << std::endl;
    }

    AbortDeadline deadline{std::chrono::steady_clock::now() + config_.max_inference};

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.language = config_.language.c_str();
    wparams.n_threads = config_.n_threads;
    wparams.temperature = 0.0f;
    wparams.temperature_inc = 0.2f;
    wparams.no_timestamps = true;
    wparams.translate = false;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.abort_callback = abort_past_deadline;
    wparams.abort_callback_user_data = &deadline;

    double secs_in = static_cast<double>(pcm16k.size()) / 16000.0;
    auto t_inference_start = std::chrono::steady_clock::now();
    int result = whisper_full(ctx_, wparams, pcm16k.data(), static_cast<int>(pcm16k.size()));
    auto inference_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_inference_start).count();

    if (config_.verbose) {
        std::cout << "⚡ Whisper inference: " << inference_ms << "ms (" << secs_in << "s audio)" << std::endl;
    }

    if (result != 0) {
        error = "whisper_full failed with code " + std::to_string(result);
        return false;
    }

    text.clear();
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment = whisper_full_get_segment_text(ctx_, i);
        if (segment) {
            text += segment;
        }
    }
    return true;
}

static std::string strip_markers(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '[') {
            size_t close = text.find(']', i);
            if (close != std::string::npos) {
                i = close + 1;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

std::string post_process_transcription(const std::string& text) {
    std::string result = trim_whitespace(strip_markers(text));
    if (result.empty()) return result;

    // Remove duplicate words at boundaries ("smooth smooth" -> "smooth")
    size_t pos = 0;
    while ((pos = result.find(' ', pos)) != std::string::npos) {
        if (pos == 0 || pos + 1 >= result.size()) {
            pos++;
            continue;
        }
        size_t word_start = result.rfind(' ', pos - 1);
        word_start = (word_start == std::string::npos) ? 0 : word_start + 1;
        std::string word1 = result.substr(word_start, pos - word_start);

        size_t word_end = result.find(' ', pos + 1);
        if (word_end == std::string::npos) word_end = result.size();
        std::string word2 = result.substr(pos + 1, word_end - pos - 1);

        if (!word1.empty() && !word2.empty()) {
            std::transform(word1.begin(), word1.end(), word1.begin(), ::tolower);
            std::transform(word2.begin(), word2.end(), word2.begin(), ::tolower);
            if (word1 == word2) {
                result.erase(pos, word_end - pos);
                continue;
            }
        }
        pos++;
    }

    if (result[0] >= 'a' && result[0] <= 'z') {
        result[0] = result[0] - 'a' + 'A';
    }
    for (size_t i = 0; i + 2 < result.size(); i++) {
        if ((result[i] == '.' || result[i] == '!' || result[i] == '?') && result[i + 1] == ' ') {
            if (result[i + 2] >= 'a' && result[i + 2] <= 'z') {
                result[i + 2] = result[i + 2] - 'a' + 'A';
            }
        }
    }
    return result;
}
