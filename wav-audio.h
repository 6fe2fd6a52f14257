#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct WavData {
    int sample_rate = 0;
    int channels = 0;
    std::vector<float> samples;  // mono, [-1, 1]
};

// Parses a RIFF/WAVE PCM16 payload held in memory. Multi-channel audio is
// down-mixed to mono.
bool decode_wav_pcm16(const std::string& payload, WavData& out, std::string& error);

// Mono PCM16 RIFF/WAVE payload from float samples (clamped to [-1, 1])
std::string encode_wav_pcm16(const std::vector<float>& samples, int sample_rate);
std::string encode_wav_pcm16(const std::vector<int16_t>& samples, int sample_rate);

std::vector<float> resample_linear(const std::vector<float>& in, int sr_in, int sr_out);
