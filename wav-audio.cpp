#include "wav-audio.h"

#include <algorithm>
#include <cmath>

static uint32_t read_u32(const std::string& s, size_t pos) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data() + pos);
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

static uint16_t read_u16(const std::string& s, size_t pos) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data() + pos);
    return uint16_t(p[0] | (p[1] << 8));
}

static void put_u32(std::string& s, uint32_t v) {
    s.push_back(char(v & 0xff));
    s.push_back(char((v >> 8) & 0xff));
    s.push_back(char((v >> 16) & 0xff));
    s.push_back(char((v >> 24) & 0xff));
}

static void put_u16(std::string& s, uint16_t v) {
    s.push_back(char(v & 0xff));
    s.push_back(char((v >> 8) & 0xff));
}

bool decode_wav_pcm16(const std::string& payload, WavData& out, std::string& error) {
    if (payload.size() < 12 || payload.compare(0, 4, "RIFF") != 0 || payload.compare(8, 4, "WAVE") != 0) {
        error = "not a RIFF/WAVE payload";
        return false;
    }

    uint16_t audio_fmt = 0, num_channels = 0, bits_per_sample = 0;
    uint32_t sample_rate = 0;
    size_t data_pos = 0, data_size = 0;
    bool got_fmt = false, got_data = false;

    // Walk chunks until 'fmt ' and 'data'
    size_t pos = 12;
    while (pos + 8 <= payload.size() && !(got_fmt && got_data)) {
        uint32_t sz = read_u32(payload, pos + 4);
        size_t body = pos + 8;
        if (payload.compare(pos, 4, "fmt ") == 0) {
            if (sz < 16 || body + 16 > payload.size()) {
                error = "truncated fmt chunk";
                return false;
            }
            audio_fmt = read_u16(payload, body);
            num_channels = read_u16(payload, body + 2);
            sample_rate = read_u32(payload, body + 4);
            bits_per_sample = read_u16(payload, body + 14);
            got_fmt = true;
        } else if (payload.compare(pos, 4, "data") == 0) {
            data_pos = body;
            // Streamed WAVs may carry a bogus size; clamp to what we have
            data_size = std::min<size_t>(sz, payload.size() - body);
            got_data = true;
        }
        pos = body + sz + (sz & 1);
    }

    if (!got_fmt || !got_data) {
        error = "missing fmt or data chunk";
        return false;
    }
    if (audio_fmt != 1 || bits_per_sample != 16 || num_channels == 0 || sample_rate == 0) {
        error = "unsupported WAV format (need PCM16)";
        return false;
    }

    out.sample_rate = static_cast<int>(sample_rate);
    out.channels = num_channels;
    out.samples.clear();

    size_t frame_bytes = size_t(num_channels) * 2;
    size_t frames = data_size / frame_bytes;
    out.samples.reserve(frames);
    for (size_t i = 0; i < frames; ++i) {
        float acc = 0.0f;
        for (size_t c = 0; c < num_channels; ++c) {
            int16_t v = static_cast<int16_t>(read_u16(payload, data_pos + i * frame_bytes + c * 2));
            acc += static_cast<float>(v) / 32768.0f;
        }
        out.samples.push_back(acc / static_cast<float>(num_channels));
    }
    return true;
}

std::string encode_wav_pcm16(const std::vector<int16_t>& samples, int sample_rate) {
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * 2);
    std::string out;
    out.reserve(44 + data_bytes);
    out += "RIFF";
    put_u32(out, 36 + data_bytes);
    out += "WAVE";
    out += "fmt ";
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, 1);  // mono
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * 2);
    put_u16(out, 2);
    put_u16(out, 16);
    out += "data";
    put_u32(out, data_bytes);
    for (int16_t s : samples) {
        put_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

std::string encode_wav_pcm16(const std::vector<float>& samples, int sample_rate) {
    std::vector<int16_t> pcm(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float v = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcm[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
    }
    return encode_wav_pcm16(pcm, sample_rate);
}

std::vector<float> resample_linear(const std::vector<float>& in, int sr_in, int sr_out) {
    if (sr_in == sr_out || in.empty() || sr_in <= 0 || sr_out <= 0) return in;
    double ratio = (double)sr_out / (double)sr_in;
    size_t out_n = (size_t)std::llround((double)in.size() * ratio);
    std::vector<float> out(out_n);
    for (size_t i = 0; i < out_n; ++i) {
        double pos = (double)i / ratio;
        size_t i0 = std::min((size_t)std::floor(pos), in.size() - 1);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double t = pos - (double)i0;
        out[i] = (float)((1.0 - t) * in[i0] + t * in[i1]);
    }
    return out;
}
