#include "wav-audio.h"
#include "sim-doubles.h"

#include <algorithm>
#include <cmath>

using namespace std;

static void put_u16(string& s, uint16_t v) {
    s.push_back(char(v & 0xff));
    s.push_back(char(v >> 8));
}

static void put_u32(string& s, uint32_t v) {
    for (int i = 0; i < 4; ++i) s.push_back(char((v >> (8 * i)) & 0xff));
}

// Stereo PCM16 with a LIST chunk between fmt and data, as browsers often send
static string stereo_wav(const vector<pair<int16_t, int16_t>>& frames, int rate) {
    string list = "INFOISFT";
    put_u32(list, 4);
    list += "sim";
    list.push_back('\0');

    string s = "RIFF";
    put_u32(s, 0);  // size left bogus on purpose
    s += "WAVEfmt ";
    put_u32(s, 16);
    put_u16(s, 1);
    put_u16(s, 2);
    put_u32(s, rate);
    put_u32(s, rate * 4);
    put_u16(s, 4);
    put_u16(s, 16);
    s += "LIST";
    put_u32(s, static_cast<uint32_t>(list.size()));
    s += list;
    s += "data";
    put_u32(s, static_cast<uint32_t>(frames.size() * 4));
    for (const auto& f : frames) {
        put_u16(s, static_cast<uint16_t>(f.first));
        put_u16(s, static_cast<uint16_t>(f.second));
    }
    return s;
}

int main() {
    cout << "=== wav audio simulation ===\n";

    WavData wav;
    string error;

    vector<float> tone(220);
    for (size_t i = 0; i < tone.size(); ++i) tone[i] = 0.5f * std::sin(2.0f * 3.14159265f * 440.0f * i / 22050.0f);
    string mono = encode_wav_pcm16(tone, 22050);
    check(mono.size() == 44 + tone.size() * 2 && mono.compare(0, 4, "RIFF") == 0, "44-byte header plus PCM16 body");
    check(decode_wav_pcm16(mono, wav, error) && wav.sample_rate == 22050 && wav.channels == 1 &&
          wav.samples.size() == tone.size(), "mono payload decoded");
    float max_err = 0.0f;
    for (size_t i = 0; i < tone.size() && i < wav.samples.size(); ++i) {
        max_err = std::max(max_err, std::fabs(tone[i] - wav.samples[i]));
    }
    check(max_err < 1e-3f, "samples survive PCM16 quantization");

    check(encode_wav_pcm16(vector<float>{2.0f, -2.0f}, 16000).substr(44) == string("\xff\x7f\x01\x80", 4),
          "out-of-range samples clamped");

    string stereo = stereo_wav({{16384, -16384}, {16384, 16384}, {-32768, -32768}}, 48000);
    check(decode_wav_pcm16(stereo, wav, error) && wav.channels == 2 && wav.samples.size() == 3,
          "stereo payload with an extra chunk decoded");
    check(wav.samples.size() == 3 && wav.samples[0] == 0.0f && wav.samples[1] == 0.5f && wav.samples[2] == -1.0f,
          "channels averaged into mono");

    string truncated = stereo.substr(0, stereo.size() - 3);
    check(decode_wav_pcm16(truncated, wav, error) && wav.samples.size() == 2, "truncated data clamped to whole frames");

    check(!decode_wav_pcm16("OggS\0\0\0\0\0\0\0\0\0\0", wav, error) && error == "not a RIFF/WAVE payload",
          "non-WAV payload rejected");
    string header_only = mono.substr(0, 36);
    check(!decode_wav_pcm16(header_only, wav, error) && error == "missing fmt or data chunk", "missing data chunk rejected");
    string float_wav = mono;
    float_wav[20] = 3;  // IEEE float format tag
    check(!decode_wav_pcm16(float_wav, wav, error) && error == "unsupported WAV format (need PCM16)",
          "non-PCM16 format rejected");

    vector<float> second(48000, 0.25f);
    vector<float> down = resample_linear(second, 48000, 16000);
    check(down.size() == 16000 && std::fabs(down[8000] - 0.25f) < 1e-6f, "48 kHz to 16 kHz keeps duration and level");
    check(resample_linear(second, 16000, 16000).size() == second.size(), "same rate is a no-op");
    vector<float> ramp = {0.0f, 1.0f};
    vector<float> up = resample_linear(ramp, 1, 2);
    check(up.size() == 4 && std::fabs(up[1] - 0.5f) < 1e-6f, "upsampling interpolates");

    return finish_sim("wav_audio_sim");
}
