#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

// Pipeline milestones recorded once per turn
enum class Checkpoint : size_t {
    TurnStart = 0,
    SttStart,
    SttEnd,
    LlmStart,
    LlmFirstToken,
    LlmFirstSentence,
    TtsStart,
    TtsEnd,
    FirstAudioResponse,
    Count
};

const char* checkpoint_name(Checkpoint checkpoint);

// Absolute timestamps in seconds; unset checkpoints stay empty until written
class LatencyCheckpoints {
public:
    void reset() { values_.fill(std::nullopt); }
    void record(Checkpoint checkpoint, double seconds) { values_[index(checkpoint)] = seconds; }
    std::optional<double> get(Checkpoint checkpoint) const { return values_[index(checkpoint)]; }
    bool has(Checkpoint checkpoint) const { return values_[index(checkpoint)].has_value(); }

private:
    static size_t index(Checkpoint checkpoint) { return static_cast<size_t>(checkpoint); }
    std::array<std::optional<double>, static_cast<size_t>(Checkpoint::Count)> values_;
};

// Interval metrics reported to the client. A field is absent when one of its
// checkpoints was never written or the interval would be negative.
struct LatencyMetrics {
    std::optional<double> total_voice_to_voice;
    std::optional<double> stt_duration;
    std::optional<double> llm_time_to_first_token;
    std::optional<double> llm_time_to_first_sentence;
    std::optional<double> tts_duration;
};

LatencyMetrics derive_latency_metrics(const LatencyCheckpoints& checkpoints);

// Wall clock seconds since the epoch, the unit of every checkpoint
double latency_now();

std::string format_latency_summary(const LatencyMetrics& metrics);
