#include "latency-tracker.h"

#include <chrono>
#include <iomanip>
#include <sstream>

const char* checkpoint_name(Checkpoint checkpoint) {
    switch (checkpoint) {
        case Checkpoint::TurnStart: return "turn_start";
        case Checkpoint::SttStart: return "stt_start";
        case Checkpoint::SttEnd: return "stt_end";
        case Checkpoint::LlmStart: return "llm_start";
        case Checkpoint::LlmFirstToken: return "llm_first_token";
        case Checkpoint::LlmFirstSentence: return "llm_first_sentence";
        case Checkpoint::TtsStart: return "tts_start";
        case Checkpoint::TtsEnd: return "tts_end";
        case Checkpoint::FirstAudioResponse: return "first_audio_response";
        case Checkpoint::Count: break;
    }
    return "unknown";
}

static std::optional<double> interval(const LatencyCheckpoints& checkpoints, Checkpoint from, Checkpoint to) {
    std::optional<double> start = checkpoints.get(from);
    std::optional<double> end = checkpoints.get(to);
    if (!start || !end) {
        return std::nullopt;
    }
    double d = *end - *start;
    if (d < 0.0) {
        return std::nullopt;
    }
    return d;
}

LatencyMetrics derive_latency_metrics(const LatencyCheckpoints& checkpoints) {
    LatencyMetrics m;
    m.total_voice_to_voice = interval(checkpoints, Checkpoint::TurnStart, Checkpoint::FirstAudioResponse);
    m.stt_duration = interval(checkpoints, Checkpoint::SttStart, Checkpoint::SttEnd);
    m.llm_time_to_first_token = interval(checkpoints, Checkpoint::LlmStart, Checkpoint::LlmFirstToken);
    m.llm_time_to_first_sentence = interval(checkpoints, Checkpoint::LlmStart, Checkpoint::LlmFirstSentence);
    m.tts_duration = interval(checkpoints, Checkpoint::TtsStart, Checkpoint::TtsEnd);
    return m;
}

double latency_now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

std::string format_latency_summary(const LatencyMetrics& metrics) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(0);
    auto field = [&out](const char* label, const std::optional<double>& v) {
        out << label << "=";
        if (v) {
            out << (*v * 1000.0) << "ms";
        } else {
            out << "n/a";
        }
    };
    field("v2v", metrics.total_voice_to_voice);
    out << " ";
    field("stt", metrics.stt_duration);
    out << " ";
    field("ttft", metrics.llm_time_to_first_token);
    out << " ";
    field("ttfs", metrics.llm_time_to_first_sentence);
    out << " ";
    field("tts", metrics.tts_duration);
    return out.str();
}
