#include "client-events.h"

ControlMessage parse_control_message(const std::string& text) {
    ControlMessage msg;
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions*/ false);
    if (doc.is_discarded()) {
        msg.action = ControlAction::Malformed;
        msg.detail = "not valid JSON";
        return msg;
    }
    if (!doc.is_object()) {
        msg.action = ControlAction::Malformed;
        msg.detail = "not a JSON object";
        return msg;
    }

    auto type = doc.find("type");
    if (type != doc.end() && type->is_string() && type->get<std::string>() == "ping") {
        msg.action = ControlAction::Ping;
        return msg;
    }

    auto action = doc.find("action");
    if (action != doc.end() && action->is_string() && action->get<std::string>() == "stop_recording") {
        msg.action = ControlAction::StopRecording;
        return msg;
    }

    msg.action = ControlAction::Unknown;
    if (action != doc.end()) {
        msg.detail = "action=" + action->dump();
    } else if (type != doc.end()) {
        msg.detail = "type=" + type->dump();
    } else {
        msg.detail = doc.dump();
    }
    return msg;
}

std::string make_event(const char* type) {
    nlohmann::json j;
    j["type"] = type;
    return j.dump();
}

std::string make_content_event(const char* type, const std::string& content) {
    nlohmann::json j;
    j["type"] = type;
    j["content"] = content;
    // Model output may carry invalid UTF-8 split across tokens
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string make_error_event(const std::string& message) {
    nlohmann::json j;
    j["type"] = "error";
    j["message"] = message;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json latency_metrics_json(const LatencyMetrics& metrics) {
    nlohmann::json m = nlohmann::json::object();
    if (metrics.total_voice_to_voice) m["total_voice_to_voice"] = *metrics.total_voice_to_voice;
    if (metrics.stt_duration) m["srt_duration"] = *metrics.stt_duration;
    if (metrics.llm_time_to_first_token) m["llm_ttft"] = *metrics.llm_time_to_first_token;
    if (metrics.llm_time_to_first_sentence) m["llm_ttfs"] = *metrics.llm_time_to_first_sentence;
    if (metrics.tts_duration) m["tts_duration"] = *metrics.tts_duration;
    return m;
}

std::string make_latency_event(const LatencyMetrics& metrics) {
    nlohmann::json j;
    j["type"] = "latency_metrics";
    j["metrics"] = latency_metrics_json(metrics);
    return j.dump();
}
