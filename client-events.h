#pragma once

#include "latency-tracker.h"

#include <nlohmann/json.hpp>
#include <string>

// Outbound half of the duplex connection. Sends may come from several threads;
// implementations serialize them. A false return means the peer is gone.
class ClientChannel {
public:
    virtual ~ClientChannel() = default;
    virtual bool send_text(const std::string& message) = 0;
    virtual bool send_binary(const std::string& payload) = 0;
};

enum class ControlAction {
    Ping,
    StopRecording,
    Unknown,
    Malformed
};

struct ControlMessage {
    ControlAction action = ControlAction::Malformed;
    std::string detail;  // parse error or the unrecognized type/action
};

// {"type":"ping"} and {"action":"stop_recording"}; anything else is Unknown,
// and text that is not a JSON object is Malformed.
ControlMessage parse_control_message(const std::string& text);

// Outbound event documents
std::string make_event(const char* type);
std::string make_content_event(const char* type, const std::string& content);
std::string make_error_event(const std::string& message);
std::string make_latency_event(const LatencyMetrics& metrics);

nlohmann::json latency_metrics_json(const LatencyMetrics& metrics);
