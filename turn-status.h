#pragma once

#include <string>

// Why a turn stage did not complete
enum class TurnError {
    None,
    CollaboratorUnavailable,
    EmptyTranscription,
    MalformedControlMessage,
    MalformedFunctionDirective,
    LookupFailure,
    SessionNotFound,
    Interrupted
};

inline const char* turn_error_name(TurnError error) {
    switch (error) {
        case TurnError::None: return "none";
        case TurnError::CollaboratorUnavailable: return "collaborator_unavailable";
        case TurnError::EmptyTranscription: return "empty_transcription";
        case TurnError::MalformedControlMessage: return "malformed_control_message";
        case TurnError::MalformedFunctionDirective: return "malformed_function_directive";
        case TurnError::LookupFailure: return "lookup_failure";
        case TurnError::SessionNotFound: return "session_not_found";
        case TurnError::Interrupted: return "interrupted";
    }
    return "unknown";
}

struct TurnStatus {
    TurnError error = TurnError::None;
    std::string message;

    bool ok() const { return error == TurnError::None; }

    static TurnStatus success() { return TurnStatus(); }
    static TurnStatus failure(TurnError error, const std::string& message) {
        TurnStatus s;
        s.error = error;
        s.message = message;
        return s;
    }
};
