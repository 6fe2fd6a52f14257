#pragma once

#include "session-store.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

// External services a turn depends on. Implementations report failure through
// the return value and the error out-parameter; they must be safe to call from
// several sessions at once.

class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual bool transcribe(const std::string& audio, std::string& text, std::string& error) = 0;
};

// One piece of a streamed completion. A fragment carries either text, a piece of a
// function-call directive, or both; directive pieces are concatenated in order.
struct CompletionChunk {
    std::string content;
    std::string function_name;
    std::string function_arguments;
};

struct CompletionRequest {
    std::vector<ChatMessage> messages;
    bool allow_function_calls = true;
    // Generation should stop (and report failure) once this passes
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
};

class CompletionService {
public:
    virtual ~CompletionService() = default;
    // Calls on_chunk for every fragment in generation order. Returning false from
    // on_chunk stops the stream early; that is not an error.
    virtual bool stream(const CompletionRequest& request,
                        const std::function<bool(const CompletionChunk&)>& on_chunk,
                        std::string& error) = 0;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual bool synthesize(const std::string& text, std::string& audio, std::string& error) = 0;
};

// The closed set of lookups a model may request
enum class LookupKind {
    FetchSummaryByCode,
    FetchRecordByCode
};

struct LookupQuery {
    LookupKind kind = LookupKind::FetchSummaryByCode;
    std::string code;
};

class RecordLookup {
public:
    virtual ~RecordLookup() = default;
    virtual bool lookup(const LookupQuery& query, std::string& result, std::string& error) = 0;
};
