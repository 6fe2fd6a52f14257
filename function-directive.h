#pragma once

#include "collaborators.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Name of the only function offered to the completion service
extern const char* const kPatientInfoFunction;

// Function-call directive accumulated from completion fragments
struct FunctionCall {
    std::string name;
    std::string arguments;  // JSON object text

    bool empty() const { return name.empty() && arguments.empty(); }
    void append(const CompletionChunk& chunk) {
        name += chunk.function_name;
        arguments += chunk.function_arguments;
    }
};

// JSON schema of the offered function, in the OpenAI "tools" layout
nlohmann::json lookup_function_schema();

// Validates a model-supplied directive and maps it onto a typed query.
// Never evaluates the model's text; anything outside the schema is rejected.
bool parse_lookup_query(const FunctionCall& call, LookupQuery& query, std::string& error);

bool is_valid_record_code(const std::string& code);

// Text the local model is told to emit when it wants the lookup
extern const char* const kFunctionCallOpen;
extern const char* const kFunctionCallClose;

// System-prompt addendum describing the offered function and the marker syntax
std::string function_call_instructions();

// Splits raw model output into speakable text and <function_call>{...}</function_call>
// directives. Text that might be the start of a marker is held back until it is
// known not to be one.
class DirectiveExtractor {
public:
    // Appends the chunks produced by `piece` to `out`
    void feed(const std::string& piece, std::vector<CompletionChunk>& out);
    // End of generation: releases held-back text. An unterminated directive is
    // emitted as-is so validation rejects it.
    void finish(std::vector<CompletionChunk>& out);

private:
    void emit_directive(const std::string& body, std::vector<CompletionChunk>& out);

    std::string pending_;
    bool inside_ = false;
};
