#include "function-directive.h"
#include "speech-text.h"

#include <algorithm>
#include <cctype>

const char* const kPatientInfoFunction = "get_patient_info";

nlohmann::json lookup_function_schema() {
    return {
        {"type", "function"},
        {"function", {
            {"name", kPatientInfoFunction},
            {"description", "Get patient details from the transcripts table by patient code. "
                            "Use detail \"summary\" for most questions and \"full\" only when the "
                            "whole transcript is needed."},
            {"parameters", {
                {"type", "object"},
                {"properties", {
                    {"patient_code", {
                        {"type", "string"},
                        {"description", "The patient code, e.g. P-1042"}
                    }},
                    {"detail", {
                        {"type", "string"},
                        {"enum", nlohmann::json::array({"summary", "full"})}
                    }}
                }},
                {"required", nlohmann::json::array({"patient_code"})},
                {"additionalProperties", false}
            }}
        }}
    };
}

bool is_valid_record_code(const std::string& code) {
    if (code.empty() || code.size() > 64) return false;
    for (char c : code) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '-' && c != '_') return false;
    }
    return true;
}

bool parse_lookup_query(const FunctionCall& call, LookupQuery& query, std::string& error) {
    if (call.name != kPatientInfoFunction) {
        error = "unknown function '" + call.name + "'";
        return false;
    }

    nlohmann::json args = nlohmann::json::parse(call.arguments, nullptr, /*allow_exceptions*/ false);
    if (args.is_discarded() || !args.is_object()) {
        error = "function arguments are not a JSON object";
        return false;
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (it.key() != "patient_code" && it.key() != "detail") {
            error = "unexpected argument '" + it.key() + "'";
            return false;
        }
    }

    auto code = args.find("patient_code");
    if (code == args.end() || !code->is_string()) {
        error = "patient_code must be a string";
        return false;
    }
    std::string value = code->get<std::string>();
    if (!is_valid_record_code(value)) {
        error = "invalid patient_code '" + value + "'";
        return false;
    }

    LookupKind kind = LookupKind::FetchSummaryByCode;
    auto detail = args.find("detail");
    if (detail != args.end()) {
        if (!detail->is_string()) {
            error = "detail must be a string";
            return false;
        }
        std::string d = detail->get<std::string>();
        if (d == "full") {
            kind = LookupKind::FetchRecordByCode;
        } else if (d != "summary") {
            error = "detail must be \"summary\" or \"full\"";
            return false;
        }
    }

    query.kind = kind;
    query.code = value;
    return true;
}

const char* const kFunctionCallOpen = "<function_call>";
const char* const kFunctionCallClose = "</function_call>";

std::string function_call_instructions() {
    std::string out;
    out += "You have access to the following function:\n";
    out += lookup_function_schema().dump(2);
    out += "\nWhen you need patient details, reply with only ";
    out += kFunctionCallOpen;
    out += "{\"name\": \"";
    out += kPatientInfoFunction;
    out += "\", \"arguments\": {\"patient_code\": \"<code>\", \"detail\": \"summary\"}}";
    out += kFunctionCallClose;
    out += " and nothing else. The result will be given to you in the next message.";
    return out;
}

// Length of the longest suffix of `s` that is a proper prefix of `marker`
static size_t partial_marker_suffix(const std::string& s, const std::string& marker) {
    size_t max_len = std::min(s.size(), marker.size() - 1);
    for (size_t len = max_len; len > 0; --len) {
        if (s.compare(s.size() - len, len, marker, 0, len) == 0) {
            return len;
        }
    }
    return 0;
}

void DirectiveExtractor::emit_directive(const std::string& body, std::vector<CompletionChunk>& out) {
    CompletionChunk chunk;
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("name") && doc["name"].is_string()) {
        chunk.function_name = doc["name"].get<std::string>();
        auto args = doc.find("arguments");
        if (args == doc.end()) {
            chunk.function_arguments = "{}";
        } else if (args->is_string()) {
            // Some models double-encode the arguments object
            chunk.function_arguments = args->get<std::string>();
        } else {
            chunk.function_arguments = args->dump();
        }
    } else {
        // Keep the raw text so parse_lookup_query reports it
        chunk.function_name = "<malformed>";
        chunk.function_arguments = body;
    }
    out.push_back(std::move(chunk));
}

void DirectiveExtractor::feed(const std::string& piece, std::vector<CompletionChunk>& out) {
    pending_ += piece;
    const std::string open = kFunctionCallOpen;
    const std::string close = kFunctionCallClose;

    for (;;) {
        if (!inside_) {
            size_t at = pending_.find(open);
            if (at == std::string::npos) {
                size_t hold = partial_marker_suffix(pending_, open);
                if (pending_.size() > hold) {
                    CompletionChunk text;
                    text.content = pending_.substr(0, pending_.size() - hold);
                    out.push_back(std::move(text));
                    pending_.erase(0, pending_.size() - hold);
                }
                return;
            }
            if (at > 0) {
                CompletionChunk text;
                text.content = pending_.substr(0, at);
                out.push_back(std::move(text));
            }
            pending_.erase(0, at + open.size());
            inside_ = true;
        } else {
            size_t at = pending_.find(close);
            if (at == std::string::npos) {
                return;
            }
            emit_directive(trim_whitespace(pending_.substr(0, at)), out);
            pending_.erase(0, at + close.size());
            inside_ = false;
        }
    }
}

void DirectiveExtractor::finish(std::vector<CompletionChunk>& out) {
    if (pending_.empty()) {
        inside_ = false;
        return;
    }
    if (inside_) {
        emit_directive(trim_whitespace(pending_), out);
    } else {
        CompletionChunk text;
        text.content = pending_;
        out.push_back(std::move(text));
    }
    pending_.clear();
    inside_ = false;
}
