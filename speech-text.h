#pragma once

#include <string>
#include <vector>

// Strips text a speech synthesizer should not read aloud: parenthetical asides,
// *emphasis* and _emphasis_ spans, runs of '~' (collapsed to '!') and every byte
// outside 7-bit ASCII, then trims surrounding whitespace. Total and idempotent.
std::string sanitize_for_speech(const std::string& fragment);

// True when text ends (ignoring trailing whitespace) in '.', '!' or '?'
bool ends_sentence(const std::string& text);

// Accumulates streamed completion fragments into whole sentences
class SentenceSegmenter {
public:
    // Appends a fragment; returns the completed sentence, if this fragment
    // completed one, trimmed of surrounding whitespace.
    std::vector<std::string> feed(const std::string& fragment);

    // Returns whatever is left (possibly unterminated) and resets
    std::string flush();

    bool empty() const { return buffer_.empty(); }
    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
};

std::string trim_whitespace(const std::string& text);
