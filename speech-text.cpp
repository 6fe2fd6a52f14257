#include "speech-text.h"

std::string trim_whitespace(const std::string& text) {
    static const char* ws = " \t\r\n\f\v";
    size_t b = text.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = text.find_last_not_of(ws);
    return text.substr(b, e - b + 1);
}

static std::string strip_non_ascii(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (static_cast<unsigned char>(c) < 0x80) {
            out.push_back(c);
        }
    }
    return out;
}

static std::string collapse_tildes(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '~') {
            while (i + 1 < text.size() && text[i + 1] == '~') ++i;
            out.push_back('!');
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

// Removes "( ... )" spans that close on the same line
static std::string strip_parentheticals(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '(') {
            size_t j = text.find_first_of(")\n\r", i + 1);
            if (j == std::string::npos) {
                // Nothing closes on this line or after it
                out.append(text, i, std::string::npos);
                break;
            }
            if (text[j] == ')') {
                i = j + 1;
                continue;
            }
            // Unclosed on this line; nothing before the line break can close either
            out.append(text, i, j - i);
            i = j;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

// Removes *...* and _..._ spans with at least one character between the markers
static std::string strip_emphasis(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if ((c == '*' || c == '_') && i + 1 < text.size() && text[i + 1] != c) {
            size_t j = text.find(c, i + 1);
            if (j != std::string::npos) {
                i = j + 1;
                continue;
            }
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

static std::string sanitize_pass(const std::string& text) {
    std::string s = collapse_tildes(text);
    s = strip_parentheticals(s);
    s = strip_emphasis(s);
    s = strip_non_ascii(s);
    return trim_whitespace(s);
}

std::string sanitize_for_speech(const std::string& fragment) {
    // A removal can expose a new match (e.g. "(*\n*)" becomes "()"), so repeat
    // until nothing changes. Every pass either shrinks the text or is the last.
    std::string current = sanitize_pass(fragment);
    for (;;) {
        std::string next = sanitize_pass(current);
        if (next == current) {
            return current;
        }
        current.swap(next);
    }
}

bool ends_sentence(const std::string& text) {
    size_t e = text.find_last_not_of(" \t\r\n\f\v");
    if (e == std::string::npos) return false;
    char c = text[e];
    return c == '.' || c == '!' || c == '?';
}

std::vector<std::string> SentenceSegmenter::feed(const std::string& fragment) {
    std::vector<std::string> sentences;
    buffer_ += fragment;
    if (ends_sentence(buffer_)) {
        std::string sentence = trim_whitespace(buffer_);
        buffer_.clear();
        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
    }
    return sentences;
}

std::string SentenceSegmenter::flush() {
    std::string rest = trim_whitespace(buffer_);
    buffer_.clear();
    return rest;
}
