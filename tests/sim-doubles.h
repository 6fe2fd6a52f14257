#pragma once

// In-process stand-ins for the external services, shared by the simulations

#include "client-events.h"
#include "collaborators.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int g_failures = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  ✅ " << what << "\n";
    } else {
        std::cout << "  ❌ " << what << "\n";
        g_failures++;
    }
}

static int finish_sim(const char* name) {
    if (g_failures == 0) {
        std::cout << "=== " << name << ": all checks passed ===\n";
        return 0;
    }
    std::cout << "=== " << name << ": " << g_failures << " check(s) failed ===\n";
    return 1;
}

struct ScriptedTranscriber : Transcriber {
    std::string text = "What is the summary for patient P-1?";
    bool fail = false;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};

    bool transcribe(const std::string&, std::string& out, std::string& error) override {
        calls++;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail) {
            error = "connection refused";
            return false;
        }
        out = text;
        return true;
    }
};

// Replays a fixed list of chunks per call, with a pause before each chunk
struct ScriptedCompletion : CompletionService {
    std::vector<std::vector<CompletionChunk>> scripts;  // one per stream() call
    std::chrono::milliseconds chunk_delay{0};
    bool fail_before_first = false;
    std::mutex mutex;
    std::vector<CompletionRequest> requests;

    static CompletionChunk text(const std::string& s) {
        CompletionChunk c;
        c.content = s;
        return c;
    }
    static CompletionChunk call(const std::string& name, const std::string& args) {
        CompletionChunk c;
        c.function_name = name;
        c.function_arguments = args;
        return c;
    }

    bool stream(const CompletionRequest& request,
                const std::function<bool(const CompletionChunk&)>& on_chunk,
                std::string& error) override {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(mutex);
            index = requests.size();
            requests.push_back(request);
        }
        if (fail_before_first) {
            error = "model server unreachable";
            return false;
        }
        if (index >= scripts.size()) {
            return true;
        }
        for (const CompletionChunk& chunk : scripts[index]) {
            if (chunk_delay.count() > 0) std::this_thread::sleep_for(chunk_delay);
            if (!on_chunk(chunk)) return true;
        }
        return true;
    }

    size_t request_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }
};

// Audio is "AUDIO:<text>". Per-text delays and failures; optionally blocks every
// call until release() so tests can hold synthesis in flight.
struct ControlledSynthesizer : SpeechSynthesizer {
    std::map<std::string, int> delay_ms;
    std::map<std::string, bool> fail;
    bool gated = false;

    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
    std::vector<std::string> started;

    bool synthesize(const std::string& text, std::string& audio, std::string& error) override {
        int delay = 0;
        bool should_fail = false;
        {
            std::unique_lock<std::mutex> lock(mutex);
            started.push_back(text);
            cv.notify_all();
            if (gated) {
                cv.wait(lock, [this] { return released; });
            }
            auto d = delay_ms.find(text);
            if (d != delay_ms.end()) delay = d->second;
            auto f = fail.find(text);
            should_fail = f != fail.end() && f->second;
        }
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        if (should_fail) {
            error = "voice backend error";
            return false;
        }
        audio = "AUDIO:" + text;
        return true;
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }

    bool wait_started(size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return started.size() >= n; });
    }

    size_t started_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return started.size();
    }
};

struct ScriptedLookup : RecordLookup {
    std::map<std::string, std::string> records;
    std::mutex mutex;
    std::vector<LookupQuery> queries;

    bool lookup(const LookupQuery& query, std::string& result, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        queries.push_back(query);
        auto it = records.find(query.code);
        if (it == records.end()) {
            error = "no record for " + query.code;
            return false;
        }
        result = it->second;
        return true;
    }
};

// Records everything sent to the client, in order
struct RecordingChannel : ClientChannel {
    struct Sent {
        bool binary;
        std::string data;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Sent> sent;

    bool send_text(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        sent.push_back({false, message});
        cv.notify_all();
        return true;
    }

    bool send_binary(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex);
        sent.push_back({true, payload});
        cv.notify_all();
        return true;
    }

    std::vector<Sent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent;
    }

    // Event types in order; binary frames show up as "<audio>"
    std::vector<std::string> types() {
        std::vector<std::string> out;
        for (const Sent& s : snapshot()) {
            if (s.binary) {
                out.push_back("<audio>");
                continue;
            }
            nlohmann::json doc = nlohmann::json::parse(s.data, nullptr, false);
            out.push_back(doc.is_object() && doc.contains("type") ? doc["type"].get<std::string>() : "?");
        }
        return out;
    }

    std::vector<nlohmann::json> events_of(const std::string& type) {
        std::vector<nlohmann::json> out;
        for (const Sent& s : snapshot()) {
            if (s.binary) continue;
            nlohmann::json doc = nlohmann::json::parse(s.data, nullptr, false);
            if (doc.is_object() && doc.value("type", "") == type) out.push_back(doc);
        }
        return out;
    }

    std::vector<std::string> audio() {
        std::vector<std::string> out;
        for (const Sent& s : snapshot()) {
            if (s.binary) out.push_back(s.data);
        }
        return out;
    }

    size_t count(const std::string& type) { return events_of(type).size(); }

    bool wait_for_count(const std::string& type, size_t n, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (count(type) >= n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return count(type) >= n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        sent.clear();
    }
};
