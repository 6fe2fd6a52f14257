#pragma once

#include "collaborators.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct SynthesisPipelineConfig {
    size_t max_in_flight = 4;                     // concurrent synthesis calls
    std::chrono::milliseconds timeout{15000};     // per sentence
    bool drop_after_cancel = false;               // discard audio already in flight on cancel
};

// Synthesizes sentences concurrently and hands the audio to `sink` strictly in the
// order the sentences were dispatched. A sentence whose synthesis fails or times
// out is skipped; later sentences are still delivered.
class SynthesisPipeline {
public:
    // Called on the delivery thread, once per delivered sentence, in order
    using AudioSink = std::function<void(const std::string& text, const std::string& audio)>;

    SynthesisPipeline(std::shared_ptr<SpeechSynthesizer> synthesizer,
                      const SynthesisPipelineConfig& config,
                      AudioSink sink,
                      const std::string& log_tag = "");
    ~SynthesisPipeline();

    SynthesisPipeline(const SynthesisPipeline&) = delete;
    SynthesisPipeline& operator=(const SynthesisPipeline&) = delete;

    // Queues one sentence. Blocks only while max_in_flight calls are running.
    // Returns false once the pipeline is cancelled or finished.
    bool dispatch(const std::string& text);

    // Stops accepting sentences and wakes a blocked dispatch
    void cancel();
    bool cancelled() const;

    // Waits until every dispatched sentence was delivered or skipped
    void finish();

    struct Stats {
        size_t dispatched = 0;
        size_t delivered = 0;
        size_t failed = 0;
        size_t timed_out = 0;
        size_t dropped = 0;
    };
    Stats stats() const;

private:
    struct Slot {
        std::string text;
        std::chrono::steady_clock::time_point deadline;
        bool done = false;
        bool expired = false;  // deadline passed; no longer counted in flight
        bool ok = false;
        std::string audio;
        std::string error;
    };

    // Shared with detached synthesis workers, which may outlive the pipeline
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::map<uint64_t, Slot> slots;
        uint64_t next_seq = 0;
        size_t in_flight = 0;
        bool cancelled = false;
        bool closed = false;
        Stats stats;
    };

    void run_delivery();

    std::shared_ptr<SpeechSynthesizer> synthesizer_;
    SynthesisPipelineConfig config_;
    AudioSink sink_;
    std::string log_tag_;
    std::shared_ptr<State> state_;
    std::thread delivery_thread_;
};
