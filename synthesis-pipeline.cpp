#include "synthesis-pipeline.h"

#include <exception>
#include <iostream>

SynthesisPipeline::SynthesisPipeline(std::shared_ptr<SpeechSynthesizer> synthesizer,
                                     const SynthesisPipelineConfig& config,
                                     AudioSink sink,
                                     const std::string& log_tag)
    : synthesizer_(std::move(synthesizer)), config_(config), sink_(std::move(sink)),
      log_tag_(log_tag), state_(std::make_shared<State>()) {
    if (config_.max_in_flight == 0) {
        config_.max_in_flight = 1;
    }
    delivery_thread_ = std::thread(&SynthesisPipeline::run_delivery, this);
}

SynthesisPipeline::~SynthesisPipeline() {
    finish();
}

bool SynthesisPipeline::dispatch(const std::string& text) {
    std::shared_ptr<State> st = state_;
    uint64_t seq;
    {
        std::unique_lock<std::mutex> lock(st->mutex);
        st->cv.wait(lock, [&] {
            return st->cancelled || st->closed || st->in_flight < config_.max_in_flight;
        });
        if (st->cancelled || st->closed) {
            return false;
        }
        seq = st->next_seq++;
        Slot slot;
        slot.text = text;
        slot.deadline = std::chrono::steady_clock::now() + config_.timeout;
        st->slots.emplace(seq, std::move(slot));
        st->in_flight++;
        st->stats.dispatched++;
        // Delivery may be parked without a deadline to wait for
        st->cv.notify_all();
    }

    std::shared_ptr<SpeechSynthesizer> synth = synthesizer_;
    std::thread([st, synth, seq, text]() {
        std::string audio;
        std::string error;
        bool ok = false;
        try {
            ok = synth->synthesize(text, audio, error);
        } catch (const std::exception& e) {
            error = e.what();
            ok = false;
        }
        if (ok && audio.empty()) {
            ok = false;
            error = "synthesizer returned no audio";
        }

        std::lock_guard<std::mutex> lock(st->mutex);
        auto it = st->slots.find(seq);
        if (it == st->slots.end() || it->second.expired) {
            // Timed out; delivery already released the concurrency slot
            return;
        }
        it->second.done = true;
        it->second.ok = ok;
        it->second.audio = std::move(audio);
        it->second.error = std::move(error);
        st->in_flight--;
        st->cv.notify_all();
    }).detach();

    return true;
}

void SynthesisPipeline::cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
    state_->cv.notify_all();
}

bool SynthesisPipeline::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void SynthesisPipeline::finish() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        state_->cv.notify_all();
    }
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
}

SynthesisPipeline::Stats SynthesisPipeline::stats() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->stats;
}

void SynthesisPipeline::run_delivery() {
    std::shared_ptr<State> st = state_;
    uint64_t next = 0;

    std::unique_lock<std::mutex> lock(st->mutex);
    for (;;) {
        // Expire every overdue call and release its concurrency slot
        auto now = std::chrono::steady_clock::now();
        auto wake = std::chrono::steady_clock::time_point::max();
        for (auto& entry : st->slots) {
            Slot& pending = entry.second;
            if (pending.done || pending.expired) continue;
            if (now >= pending.deadline) {
                std::cout << "⏱️ " << log_tag_ << " Synthesis timed out, skipping: \"" << pending.text << "\"" << std::endl;
                pending.expired = true;
                st->stats.timed_out++;
                st->in_flight--;
                st->cv.notify_all();
            } else if (pending.deadline < wake) {
                wake = pending.deadline;
            }
        }

        auto it = st->slots.find(next);
        if (it == st->slots.end()) {
            if (st->closed && next >= st->next_seq) {
                break;
            }
        } else if (it->second.expired) {
            st->slots.erase(it);
            next++;
            continue;
        } else if (it->second.done) {
            Slot ready = std::move(it->second);
            st->slots.erase(it);
            next++;

            if (!ready.ok) {
                std::cout << "⚠️ " << log_tag_ << " Synthesis failed, skipping audio for \"" << ready.text
                          << "\": " << ready.error << std::endl;
                st->stats.failed++;
                continue;
            }
            if (st->cancelled && config_.drop_after_cancel) {
                st->stats.dropped++;
                continue;
            }

            st->stats.delivered++;
            lock.unlock();
            sink_(ready.text, ready.audio);
            lock.lock();
            continue;
        }

        if (wake == std::chrono::steady_clock::time_point::max()) {
            st->cv.wait(lock);
        } else {
            st->cv.wait_until(lock, wake);
        }
    }
}
