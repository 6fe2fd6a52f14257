#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Runs a blocking collaborator call on its own thread and waits at most `timeout`
// for it. On timeout the call is abandoned: it keeps running detached and its
// result is dropped when it eventually returns. `call` must own (or share) every
// resource it touches.
template <typename Result>
bool call_with_timeout(std::function<bool(Result&, std::string&)> call,
                       std::chrono::milliseconds timeout,
                       Result& result,
                       std::string& error) {
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool ok = false;
        Result value{};
        std::string error;
    };
    auto shared = std::make_shared<Shared>();

    std::thread([shared, call]() {
        Result value{};
        std::string err;
        bool ok = false;
        try {
            ok = call(value, err);
        } catch (const std::exception& e) {
            err = e.what();
            ok = false;
        }
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->done = true;
        shared->ok = ok;
        shared->value = std::move(value);
        shared->error = std::move(err);
        shared->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(shared->mutex);
    if (!shared->cv.wait_for(lock, timeout, [&shared] { return shared->done; })) {
        error = "timed out after " + std::to_string(timeout.count()) + " ms";
        return false;
    }
    if (!shared->ok) {
        error = shared->error.empty() ? "call failed" : shared->error;
        return false;
    }
    result = std::move(shared->value);
    return true;
}
