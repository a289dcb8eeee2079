#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace code_intelligence {

template <typename T>
struct TimedOutcome {
    std::optional<T> value;
    bool timed_out = false;
    std::string error; // set when the task threw
};

// Runs `task` on its own thread and waits at most `timeout`. A task that
// overruns is detached and keeps running; anything it captures must own its
// state (shared_ptr or copies).
template <typename T, typename Fn>
TimedOutcome<T> run_with_timeout(Fn task, std::chrono::milliseconds timeout) {
    TimedOutcome<T> outcome;
    auto promise = std::make_shared<std::promise<T>>();
    auto fut = promise->get_future();

    std::thread worker;
    try {
        worker = std::thread([task = std::move(task), promise]() mutable {
            try {
                promise->set_value(task());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    } catch (const std::system_error& e) {
        outcome.error = std::string("worker thread start failed: ") + e.what();
        return outcome;
    }

    if (fut.wait_for(timeout) != std::future_status::ready) {
        worker.detach();
        outcome.timed_out = true;
        return outcome;
    }

    worker.join();
    try {
        outcome.value = fut.get();
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    return outcome;
}

} // namespace code_intelligence
