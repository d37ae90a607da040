#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <executor/cancel_token.hpp>

// Turns SIGINT into a cancellation of `token` for the lifetime of the object.
// The signal handler only sets a flag; a watcher thread does the rest.
// A second SIGINT exits immediately with status 130.
class InterruptWatcher {
public:
    using Callback = std::function<void()>;

    InterruptWatcher(CancelToken token, Callback on_interrupt);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    CancelToken token_;
    Callback on_interrupt_;
    std::thread thread_;
    std::atomic<bool> stop_{false};

    void watch_loop();
};
