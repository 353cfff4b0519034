#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace strikebox {

// ---------------------------------------------------------------------------
// Polls a flag that a signal handler sets and runs on_signal once, on its own
// thread, the first time the flag is seen. The destructor stops and joins the
// thread, so unwinding past a watcher never leaves it joinable.
// ---------------------------------------------------------------------------
class SignalWatcher {
public:
    SignalWatcher(const std::atomic<bool>& flag, std::function<void()> on_signal,
                  std::chrono::milliseconds poll = std::chrono::milliseconds(200));
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void stop();
    bool fired() const { return fired_.load(); }

private:
    void loop();

    const std::atomic<bool>&  flag_;
    std::function<void()>     on_signal_;
    std::chrono::milliseconds poll_;
    std::atomic<bool>         done_{false};
    std::atomic<bool>         fired_{false};
    std::thread               thread_;
};

} // namespace strikebox
