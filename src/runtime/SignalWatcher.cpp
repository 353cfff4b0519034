#include "runtime/SignalWatcher.hpp"
#include <utility>

using namespace strikebox;

SignalWatcher::SignalWatcher(const std::atomic<bool>& flag, std::function<void()> on_signal,
                             std::chrono::milliseconds poll)
    : flag_(flag), on_signal_(std::move(on_signal)), poll_(poll) {
    thread_ = std::thread([this] { loop(); });
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::stop() {
    done_.store(true);
    if (thread_.joinable()) thread_.join();
}

void SignalWatcher::loop() {
    while (!done_.load()) {
        if (flag_.load()) {
            fired_.store(true);
            on_signal_();
            return;
        }
        std::this_thread::sleep_for(poll_);
    }
}
