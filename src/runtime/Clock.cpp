#include "runtime/Clock.hpp"
#include <boost/asio/post.hpp>

using namespace strikebox;

AsioClock::AsioClock()
    : sleep_timer_(ioc_), wait_timer_(ioc_) {}

Clock::time_point AsioClock::now() const {
    return std::chrono::steady_clock::now();
}

bool AsioClock::run_timer(boost::asio::steady_timer& timer, std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lock(run_mtx_);

    bool expired = true;
    timer.expires_after(d);
    timer.async_wait([&expired](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) expired = false;
    });

    // run() returns once the timer handler (and any posted cancel) has run.
    ioc_.restart();
    ioc_.run();
    return expired;
}

void AsioClock::sleep_for(std::chrono::milliseconds d) {
    if (d.count() <= 0) return;
    run_timer(sleep_timer_, d);
}

bool AsioClock::wait_for(std::chrono::milliseconds d) {
    if (cancelled_.load()) return false;
    if (d.count() <= 0) return true;
    bool expired = run_timer(wait_timer_, d);
    return expired && !cancelled_.load();
}

void AsioClock::cancel() {
    cancelled_.store(true);
    // Only the cancellable timer is touched. A cancel landing while no wait
    // is running is picked up by the cancelled_ check on the next wait_for().
    boost::asio::post(ioc_, [this] { wait_timer_.cancel(); });
}

bool AsioClock::cancelled() const {
    return cancelled_.load();
}
