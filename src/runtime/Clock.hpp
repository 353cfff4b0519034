#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace strikebox {

// ---------------------------------------------------------------------------
// Time source + timed waits for the strike loop.
//
// Two kinds of wait:
//   sleep_for()  fixed pause. Used for order polling and retry backoff.
//                Always runs to its deadline.
//   wait_for()   cancellable pause. Used for the position hold and the
//                inter-iteration cooldown. cancel() from any thread cuts the
//                current wait short and makes every later wait_for() return
//                immediately. Returns false when the wait was cut short.
//
// Tests inject a fake that advances virtual time instead of sleeping.
// ---------------------------------------------------------------------------
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
    virtual bool wait_for(std::chrono::milliseconds d) = 0;
    virtual void cancel() = 0;
    virtual bool cancelled() const = 0;
};

// Boost.Asio implementation. One io_context, driven by the calling thread for
// the duration of each wait. cancel() posts onto the context so the timer is
// only ever touched from the thread running it.
class AsioClock : public Clock {
public:
    AsioClock();

    time_point now() const override;
    void sleep_for(std::chrono::milliseconds d) override;
    bool wait_for(std::chrono::milliseconds d) override;
    void cancel() override;
    bool cancelled() const override;

private:
    bool run_timer(boost::asio::steady_timer& timer, std::chrono::milliseconds d);

    boost::asio::io_context   ioc_;
    boost::asio::steady_timer sleep_timer_;
    boost::asio::steady_timer wait_timer_;
    std::atomic<bool>         cancelled_{false};
    std::mutex                run_mtx_;
};

} // namespace strikebox
