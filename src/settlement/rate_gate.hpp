#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <stdexcept>
#include <thread>
#include <utility>

// ---------------------------------------------------------------------------
// RateGate — admits at most `max_events` per `period`, blocking the caller
// ---------------------------------------------------------------------------
class RateGate {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using SleepFn = std::function<void(Clock::duration)>;

    RateGate(int max_events, Clock::duration period)
        : RateGate(max_events, period,
                   [] { return Clock::now(); },
                   [](Clock::duration d) { std::this_thread::sleep_for(d); }) {}

    RateGate(int max_events, Clock::duration period, NowFn now, SleepFn sleep)
        : max_events_(max_events),
          period_(period),
          now_(std::move(now)),
          sleep_(std::move(sleep)) {
        if (max_events_ <= 0) {
            throw std::invalid_argument("RateGate requires max_events > 0");
        }
    }

    void wait_to_proceed() {
        auto now = now_();
        while (!admitted_.empty() && now - admitted_.front() >= period_) {
            admitted_.pop_front();
        }
        if (static_cast<int>(admitted_.size()) >= max_events_) {
            auto wait = admitted_.front() + period_ - now;
            sleep_(wait);
            admitted_.pop_front();
            now = now_();
        }
        admitted_.push_back(now);
        ++total_waits_;
    }

    int total_waits() const { return total_waits_; }

private:
    int max_events_;
    Clock::duration period_;
    NowFn now_;
    SleepFn sleep_;
    std::deque<Clock::time_point> admitted_;
    int total_waits_ = 0;
};
