#pragma once

#include <functional>

namespace scaletuner {

enum class ClockState { Ready, Running, Stopped };

const char* to_string(ClockState state);

// Elapsed-time source for block timestamps. A clock is started once and read
// while running; using it out of that sequence throws StateError so driver
// bugs show up instead of stale timestamps.
class Clock {
public:
    // Returns seconds from an arbitrary monotonic origin.
    using TimeSource = std::function<double()>;

    explicit Clock(bool start = false, TimeSource source = steady_seconds);

    ClockState state() const { return state_; }
    bool ready() const { return state_ == ClockState::Ready; }
    bool running() const { return state_ == ClockState::Running; }
    bool stopped() const { return state_ == ClockState::Stopped; }

    // Back to Ready, optionally starting right away.
    void reset(bool start = false);

    double start();
    // Returns the total running time in seconds.
    double stop();
    // Seconds since start().
    double elapsed() const;
    double operator()() const { return elapsed(); }

    static double steady_seconds();

private:
    TimeSource source_;
    ClockState state_ = ClockState::Ready;
    double t_start_ = 0.0;
    double t_stop_ = 0.0;
};

} // namespace scaletuner
