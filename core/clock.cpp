#include "scaletuner/clock.hpp"
#include "scaletuner/errors.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace scaletuner {

const char* to_string(ClockState state) {
    switch (state) {
        case ClockState::Ready: return "ready";
        case ClockState::Running: return "running";
        case ClockState::Stopped: return "stopped";
    }
    return "unknown";
}

Clock::Clock(bool start, TimeSource source) : source_(std::move(source)) {
    if (!source_) source_ = steady_seconds;
    reset(start);
}

double Clock::steady_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

void Clock::reset(bool start_now) {
    state_ = ClockState::Ready;
    t_start_ = 0.0;
    t_stop_ = 0.0;
    if (start_now) start();
}

double Clock::start() {
    if (state_ != ClockState::Ready) {
        throw StateError(std::string("cannot start clock in state: ") + to_string(state_));
    }
    t_start_ = source_();
    state_ = ClockState::Running;
    return 0.0;
}

double Clock::stop() {
    if (state_ != ClockState::Running) {
        throw StateError(std::string("cannot stop clock in state: ") + to_string(state_));
    }
    t_stop_ = source_();
    state_ = ClockState::Stopped;
    return t_stop_ - t_start_;
}

double Clock::elapsed() const {
    if (state_ != ClockState::Running) {
        throw StateError(std::string("cannot get time for clock in state: ") + to_string(state_));
    }
    return source_() - t_start_;
}

} // namespace scaletuner
