#include "util/clock.hpp"

namespace gbce {

Timestamp SystemClock::now() const {
    return std::chrono::time_point_cast<Duration>(Clock::now());
}

// Starts at a fixed, readable instant so test output is stable.
SimulatedClock::SimulatedClock()
    : current_(std::chrono::time_point_cast<Duration>(
          Clock::from_time_t(1'500'000'000))) {}

SimulatedClock::SimulatedClock(Timestamp start)
    : current_(start) {}

} // namespace gbce
