#pragma once

#include <chrono>

namespace gbce {

using Clock     = std::chrono::system_clock;
using Duration  = std::chrono::milliseconds;
using Timestamp = std::chrono::time_point<Clock, Duration>;

class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

// Wall clock, truncated to millisecond resolution.
class SystemClock : public IClock {
public:
    Timestamp now() const override;
};

// Manually driven clock for tests and replays.
class SimulatedClock : public IClock {
public:
    SimulatedClock();
    explicit SimulatedClock(Timestamp start);

    Timestamp now() const override { return current_; }

    void set_time(Timestamp t) { current_ = t; }
    void advance(Duration delta) { current_ += delta; }

private:
    Timestamp current_;
};

} // namespace gbce
