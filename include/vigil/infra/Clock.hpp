#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>

namespace vigil::infra {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;
using MonoDur   = MonoClock::duration;

// Seconds as double. Used for every timestamp that leaves the process
// (checkpoints, snapshots, exported traces).
using Seconds = std::chrono::duration<double>;

// Upper bound for configurable intervals and windows, in seconds.
inline constexpr double kMaxIntervalSeconds = 86400.0;

// Finite, positive and no longer than kMaxIntervalSeconds. Anything else
// cannot be converted to a MonoDur safely.
inline bool is_valid_interval(double seconds) noexcept {
    return std::isfinite(seconds) && seconds > 0.0 && seconds <= kMaxIntervalSeconds;
}

// Wall-clock seconds since the Unix epoch that never go backwards.
// The system clock is read once per process; everything after that is
// steady-clock elapsed time added to the anchor.
double wall_seconds() noexcept;

// Injectable time source. Components default to wall_seconds; tests pass a
// ManualClock.
using ClockFn = std::function<double()>;

inline ClockFn default_clock() {
    return &wall_seconds;
}

// Test/replay clock. A single thread drives it; any thread may read it.
class ManualClock {
public:
    explicit ManualClock(double start = 0.0) : t_(start) {}

    void set(double t) { t_.store(t); }
    void advance(double dt) { t_.store(t_.load() + dt); }
    double now() const { return t_.load(); }

    ClockFn fn() {
        return [this]() { return now(); };
    }

private:
    std::atomic<double> t_;
};

} // namespace vigil::infra
