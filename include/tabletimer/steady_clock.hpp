#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace tabletimer {

struct SteadyClock {
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = Clock::duration;

  // Source of "now" for anything driven by the event loop. Tests swap in a
  // hand-advanced clock.
  using NowFunction = std::function<TimePoint()>;

  static TimePoint now() { return Clock::now(); }

  static TimePoint addMilliseconds(const TimePoint &tp, uint64_t ms) {
    return tp + std::chrono::milliseconds(ms);
  }

  static int64_t durationMs(const TimePoint &from, const TimePoint &to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
        .count();
  }
};

} // namespace tabletimer
