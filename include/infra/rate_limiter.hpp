#pragma once

#include <chrono>

/*
    RateLimiter gates an expensive call (the detector) to a fixed rate from inside a loop that runs faster.

    There is no timer thread. The loop asks try_acquire(now) every iteration; the call is granted when now has reached
    the next eligible time, which then moves one period past now. A loop that stalls does not build up a burst of
    pending grants, it simply gets the next one as soon as it checks again.
*/

namespace dac {

class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  // rate_hz <= 0 disables the limiter (never grants)
  explicit RateLimiter(double rate_hz);

  bool try_acquire(Clock::time_point now);

  // Next call to try_acquire is granted immediately
  void reset();

  bool enabled() const { return enabled_; }
  Clock::duration period() const { return period_; }
  Clock::time_point next_eligible() const { return next_eligible_; }

private:
  bool enabled_{false};
  Clock::duration period_{};
  Clock::time_point next_eligible_{Clock::time_point::min()};
};

} // namespace dac
