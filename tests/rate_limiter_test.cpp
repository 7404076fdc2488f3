#include <chrono>
#include <iostream>

#include "infra/rate_limiter.hpp"

int main() {
  using namespace std::chrono_literals;
  using Clock = dac::RateLimiter::Clock;

  dac::RateLimiter limiter(5.0);
  if (!limiter.enabled() || limiter.period() != std::chrono::duration_cast<Clock::duration>(200ms)) {
    std::cerr << "5 Hz limiter should have a 200 ms period\n";
    return 1;
  }

  const Clock::time_point t0{std::chrono::seconds(100)};

  if (!limiter.try_acquire(t0)) {
    std::cerr << "first call must be due\n";
    return 1;
  }
  if (limiter.try_acquire(t0 + 10ms) || limiter.try_acquire(t0 + 199ms)) {
    std::cerr << "granted inside the period\n";
    return 1;
  }
  if (!limiter.try_acquire(t0 + 200ms)) {
    std::cerr << "not granted at the period boundary\n";
    return 1;
  }

  // A stall does not bank grants: one grant, then a full period again
  if (!limiter.try_acquire(t0 + 2000ms)) {
    std::cerr << "not granted after a stall\n";
    return 1;
  }
  if (limiter.try_acquire(t0 + 2100ms)) {
    std::cerr << "stall produced a burst\n";
    return 1;
  }

  // Over one simulated second of a 30 Hz loop the detector runs 5 times
  dac::RateLimiter paced(5.0);
  int grants = 0;
  for (int i = 0; i < 30; ++i) {
    if (paced.try_acquire(t0 + std::chrono::microseconds(i * 33333))) ++grants;
  }
  if (grants != 5) {
    std::cerr << "expected 5 grants in one second, got " << grants << "\n";
    return 1;
  }

  limiter.reset();
  if (!limiter.try_acquire(t0 + 2101ms)) {
    std::cerr << "reset must make the next call due\n";
    return 1;
  }

  dac::RateLimiter off(0.0);
  if (off.enabled() || off.try_acquire(t0)) {
    std::cerr << "zero rate must disable the limiter\n";
    return 1;
  }

  return 0;
}
