#include "infra/rate_limiter.hpp"

namespace dac {

RateLimiter::RateLimiter(double rate_hz) {
  if (rate_hz <= 0.0) return;

  enabled_ = true;
  period_ = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / rate_hz));
}

bool RateLimiter::try_acquire(Clock::time_point now) {
  if (!enabled_) return false;
  if (now < next_eligible_) return false;

  next_eligible_ = now + period_;
  return true;
}

void RateLimiter::reset() {
  next_eligible_ = Clock::time_point::min();
}

} // namespace dac
