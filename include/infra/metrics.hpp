#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/*
  Metrics owns one StageMetrics per worker (frame source, control loop, detector). Stages update their counters with
  relaxed atomics from their own thread; the HUD reads them from the render thread and derives rates from deltas.
*/

namespace dac {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

struct StageMetrics {
  std::string name;

  std::atomic<std::uint64_t> count{0};
  std::atomic<std::uint64_t> avg_latency_ns{0};
  std::atomic<std::uint64_t> last_event_ns{0};
  std::atomic<std::uint64_t> work_ns_total{0};
  std::atomic<std::uint64_t> failures{0};

  explicit StageMetrics(std::string n) : name(std::move(n)) {
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_item(std::uint64_t latency_ns) {
    count.fetch_add(1, std::memory_order_relaxed);

    // EMA with 1/8 weight on the new sample
    auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    auto next = (prev == 0) ? latency_ns : (prev * 7 + latency_ns) / 8;
    avg_latency_ns.store(next, std::memory_order_relaxed);

    work_ns_total.fetch_add(latency_ns, std::memory_order_relaxed);
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_failure() {
    failures.fetch_add(1, std::memory_order_relaxed);
  }
};

// Records the time between construction and destruction as one item. Null metrics are allowed.
class StageTimer {
public:
  explicit StageTimer(StageMetrics* m) : m_(m), t0_(NowNs()) {}
  ~StageTimer() {
    if (m_) m_->on_item(NowNs() - t0_);
  }

  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  StageMetrics* m_;
  std::uint64_t t0_;
};

class Metrics {
public:
  StageMetrics* make_stage(std::string name) {
    stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
    return stages_.back().get();
  }

  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

} // namespace dac
