#pragma once
#include <atomic>

/*
    StopSource is owned by the application and represents a shutdown request for every worker.

    A StopToken is the read-only view of it handed to each thread. Workers also get their own local stop flag through
    ThreadRunner, so one stage can be stopped without tearing the rest down. A worker exits when either is set.
*/

namespace dac {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }

  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool stop_{false};
};

} // namespace dac
