#pragma once

#include <atomic>
#include <string>

#include "infra/event_log.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

namespace dac {

// A long-running worker thread (frame source, operator intake). Lifecycle events go to the event log.
class Stage {
public:
  Stage(std::string name, EventLog* log);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  void start(StopToken global_stop);
  void stop();

  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& global_stop,
                   const std::atomic_bool& local_stop) = 0;

  static bool ShouldStop(const StopToken& global_stop, const std::atomic_bool& local_stop) {
    return global_stop.stop_requested() || local_stop.load(std::memory_order_relaxed);
  }

  EventLog* log_;

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace dac
