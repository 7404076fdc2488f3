#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread and gives every worker the same start/stop contract:
        - the worker function receives the global StopToken and its own local stop flag
        - request_stop() only affects this worker
        - destruction requests a stop and joins
*/

namespace dac {

class ThreadRunner {
public:
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws if the runner already owns a running thread
  void start(StopToken global_stop, Fn fn);

  void request_stop();
  bool stop_requested() const;

  void join();
  bool joinable() const;

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  StopToken global_stop_{};
  std::string name_{"thread"};
};

} // namespace dac
