#include "infra/thread_runner.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#ifdef __linux__
#include <pthread.h>
#endif

namespace dac {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  global_stop_ = global_stop;

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
#ifdef __linux__
    // Kernel limit is 16 bytes including the terminator
    const std::string short_name = name_.substr(0, 15);
    pthread_setname_np(pthread_self(), short_name.c_str());
#endif
    fn(global_stop_, local_stop_);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace dac
