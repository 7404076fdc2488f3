#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

int main() {
  using namespace std::chrono_literals;

  dac::StopSource global_stop;
  std::atomic<int> ticks{0};

  dac::ThreadRunner runner("frame_source_worker");

  runner.start(global_stop.token(), [&ticks](const dac::StopToken& global, const std::atomic_bool& local) {
    while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
      ++ticks;
      std::this_thread::sleep_for(5ms);
    }
  });

  // Starting twice is a programming error and throws
  bool threw = false;
  try {
    runner.start(global_stop.token(), [](const dac::StopToken&, const std::atomic_bool&) {});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "second start must throw\n";
    return 1;
  }

  std::this_thread::sleep_for(100ms);
  if (ticks.load() == 0) {
    std::cerr << "worker never ran\n";
    return 1;
  }

  global_stop.request_stop();
  runner.join();
  if (runner.joinable() || !runner.stop_requested()) {
    std::cerr << "global stop did not end the worker\n";
    return 1;
  }

  // A local stop ends only its own worker
  dac::StopSource other;
  dac::ThreadRunner a("a");
  dac::ThreadRunner b("b");
  std::atomic_bool b_exited{false};

  auto spin = [](const dac::StopToken& g, const std::atomic_bool& l) {
    while (!g.stop_requested() && !l.load(std::memory_order_relaxed)) std::this_thread::sleep_for(2ms);
  };
  a.start(other.token(), spin);
  b.start(other.token(), [&](const dac::StopToken& g, const std::atomic_bool& l) {
    spin(g, l);
    b_exited.store(true);
  });

  a.request_stop();
  a.join();
  std::this_thread::sleep_for(20ms);
  if (b_exited.load()) {
    std::cerr << "local stop leaked into another worker\n";
    return 1;
  }

  other.request_stop();
  b.join();
  if (!b_exited.load()) {
    std::cerr << "worker b did not exit\n";
    return 1;
  }

  return 0;
}
