#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>
#include <utility>

#include "core/frame.hpp"
#include "infra/latest_store.hpp"

int main() {
  dac::LatestStore<int> store;

  if (store.read_latest() || store.read_snapshot() || store.has_value() || store.version() != 0) {
    std::cerr << "empty store must read as no data\n";
    return 1;
  }

  store.write(1);
  store.write(2);
  store.write(3);

  auto v = store.read_latest();
  if (!v || *v != 3) {
    std::cerr << "expected freshest value 3\n";
    return 1;
  }
  if (store.version() != 3) {
    std::cerr << "version must count every write\n";
    return 1;
  }

  // Reading does not consume
  auto again = store.read_snapshot();
  if (!again || again->value != 3 || again->version != 3) {
    std::cerr << "snapshot mismatch after repeated read\n";
    return 1;
  }

  // Frames share pixels with the slot; the reader gets the newest sequence id
  dac::LatestStore<dac::Frame> frames;
  for (std::uint64_t i = 0; i < 5; ++i) {
    dac::Frame f;
    f.sequence_id = i;
    f.image = cv::Mat(4, 6, CV_8UC3, cv::Scalar(static_cast<double>(i), 0, 0));
    frames.write(std::move(f));
  }
  auto fr = frames.read_latest();
  if (!fr || fr->sequence_id != 4 || fr->empty() || fr->image.cols != 6) {
    std::cerr << "frame slot did not keep the newest frame\n";
    return 1;
  }

  // A reader racing a writer never sees a value go backwards
  dac::LatestStore<std::uint64_t> counter;
  std::atomic_bool done{false};
  std::thread writer([&] {
    for (std::uint64_t i = 1; i <= 20000; ++i) counter.write(i);
    done.store(true);
  });

  std::uint64_t last = 0;
  bool regressed = false;
  while (!done.load()) {
    if (auto s = counter.read_snapshot()) {
      if (s->value < last || s->value != s->version) regressed = true;
      last = s->value;
    }
  }
  writer.join();

  if (regressed) {
    std::cerr << "reader observed a stale or torn value\n";
    return 1;
  }
  if (*counter.read_latest() != 20000) {
    std::cerr << "final value must be the last write\n";
    return 1;
  }

  return 0;
}
