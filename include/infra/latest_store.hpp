#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
    LatestStore is the shared frame slot between the video ingestion thread and the control/render loop.

    The decoder produces frames at whatever rate the stream delivers them. The control loop runs at the display rate
    and only ever cares about the newest frame. A FIFO between the two would let frames back up behind a slow
    detection cycle and the controller would end up steering on old images.

    LatestStore keeps exactly one value:
    - write() unconditionally replaces the previous value (freshest wins, no history)
    - read_latest() copies the value out under the lock and returns immediately, so the producer is only blocked for
      the duration of a copy, never for the consumer's processing
    - an empty store reads as std::nullopt; callers treat that as "no data yet" and move on

    version() increases on every write so a consumer can tell whether it already handled the current value.
*/

namespace dac {

template <typename T>
class LatestStore {
public:
  struct Snapshot {
    T value;
    std::uint64_t version{0};
  };

  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  void write(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = std::move(value);
    has_value_ = true;
    ++version_;
  }

  std::optional<T> read_latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_) return std::nullopt;
    return latest_;
  }

  // Value and the version it was written under, read atomically
  std::optional<Snapshot> read_snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_) return std::nullopt;
    return Snapshot{latest_, version_};
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(mu_);
    return has_value_;
  }

private:
  mutable std::mutex mu_;
  T latest_{};
  bool has_value_{false};
  std::uint64_t version_{0};
};

} // namespace dac
