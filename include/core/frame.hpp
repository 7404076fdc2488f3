#pragma once

#include <chrono>
#include <cstdint>

#include <opencv2/core.hpp>

/*
    One decoded video frame. The stream carries no timestamps we trust, so capture_time is the moment the decoder
    handed the frame to us.
*/

namespace dac {

using TimePoint = std::chrono::steady_clock::time_point;

struct Frame {
  TimePoint capture_time{};

  // Monotonic per stream, starts at 0 and keeps counting across reconnects
  std::uint64_t sequence_id{0};

  // BGR image. Copies share pixels (cv::Mat refcount); clone before drawing on it.
  cv::Mat image;

  bool empty() const { return image.empty() || image.cols <= 0 || image.rows <= 0; }
};

} // namespace dac
