#include "stages/frame_source_stage.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include <opencv2/core.hpp>

namespace dac {

FrameSourceStage::FrameSourceStage(StageMetrics* metrics, VideoConfig cfg, LatestStore<Frame>& out, EventLog* log)
    : Stage("frame_source", log), metrics_(metrics), cfg_(std::move(cfg)), out_(out) {}

FrameSourceStage::~FrameSourceStage() {
  stop();
}

bool FrameSourceStage::open(cv::VideoCapture& cap) {
  const int api = (cfg_.backend == "ffmpeg") ? cv::CAP_FFMPEG : cv::CAP_ANY;

  if (log_) log_->info("video", "opening " + cfg_.url);
  if (!cap.open(cfg_.url, api)) {
    if (log_) log_->warn("video", "could not open " + cfg_.url);
    return false;
  }

  // Only the newest frame matters; do not let the decoder queue up a backlog
  cap.set(cv::CAP_PROP_BUFFERSIZE, 1);

  if (log_) log_->info("video", "stream open");
  return true;
}

void FrameSourceStage::wait_before_reopen(const StopToken& global, const std::atomic_bool& local) const {
  const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg_.reopen_delay_ms);
  while (!ShouldStop(global, local) && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

void FrameSourceStage::run(const StopToken& global, const std::atomic_bool& local) {
  cv::VideoCapture cap;
  int consecutive_failures = 0;

  while (!ShouldStop(global, local)) {
    if (!cap.isOpened()) {
      if (!open(cap)) {
        wait_before_reopen(global, local);
        continue;
      }
      consecutive_failures = 0;
    }

    const auto t0 = NowNs();

    cv::Mat img;
    if (!cap.read(img) || img.empty()) {
      if (++consecutive_failures >= cfg_.reopen_after_failures) {
        if (log_) log_->warn("video", "no frames after " + std::to_string(consecutive_failures) + " reads, reopening");
        if (metrics_) metrics_->on_failure();
        cap.release();
        wait_before_reopen(global, local);
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      continue;
    }
    consecutive_failures = 0;

    if (cfg_.flip_vertical) cv::flip(img, img, 0);
    if (cfg_.flip_horizontal) cv::flip(img, img, 1);

    Frame f;
    f.capture_time = std::chrono::steady_clock::now();
    f.sequence_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    f.image = std::move(img);

    out_.write(std::move(f));

    if (metrics_) metrics_->on_item(NowNs() - t0);
  }

  cap.release();
}

} // namespace dac
