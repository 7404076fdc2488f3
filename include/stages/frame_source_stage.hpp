#pragma once

#include <cstdint>

#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/event_log.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace dac {

// Decodes the vehicle's video stream and keeps the freshest frame in the slot.
// Never blocks anyone else: if the stream cannot be opened or goes quiet, the stage keeps reopening it on its own.
class FrameSourceStage final : public Stage {
public:
  FrameSourceStage(StageMetrics* metrics, VideoConfig cfg, LatestStore<Frame>& out, EventLog* log);
  ~FrameSourceStage() override;

  std::uint64_t frames_produced() const { return next_id_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  bool open(cv::VideoCapture& cap);
  void wait_before_reopen(const StopToken& global_stop, const std::atomic_bool& local_stop) const;

  StageMetrics* metrics_;
  VideoConfig cfg_;
  LatestStore<Frame>& out_;

  // Keeps counting across reconnects
  std::atomic<std::uint64_t> next_id_{0};
};

} // namespace dac
