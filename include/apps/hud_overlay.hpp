#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "core/approach_controller.hpp"
#include "core/command_dispatcher.hpp"
#include "core/config.hpp"
#include "core/controller_mode.hpp"
#include "infra/event_log.hpp"
#include "infra/metrics.hpp"

namespace dac {

// Everything the overlay shows besides the image itself, gathered by the render loop once per displayed frame
struct HudStatus {
  ControllerMode mode{ControllerMode::Idle};
  std::uint64_t engagement{0};
  std::uint64_t frame_id{0};
  const CycleReport* cycle{nullptr};              // last cycle that ran detection, may be null
  std::optional<DispatchRecord> last_command;
  CommandDispatcher::Counters counters{};
  bool settling{false};
};

class HudOverlay {
public:
  explicit HudOverlay(DisplayConfig cfg);

  // Draws boxes, the target and the status panel onto bgr (a copy of the shared frame)
  void draw(cv::Mat& bgr, const HudStatus& status, const Metrics& metrics, const EventLog* log);

private:
  void draw_candidates(cv::Mat& bgr, const CycleReport& cycle) const;
  void refresh_panel(const cv::Mat& like, const HudStatus& status, const Metrics& metrics, const EventLog* log);

  DisplayConfig cfg_;

  std::chrono::steady_clock::time_point last_refresh_{};
  cv::Mat panel_;

  struct Prev { std::uint64_t count{0}; };
  std::unordered_map<const StageMetrics*, Prev> prev_stage_;
  std::uint64_t last_tick_ns_{0};
};

} // namespace dac
