#pragma once

#include <cstdint>
#include <mutex>

#include "core/controller_mode.hpp"
#include "core/frame.hpp"
#include "infra/latest_store.hpp"

namespace dac {

// State shared between the ingestion thread, the control/render loop and the operator intake.
// Owned by the application and passed by reference; nothing here is global.
class SharedState {
public:
  SharedState() = default;

  SharedState(const SharedState&) = delete;
  SharedState& operator=(const SharedState&) = delete;

  // Freshest decoded frame. Written only by the frame source.
  LatestStore<Frame>& frames() { return frames_; }
  const LatestStore<Frame>& frames() const { return frames_; }

  ControllerMode mode() const;

  // Returns the previous mode. Switching into AutoApproach from any other mode starts a new engagement.
  ControllerMode set_mode(ControllerMode m);

  // Incremented every time an approach engagement starts
  std::uint64_t engagement() const;

private:
  LatestStore<Frame> frames_;

  mutable std::mutex mu_;
  ControllerMode mode_{ControllerMode::Idle};
  std::uint64_t engagement_{0};
};

} // namespace dac
