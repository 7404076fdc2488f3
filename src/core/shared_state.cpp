#include "core/shared_state.hpp"

namespace dac {

ControllerMode SharedState::mode() const {
  std::lock_guard<std::mutex> lock(mu_);
  return mode_;
}

ControllerMode SharedState::set_mode(ControllerMode m) {
  std::lock_guard<std::mutex> lock(mu_);
  const ControllerMode prev = mode_;
  if (m == ControllerMode::AutoApproach && prev != ControllerMode::AutoApproach) ++engagement_;
  mode_ = m;
  return prev;
}

std::uint64_t SharedState::engagement() const {
  std::lock_guard<std::mutex> lock(mu_);
  return engagement_;
}

} // namespace dac
