#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "infra/command_channel.hpp"
#include "infra/event_log.hpp"

namespace dac {

// Channel that never touches the network. Every command is logged, counted and answered with a canned reply.
// Only the most recent `keep_last` commands are kept for inspection.
// Used for replaying recorded footage through the controller.
class DryRunChannel final : public CommandChannel {
public:
  explicit DryRunChannel(EventLog* log, std::string canned_reply = "ok", std::size_t keep_last = 256);

  TransportReply send(const std::string& command) override;

  // Most recent commands, oldest first
  std::vector<std::string> sent() const;

  // Every command ever sent, including the ones no longer kept
  std::uint64_t sent_count() const;

private:
  EventLog* log_;
  const std::string canned_reply_;
  const std::size_t keep_last_;

  mutable std::mutex mu_;
  std::deque<std::string> sent_;
  std::uint64_t sent_count_{0};
};

} // namespace dac
