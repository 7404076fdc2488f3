#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "core/command.hpp"
#include "infra/command_channel.hpp"
#include "infra/event_log.hpp"

/*
    CommandDispatcher is the only path to the vehicle's command channel.

    The vehicle handles one command at a time, so every exchange (send + wait for reply) runs under one mutex: a new
    command never goes out while another is still waiting for its acknowledgement. There is no queue; whoever gets
    the mutex next sends next.

    Operator and system commands are never held back. Autonomous commands are paced by the settle delay: after an
    exchange completes, autonomous_ready() stays false until the command's settle delay has elapsed, so the
    steering loop cannot flood the vehicle. The settle is a deadline, not a sleep, so callers keep running.
*/

namespace dac {

enum class CommandSource {
  Autonomous,
  Manual,
  System
};

const char* ToString(CommandSource s);

struct DispatchRecord {
  Command command;
  CommandSource source{CommandSource::System};
  TransportReply reply;
  std::chrono::steady_clock::time_point completed{};
};

class CommandDispatcher {
public:
  using Clock = std::chrono::steady_clock;

  struct Counters {
    std::uint64_t sent{0};
    std::uint64_t acknowledged{0};
    std::uint64_t timeouts{0};
    std::uint64_t errors{0};
  };

  CommandDispatcher(CommandChannel& channel, SettleTable settle, EventLog* log);

  CommandDispatcher(const CommandDispatcher&) = delete;
  CommandDispatcher& operator=(const CommandDispatcher&) = delete;

  // Blocks until the reply arrives or the channel times out
  TransportReply dispatch(Command cmd, CommandSource source);

  // True once the settle delay of the last command has elapsed
  bool autonomous_ready(Clock::time_point now) const;
  Clock::time_point settle_deadline() const;

  std::optional<DispatchRecord> last() const;
  Counters counters() const;

  const SettleTable& settle_table() const { return settle_; }

private:
  CommandChannel& channel_;
  const SettleTable settle_;
  EventLog* log_;

  // Held for a whole exchange
  std::mutex exchange_mu_;

  // Guards the fields below; never held while waiting on the channel
  mutable std::mutex state_mu_;
  Clock::time_point settle_deadline_{};
  std::optional<DispatchRecord> last_;
  Counters counters_{};
};

} // namespace dac
