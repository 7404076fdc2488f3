#include "core/command_dispatcher.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace dac {

const char* ToString(CommandSource s) {
  switch (s) {
    case CommandSource::Autonomous: return "auto";
    case CommandSource::Manual: return "manual";
    case CommandSource::System: return "system";
  }
  return "unknown";
}

CommandDispatcher::CommandDispatcher(CommandChannel& channel, SettleTable settle, EventLog* log)
    : channel_(channel), settle_(std::move(settle)), log_(log) {}

TransportReply CommandDispatcher::dispatch(Command cmd, CommandSource source) {
  cmd.settle = settle_.lookup(cmd);
  const std::string wire = ToWire(cmd);

  std::lock_guard<std::mutex> exchange(exchange_mu_);

  if (log_) {
    std::ostringstream oss;
    oss << ToString(source) << " '" << wire << "' (settle " << cmd.settle.count() << " ms)";
    log_->info("dispatch", oss.str());
  }

  TransportReply reply = channel_.send(wire);
  const auto done = Clock::now();

  std::lock_guard<std::mutex> lock(state_mu_);

  // A timed-out command may still have been executed, so it settles like an acknowledged one
  settle_deadline_ = std::max(settle_deadline_, done + cmd.settle);

  ++counters_.sent;
  switch (reply.status) {
    case ReplyStatus::Ok:
      if (reply.acknowledged()) ++counters_.acknowledged;
      break;
    case ReplyStatus::Timeout:
      ++counters_.timeouts;
      break;
    case ReplyStatus::SocketError:
      ++counters_.errors;
      break;
  }

  DispatchRecord rec;
  rec.command = std::move(cmd);
  rec.source = source;
  rec.reply = reply;
  rec.completed = done;
  last_ = std::move(rec);

  return reply;
}

bool CommandDispatcher::autonomous_ready(Clock::time_point now) const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return now >= settle_deadline_;
}

CommandDispatcher::Clock::time_point CommandDispatcher::settle_deadline() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return settle_deadline_;
}

std::optional<DispatchRecord> CommandDispatcher::last() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return last_;
}

CommandDispatcher::Counters CommandDispatcher::counters() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return counters_;
}

} // namespace dac
