#include "core/session.hpp"

namespace dac {

SequenceResult SendSequence(CommandDispatcher& dispatcher,
                            const std::vector<std::string>& lines,
                            const std::string& phase,
                            EventLog* log) {
  SequenceResult result;

  for (const auto& line : lines) {
    auto cmd = ParseCommandLine(line);
    if (!cmd) continue;

    const TransportReply reply = dispatcher.dispatch(*cmd, CommandSource::System);
    ++result.sent;

    if (reply.acknowledged()) {
      ++result.acknowledged;
    } else if (log) {
      std::string detail = ToString(reply.status);
      if (!reply.text.empty()) detail += " '" + reply.text + "'";
      log->warn(phase, "'" + ToWire(*cmd) + "' not acknowledged (" + detail + "), continuing");
    }
  }

  return result;
}

SequenceResult StartSession(CommandDispatcher& dispatcher, const VehicleConfig& cfg, EventLog* log) {
  std::vector<std::string> lines = cfg.init_commands;
  if (cfg.auto_takeoff) lines.emplace_back("takeoff");

  if (log) log->info("session", "starting, " + std::to_string(lines.size()) + " command(s)");
  return SendSequence(dispatcher, lines, "session", log);
}

SequenceResult EndSession(CommandDispatcher& dispatcher, const VehicleConfig& cfg, EventLog* log) {
  if (log) log->info("session", "ending, " + std::to_string(cfg.shutdown_commands.size()) + " command(s)");
  return SendSequence(dispatcher, cfg.shutdown_commands, "session", log);
}

} // namespace dac
