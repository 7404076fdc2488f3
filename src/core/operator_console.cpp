#include "core/operator_console.hpp"

#include <utility>

namespace dac {

OperatorConsole::OperatorConsole(CommandDispatcher& dispatcher, SharedState& shared, EventLog* log)
    : dispatcher_(dispatcher), shared_(shared), log_(log) {}

OperatorConsole::Outcome OperatorConsole::change_mode(ControllerMode m) {
  const ControllerMode prev = shared_.set_mode(m);
  if (log_) log_->info("operator", std::string("mode ") + ToString(prev) + " -> " + ToString(m));

  Outcome out;
  out.kind = Outcome::Kind::ModeChanged;
  out.mode = m;
  return out;
}

OperatorConsole::Outcome OperatorConsole::submit(const std::string& line) {
  auto cmd = ParseCommandLine(line);
  if (!cmd) return {};

  // A bare mode word switches the controller; with arguments it is a vehicle command like any other
  if (!cmd->argument && cmd->raw_args.empty()) {
    if (auto m = ParseControllerMode(cmd->opcode)) return change_mode(*m);
  }

  Outcome out;
  out.kind = Outcome::Kind::CommandSent;

  // Autonomy must not steer a vehicle the operator is putting down
  if (cmd->opcode == "land" || cmd->opcode == "emergency") {
    const ControllerMode prev = shared_.set_mode(ControllerMode::Idle);
    out.mode = ControllerMode::Idle;
    if (log_ && prev != ControllerMode::Idle) {
      log_->info("operator", std::string("mode ") + ToString(prev) + " -> idle (" + cmd->opcode + ")");
    }
  }

  out.reply = dispatcher_.dispatch(*cmd, CommandSource::Manual);
  out.command = std::move(cmd);
  return out;
}

OperatorConsole::Outcome OperatorConsole::key(int keycode) {
  switch (keycode) {
    case 'a': return change_mode(ControllerMode::AutoApproach);
    case 'm': return change_mode(ControllerMode::Manual);
    case 'i': return change_mode(ControllerMode::Idle);
    case 't': return submit("takeoff");
    case 'l': return submit("land");
    case 'e': return submit("emergency");
    case 'b': return submit("battery?");
    default: return {};
  }
}

} // namespace dac
