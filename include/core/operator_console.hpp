#pragma once

#include <optional>
#include <string>

#include "core/command.hpp"
#include "core/command_dispatcher.hpp"
#include "core/shared_state.hpp"
#include "infra/event_log.hpp"

namespace dac {

// Turns operator input (typed lines, window keys) into mode changes or manual vehicle commands.
// Manual commands go straight to the dispatcher and are never held back by the autonomous settle delay.
class OperatorConsole {
public:
  struct Outcome {
    enum class Kind {
      Ignored,       // blank line
      ModeChanged,
      CommandSent
    };

    Kind kind{Kind::Ignored};
    std::optional<ControllerMode> mode;     // new mode, for ModeChanged and for land/emergency
    std::optional<Command> command;
    TransportReply reply{};
  };

  OperatorConsole(CommandDispatcher& dispatcher, SharedState& shared, EventLog* log);

  Outcome submit(const std::string& line);

  // Single-key bindings of the video window; unknown keys are ignored
  Outcome key(int keycode);

private:
  Outcome change_mode(ControllerMode m);

  CommandDispatcher& dispatcher_;
  SharedState& shared_;
  EventLog* log_;
};

} // namespace dac
