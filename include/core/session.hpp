#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/command_dispatcher.hpp"
#include "core/config.hpp"
#include "infra/event_log.hpp"

/*
    Session bracketing for the vehicle:
        start: init_commands ("command" enters SDK mode, "streamon" starts video), then "takeoff" if auto_takeoff
        end:   shutdown_commands ("land", "streamoff")

    Every line goes out as a System command and is never skipped; a reply other than "ok" is logged as a warning and
    the sequence continues, since the vehicle may still have acted on it.
*/

namespace dac {

struct SequenceResult {
  std::size_t sent{0};
  std::size_t acknowledged{0};

  bool all_acknowledged() const { return sent == acknowledged; }
};

SequenceResult SendSequence(CommandDispatcher& dispatcher,
                            const std::vector<std::string>& lines,
                            const std::string& phase,
                            EventLog* log);

SequenceResult StartSession(CommandDispatcher& dispatcher, const VehicleConfig& cfg, EventLog* log);
SequenceResult EndSession(CommandDispatcher& dispatcher, const VehicleConfig& cfg, EventLog* log);

} // namespace dac
