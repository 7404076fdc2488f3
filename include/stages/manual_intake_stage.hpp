#pragma once

#include <string>

#include "core/operator_console.hpp"
#include "infra/event_log.hpp"
#include "stages/stage.hpp"

namespace dac {

// Reads newline-terminated operator lines from a file descriptor (stdin by default) and hands them to the console.
// The descriptor is polled with a short timeout so a stop request is noticed even when nobody is typing.
class ManualIntakeStage final : public Stage {
public:
  ManualIntakeStage(OperatorConsole& console, EventLog* log, int fd = 0);
  ~ManualIntakeStage() override;

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  void handle_line(const std::string& line);

  OperatorConsole& console_;
  int fd_;
};

} // namespace dac
