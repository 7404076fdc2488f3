#include "stages/stage.hpp"

#include <exception>
#include <utility>

namespace dac {

Stage::Stage(std::string name, EventLog* log)
    : log_(log), name_(std::move(name)), runner_(name_) {}

Stage::~Stage() {
  runner_.request_stop();
  runner_.join();
}

void Stage::start(StopToken global_stop) {
  if (log_) log_->info("stage", name_ + " started");

  runner_.start(global_stop, [this](const StopToken& g, const std::atomic_bool& l) {
    try {
      run(g, l);
    } catch (const std::exception& e) {
      // A worker that dies takes only itself down; the rest of the session keeps running
      if (log_) log_->error("stage", name_ + " terminated: " + e.what());
    }
  });
}

void Stage::stop() {
  runner_.request_stop();
  const bool was_running = runner_.joinable();
  runner_.join();

  if (was_running && log_) log_->info("stage", name_ + " stopped");
}

} // namespace dac
