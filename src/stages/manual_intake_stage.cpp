#include "stages/manual_intake_stage.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace dac {

ManualIntakeStage::ManualIntakeStage(OperatorConsole& console, EventLog* log, int fd)
    : Stage("manual_intake", log), console_(console), fd_(fd) {}

ManualIntakeStage::~ManualIntakeStage() {
  stop();
}

void ManualIntakeStage::handle_line(const std::string& line) {
  const auto out = console_.submit(line);
  if (out.kind == OperatorConsole::Outcome::Kind::CommandSent && log_) {
    log_->info("operator", "'" + ToWire(*out.command) + "' -> " + ToString(out.reply.status) +
                               (out.reply.text.empty() ? "" : " '" + out.reply.text + "'"));
  }
}

void ManualIntakeStage::run(const StopToken& global, const std::atomic_bool& local) {
  std::string pending;
  char buf[512];

  while (!ShouldStop(global, local)) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, 100);
    if (ready < 0) {
      if (errno == EINTR) continue;
      if (log_) log_->error("intake", std::string("poll failed: ") + std::strerror(errno));
      return;
    }
    if (ready == 0) continue;

    const ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      if (log_) log_->error("intake", std::string("read failed: ") + std::strerror(errno));
      return;
    }
    if (n == 0) {
      if (!pending.empty()) handle_line(pending);
      if (log_) log_->info("intake", "input closed, operator lines no longer read");
      return;
    }

    pending.append(buf, static_cast<std::size_t>(n));

    std::size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      const std::string line = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      handle_line(line);
    }
  }
}

} // namespace dac
