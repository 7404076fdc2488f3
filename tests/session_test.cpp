#include <chrono>
#include <iostream>
#include <string>

#include "core/session.hpp"
#include "infra/dry_run_channel.hpp"

int main() {
  using namespace std::chrono_literals;

  dac::EventLog log(32, false);

  // Defaults: command, streamon; no takeoff
  {
    dac::DryRunChannel channel(&log);
    dac::CommandDispatcher dispatcher(channel, dac::SettleTable(0ms), &log);
    dac::VehicleConfig cfg;

    const auto start = dac::StartSession(dispatcher, cfg, &log);
    const auto sent = channel.sent();
    if (start.sent != 2 || !start.all_acknowledged() || sent.size() != 2 || sent[0] != "command" ||
        sent[1] != "streamon") {
      std::cerr << "default start sequence mismatch\n";
      return 1;
    }

    const auto end = dac::EndSession(dispatcher, cfg, &log);
    const auto all = channel.sent();
    if (end.sent != 2 || all.size() != 4 || all[2] != "land" || all[3] != "streamoff") {
      std::cerr << "default shutdown sequence mismatch\n";
      return 1;
    }
  }

  // auto_takeoff appends takeoff; a vehicle that answers "error" is warned about but the sequence continues
  {
    dac::DryRunChannel channel(&log, "error");
    dac::CommandDispatcher dispatcher(channel, dac::SettleTable(0ms), &log);
    dac::VehicleConfig cfg;
    cfg.auto_takeoff = true;

    const auto start = dac::StartSession(dispatcher, cfg, &log);
    const auto sent = channel.sent();
    if (start.sent != 3 || start.acknowledged != 0 || sent.back() != "takeoff") {
      std::cerr << "unacknowledged commands must not stop the sequence\n";
      return 1;
    }

    int warnings = 0;
    for (const auto& ev : log.recent(32)) {
      if (ev.level == dac::LogLevel::Warn && ev.category == "session") ++warnings;
    }
    if (warnings != 3) {
      std::cerr << "each unacknowledged command must be warned about\n";
      return 1;
    }
  }

  // The record keeps only the newest commands but the count covers all of them
  {
    dac::DryRunChannel channel(nullptr, "ok", 3);
    for (int i = 0; i < 10; ++i) channel.send("cw " + std::to_string(i));
    const auto kept = channel.sent();
    if (channel.sent_count() != 10 || kept.size() != 3 || kept.front() != "cw 7" || kept.back() != "cw 9") {
      std::cerr << "dry-run record must keep the newest commands and count all of them\n";
      return 1;
    }
  }

  return 0;
}
