#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "infra/event_log.hpp"

int main() {
  dac::EventLog log(4, false);

  if (log.total() != 0 || !log.recent(10).empty()) {
    std::cerr << "new log must be empty\n";
    return 1;
  }

  log.info("transport", "one");
  log.warn("transport", "two");
  log.error("detect", "three");
  log.info("cycle", "four");
  log.info("cycle", "five");

  // Only the newest four are kept, oldest first
  const auto recent = log.recent(10);
  if (log.total() != 5 || recent.size() != 4 || recent.front().message != "two" || recent.back().message != "five") {
    std::cerr << "ring did not keep the newest events in order\n";
    return 1;
  }
  if (recent[0].level != dac::LogLevel::Warn || recent[1].level != dac::LogLevel::Error ||
      recent[1].category != "detect") {
    std::cerr << "level/category not recorded\n";
    return 1;
  }

  const auto two = log.recent(2);
  if (two.size() != 2 || two[0].message != "four" || two[1].message != "five") {
    std::cerr << "recent(n) must return the last n\n";
    return 1;
  }

  const std::string ts = dac::EventLog::FormatTime(recent.back().time);
  if (ts.size() != 12 || ts[2] != ':' || ts[5] != ':' || ts[8] != '.') {
    std::cerr << "timestamp should look like HH:MM:SS.mmm, got '" << ts << "'\n";
    return 1;
  }

  // Concurrent writers lose nothing
  dac::EventLog shared(8, false);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&shared, t] {
      for (int i = 0; i < 250; ++i) shared.info("w" + std::to_string(t), std::to_string(i));
    });
  }
  for (auto& w : writers) w.join();

  if (shared.total() != 1000 || shared.recent(100).size() != 8) {
    std::cerr << "concurrent logging lost events\n";
    return 1;
  }

  return 0;
}
