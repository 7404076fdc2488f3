#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

/*
  EventLog is the operator-facing log sink. Every command exchange, detection-cycle decision and stage lifecycle
  event goes through it. Each event is printed immediately as "[HH:MM:SS.mmm] [category] message" (warnings and
  errors go to stderr) and the most recent ones are retained so the HUD can show them on the video.

  Components take a nullable EventLog*, same as StageMetrics, so tests can run without one.
*/

namespace dac {

enum class LogLevel {
  Info,
  Warn,
  Error
};

struct LogEvent {
  std::chrono::system_clock::time_point time{};
  LogLevel level{LogLevel::Info};
  std::string category;
  std::string message;
};

class EventLog {
public:
  explicit EventLog(std::size_t retained = 64, bool echo = true);

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  void info(const std::string& category, const std::string& message);
  void warn(const std::string& category, const std::string& message);
  void error(const std::string& category, const std::string& message);

  void log(LogLevel level, const std::string& category, const std::string& message);

  // Newest last
  std::vector<LogEvent> recent(std::size_t max_events) const;
  std::uint64_t total() const;

  static std::string FormatTime(std::chrono::system_clock::time_point t);

private:
  const std::size_t retained_;
  const bool echo_;

  mutable std::mutex mu_;
  std::deque<LogEvent> events_;
  std::uint64_t total_{0};
};

} // namespace dac
