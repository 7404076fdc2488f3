#include "infra/event_log.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace dac {

static const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Info: break;
  }
  return "info";
}

EventLog::EventLog(std::size_t retained, bool echo) : retained_(retained), echo_(echo) {}

void EventLog::info(const std::string& category, const std::string& message) {
  log(LogLevel::Info, category, message);
}

void EventLog::warn(const std::string& category, const std::string& message) {
  log(LogLevel::Warn, category, message);
}

void EventLog::error(const std::string& category, const std::string& message) {
  log(LogLevel::Error, category, message);
}

void EventLog::log(LogLevel level, const std::string& category, const std::string& message) {
  LogEvent ev;
  ev.time = std::chrono::system_clock::now();
  ev.level = level;
  ev.category = category;
  ev.message = message;

  std::lock_guard<std::mutex> lock(mu_);

  // Printing under the lock keeps lines from different threads whole
  if (echo_) {
    std::ostream& os = (level == LogLevel::Info) ? std::cout : std::cerr;
    os << "[" << FormatTime(ev.time) << "] [" << ev.category << "]";
    if (level != LogLevel::Info) os << " " << LevelTag(level) << ":";
    os << " " << ev.message << std::endl;
  }

  ++total_;
  if (retained_ == 0) return;
  if (events_.size() >= retained_) events_.pop_front();
  events_.push_back(std::move(ev));
}

std::vector<LogEvent> EventLog::recent(std::size_t max_events) const {
  std::lock_guard<std::mutex> lock(mu_);
  const std::size_t n = std::min(max_events, events_.size());
  return std::vector<LogEvent>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
}

std::uint64_t EventLog::total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return total_;
}

std::string EventLog::FormatTime(std::chrono::system_clock::time_point t) {
  using namespace std::chrono;

  const std::time_t secs = system_clock::to_time_t(t);
  const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count() % 1000;

  std::tm tm_buf{};
  localtime_r(&secs, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms;
  return oss.str();
}

} // namespace dac
