#include "core/command.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace dac {

std::string Trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static bool ParseInt(const std::string& s, int& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
  out = static_cast<int>(v);
  return true;
}

std::string ToWire(const Command& cmd) {
  std::ostringstream oss;
  oss << cmd.opcode;
  if (!cmd.raw_args.empty()) {
    oss << " " << cmd.raw_args;
  } else if (cmd.argument) {
    oss << " " << *cmd.argument;
  }
  return oss.str();
}

Command Rotate(int degrees) {
  Command c;
  c.opcode = (degrees >= 0) ? "cw" : "ccw";
  c.argument = std::abs(degrees);
  return c;
}

Command Forward(int centimetres) {
  Command c;
  c.opcode = "forward";
  c.argument = centimetres;
  return c;
}

Command Simple(const std::string& opcode) {
  Command c;
  c.opcode = opcode;
  return c;
}

std::optional<Command> ParseCommandLine(const std::string& text) {
  const std::string line = Trim(text);
  if (line.empty()) return std::nullopt;

  Command c;
  const std::size_t sp = line.find_first_of(" \t");
  if (sp == std::string::npos) {
    c.opcode = line;
    return c;
  }

  c.opcode = line.substr(0, sp);
  const std::string rest = Trim(line.substr(sp + 1));

  // The operator's text goes out exactly as typed; the numeric value is only informational
  c.raw_args = rest;
  int value = 0;
  if (ParseInt(rest, value)) c.argument = value;
  return c;
}

SettleTable::SettleTable() : SettleTable(std::chrono::milliseconds(1000)) {
  using std::chrono::milliseconds;
  delays_["cw"] = milliseconds(1000);
  delays_["ccw"] = milliseconds(1000);
  delays_["forward"] = milliseconds(2000);
  delays_["takeoff"] = milliseconds(5000);
}

SettleTable::SettleTable(std::chrono::milliseconds fallback) : fallback_(fallback) {}

void SettleTable::set(const std::string& opcode, std::chrono::milliseconds delay) {
  delays_[opcode] = delay;
}

std::chrono::milliseconds SettleTable::lookup(const Command& cmd) const {
  if (cmd.is_query()) return std::chrono::milliseconds(0);
  const auto it = delays_.find(cmd.opcode);
  if (it == delays_.end()) return fallback_;
  return it->second;
}

} // namespace dac
