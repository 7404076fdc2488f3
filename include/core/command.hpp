#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

/*
    Vehicle SDK commands. On the wire a command is a single ASCII datagram: the opcode, optionally followed by its
    argument ("cw 15", "forward 30", "flip l", "battery?"). Commands go out one at a time and each elicits at most one
    reply datagram.
*/

namespace dac {

struct Command {
  std::string opcode;                 // "cw", "forward", "takeoff", "battery?", ...
  std::optional<int> argument;        // degrees or centimetres for motion commands, when it fits an int
  std::string raw_args;               // argument text as typed by the operator ("l" for "flip l"); sent verbatim
  std::chrono::milliseconds settle{0};  // filled in by the dispatcher from the settle table

  // Motion commands move the vehicle and must settle; queries ("battery?") and mode commands do not
  bool is_query() const { return !opcode.empty() && opcode.back() == '?'; }
};

// "cw 15", "flip l", "takeoff". Operator argument text wins over the numeric argument.
std::string ToWire(const Command& cmd);

// Rotation toward a signed angle: positive -> "cw", negative -> "ccw"
Command Rotate(int degrees);
Command Forward(int centimetres);
Command Simple(const std::string& opcode);

// Operator text -> Command. Only rejects empty (whitespace-only) input, everything else is passed to the vehicle as is.
std::optional<Command> ParseCommandLine(const std::string& text);

std::string Trim(const std::string& s);

// Settle delay per opcode, with a fallback for opcodes not listed. Query commands never settle.
class SettleTable {
public:
  SettleTable();
  explicit SettleTable(std::chrono::milliseconds fallback);

  void set(const std::string& opcode, std::chrono::milliseconds delay);
  std::chrono::milliseconds lookup(const Command& cmd) const;

  std::chrono::milliseconds fallback() const { return fallback_; }
  const std::unordered_map<std::string, std::chrono::milliseconds>& entries() const { return delays_; }

private:
  std::chrono::milliseconds fallback_{1000};
  std::unordered_map<std::string, std::chrono::milliseconds> delays_;
};

} // namespace dac
