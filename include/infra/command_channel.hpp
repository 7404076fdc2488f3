#pragma once

#include <chrono>
#include <string>

namespace dac {

enum class ReplyStatus {
  Ok,           // a reply datagram arrived, text holds it (may still say "error")
  Timeout,      // nothing within the reply timeout, outcome on the vehicle is unknown
  SocketError   // send/receive failed at the socket level
};

struct TransportReply {
  ReplyStatus status{ReplyStatus::Timeout};
  std::string text;                       // reply payload, or the error description for SocketError
  std::chrono::milliseconds elapsed{0};

  bool ok() const { return status == ReplyStatus::Ok; }
  // Reply arrived and the vehicle acknowledged with "ok"
  bool acknowledged() const;
};

const char* ToString(ReplyStatus status);

// Request/reply over an unreliable link: one command out, at most one reply back.
// Implementations report failures in the returned value and stay usable afterwards.
class CommandChannel {
public:
  virtual ~CommandChannel() = default;

  virtual TransportReply send(const std::string& command) = 0;
};

} // namespace dac
