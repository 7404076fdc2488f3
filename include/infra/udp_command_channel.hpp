#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <netinet/in.h>

#include "infra/command_channel.hpp"
#include "infra/event_log.hpp"

namespace dac {

// Blocking UDP request/reply to the vehicle's SDK port.
//
// The socket is bound to its own local port so the reply traffic does not collide with the video stream port.
// Not safe for concurrent send() calls; the CommandDispatcher is the single owner.
class UdpCommandChannel final : public CommandChannel {
public:
  struct Params {
    std::string remote_ip{"192.168.10.1"};
    std::uint16_t remote_port{8889};
    std::uint16_t local_port{9000};   // 0 lets the kernel pick
    std::chrono::milliseconds reply_timeout{1000};
    std::size_t max_reply_bytes{1024};
  };

  // Throws std::runtime_error if the socket cannot be created or bound
  UdpCommandChannel(Params p, EventLog* log);
  ~UdpCommandChannel() override;

  UdpCommandChannel(const UdpCommandChannel&) = delete;
  UdpCommandChannel& operator=(const UdpCommandChannel&) = delete;

  TransportReply send(const std::string& command) override;

  std::uint16_t local_port() const { return bound_port_; }
  const Params& params() const { return p_; }

private:
  Params p_;
  EventLog* log_;
  int fd_{-1};
  sockaddr_in remote_{};
  std::uint16_t bound_port_{0};
  std::uint64_t stale_dropped_{0};

  // Discards replies that arrived after an earlier exchange timed out
  void drain_stale();
  bool from_remote(const sockaddr_in& from) const;
  void log_outcome(const std::string& command, const TransportReply& reply);
};

} // namespace dac
