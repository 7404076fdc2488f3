#include "infra/udp_command_channel.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dac {

static std::string ErrnoText(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

static std::string TrimReply(const char* data, std::size_t n) {
  std::string s(data, n);
  while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\0')) s.pop_back();
  return s;
}

UdpCommandChannel::UdpCommandChannel(Params p, EventLog* log) : p_(std::move(p)), log_(log) {
  if (p_.reply_timeout.count() <= 0) {
    throw std::runtime_error("UdpCommandChannel: reply timeout must be > 0");
  }

  remote_.sin_family = AF_INET;
  remote_.sin_port = htons(p_.remote_port);
  if (inet_pton(AF_INET, p_.remote_ip.c_str(), &remote_.sin_addr) != 1) {
    throw std::runtime_error("UdpCommandChannel: invalid remote ip '" + p_.remote_ip + "'");
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    throw std::runtime_error(ErrnoText("UdpCommandChannel: socket failed"));
  }

  const int reuse = 1;
  ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  local.sin_port = htons(p_.local_port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    const std::string err = ErrnoText("UdpCommandChannel: bind to local port " + std::to_string(p_.local_port) + " failed");
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error(err);
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  }

  if (log_) {
    std::ostringstream oss;
    oss << "bound local port " << bound_port_ << ", vehicle " << p_.remote_ip << ":" << p_.remote_port
        << ", reply timeout " << p_.reply_timeout.count() << " ms";
    log_->info("transport", oss.str());
  }
}

UdpCommandChannel::~UdpCommandChannel() {
  if (fd_ >= 0) ::close(fd_);
}

bool UdpCommandChannel::from_remote(const sockaddr_in& from) const {
  return from.sin_addr.s_addr == remote_.sin_addr.s_addr && from.sin_port == remote_.sin_port;
}

void UdpCommandChannel::drain_stale() {
  std::vector<char> buf(p_.max_reply_bytes);
  while (true) {
    const ssize_t n = ::recv(fd_, buf.data(), buf.size(), MSG_DONTWAIT);
    if (n < 0) return;  // EAGAIN: nothing queued, or an error the next recv will report
    ++stale_dropped_;
    if (log_) log_->warn("transport", "dropped late reply '" + TrimReply(buf.data(), static_cast<std::size_t>(n)) + "'");
  }
}

TransportReply UdpCommandChannel::send(const std::string& command) {
  using Clock = std::chrono::steady_clock;

  TransportReply reply;
  const auto t0 = Clock::now();
  auto finish = [&](ReplyStatus status, std::string text) {
    reply.status = status;
    reply.text = std::move(text);
    reply.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);
    log_outcome(command, reply);
    return reply;
  };

  drain_stale();

  const ssize_t sent = ::sendto(fd_, command.data(), command.size(), 0,
                                reinterpret_cast<const sockaddr*>(&remote_), sizeof(remote_));
  if (sent < 0) {
    return finish(ReplyStatus::SocketError, ErrnoText("sendto"));
  }

  const auto deadline = t0 + p_.reply_timeout;
  std::vector<char> buf(p_.max_reply_bytes);

  while (true) {
    const auto now = Clock::now();
    if (now >= deadline) return finish(ReplyStatus::Timeout, "");

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, static_cast<int>(std::max<std::int64_t>(1, remaining.count())));
    if (ready < 0) {
      if (errno == EINTR) continue;
      return finish(ReplyStatus::SocketError, ErrnoText("poll"));
    }
    if (ready == 0) continue;

    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      // ICMP port unreachable from an earlier send surfaces here; report it and leave the socket as is
      return finish(ReplyStatus::SocketError, ErrnoText("recvfrom"));
    }

    // Anything not sent by the vehicle is ignored and does not end the wait
    if (!from_remote(from)) continue;

    return finish(ReplyStatus::Ok, TrimReply(buf.data(), static_cast<std::size_t>(n)));
  }
}

void UdpCommandChannel::log_outcome(const std::string& command, const TransportReply& reply) {
  if (!log_) return;

  std::ostringstream oss;
  oss << "'" << command << "' -> ";
  switch (reply.status) {
    case ReplyStatus::Ok:
      oss << "'" << reply.text << "'";
      break;
    case ReplyStatus::Timeout:
      oss << "timeout";
      break;
    case ReplyStatus::SocketError:
      oss << "error (" << reply.text << ")";
      break;
  }
  oss << " in " << reply.elapsed.count() << " ms";

  if (reply.ok()) {
    log_->info("transport", oss.str());
  } else {
    log_->warn("transport", oss.str());
  }
}

} // namespace dac
