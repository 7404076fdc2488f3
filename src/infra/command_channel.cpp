#include "infra/command_channel.hpp"

namespace dac {

bool TransportReply::acknowledged() const {
  return status == ReplyStatus::Ok && text == "ok";
}

const char* ToString(ReplyStatus status) {
  switch (status) {
    case ReplyStatus::Ok: return "ok";
    case ReplyStatus::Timeout: return "timeout";
    case ReplyStatus::SocketError: return "socket_error";
  }
  return "unknown";
}

} // namespace dac
