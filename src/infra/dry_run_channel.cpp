#include "infra/dry_run_channel.hpp"

#include <utility>

namespace dac {

DryRunChannel::DryRunChannel(EventLog* log, std::string canned_reply, std::size_t keep_last)
    : log_(log), canned_reply_(std::move(canned_reply)), keep_last_(keep_last) {}

TransportReply DryRunChannel::send(const std::string& command) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++sent_count_;
    if (keep_last_ > 0) {
      if (sent_.size() >= keep_last_) sent_.pop_front();
      sent_.push_back(command);
    }
  }

  if (log_) log_->info("dry-run", "'" + command + "' -> '" + canned_reply_ + "'");

  TransportReply r;
  r.status = ReplyStatus::Ok;
  r.text = canned_reply_;
  return r;
}

std::vector<std::string> DryRunChannel::sent() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::vector<std::string>(sent_.begin(), sent_.end());
}

std::uint64_t DryRunChannel::sent_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sent_count_;
}

} // namespace dac
