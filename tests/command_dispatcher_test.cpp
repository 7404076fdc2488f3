#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/command_dispatcher.hpp"

namespace {

// Replies with whatever status is queued next (Ok "ok" once the queue is empty) and tracks overlapping exchanges
class ScriptedChannel final : public dac::CommandChannel {
public:
  dac::TransportReply send(const std::string& command) override {
    const int now_in = ++in_flight_;
    int prev = max_in_flight_.load();
    while (now_in > prev && !max_in_flight_.compare_exchange_weak(prev, now_in)) {}

    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

    dac::TransportReply r;
    r.status = dac::ReplyStatus::Ok;
    r.text = "ok";
    {
      std::lock_guard<std::mutex> lock(mu_);
      sent_.push_back(command);
      if (!script_.empty()) {
        r.status = script_.front();
        r.text = (r.status == dac::ReplyStatus::Ok) ? "ok" : "";
        script_.erase(script_.begin());
      }
    }

    --in_flight_;
    return r;
  }

  void queue(dac::ReplyStatus s) {
    std::lock_guard<std::mutex> lock(mu_);
    script_.push_back(s);
  }

  std::vector<std::string> sent() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sent_;
  }

  int max_in_flight() const { return max_in_flight_.load(); }

  int delay_ms{0};

private:
  mutable std::mutex mu_;
  std::vector<std::string> sent_;
  std::vector<dac::ReplyStatus> script_;
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

}  // namespace

int main() {
  using namespace std::chrono_literals;
  using Clock = dac::CommandDispatcher::Clock;

  ScriptedChannel channel;

  dac::SettleTable settle(0ms);
  settle.set("cw", 200ms);
  settle.set("forward", 500ms);

  dac::CommandDispatcher dispatcher(channel, settle, nullptr);

  if (!dispatcher.autonomous_ready(Clock::now())) {
    std::cerr << "fresh dispatcher must be ready\n";
    return 1;
  }

  // Autonomous rotation: not ready again until the settle delay has passed
  const auto r1 = dispatcher.dispatch(dac::Rotate(15), dac::CommandSource::Autonomous);
  const auto after1 = Clock::now();
  if (!r1.acknowledged()) {
    std::cerr << "expected ok reply\n";
    return 1;
  }
  if (dispatcher.autonomous_ready(after1)) {
    std::cerr << "must be settling right after a rotation\n";
    return 1;
  }
  const auto deadline1 = dispatcher.settle_deadline();
  if (deadline1 < after1 + 150ms || deadline1 > after1 + 250ms) {
    std::cerr << "settle deadline should be about 200 ms after the reply\n";
    return 1;
  }
  if (!dispatcher.autonomous_ready(deadline1)) {
    std::cerr << "must be ready at the settle deadline\n";
    return 1;
  }

  // Operator commands go out during the settle and never shorten it
  const auto r2 = dispatcher.dispatch(dac::Simple("battery?"), dac::CommandSource::Manual);
  if (!r2.ok() || channel.sent().size() != 2) {
    std::cerr << "manual command was held back\n";
    return 1;
  }
  if (dispatcher.settle_deadline() != deadline1) {
    std::cerr << "query shortened the settle deadline\n";
    return 1;
  }

  auto last = dispatcher.last();
  if (!last || last->source != dac::CommandSource::Manual || dac::ToWire(last->command) != "battery?") {
    std::cerr << "last exchange not recorded\n";
    return 1;
  }

  // A timed-out motion command still settles
  channel.queue(dac::ReplyStatus::Timeout);
  const auto r3 = dispatcher.dispatch(dac::Forward(30), dac::CommandSource::Autonomous);
  const auto after3 = Clock::now();
  if (r3.status != dac::ReplyStatus::Timeout) {
    std::cerr << "expected scripted timeout\n";
    return 1;
  }
  if (dispatcher.autonomous_ready(after3 + 300ms) || !dispatcher.autonomous_ready(after3 + 600ms)) {
    std::cerr << "timed-out forward should settle for about 500 ms\n";
    return 1;
  }

  channel.queue(dac::ReplyStatus::SocketError);
  dispatcher.dispatch(dac::Simple("streamon"), dac::CommandSource::Manual);

  const auto c = dispatcher.counters();
  if (c.sent != 4 || c.acknowledged != 2 || c.timeouts != 1 || c.errors != 1) {
    std::cerr << "counters mismatch: sent " << c.sent << " ok " << c.acknowledged << " timeouts " << c.timeouts
              << " errors " << c.errors << "\n";
    return 1;
  }

  // Concurrent callers never overlap on the channel
  channel.delay_ms = 5;
  std::vector<std::thread> callers;
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&dispatcher, t] {
      for (int i = 0; i < 5; ++i) {
        dispatcher.dispatch(dac::Simple(t % 2 ? "battery?" : "speed?"),
                            t % 2 ? dac::CommandSource::Manual : dac::CommandSource::System);
      }
    });
  }
  for (auto& th : callers) th.join();

  if (channel.max_in_flight() != 1) {
    std::cerr << "exchanges overlapped (" << channel.max_in_flight() << " in flight)\n";
    return 1;
  }
  if (dispatcher.counters().sent != 24) {
    std::cerr << "expected 24 exchanges\n";
    return 1;
  }

  return 0;
}
