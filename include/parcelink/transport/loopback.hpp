#pragma once
/**
 * @file loopback.hpp
 * @brief In-memory lossy link between any number of named endpoints (header-only).
 *
 * Used by the tests and by `parcelsim`. Each endpoint gets a SendFn from
 * `sender(local_id)`; frames written through it are queued and handed out by
 * `poll(now_ms, deliver)` once their latency has elapsed. Nothing is ever
 * delivered from inside a send call.
 *
 * Loss is injected two ways:
 *  - `set_drop_rate(p)`: each frame is dropped with probability p (seeded PRNG,
 *    so a run is reproducible).
 *  - `set_drop_predicate(fn)`: drop exactly the frames `fn` picks.
 *
 * Frames longer than `mtu` (when non-zero) are refused with TxResult::Error,
 * the way a BLE stack refuses an oversized write.
 */

#include "parcelink/transport/link.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace parcelink::transport {

class LoopbackLink {
public:
  struct Frame {
    std::string from;
    std::string to;
    std::vector<uint8_t> data;
    uint32_t deliver_at{0};
  };

  /// Return true to drop the frame.
  using DropPredicate = std::function<bool(const Frame&)>;
  /// Called once per delivered frame: (to, from, bytes).
  using DeliverFn = std::function<void(const std::string& to, const std::string& from,
                                       const std::vector<uint8_t>& data)>;

  explicit LoopbackLink(uint32_t seed = 1) : rng_(seed) {}

  void set_drop_rate(double p) { drop_rate_ = p < 0.0 ? 0.0 : (p > 1.0 ? 1.0 : p); }
  void set_drop_predicate(DropPredicate fn) { drop_fn_ = std::move(fn); }
  void set_latency_ms(uint32_t ms) { latency_ms_ = ms; }
  void set_mtu(std::size_t mtu) { mtu_ = mtu; }

  /// SendFn that writes frames from `local_id` to whatever device id it is given.
  SendFn sender(const std::string& local_id) {
    return [this, local_id](const std::string& device_id, const uint8_t* data, std::size_t len) {
      return write(local_id, device_id, data, len);
    };
  }

  /**
   * @brief Deliver every frame that was in flight on entry and is due.
   *
   * Frames written by `deliver` itself wait for the next poll.
   * @return Number of frames delivered.
   */
  std::size_t poll(uint32_t now_ms, const DeliverFn& deliver) {
    now_ms_ = now_ms;
    std::size_t budget = in_flight_.size();
    std::size_t n = 0;
    while (budget > 0 && !in_flight_.empty()) {
      if (static_cast<int32_t>(now_ms - in_flight_.front().deliver_at) < 0) break;
      Frame f = std::move(in_flight_.front());
      in_flight_.pop_front();
      --budget;
      ++delivered_;
      ++n;
      if (deliver) deliver(f.to, f.from, f.data);
    }
    return n;
  }

  std::size_t in_flight() const { return in_flight_.size(); }
  uint64_t sent() const { return sent_; }
  uint64_t dropped() const { return dropped_; }
  uint64_t delivered() const { return delivered_; }
  uint64_t refused() const { return refused_; }

private:
  TxResult write(const std::string& from, const std::string& to,
                 const uint8_t* data, std::size_t len) {
    if (!data && len > 0) { ++refused_; return TxResult::Error; }
    if (mtu_ != 0 && len > mtu_) { ++refused_; return TxResult::Error; }

    Frame f;
    f.from = from;
    f.to = to;
    f.data.assign(data, data + len);
    f.deliver_at = now_ms_ + latency_ms_;
    ++sent_;

    // the writer sees Ok either way: a lost BLE write is silent
    if (drop_fn_ && drop_fn_(f)) { ++dropped_; return TxResult::Ok; }
    if (drop_rate_ > 0.0 && coin_(rng_) < drop_rate_) { ++dropped_; return TxResult::Ok; }

    in_flight_.push_back(std::move(f));
    return TxResult::Ok;
  }

  std::deque<Frame> in_flight_;
  std::mt19937 rng_;
  std::uniform_real_distribution<double> coin_{0.0, 1.0};
  DropPredicate drop_fn_;
  double drop_rate_{0.0};
  uint32_t latency_ms_{0};
  std::size_t mtu_{0};
  uint32_t now_ms_{0};
  uint64_t sent_{0};
  uint64_t dropped_{0};
  uint64_t delivered_{0};
  uint64_t refused_{0};
};

} // namespace parcelink::transport
