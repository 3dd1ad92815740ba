// -----------------------------------------------------------------------------
// queue.cpp: Implementation of ParcelQueue
//
// API & field descriptions:
//   see include/parcelink/queue.hpp
//
// Runnable scenarios:
//   see tests/ (test_queue_send.cpp, test_queue_receive.cpp, test_scenarios.cpp)
//
// NOTE: This file is about *how* the send state machine, the reassembly path
// and the housekeeping sweep are driven. Every user callback (send function,
// completed handler) is invoked only after the state it could observe has
// been updated, and nothing holds an iterator across such a call unless the
// container cannot change underneath it.
// -----------------------------------------------------------------------------
#include "parcelink/queue.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#ifdef ARDUINO
  #include <Arduino.h>
#else
  #include <chrono>
#endif

namespace parcelink {

namespace {

constexpr int32_t HEADER_SLOT = -1;

std::vector<int32_t> all_slots(size_t data_parcels) {
  std::vector<int32_t> slots;
  slots.reserve(data_parcels + 1);
  slots.push_back(HEADER_SLOT);
  for (size_t i = 0; i < data_parcels; ++i) slots.push_back(static_cast<int32_t>(i));
  return slots;
}

// Restarted processes must not replay an earlier id sequence.
uint32_t clock_seed() {
#ifdef ARDUINO
  return static_cast<uint32_t>(micros()) ^ 0x5EED1234u;
#else
  const uint64_t t = static_cast<uint64_t>(
      std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return static_cast<uint32_t>(t ^ (t >> 32));
#endif
}

} // namespace

const char* phase_name(ParcelQueue::SendPhase phase) {
  switch (phase) {
    case ParcelQueue::SendPhase::Idle:            return "idle";
    case ParcelQueue::SendPhase::Bursting:        return "bursting";
    case ParcelQueue::SendPhase::Listening:       return "listening";
    case ParcelQueue::SendPhase::AwaitingReceipt: return "awaiting_receipt";
    case ParcelQueue::SendPhase::Backoff:         return "backoff";
  }
  return "unknown";
}

// ---------- public ----------

ParcelQueue::ParcelQueue(SendFn send, const Config& config)
: send_(std::move(send)), config_(config) {
  if (!config_.is_valid()) {
    log_.warn("config_invalid").kv("action", "using_defaults");
    config_ = Config();
  }
  ids_.reseed(config_.msg_id_seed != 0 ? config_.msg_id_seed : clock_seed());
}

bool ParcelQueue::set_config(const Config& config) {
  if (!config.is_valid()) {
    log_.warn("config_invalid").kv("action", "kept_previous");
    return false;
  }
  config_ = config;
  return true;
}

// -----------------------------------------------------------------------------
// enqueue(): validate and append to the target's FIFO.
// POLICY:
//   - The parcel-count limit is checked on the uncompressed size; compression
//     can only make the message smaller.
//   - An id already queued or in flight anywhere is refused, so a receipt can
//     always be routed to exactly one send.
// -----------------------------------------------------------------------------
bool ParcelQueue::enqueue(OutgoingMessage msg) {
  if (msg.target_device_id.empty()) {
    log_.warn("enqueue_rejected").kv("reason", "empty_target");
    return false;
  }

  if (msg.msg_id.empty()) {
    msg.msg_id = new_message_id();
  } else if (!is_valid_msg_id(msg.msg_id)) {
    log_.warn("enqueue_rejected").kv("reason", "invalid_msg_id").kv("dev", msg.target_device_id);
    return false;
  } else if (msg_id_in_use(msg.msg_id)) {
    log_.warn("enqueue_rejected").kv("reason", "duplicate_msg_id")
        .kv("msg", msg.msg_id.c_str()).kv("dev", msg.target_device_id);
    return false;
  }

  const size_t parcels = OutgoingMessage::parcel_count_for(msg.payload.size(), config_.max_parcel_size);
  if (parcels > MAX_DATA_PARCELS) {
    log_.warn("enqueue_rejected").kv("reason", "payload_too_large")
        .kv("msg", msg.msg_id.c_str()).kv("bytes", static_cast<uint64_t>(msg.payload.size()));
    return false;
  }

  DeviceState& dev = devices_[msg.target_device_id];
  if (dev.outgoing.full()) {
    log_.warn("enqueue_rejected").kv("reason", "queue_full")
        .kv("msg", msg.msg_id.c_str()).kv("dev", msg.target_device_id);
    return false;
  }

  msg.retry_count = 0;
  msg.enqueued_at = now_ms_;

  log_.debug("enqueued").kv("msg", msg.msg_id.c_str()).kv("dev", msg.target_device_id)
      .kv("bytes", static_cast<uint64_t>(msg.payload.size()))
      .kv("depth", static_cast<uint64_t>(dev.outgoing.size() + 1));

  dev.outgoing.push_back(std::move(msg));
  return true;
}

MsgIdStr ParcelQueue::new_message_id() {
  // Bound the attempts; with 26^6 ids a handful of collisions in a row does not happen.
  MsgIdStr id = ids_.next();
  for (size_t i = 0; i < 16 && msg_id_in_use(id); ++i) {
    id = ids_.next();
  }
  return id;
}

void ParcelQueue::on_data_received(const std::string& device_id, const uint8_t* data, size_t len,
                                   uint32_t now_ms) {
  if (!data || len == 0) {
    log_.warn("frame_dropped").kv("dev", device_id).kv("reason", "empty");
    return;
  }

  // Called from inside our own send function: park it until the next tick.
  if (in_transmit_) {
    if (inbox_.full()) {
      log_.warn("frame_dropped").kv("dev", device_id).kv("reason", "inbox_full");
      return;
    }
    InboundFrame f;
    f.device_id = device_id;
    f.data.assign(data, data + len);
    f.received_at = now_ms;
    inbox_.push_back(std::move(f));
    return;
  }

  process_frame(device_id, data, len, now_ms);
}

bool ParcelQueue::request_missing(const std::string& device_id, const MsgIdStr& msg_id) {
  auto dev = devices_.find(device_id);
  if (dev == devices_.end()) return false;
  auto in = dev->second.incoming.find(msg_id);
  if (in == dev->second.incoming.end() || in->second.is_complete()) return false;

  in->second.mark_missing_request_sent(now_ms_);
  const Receipt r = Receipt::missing(msg_id, in->second.missing_parcels());
  log_.info("missing_requested").kv("msg", msg_id.c_str()).kv("dev", device_id)
      .kv("count", static_cast<uint64_t>(r.missing_parcels.size())).kv("on_demand", true);
  send_receipt(device_id, r);
  return true;
}

bool ParcelQueue::get_completed(CompletedMessage& out) {
  if (completed_.empty()) return false;
  out = std::move(completed_.front());
  completed_.pop_front();
  return true;
}

bool ParcelQueue::get_outcome(SendOutcome& out) {
  if (outcomes_.empty()) return false;
  out = outcomes_.front();
  outcomes_.pop_front();
  return true;
}

// -----------------------------------------------------------------------------
// tick(): the only place time moves forward.
// ORDER:
//   1. frames deferred from inside a send (receipts first reach their sends),
//   2. every device's send state machine, over a snapshot of the device keys,
//   3. housekeeping, when its interval has elapsed.
// POLICY:
//   - A clock reading earlier than the last one is treated as "no time passed".
// -----------------------------------------------------------------------------
void ParcelQueue::tick(uint32_t now_ms) {
  if (!ticked_) {
    ticked_ = true;
    last_housekeeping_at_ = now_ms;
  } else if (!deadline_reached(now_ms, now_ms_)) {
    now_ms = now_ms_;
  }
  now_ms_ = now_ms;

  drain_inbox();

  std::vector<std::string> keys;
  keys.reserve(devices_.size());
  for (const auto& kv : devices_) keys.push_back(kv.first);
  for (const auto& key : keys) step_device(key, now_ms);

  if (elapsed_ms(now_ms, last_housekeeping_at_) >= config_.housekeeping_interval_ms) {
    housekeep(now_ms);
  }
}

// -----------------------------------------------------------------------------
// housekeep(): three sweeps, each collecting keys before touching a map.
//   1. sent records and remembered completed ids older than the retention
//      window are dropped,
//   2. incoming messages silent past the abandonment timeout are removed
//      (with their orphans); no receipt,
//   3. incoming messages silent past the request delay get a `missing`
//      receipt, at most once per delay window.
// Nudge receipts go out last, after all maps are consistent again.
// -----------------------------------------------------------------------------
void ParcelQueue::housekeep(uint32_t now_ms) {
  last_housekeeping_at_ = now_ms;

  // 1. retention
  std::vector<MsgIdStr> expired;
  for (const auto& kv : sent_records_) {
    if (elapsed_ms(now_ms, kv.second.sent_at) > config_.sent_message_retention_ms) {
      expired.push_back(kv.first);
    }
  }
  for (const auto& id : expired) {
    sent_records_.erase(id);
    log_.debug("sent_record_expired").kv("msg", id.c_str());
  }

  struct Nudge {
    std::string device_id;
    Receipt receipt;
  };
  std::vector<Nudge> nudges;

  for (auto& dkv : devices_) {
    DeviceState& dev = dkv.second;

    // completed ids age out with the same window; oldest sit at the front
    while (!dev.recent_completed.empty() &&
           elapsed_ms(now_ms, dev.recent_completed.front().completed_at) > config_.sent_message_retention_ms) {
      log_.debug("completed_id_expired").kv("msg", dev.recent_completed.front().msg_id.c_str())
          .kv("dev", dkv.first);
      dev.recent_completed.pop_front();
    }

    // 2. abandonment
    std::vector<MsgIdStr> stale;
    for (const auto& ikv : dev.incoming) {
      if (ikv.second.is_stale(now_ms, config_.incomplete_message_timeout_ms)) stale.push_back(ikv.first);
    }
    for (const auto& id : stale) {
      auto it = dev.incoming.find(id);
      log_.warn("incoming_abandoned").kv("msg", id.c_str()).kv("dev", dkv.first)
          .kv("received", static_cast<uint64_t>(it->second.received_count()))
          .kv("total", static_cast<uint32_t>(it->second.total_parcels()));
      dev.incoming.erase(it);
    }

    const size_t orphans_before = dev.orphans.size();
    dev.orphans.erase(
        std::remove_if(dev.orphans.begin(), dev.orphans.end(), [&](const OrphanSet& o) {
          return elapsed_ms(now_ms, o.last_activity) > config_.incomplete_message_timeout_ms;
        }),
        dev.orphans.end());
    if (dev.orphans.size() != orphans_before) {
      log_.warn("orphans_abandoned").kv("dev", dkv.first)
          .kv("count", static_cast<uint64_t>(orphans_before - dev.orphans.size()));
    }

    // 3. stall nudging
    for (auto& ikv : dev.incoming) {
      IncomingMessage& in = ikv.second;
      if (!in.needs_missing_request(now_ms, config_.missing_parcel_request_delay_ms)) continue;
      in.mark_missing_request_sent(now_ms);
      nudges.push_back(Nudge{dkv.first, Receipt::missing(ikv.first, in.missing_parcels())});
    }
  }

  for (const auto& n : nudges) {
    log_.info("missing_requested").kv("msg", n.receipt.msg_id.c_str()).kv("dev", n.device_id)
        .kv("count", static_cast<uint64_t>(n.receipt.missing_parcels.size()));
    send_receipt(n.device_id, n.receipt);
  }
}

size_t ParcelQueue::queue_length(const std::string& device_id) const {
  auto it = devices_.find(device_id);
  return it == devices_.end() ? 0 : it->second.outgoing.size();
}

bool ParcelQueue::is_sending(const std::string& device_id) const {
  return phase(device_id) != SendPhase::Idle;
}

ParcelQueue::SendPhase ParcelQueue::phase(const std::string& device_id) const {
  auto it = devices_.find(device_id);
  return it == devices_.end() ? SendPhase::Idle : it->second.phase;
}

size_t ParcelQueue::incoming_count(const std::string& device_id) const {
  auto it = devices_.find(device_id);
  return it == devices_.end() ? 0 : it->second.incoming.size();
}

size_t ParcelQueue::orphan_count(const std::string& device_id) const {
  auto it = devices_.find(device_id);
  return it == devices_.end() ? 0 : it->second.orphans.size();
}

// -----------------------------------------------------------------------------
// cancel_device(): forget a device in one step.
// OUT:
//   - One Cancelled outcome per queued message, active first.
//   - Sent records survive: they belong to the retention window, not the link.
// -----------------------------------------------------------------------------
bool ParcelQueue::cancel_device(const std::string& device_id) {
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return false;

  std::vector<SendOutcome> cancelled;
  for (const auto& m : it->second.outgoing) {
    SendOutcome o;
    o.msg_id = m.msg_id;
    o.target_device_id = device_id;
    o.delivered = false;
    o.retries = m.retry_count;
    o.reason = OutcomeReason::Cancelled;
    cancelled.push_back(o);
  }

  for (auto p = pending_receipts_.begin(); p != pending_receipts_.end();) {
    if (p->second == device_id) p = pending_receipts_.erase(p);
    else ++p;
  }

  log_.info("device_cancelled").kv("dev", device_id)
      .kv("outgoing", static_cast<uint64_t>(cancelled.size()))
      .kv("incoming", static_cast<uint64_t>(it->second.incoming.size()));

  devices_.erase(it);

  for (const auto& o : cancelled) publish_outcome(o);
  return true;
}

void ParcelQueue::reset() {
  devices_.clear();
  pending_receipts_.clear();
  sent_records_.clear();
  inbox_.clear();
  completed_.clear();
  outcomes_.clear();
  ticked_ = false;
  now_ms_ = 0;
  last_housekeeping_at_ = 0;
  log_.info("reset");
}

// ---------- private: send side ----------

// -----------------------------------------------------------------------------
// step_device(): advance one device's send state machine.
// POLICY:
//   - Replays (delayed retransmissions) use the channel only while no burst
//     is on it: in Idle, AwaitingReceipt and Backoff.
//   - In Idle, pending replays go before the next queued message.
// -----------------------------------------------------------------------------
void ParcelQueue::step_device(const std::string& device_id, uint32_t now_ms) {
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return;
  DeviceState& dev = it->second;

  switch (dev.phase) {
    case SendPhase::Idle:
      if (!dev.replays.empty()) {
        run_replays(device_id, dev, now_ms);
        if (!dev.replays.empty()) return;
      }
      if (!dev.outgoing.empty() && send_) start_attempt(device_id, dev, now_ms);
      return;

    case SendPhase::Bursting:
      run_burst(device_id, dev, now_ms);
      return;

    case SendPhase::Listening:
      if (deadline_reached(now_ms, dev.active.deadline)) {
        dev.phase = SendPhase::Bursting;
        run_burst(device_id, dev, now_ms);
      }
      return;

    case SendPhase::AwaitingReceipt:
      if (deadline_reached(now_ms, dev.active.deadline)) {
        log_.warn("receipt_timeout").kv("msg", dev.outgoing.front().msg_id.c_str()).kv("dev", device_id);
        fail_attempt(device_id, dev, OutcomeReason::ReceiptTimeout, now_ms);
        return;
      }
      run_replays(device_id, dev, now_ms);
      return;

    case SendPhase::Backoff:
      if (deadline_reached(now_ms, dev.active.deadline)) {
        start_attempt(device_id, dev, now_ms);
        return;
      }
      run_replays(device_id, dev, now_ms);
      return;
  }
}

// -----------------------------------------------------------------------------
// start_attempt(): derive parcels, refresh the sent record, open the burst.
// PRE:   dev.outgoing is not empty.
// OUT:
//   - sent_records_[id] holds this attempt's frames, sent_at = now.
//   - pending_receipts_[id] = device for the whole attempt, so a receipt that
//     arrives mid-burst still resolves it.
// -----------------------------------------------------------------------------
void ParcelQueue::start_attempt(const std::string& device_id, DeviceState& dev, uint32_t now_ms) {
  if (!send_) {
    dev.phase = SendPhase::Idle;
    return;
  }

  const OutgoingMessage& msg = dev.outgoing.front();
  const ParcelSet set = msg.to_parcels(config_.max_parcel_size, config_.compression_threshold);

  dev.active = ActiveSend();
  dev.active.frames.reserve(set.size());
  dev.active.frames.push_back(encode(set.header));
  for (const auto& p : set.data) dev.active.frames.push_back(encode(p));

  SentMessageRecord& rec = sent_records_[msg.msg_id];
  rec.msg_id = msg.msg_id;
  rec.target_device_id = device_id;
  rec.frames = dev.active.frames;
  rec.sent_at = now_ms;

  pending_receipts_[msg.msg_id] = device_id;

  dev.active.to_send = all_slots(set.data.size());
  dev.active.burst_cycles = 1;
  dev.phase = SendPhase::Bursting;

  log_.info("send_start").kv("msg", msg.msg_id.c_str()).kv("dev", device_id)
      .kv("parcels", static_cast<uint64_t>(set.data.size()))
      .kv("attempt", static_cast<int>(msg.retry_count) + 1)
      .kv("compressed", set.header.is_compressed());

  run_burst(device_id, dev, now_ms);
}

// -----------------------------------------------------------------------------
// run_burst(): write due frames from to_send.
// POLICY:
//   - A write is due once inter_parcel_delay_ms has elapsed since the last
//     successful one (immediately if there was none).
//   - A failed write is logged and skipped; it costs no delay and does not
//     count toward the listen window.
//   - After every parcels_before_pause successful writes (but not after the
//     last frame) the device listens for listen_window_ms, measured from when
//     the next write would have been due.
// OUT:
//   - Burst finished: AwaitingReceipt with deadline now + receipt_timeout_ms.
// -----------------------------------------------------------------------------
void ParcelQueue::run_burst(const std::string& device_id, DeviceState& dev, uint32_t now_ms) {
  ActiveSend& a = dev.active;

  while (a.cursor < a.to_send.size()) {
    if (!tx_due(dev, now_ms)) return;

    const int32_t slot = a.to_send[a.cursor];
    const Bytes& frame = a.frames[static_cast<size_t>(slot + 1)];

    const TxResult r = transmit(device_id, frame);
    ++a.cursor;
    if (r != TxResult::Ok) {
      log_.warn("parcel_send_failed").kv("msg", dev.outgoing.front().msg_id.c_str())
          .kv("dev", device_id).kv("parcel", static_cast<int64_t>(slot))
          .kv("result", transport::tx_result_name(r));
      continue;
    }

    note_tx(dev, now_ms);
    ++a.sent_in_burst;

    if (a.cursor < a.to_send.size() && a.sent_in_burst % config_.parcels_before_pause == 0) {
      const uint32_t from = tx_due(dev, now_ms) ? now_ms : dev.last_tx_at + config_.inter_parcel_delay_ms;
      a.deadline = from + config_.listen_window_ms;
      dev.phase = SendPhase::Listening;
      log_.debug("listen_window").kv("dev", device_id)
          .kv("after", static_cast<uint32_t>(a.sent_in_burst));
      return;
    }
  }

  dev.phase = SendPhase::AwaitingReceipt;
  a.deadline = now_ms + config_.receipt_timeout_ms;
  log_.debug("burst_done").kv("msg", dev.outgoing.front().msg_id.c_str()).kv("dev", device_id)
      .kv("sent", static_cast<uint32_t>(a.sent_in_burst))
      .kv("cycle", static_cast<int>(a.burst_cycles));
}

// -----------------------------------------------------------------------------
// run_replays(): answer delayed `missing` requests from the sent records.
// POLICY:
//   - Same pacing as a burst; frames come from the record, so a replay sends
//     exactly what the last attempt sent.
//   - A record that expired while the job waited ends the job.
// -----------------------------------------------------------------------------
void ParcelQueue::run_replays(const std::string& device_id, DeviceState& dev, uint32_t now_ms) {
  while (!dev.replays.empty() && tx_due(dev, now_ms)) {
    ReplayJob& job = dev.replays.front();

    auto rec = sent_records_.find(job.msg_id);
    if (rec == sent_records_.end()) {
      log_.warn("retransmit_unavailable").kv("msg", job.msg_id.c_str()).kv("dev", device_id)
          .kv("reason", "not_in_retention").kv("detail", "cannot retransmit, not in retention");
      dev.replays.pop_front();
      continue;
    }

    if (job.cursor < job.parcels.size()) {
      const uint16_t num = job.parcels[job.cursor++];
      const Bytes* frame = rec->second.data_frame(num);
      if (frame) {
        const TxResult r = transmit(device_id, *frame);
        if (r == TxResult::Ok) {
          note_tx(dev, now_ms);
        } else {
          log_.warn("parcel_send_failed").kv("msg", job.msg_id.c_str()).kv("dev", device_id)
              .kv("parcel", static_cast<int>(num)).kv("result", transport::tx_result_name(r))
              .kv("replay", true);
        }
      }
    }

    if (job.cursor >= job.parcels.size()) {
      log_.info("replay_done").kv("msg", job.msg_id.c_str()).kv("dev", device_id)
          .kv("parcels", static_cast<uint64_t>(job.parcels.size()));
      dev.replays.pop_front();
    }
  }
}

// -----------------------------------------------------------------------------
// resolve_receipt(): a receipt for the attempt this device has open.
//   complete       -> delivered
//   missing        -> resend exactly the listed (valid, de-duplicated) indices
//   checksumFailed -> resend header + every data parcel
// A `missing` list with nothing usable in it fails the attempt.
// -----------------------------------------------------------------------------
void ParcelQueue::resolve_receipt(const std::string& device_id, DeviceState& dev,
                                  const Receipt& receipt, uint32_t now_ms) {
  log_.info("receipt").kv("msg", receipt.msg_id.c_str()).kv("dev", device_id)
      .kv("status", status_name(receipt.status)).kv("phase", phase_name(dev.phase));

  const uint16_t total = static_cast<uint16_t>(dev.active.frames.size() - 1);

  switch (receipt.status) {
    case ReceiptStatus::Complete:
      finish_message(device_id, dev, true, OutcomeReason::Delivered);
      return;

    case ReceiptStatus::Missing: {
      const std::vector<uint16_t> wanted = valid_indices(receipt.missing_parcels, total);
      if (wanted.empty()) {
        log_.warn("missing_list_empty").kv("msg", receipt.msg_id.c_str()).kv("dev", device_id)
            .kv("requested", static_cast<uint64_t>(receipt.missing_parcels.size()));
        fail_attempt(device_id, dev, OutcomeReason::EmptyMissingList, now_ms);
        return;
      }
      std::vector<int32_t> slots(wanted.begin(), wanted.end());
      start_resend(device_id, dev, std::move(slots), now_ms);
      return;
    }

    case ReceiptStatus::ChecksumFailed:
      start_resend(device_id, dev, all_slots(total), now_ms);
      return;
  }
}

void ParcelQueue::start_resend(const std::string& device_id, DeviceState& dev,
                               std::vector<int32_t> slots, uint32_t now_ms) {
  ActiveSend& a = dev.active;
  if (config_.max_resend_cycles != 0 && a.burst_cycles >= config_.max_resend_cycles) {
    log_.warn("resend_cycles_exhausted").kv("msg", dev.outgoing.front().msg_id.c_str())
        .kv("dev", device_id).kv("cycles", static_cast<int>(a.burst_cycles));
    fail_attempt(device_id, dev, OutcomeReason::ResendCyclesExhausted, now_ms);
    return;
  }

  ++a.burst_cycles;
  a.to_send = std::move(slots);
  a.cursor = 0;
  a.sent_in_burst = 0;
  dev.phase = SendPhase::Bursting;

  auto rec = sent_records_.find(dev.outgoing.front().msg_id);
  if (rec != sent_records_.end()) rec->second.sent_at = now_ms;

  log_.info("resend").kv("msg", dev.outgoing.front().msg_id.c_str()).kv("dev", device_id)
      .kv("parcels", static_cast<uint64_t>(a.to_send.size()))
      .kv("cycle", static_cast<int>(a.burst_cycles));
}

// -----------------------------------------------------------------------------
// fail_attempt(): count the failure against max_retries.
// OUT:
//   - retry_count < max_retries: Backoff for retry_backoff_ms, then a fresh attempt.
//   - otherwise the message is dropped with a failed outcome.
// -----------------------------------------------------------------------------
void ParcelQueue::fail_attempt(const std::string& device_id, DeviceState& dev,
                               OutcomeReason reason, uint32_t now_ms) {
  OutgoingMessage& msg = dev.outgoing.front();
  pending_receipts_.erase(msg.msg_id);
  ++msg.retry_count;

  if (msg.retry_count >= config_.max_retries) {
    log_.error("message_dropped").kv("msg", msg.msg_id.c_str()).kv("dev", device_id)
        .kv("reason", outcome_reason_name(reason)).kv("retries", static_cast<int>(msg.retry_count));
    finish_message(device_id, dev, false, reason);
    return;
  }

  log_.warn("attempt_failed").kv("msg", msg.msg_id.c_str()).kv("dev", device_id)
      .kv("reason", outcome_reason_name(reason))
      .kv("retry", static_cast<int>(msg.retry_count))
      .kv("max", static_cast<int>(config_.max_retries));

  dev.active = ActiveSend();
  dev.active.deadline = now_ms + config_.retry_backoff_ms;
  dev.phase = SendPhase::Backoff;
}

void ParcelQueue::finish_message(const std::string& device_id, DeviceState& dev,
                                 bool delivered, OutcomeReason reason) {
  const OutgoingMessage& msg = dev.outgoing.front();

  SendOutcome o;
  o.msg_id = msg.msg_id;
  o.target_device_id = device_id;
  o.delivered = delivered;
  o.retries = msg.retry_count;
  o.reason = reason;

  pending_receipts_.erase(msg.msg_id);
  dev.outgoing.pop_front();
  dev.active = ActiveSend();
  dev.phase = SendPhase::Idle;

  if (delivered) {
    log_.info("delivered").kv("msg", o.msg_id.c_str()).kv("dev", device_id)
        .kv("retries", static_cast<int>(o.retries));
  }
  publish_outcome(o);
}

TxResult ParcelQueue::transmit(const std::string& device_id, const Bytes& frame) {
  if (!send_) return TxResult::Error;

  const bool was_in_transmit = in_transmit_;
  in_transmit_ = true;

  TxResult r = TxResult::Error;
  try {
    r = send_(device_id, frame.data(), frame.size());
  }
  catch (const std::exception& e) {
    log_.error("send_threw").kv("dev", device_id).kv("what", e.what());
    r = TxResult::Error;
  }

  in_transmit_ = was_in_transmit;
  return r;
}

bool ParcelQueue::tx_due(const DeviceState& dev, uint32_t now_ms) const {
  return !dev.tx_armed || elapsed_ms(now_ms, dev.last_tx_at) >= config_.inter_parcel_delay_ms;
}

void ParcelQueue::note_tx(DeviceState& dev, uint32_t now_ms) {
  dev.last_tx_at = now_ms;
  dev.tx_armed = true;
}

// ---------- private: receive side ----------

// -----------------------------------------------------------------------------
// process_frame(): route one inbound frame by its leading type byte.
// POLICY:
//   - Malformed frames of any type are logged and dropped, never answered.
// -----------------------------------------------------------------------------
void ParcelQueue::process_frame(const std::string& device_id, const uint8_t* data, size_t len,
                                uint32_t now_ms) {
  switch (frame_type(data, len)) {
    case FrameType::Receipt: {
      auto r = decode_receipt(data, len);
      if (!r) {
        log_.warn("frame_dropped").kv("dev", device_id).kv("reason", "malformed_receipt")
            .kv("len", static_cast<uint64_t>(len));
        return;
      }
      handle_receipt(device_id, *r, now_ms);
      return;
    }

    case FrameType::Header: {
      auto p = decode_as_header(data, len);
      if (!p) {
        log_.warn("frame_dropped").kv("dev", device_id).kv("reason", "malformed_header")
            .kv("len", static_cast<uint64_t>(len));
        return;
      }
      handle_header(device_id, *p, now_ms);
      return;
    }

    case FrameType::Data: {
      auto p = decode_as_data(data, len);
      if (!p) {
        log_.warn("frame_dropped").kv("dev", device_id).kv("reason", "malformed_data")
            .kv("len", static_cast<uint64_t>(len));
        return;
      }
      handle_data(device_id, *p, now_ms);
      return;
    }

    case FrameType::Unknown:
      break;
  }

  log_.warn("frame_dropped").kv("dev", device_id).kv("reason", "unknown_frame_type")
      .kv("type", static_cast<uint32_t>(data[0]));
}

void ParcelQueue::drain_inbox() {
  // Only what is queued now; replies produced while draining wait a tick.
  size_t budget = inbox_.size();
  while (budget-- > 0 && !inbox_.empty()) {
    InboundFrame f = std::move(inbox_.front());
    inbox_.pop_front();
    process_frame(f.device_id, f.data.data(), f.data.size(), f.received_at);
  }
}

void ParcelQueue::handle_receipt(const std::string& device_id, const Receipt& receipt,
                                 uint32_t now_ms) {
  auto pending = pending_receipts_.find(receipt.msg_id);
  if (pending != pending_receipts_.end()) {
    const std::string target = pending->second;
    auto dev = devices_.find(target);
    if (dev != devices_.end() && dev->second.phase != SendPhase::Idle &&
        dev->second.phase != SendPhase::Backoff && !dev->second.outgoing.empty() &&
        dev->second.outgoing.front().msg_id == receipt.msg_id) {
      resolve_receipt(target, dev->second, receipt, now_ms);
      return;
    }
    pending_receipts_.erase(pending);          // no attempt behind it any more
  }

  handle_unsolicited(device_id, receipt);
}

// -----------------------------------------------------------------------------
// handle_unsolicited(): a receipt no open attempt is waiting for.
// POLICY:
//   - `missing`: queue a replay on the record's target device if the record is
//     still within retention; otherwise log and drop.
//   - anything else: logged, nothing to do.
// -----------------------------------------------------------------------------
void ParcelQueue::handle_unsolicited(const std::string& device_id, const Receipt& receipt) {
  if (receipt.status != ReceiptStatus::Missing) {
    log_.debug("receipt_unsolicited").kv("msg", receipt.msg_id.c_str()).kv("dev", device_id)
        .kv("status", status_name(receipt.status));
    return;
  }

  auto rec = sent_records_.find(receipt.msg_id);
  if (rec == sent_records_.end()) {
    log_.warn("retransmit_unavailable").kv("msg", receipt.msg_id.c_str()).kv("dev", device_id)
        .kv("reason", "not_in_retention").kv("detail", "cannot retransmit, not in retention");
    return;
  }

  std::vector<uint16_t> wanted = valid_indices(receipt.missing_parcels, rec->second.total_parcels());
  if (wanted.empty()) {
    log_.warn("missing_list_empty").kv("msg", receipt.msg_id.c_str()).kv("dev", device_id)
        .kv("requested", static_cast<uint64_t>(receipt.missing_parcels.size()));
    return;
  }

  const std::string target = rec->second.target_device_id;
  DeviceState& dev = devices_[target];
  if (dev.replays.full()) {
    log_.warn("replay_dropped").kv("msg", receipt.msg_id.c_str()).kv("dev", target)
        .kv("reason", "replay_queue_full");
    return;
  }

  log_.info("replay_queued").kv("msg", receipt.msg_id.c_str()).kv("dev", target)
      .kv("parcels", static_cast<uint64_t>(wanted.size()));

  ReplayJob job;
  job.msg_id = receipt.msg_id;
  job.parcels = std::move(wanted);
  dev.replays.push_back(std::move(job));
}

// -----------------------------------------------------------------------------
// handle_header(): first header opens the buffer; later ones are ignored.
// POLICY:
//   - A header for a recently completed id means our `complete` receipt was
//     lost: answer `complete` again, deliver nothing.
//   - Data parcels parked in the orphan buffer are merged in.
//   - total_parcels == 0 completes on the header alone.
// -----------------------------------------------------------------------------
void ParcelQueue::handle_header(const std::string& device_id, const Parcel& header, uint32_t now_ms) {
  DeviceState& dev = devices_[device_id];

  if (recently_completed(dev, header.msg_id)) {
    log_.debug("header_for_completed").kv("msg", header.msg_id.c_str()).kv("dev", device_id);
    send_receipt(device_id, Receipt::complete(header.msg_id));
    return;
  }

  if (dev.incoming.count(header.msg_id)) {
    log_.debug("header_duplicate").kv("msg", header.msg_id.c_str()).kv("dev", device_id);
    return;
  }

  auto ins = dev.incoming.emplace(header.msg_id, IncomingMessage(header, device_id, now_ms));
  IncomingMessage& in = ins.first->second;

  size_t merged = 0;
  auto orphan = std::find_if(dev.orphans.begin(), dev.orphans.end(),
                             [&](const OrphanSet& o) { return o.msg_id == header.msg_id; });
  if (orphan != dev.orphans.end()) {
    for (const auto& p : orphan->parcels) {
      if (in.add_parcel(p, now_ms) == IncomingMessage::AddResult::Added) ++merged;
    }
    dev.orphans.erase(orphan);
  }

  log_.info("incoming_start").kv("msg", header.msg_id.c_str()).kv("dev", device_id)
      .kv("total", static_cast<uint32_t>(header.total_parcels))
      .kv("compressed", header.is_compressed())
      .kv("merged", static_cast<uint64_t>(merged));

  check_complete(device_id, dev, header.msg_id, now_ms);
}

void ParcelQueue::handle_data(const std::string& device_id, const Parcel& parcel, uint32_t now_ms) {
  DeviceState& dev = devices_[device_id];

  if (recently_completed(dev, parcel.msg_id)) {
    log_.debug("data_for_completed").kv("msg", parcel.msg_id.c_str()).kv("dev", device_id)
        .kv("parcel", static_cast<int>(parcel.parcel_num));
    return;
  }

  auto it = dev.incoming.find(parcel.msg_id);
  if (it == dev.incoming.end()) {
    buffer_orphan(device_id, dev, parcel, now_ms);
    return;
  }

  switch (it->second.add_parcel(parcel, now_ms)) {
    case IncomingMessage::AddResult::Added:
      check_complete(device_id, dev, parcel.msg_id, now_ms);
      return;
    case IncomingMessage::AddResult::Duplicate:
      log_.debug("parcel_duplicate").kv("msg", parcel.msg_id.c_str()).kv("dev", device_id)
          .kv("parcel", static_cast<int>(parcel.parcel_num));
      return;
    case IncomingMessage::AddResult::OutOfRange:
      log_.warn("parcel_out_of_range").kv("msg", parcel.msg_id.c_str()).kv("dev", device_id)
          .kv("parcel", static_cast<int>(parcel.parcel_num))
          .kv("total", static_cast<uint32_t>(it->second.total_parcels()));
      return;
    case IncomingMessage::AddResult::WrongMessage:
      return;
  }
}

void ParcelQueue::buffer_orphan(const std::string& device_id, DeviceState& dev,
                                const Parcel& parcel, uint32_t now_ms) {
  auto orphan = std::find_if(dev.orphans.begin(), dev.orphans.end(),
                             [&](const OrphanSet& o) { return o.msg_id == parcel.msg_id; });

  if (orphan == dev.orphans.end()) {
    if (dev.orphans.size() >= MAX_ORPHAN_MESSAGES) {
      log_.warn("parcel_dropped").kv("msg", parcel.msg_id.c_str()).kv("dev", device_id)
          .kv("parcel", static_cast<int>(parcel.parcel_num)).kv("reason", "unknown_message");
      return;
    }
    OrphanSet set;
    set.msg_id = parcel.msg_id;
    dev.orphans.push_back(std::move(set));
    orphan = dev.orphans.end() - 1;
  }

  const bool held = std::any_of(orphan->parcels.begin(), orphan->parcels.end(),
                                [&](const Parcel& p) { return p.parcel_num == parcel.parcel_num; });
  if (held) return;

  if (orphan->parcels.size() >= MAX_ORPHAN_PARCELS) {
    log_.warn("parcel_dropped").kv("msg", parcel.msg_id.c_str()).kv("dev", device_id)
        .kv("parcel", static_cast<int>(parcel.parcel_num)).kv("reason", "orphan_buffer_full");
    return;
  }

  orphan->parcels.push_back(parcel);
  orphan->last_activity = now_ms;
  log_.debug("parcel_orphaned").kv("msg", parcel.msg_id.c_str()).kv("dev", device_id)
      .kv("parcel", static_cast<int>(parcel.parcel_num));
}

// -----------------------------------------------------------------------------
// check_complete(): the completeness + checksum gate.
// OUT:
//   - Ok:       entry removed, id remembered, `complete` sent, payload delivered.
//   - failure:  entry removed, `checksumFailed` sent (a bad inflate counts too).
// The receipt and the handler run after the maps are updated.
// -----------------------------------------------------------------------------
void ParcelQueue::check_complete(const std::string& device_id, DeviceState& dev,
                                 const MsgIdStr& msg_id, uint32_t now_ms) {
  auto it = dev.incoming.find(msg_id);
  if (it == dev.incoming.end() || !it->second.is_complete()) return;

  Bytes payload;
  const IncomingMessage::AssembleStatus st = it->second.assemble(payload);
  const uint32_t total = it->second.total_parcels();
  dev.incoming.erase(it);

  if (st != IncomingMessage::AssembleStatus::Ok) {
    const char* reason = (st == IncomingMessage::AssembleStatus::DecompressFailed)
                             ? "decompress_failed" : "checksum_mismatch";
    log_.warn("incoming_rejected").kv("msg", msg_id.c_str()).kv("dev", device_id)
        .kv("reason", reason);
    send_receipt(device_id, Receipt::checksum_failed(msg_id));
    return;
  }

  remember_completed(dev, msg_id, now_ms);

  CompletedMessage done;
  done.msg_id = msg_id;
  done.source_device_id = device_id;
  done.payload = std::move(payload);
  done.received_at = now_ms;

  log_.info("incoming_complete").kv("msg", msg_id.c_str()).kv("dev", device_id)
      .kv("parcels", total).kv("bytes", static_cast<uint64_t>(done.payload.size()));

  send_receipt(device_id, Receipt::complete(msg_id));
  deliver_completed(std::move(done));
}

void ParcelQueue::send_receipt(const std::string& device_id, const Receipt& receipt) {
  const Bytes frame = encode_receipt(receipt);
  const TxResult r = transmit(device_id, frame);
  if (r != TxResult::Ok) {
    log_.warn("receipt_send_failed").kv("msg", receipt.msg_id.c_str()).kv("dev", device_id)
        .kv("status", status_name(receipt.status)).kv("result", transport::tx_result_name(r));
  }
}

void ParcelQueue::deliver_completed(CompletedMessage msg) {
  if (on_completed_) {
    try {
      on_completed_(msg);
    }
    catch (const std::exception& e) {
      log_.error("completed_handler_threw").kv("msg", msg.msg_id.c_str()).kv("what", e.what());
    }
    return;
  }

  if (completed_.full()) {
    log_.error("completed_dropped").kv("msg", msg.msg_id.c_str())
        .kv("dev", msg.source_device_id).kv("reason", "outbox_full");
    return;
  }
  completed_.push_back(std::move(msg));
}

void ParcelQueue::publish_outcome(const SendOutcome& outcome) {
  if (outcomes_.full()) {
    // keep the newest: the oldest has been sitting unread the longest
    const SendOutcome& lost = outcomes_.front();
    log_.error("outcome_dropped").kv("msg", lost.msg_id.c_str()).kv("dev", lost.target_device_id)
        .kv("reason", outcome_reason_name(lost.reason));
    outcomes_.pop_front();
  }
  outcomes_.push_back(outcome);
}

// ---------- private: helpers ----------

bool ParcelQueue::recently_completed(const DeviceState& dev, const MsgIdStr& msg_id) {
  return std::any_of(dev.recent_completed.begin(), dev.recent_completed.end(),
                     [&](const CompletedId& c) { return c.msg_id == msg_id; });
}

void ParcelQueue::remember_completed(DeviceState& dev, const MsgIdStr& msg_id, uint32_t now_ms) {
  if (dev.recent_completed.full()) dev.recent_completed.pop_front();
  CompletedId c;
  c.msg_id = msg_id;
  c.completed_at = now_ms;
  dev.recent_completed.push_back(c);
}

std::vector<uint16_t> ParcelQueue::valid_indices(const std::vector<uint16_t>& requested,
                                                 uint16_t total) const {
  std::vector<uint16_t> out;
  out.reserve(std::min<size_t>(requested.size(), total));
  std::vector<bool> seen(total, false);
  for (uint16_t idx : requested) {
    if (idx >= total || seen[idx]) continue;
    seen[idx] = true;
    out.push_back(idx);
  }
  return out;
}

bool ParcelQueue::msg_id_in_use(const MsgIdStr& msg_id) const {
  if (pending_receipts_.count(msg_id)) return true;
  if (sent_records_.count(msg_id)) return true;
  for (const auto& kv : devices_) {
    for (const auto& m : kv.second.outgoing) {
      if (m.msg_id == msg_id) return true;
    }
  }
  return false;
}

} // namespace parcelink
