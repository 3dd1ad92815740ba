/**
 * @file queue.hpp
 * @brief ParcelQueue: reliable chunked messaging over a small-MTU, lossy BLE link.
 *
 * @details
 * ## Field Brief
 * A BLE write carries a couple of hundred bytes and may silently vanish.
 * ParcelQueue turns that into "this payload arrived, whole and verified, once"
 * or "it did not, and here is why". It knows nothing about GATT, radios or
 * threads. It only knows **frames out** through a send function, **frames in**
 * through `on_data_received()`, and **time** through `tick(now_ms)`.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  host                          ParcelQueue                          peer
 *   │ enqueue(msg) ──────────► per-device FIFO
 *   │ tick(now) ─────────────► send state machine ── header, data... ──► reassembly
 *   │                               │  (paced, listen windows)             │
 *   │                               ◄──────────── receipt (JSON) ──────────┘
 *   │ on_data_received(dev, bytes) ─► receipts / headers / data
 *   │ get_outcome() ◄────────── delivered | failed(reason)
 *   │ get_completed() ◄──────── reassembled payloads from peers
 * ```
 *
 * One send state machine per device, advanced only by `tick()`:
 * ```
 *   Idle ─► Bursting ─► (Listening ─► Bursting)* ─► AwaitingReceipt
 *             ▲                                         │
 *             └──── missing / checksumFailed ───────────┤
 *                                                       ├─ complete ──► Idle (delivered)
 *   Backoff ◄──── timeout / budget exhausted ───────────┘
 *      └─► Bursting (next attempt) or Idle (dropped)
 * ```
 *
 * ---
 *
 * @par Timing
 * Every pause is a deadline, never a sleep:
 * - `inter_parcel_delay_ms` after each successful write,
 * - `listen_window_ms` after every `parcels_before_pause` writes,
 * - `receipt_timeout_ms` after the last write of a burst,
 * - `retry_backoff_ms` between failed attempts.
 * Call `tick()` at least as often as the smallest of these for the intended
 * pacing; a coarser tick just stretches the schedule.
 *
 * @par Re-entrancy
 * If the send function delivers a reply synchronously (straight back into
 * `on_data_received()` on this object), the reply is parked in a bounded inbox
 * and processed on the next `tick()`. Handlers run after all internal state is
 * updated, so a completed-message handler may call `enqueue()` or
 * `cancel_device()`.
 *
 * @par Failure Model
 * - `enqueue()` returns false: empty target, bad or duplicate id, queue full,
 *   payload too large for 65535 parcels.
 * - A write that returns Busy/Error (or throws) is logged and left for the
 *   receiver to report as missing.
 * - Malformed inbound frames are logged and dropped; no receipt is sent.
 * - Nothing here throws to the host.
 *
 * @par Minimal Usage Example
 * @code
 * parcelink::ParcelQueue q(my_ble_write);
 * parcelink::OutgoingMessage m;
 * m.target_device_id = "peer-1";
 * m.payload = bytes;
 * q.enqueue(std::move(m));
 *
 * // BLE notification callback:
 * q.on_data_received(dev, data, len, millis());
 *
 * // main loop:
 * q.tick(millis());
 * parcelink::SendOutcome o;
 * while (q.get_outcome(o)) { ... }
 * parcelink::CompletedMessage c;
 * while (q.get_completed(c)) { ... }
 * @endcode
 *
 * Not thread-safe. Hosts with several threads guard the object externally.
 */
#ifndef PARCELINK_QUEUE_HPP
#define PARCELINK_QUEUE_HPP

#include "etl/deque.h"
#include "parcelink/config.hpp"
#include "parcelink/log.hpp"
#include "parcelink/message.hpp"
#include "parcelink/receipt.hpp"
#include "parcelink/transport/link.hpp"
#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace parcelink {

using transport::SendFn;
using transport::TxResult;

class ParcelQueue {
public:
  /// @name Capacities (compile-time)
  ///@{
  static constexpr size_t OUTGOING_QUEUE_CAP   = 16;  ///< queued + active messages per device
  static constexpr size_t COMPLETED_CAP        = 16;  ///< completed-message outbox
  static constexpr size_t OUTCOME_CAP          = 32;  ///< send-outcome outbox
  static constexpr size_t INBOX_CAP            = 32;  ///< frames deferred from inside a send
  static constexpr size_t REPLAY_QUEUE_CAP     = 8;   ///< delayed retransmissions per device
  static constexpr size_t RECENT_COMPLETED_CAP = 32;  ///< at-most-once ring per device (aged out with sent records)
  static constexpr size_t MAX_ORPHAN_MESSAGES  = 4;   ///< headerless messages held per device
  static constexpr size_t MAX_ORPHAN_PARCELS   = 64;  ///< data parcels held per headerless message
  ///@}

  enum class SendPhase : uint8_t {
    Idle = 0,
    Bursting,
    Listening,
    AwaitingReceipt,
    Backoff,
  };

  using CompletedHandler = std::function<void(const CompletedMessage&)>;

  /**
   * @param send   Outbound frame writer; may be empty and set later.
   * @param config Tunables. An invalid config is replaced by defaults (logged).
   */
  explicit ParcelQueue(SendFn send = SendFn(), const Config& config = Config());

  void set_send_fn(SendFn send) { send_ = std::move(send); }

  const Config& config() const { return config_; }

  /// Replace the tunables. Rejected (false, logged) if `config.is_valid()` fails.
  bool set_config(const Config& config);

  Logger& logger() { return log_; }
  const Logger& logger() const { return log_; }

  // ---------- sending ----------

  /**
   * @brief Queue a message for its target device.
   *
   * An empty `msg_id` is filled from new_message_id(). `retry_count` is reset
   * and `enqueued_at` set to the last tick time.
   */
  bool enqueue(OutgoingMessage msg);

  /// Fresh six-letter id not used by any live sent record or pending send.
  MsgIdStr new_message_id();

  /// Restart the id sequence from `seed` (reproducible runs, tests).
  void seed_ids(uint32_t seed) { ids_.reseed(seed); }

  // ---------- receiving ----------

  /// Feed one frame read from `device_id`.
  void on_data_received(const std::string& device_id, const uint8_t* data, size_t len,
                        uint32_t now_ms);
  void on_data_received(const std::string& device_id, const Bytes& data, uint32_t now_ms) {
    on_data_received(device_id, data.data(), data.size(), now_ms);
  }

  /// Pop the oldest completed message (only used when no handler is set).
  bool get_completed(CompletedMessage& out);

  /**
   * @brief Ask `device_id` now for the parcels still missing from `msg_id`.
   *
   * Sends a `missing` receipt without waiting for the stall sweep and restarts
   * that message's nudge window. False if no reassembly for the pair is open.
   */
  bool request_missing(const std::string& device_id, const MsgIdStr& msg_id);

  /// Receive completed messages by callback instead of get_completed().
  void set_completed_handler(CompletedHandler handler) { on_completed_ = std::move(handler); }

  /// Pop the oldest send outcome.
  bool get_outcome(SendOutcome& out);

  // ---------- time ----------

  /// Advance every send state machine, drain deferred frames, run housekeeping when due.
  void tick(uint32_t now_ms);

  /// Run the retention / stall / abandonment sweep now.
  void housekeep(uint32_t now_ms);

  uint32_t now_ms() const { return now_ms_; }

  // ---------- introspection ----------

  size_t queue_length(const std::string& device_id) const;
  bool is_sending(const std::string& device_id) const;
  SendPhase phase(const std::string& device_id) const;
  size_t incoming_count(const std::string& device_id) const;
  size_t orphan_count(const std::string& device_id) const;
  size_t sent_record_count() const { return sent_records_.size(); }
  bool has_sent_record(const MsgIdStr& msg_id) const { return sent_records_.count(msg_id) != 0; }

  // ---------- control ----------

  /// Drop all state for one device; queued and active sends finish as Cancelled.
  bool cancel_device(const std::string& device_id);

  /// Drop all state for all devices and clear the outboxes.
  void reset();

private:
  struct ActiveSend {
    std::vector<Bytes> frames;        ///< [0] header, [1 + i] data parcel i
    std::vector<int32_t> to_send;     ///< -1 = header, otherwise data index
    size_t   cursor{0};
    uint16_t sent_in_burst{0};
    uint8_t  burst_cycles{0};
    uint32_t deadline{0};             ///< listen / receipt / backoff deadline
  };

  struct ReplayJob {
    MsgIdStr msg_id;
    std::vector<uint16_t> parcels;
    size_t cursor{0};
  };

  struct OrphanSet {
    MsgIdStr msg_id;
    std::vector<Parcel> parcels;
    uint32_t last_activity{0};
  };

  struct CompletedId {
    MsgIdStr msg_id;
    uint32_t completed_at{0};
  };

  struct DeviceState {
    etl::deque<OutgoingMessage, OUTGOING_QUEUE_CAP> outgoing;   ///< front = active
    SendPhase  phase{SendPhase::Idle};
    ActiveSend active;
    uint32_t   last_tx_at{0};           ///< time of the last successful write
    bool       tx_armed{false};         ///< false until the first write: no gap owed
    etl::deque<ReplayJob, REPLAY_QUEUE_CAP> replays;

    std::map<MsgIdStr, IncomingMessage> incoming;
    std::vector<OrphanSet> orphans;
    etl::deque<CompletedId, RECENT_COMPLETED_CAP> recent_completed;
  };

  struct InboundFrame {
    std::string device_id;
    Bytes data;
    uint32_t received_at{0};
  };

  // send side
  void step_device(const std::string& device_id, uint32_t now_ms);
  void start_attempt(const std::string& device_id, DeviceState& dev, uint32_t now_ms);
  void run_burst(const std::string& device_id, DeviceState& dev, uint32_t now_ms);
  void run_replays(const std::string& device_id, DeviceState& dev, uint32_t now_ms);
  void resolve_receipt(const std::string& device_id, DeviceState& dev,
                       const Receipt& receipt, uint32_t now_ms);
  void start_resend(const std::string& device_id, DeviceState& dev,
                    std::vector<int32_t> slots, uint32_t now_ms);
  void fail_attempt(const std::string& device_id, DeviceState& dev,
                    OutcomeReason reason, uint32_t now_ms);
  void finish_message(const std::string& device_id, DeviceState& dev,
                      bool delivered, OutcomeReason reason);
  TxResult transmit(const std::string& device_id, const Bytes& frame);
  bool tx_due(const DeviceState& dev, uint32_t now_ms) const;
  static void note_tx(DeviceState& dev, uint32_t now_ms);

  // receive side
  void process_frame(const std::string& device_id, const uint8_t* data, size_t len,
                     uint32_t now_ms);
  void drain_inbox();
  void handle_receipt(const std::string& device_id, const Receipt& receipt, uint32_t now_ms);
  void handle_unsolicited(const std::string& device_id, const Receipt& receipt);
  void handle_header(const std::string& device_id, const Parcel& header, uint32_t now_ms);
  void handle_data(const std::string& device_id, const Parcel& parcel, uint32_t now_ms);
  void buffer_orphan(const std::string& device_id, DeviceState& dev,
                     const Parcel& parcel, uint32_t now_ms);
  void check_complete(const std::string& device_id, DeviceState& dev,
                      const MsgIdStr& msg_id, uint32_t now_ms);
  void send_receipt(const std::string& device_id, const Receipt& receipt);
  void deliver_completed(CompletedMessage msg);
  void publish_outcome(const SendOutcome& outcome);

  static bool recently_completed(const DeviceState& dev, const MsgIdStr& msg_id);
  static void remember_completed(DeviceState& dev, const MsgIdStr& msg_id, uint32_t now_ms);
  std::vector<uint16_t> valid_indices(const std::vector<uint16_t>& requested, uint16_t total) const;
  bool msg_id_in_use(const MsgIdStr& msg_id) const;

  SendFn  send_;
  Config  config_;
  Logger  log_;
  CompletedHandler on_completed_;
  MsgIdGenerator ids_;

  std::map<std::string, DeviceState> devices_;
  std::map<MsgIdStr, std::string> pending_receipts_;        ///< msg_id -> device with an open attempt
  std::map<MsgIdStr, SentMessageRecord> sent_records_;

  etl::deque<InboundFrame, INBOX_CAP> inbox_;
  etl::deque<CompletedMessage, COMPLETED_CAP> completed_;
  etl::deque<SendOutcome, OUTCOME_CAP> outcomes_;

  uint32_t now_ms_{0};
  uint32_t last_housekeeping_at_{0};
  bool     ticked_{false};
  bool     in_transmit_{false};
};

/// Lowercase phase name for logs.
const char* phase_name(ParcelQueue::SendPhase phase);

} // namespace parcelink

#endif // PARCELINK_QUEUE_HPP
