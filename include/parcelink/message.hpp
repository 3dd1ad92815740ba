/**
 * @file message.hpp
 * @brief Message model: what the queue holds on each side of the link.
 *
 * @details
 * ## Sender side
 * - `OutgoingMessage`: one queued payload for one target device. Its parcel set
 *   is a pure function of (payload, max_parcel_size, compression decision), so
 *   re-deriving it for a retry yields byte-identical frames.
 * - `SentMessageRecord`: the encoded frames of the last attempt, kept for
 *   `sent_message_retention_ms` so a late `missing` receipt can be answered.
 * - `SendOutcome`: the final word on a message, delivered or not, and why.
 *
 * ## Receiver side
 * - `IncomingMessage`: sparse reassembly buffer for one message id, created from
 *   its header parcel.
 * - `CompletedMessage`: a reassembled, checksum-verified, decompressed payload.
 *
 * ## Ids
 * - `MsgIdGenerator`: short uppercase ids for callers that do not bring their own.
 *
 * None of these types know about time sources or transports; every timestamp is
 * passed in by the caller as a 32-bit monotonic millisecond reading.
 */
#ifndef PARCELINK_MESSAGE_HPP
#define PARCELINK_MESSAGE_HPP

#include "parcelink/config.hpp"
#include "parcelink/compression.hpp"
#include "parcelink/parcel.hpp"
#include <stdint.h>
#include <stddef.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace parcelink {

/// Header plus data parcels of one message, in send order.
struct ParcelSet {
  Parcel header;
  std::vector<Parcel> data;

  size_t size() const { return data.size() + 1; }
};

// ---------- sender side ----------

struct OutgoingMessage {
  std::string target_device_id;
  MsgIdStr    msg_id;                          ///< empty: the queue assigns one
  Bytes       payload;
  uint8_t     retry_count{0};                  ///< failed attempts so far
  uint32_t    enqueued_at{0};
  bool        peer_supports_compression{false};

  /**
   * @brief Split the payload into a header and data parcels.
   *
   * When the peer supports compression and `should_compress()` agrees, the
   * payload is deflated first and kept compressed only if strictly smaller.
   * The header checksum covers the bytes actually carried by the data parcels.
   */
  ParcelSet to_parcels(size_t max_parcel_size,
                       size_t compression_threshold = compression::DEFAULT_THRESHOLD) const;

  /// Data parcels needed for `payload_len` bytes (0 for an empty payload).
  static size_t parcel_count_for(size_t payload_len, size_t max_parcel_size);
};

/**
 * @brief Encoded frames of the most recent attempt of a message.
 *
 * `frames[0]` is the header; `frames[1 + i]` is data parcel `i`.
 */
struct SentMessageRecord {
  MsgIdStr           msg_id;
  std::string        target_device_id;
  std::vector<Bytes> frames;
  uint32_t           sent_at{0};

  uint16_t total_parcels() const {
    return frames.empty() ? 0 : static_cast<uint16_t>(frames.size() - 1);
  }

  /// Encoded data parcel `num`, or nullptr if out of range.
  const Bytes* data_frame(uint16_t num) const {
    const size_t i = static_cast<size_t>(num) + 1;
    return i < frames.size() ? &frames[i] : nullptr;
  }
};

enum class OutcomeReason : uint8_t {
  Delivered = 0,
  ReceiptTimeout,
  ResendCyclesExhausted,
  EmptyMissingList,
  Cancelled,
};

/// Snake-case name used in logs and CLI output.
const char* outcome_reason_name(OutcomeReason reason);

struct SendOutcome {
  MsgIdStr      msg_id;
  std::string   target_device_id;
  bool          delivered{false};
  uint8_t       retries{0};                    ///< failed attempts before the outcome
  OutcomeReason reason{OutcomeReason::Delivered};
};

// ---------- receiver side ----------

struct CompletedMessage {
  MsgIdStr    msg_id;
  std::string source_device_id;
  Bytes       payload;
  uint32_t    received_at{0};
};

/**
 * @class IncomingMessage
 * @brief Sparse reassembly buffer for one message id from one device.
 *
 * Parcel bytes are stored by index. Re-adding an index is a no-op: the first
 * copy wins and the received count is not bumped.
 */
class IncomingMessage {
public:
  enum class AddResult : uint8_t {
    Added = 0,
    Duplicate,          ///< index already held
    OutOfRange,         ///< parcel_num >= total_parcels
    WrongMessage,       ///< header parcel, or a different msg id
  };

  enum class AssembleStatus : uint8_t {
    Ok = 0,
    Incomplete,
    ChecksumMismatch,
    DecompressFailed,
  };

  IncomingMessage() = default;

  /// Start a buffer from a header parcel.
  IncomingMessage(const Parcel& header, const std::string& source_device_id, uint32_t now_ms);

  AddResult add_parcel(const Parcel& parcel, uint32_t now_ms);

  bool is_complete() const { return parcels_.size() == total_parcels_; }
  size_t received_count() const { return parcels_.size(); }

  /// Indices in [0, total) not yet received, ascending.
  std::vector<uint16_t> missing_parcels() const;

  /**
   * @brief Concatenate, verify the checksum, then decompress if flagged.
   * @param out Receives the payload only when the result is Ok.
   */
  AssembleStatus assemble(Bytes& out) const;

  /// Silent for longer than `delay_ms` and no nudge sent within `delay_ms`.
  bool needs_missing_request(uint32_t now_ms, uint32_t delay_ms) const;
  void mark_missing_request_sent(uint32_t now_ms) { last_missing_request_at_ = now_ms; }

  /// No parcel for longer than `timeout_ms`.
  bool is_stale(uint32_t now_ms, uint32_t timeout_ms) const;

  const MsgIdStr&    msg_id() const { return msg_id_; }
  const std::string& source_device_id() const { return source_device_id_; }
  uint16_t total_parcels() const { return total_parcels_; }
  uint32_t expected_checksum() const { return expected_checksum_; }
  uint8_t  flags() const { return flags_; }
  uint8_t  compression_algorithm() const { return compression_algorithm_; }
  uint32_t started_at() const { return started_at_; }
  uint32_t last_parcel_received_at() const { return last_parcel_received_at_; }
  std::optional<uint32_t> last_missing_request_at() const { return last_missing_request_at_; }

private:
  MsgIdStr    msg_id_;
  std::string source_device_id_;
  uint16_t    total_parcels_{0};
  uint32_t    expected_checksum_{0};
  uint8_t     flags_{0};
  uint8_t     compression_algorithm_{compression::NONE};
  std::map<uint16_t, Bytes> parcels_;
  uint32_t    started_at_{0};
  uint32_t    last_parcel_received_at_{0};
  std::optional<uint32_t> last_missing_request_at_;
};

// ---------- ids ----------

/**
 * @class MsgIdGenerator
 * @brief Six uppercase letters from a seeded linear congruential generator.
 *
 * 26^6 (~3e8) ids; collisions within the retention window are avoided by the
 * queue, which retries against its live sent records.
 */
class MsgIdGenerator {
public:
  static constexpr size_t ID_LEN = 6;

  explicit MsgIdGenerator(uint32_t seed = 0x5EED1234u) : state_(seed) {}

  MsgIdStr next();
  void reseed(uint32_t seed) { state_ = seed; }

private:
  uint32_t state_;
};

} // namespace parcelink

#endif // PARCELINK_MESSAGE_HPP
