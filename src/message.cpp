/**
 * @file message.cpp
 * @brief Parcel derivation, reassembly and id generation for the message model.
 *
 * Refer to `message.hpp` for the field-level documentation.
 */
#include "parcelink/message.hpp"
#include "parcelink/checksum.hpp"

#include <utility>

namespace parcelink {

// ---------- OutgoingMessage ----------

size_t OutgoingMessage::parcel_count_for(size_t payload_len, size_t max_parcel_size) {
  if (max_parcel_size == 0) max_parcel_size = 1;
  return (payload_len + max_parcel_size - 1) / max_parcel_size;
}

// -----------------------------------------------------------------------------
// to_parcels(): header + data parcels for the current payload.
// PRE:
//   - parcel_count_for(payload, max_parcel_size) <= MAX_DATA_PARCELS
//     (the queue refuses anything larger at enqueue time).
// POLICY:
//   - Compression only when the peer advertised it, the payload clears the
//     threshold, does not already look compressed, and actually shrinks.
//   - The checksum covers the transmitted bytes (compressed if compressed).
// OUT:
//   - Deterministic: same inputs always give byte-identical parcels.
// -----------------------------------------------------------------------------
ParcelSet OutgoingMessage::to_parcels(size_t max_parcel_size, size_t compression_threshold) const {
  if (max_parcel_size == 0) max_parcel_size = 1;

  Bytes wire;
  uint8_t flags = 0;
  uint8_t algorithm = compression::NONE;

  if (peer_supports_compression && compression::should_compress(payload, compression_threshold)) {
    auto packed = compression::compress(payload, compression::DEFLATE);
    if (packed && packed->size() < payload.size()) {
      wire = std::move(*packed);
      flags |= FLAG_COMPRESSED;
      algorithm = compression::DEFLATE;
    }
  }
  if (!(flags & FLAG_COMPRESSED)) wire = payload;

  const size_t n = parcel_count_for(wire.size(), max_parcel_size);

  ParcelSet set;
  set.header = Parcel::header(msg_id, static_cast<uint16_t>(n), crc32(wire), flags, algorithm);
  set.data.reserve(n);

  for (size_t i = 0; i < n; ++i) {
    const size_t begin = i * max_parcel_size;
    const size_t end = (begin + max_parcel_size < wire.size()) ? begin + max_parcel_size : wire.size();
    set.data.push_back(Parcel::data_parcel(msg_id, static_cast<uint16_t>(i),
                                           Bytes(wire.begin() + begin, wire.begin() + end)));
  }
  return set;
}

// ---------- SendOutcome ----------

const char* outcome_reason_name(OutcomeReason reason) {
  switch (reason) {
    case OutcomeReason::Delivered:             return "complete";
    case OutcomeReason::ReceiptTimeout:        return "receipt_timeout";
    case OutcomeReason::ResendCyclesExhausted: return "resend_cycles_exhausted";
    case OutcomeReason::EmptyMissingList:      return "empty_missing_list";
    case OutcomeReason::Cancelled:             return "cancelled";
  }
  return "unknown";
}

// ---------- IncomingMessage ----------

IncomingMessage::IncomingMessage(const Parcel& header, const std::string& source_device_id,
                                 uint32_t now_ms)
: msg_id_(header.msg_id),
  source_device_id_(source_device_id),
  total_parcels_(header.total_parcels),
  expected_checksum_(header.checksum),
  flags_(header.flags),
  compression_algorithm_(header.is_compressed() ? header.compression_algorithm : compression::NONE),
  started_at_(now_ms),
  last_parcel_received_at_(now_ms) {
}

IncomingMessage::AddResult IncomingMessage::add_parcel(const Parcel& parcel, uint32_t now_ms) {
  if (parcel.is_header || parcel.msg_id != msg_id_) return AddResult::WrongMessage;
  if (parcel.parcel_num >= total_parcels_)          return AddResult::OutOfRange;

  // first copy wins; a duplicate still counts as link activity
  last_parcel_received_at_ = now_ms;
  if (parcels_.count(parcel.parcel_num)) return AddResult::Duplicate;

  parcels_.emplace(parcel.parcel_num, parcel.data);
  return AddResult::Added;
}

std::vector<uint16_t> IncomingMessage::missing_parcels() const {
  std::vector<uint16_t> out;
  if (is_complete()) return out;

  out.reserve(total_parcels_ - parcels_.size());
  auto it = parcels_.begin();
  for (uint32_t i = 0; i < total_parcels_; ++i) {
    if (it != parcels_.end() && it->first == i) { ++it; continue; }
    out.push_back(static_cast<uint16_t>(i));
  }
  return out;
}

IncomingMessage::AssembleStatus IncomingMessage::assemble(Bytes& out) const {
  if (!is_complete()) return AssembleStatus::Incomplete;

  Bytes wire;
  size_t total_len = 0;
  for (const auto& kv : parcels_) total_len += kv.second.size();
  wire.reserve(total_len);
  for (const auto& kv : parcels_) wire.insert(wire.end(), kv.second.begin(), kv.second.end());

  if (crc32(wire) != expected_checksum_) return AssembleStatus::ChecksumMismatch;

  if (flags_ & FLAG_COMPRESSED) {
    auto plain = compression::decompress(wire, compression_algorithm_);
    if (!plain) return AssembleStatus::DecompressFailed;
    out = std::move(*plain);
    return AssembleStatus::Ok;
  }

  out = std::move(wire);
  return AssembleStatus::Ok;
}

bool IncomingMessage::needs_missing_request(uint32_t now_ms, uint32_t delay_ms) const {
  if (is_complete()) return false;
  if (elapsed_ms(now_ms, last_parcel_received_at_) <= delay_ms) return false;
  if (last_missing_request_at_ && elapsed_ms(now_ms, *last_missing_request_at_) <= delay_ms) {
    return false;
  }
  return true;
}

bool IncomingMessage::is_stale(uint32_t now_ms, uint32_t timeout_ms) const {
  return elapsed_ms(now_ms, last_parcel_received_at_) > timeout_ms;
}

// ---------- MsgIdGenerator ----------

MsgIdStr MsgIdGenerator::next() {
  MsgIdStr id;
  for (size_t i = 0; i < ID_LEN; ++i) {
    state_ = state_ * 1664525u + 1013904223u;               // Numerical Recipes LCG
    id += static_cast<char>('A' + ((state_ >> 16) % 26u));  // high bits: low bits cycle fast
  }
  return id;
}

} // namespace parcelink
