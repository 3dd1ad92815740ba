/**
 * @file receipt.hpp
 * @brief Receipt: the receiver's answer to a message: complete, missing[...], or checksumFailed.
 *
 * @details
 * Receipts ride the same raw channel as parcels. On the wire a receipt frame is
 * the RECEIPT frame-type byte (0x03) followed by a small JSON object:
 *
 * @code
 *   {"msg_id":"QHZKTA","status":"complete"}
 *   {"msg_id":"QHZKTA","status":"missing","parcels":[2,5]}
 *   {"msg_id":"QHZKTA","status":"checksumFailed"}
 * @endcode
 *
 * JSON keeps receipts self-describing and readable in a packet capture; they are
 * rare and small next to the data stream, so the byte cost does not matter.
 *
 * ## Dual backend
 * - Desktop/Linux builds (no @c ARDUINO) use nlohmann::json.
 * - Embedded builds (@c ARDUINO defined) use ArduinoJson with a fixed-size
 *   document. If a `missing` list does not fit, the serialized list is
 *   truncated; the sender retransmits what was listed and the next stall nudge
 *   asks for the rest.
 *
 * ## Robustness
 * Parsing never throws. Unknown status strings, a missing `msg_id`, wrong
 * value types, or non-JSON bytes all yield `std::nullopt`.
 */
#ifndef PARCELINK_RECEIPT_HPP
#define PARCELINK_RECEIPT_HPP

#include "parcelink/parcel.hpp"
#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

namespace parcelink {

enum class ReceiptStatus : uint8_t {
  Complete = 0,
  Missing,
  ChecksumFailed,
};

/// Wire name of a status: "complete", "missing", "checksumFailed".
const char* status_name(ReceiptStatus status);

/// Inverse of status_name(); nullopt for anything else.
std::optional<ReceiptStatus> status_from_name(const std::string& name);

struct Receipt {
  MsgIdStr msg_id;
  ReceiptStatus status{ReceiptStatus::Complete};
  std::vector<uint16_t> missing_parcels;   ///< only populated for Missing

  static Receipt complete(const MsgIdStr& id);
  static Receipt missing(const MsgIdStr& id, std::vector<uint16_t> parcels);
  static Receipt checksum_failed(const MsgIdStr& id);
};

/// Serialize the JSON body (no frame-type byte).
std::string to_json(const Receipt& receipt);

/// Parse a JSON body. nullopt on any malformed or unrecognized input.
std::optional<Receipt> from_json(const std::string& json_str);

/// Full receipt frame: frame-type byte + JSON body.
Bytes encode_receipt(const Receipt& receipt);

/// Decode a full receipt frame. nullopt if the frame type or body is wrong.
std::optional<Receipt> decode_receipt(const uint8_t* data, size_t len);
inline std::optional<Receipt> decode_receipt(const Bytes& b) { return decode_receipt(b.data(), b.size()); }

} // namespace parcelink

#endif // PARCELINK_RECEIPT_HPP
