/**
 * @page pl-parcel parcelink Parcel Codec
 * @file parcel.hpp
 * @brief Parcel: the atomic wire unit of the chunked BLE protocol (header and data frames).
 *
 * A message travels as exactly one **header parcel** followed by N **data parcels**.
 * The header carries metadata only; data parcels carry the payload chunks.
 * Every frame on the link starts with a one-byte frame type, so a receiver can
 * tell parcels and receipts apart without trying to parse one as the other.
 *
 * @section pl_parcel_layout Wire layout (all integers big endian)
 *
 * | Frame   | Layout                                                                   |
 * |---------|--------------------------------------------------------------------------|
 * | HEADER  | `[0x01][id_len:1][id:id_len][total:2][crc32:4][flags:1][algo:1]?`        |
 * | DATA    | `[0x02][id_len:1][id:id_len][parcel_num:2][chunk:...]`                   |
 * | RECEIPT | `[0x03][json:...]` (see receipt.hpp)                                     |
 *
 * - `id_len` is 1..32 and the id bytes are printable ASCII (0x21..0x7E).
 * - `total` counts **data** parcels only (0 for an empty payload).
 * - `crc32` covers the reassembled payload as transmitted (after compression).
 * - `flags` bit 0 = COMPRESSED. The `algo` byte is present iff that bit is set.
 * - `parcel_num` is zero based: `0 <= parcel_num < total`.
 *
 * ### Example
 * Header for message "AB", 10 data parcels, crc 0xDEADBEEF, uncompressed:
 * `01 02 41 42 00 0A DE AD BE EF 00`
 *
 * Data parcel 3 of the same message carrying "hi":
 * `02 02 41 42 00 03 68 69`
 *
 * @note Decoders never throw and never read past `len`. A buffer that does not
 *       match the requested frame shape yields `std::nullopt`.
 */
#ifndef PARCELINK_PARCEL_HPP
#define PARCELINK_PARCEL_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>

namespace parcelink {

using Bytes = std::vector<uint8_t>;

/// Longest accepted message id.
static constexpr size_t MSG_ID_MAX = 32;

/// Message id: opaque, printable ASCII, 1..MSG_ID_MAX characters.
using MsgIdStr = etl::string<MSG_ID_MAX>;

/// Leading byte of every frame on the link.
enum class FrameType : uint8_t {
  Unknown = 0x00,
  Header  = 0x01,
  Data    = 0x02,
  Receipt = 0x03,
};

static constexpr uint8_t FLAG_COMPRESSED = 0x01;    ///< header flags bit 0

/// type + id_len + total + crc32 + flags (id bytes and optional algo excluded)
static constexpr size_t HEADER_FIXED_OVERHEAD = 1 + 1 + 2 + 4 + 1;
/// type + id_len + parcel_num (id bytes excluded)
static constexpr size_t DATA_FIXED_OVERHEAD   = 1 + 1 + 2;

/// Upper bound on data parcels per message (16-bit count on the wire).
static constexpr size_t MAX_DATA_PARCELS = 0xFFFF;

/**
 * @brief True if `id` can travel in a frame: 1..MSG_ID_MAX printable ASCII bytes.
 */
bool is_valid_msg_id(const char* id, size_t len);
bool is_valid_msg_id(const MsgIdStr& id);

/**
 * @struct Parcel
 * @brief One decoded header or data frame.
 *
 * Header-only fields are zero on data parcels and vice versa; `is_header`
 * tells which set is meaningful.
 */
struct Parcel {
  MsgIdStr msg_id;
  bool     is_header{false};

  // header-only
  uint16_t total_parcels{0};
  uint32_t checksum{0};
  uint8_t  flags{0};
  uint8_t  compression_algorithm{0};    ///< meaningful iff FLAG_COMPRESSED

  // data-only
  uint16_t parcel_num{0};
  Bytes    data;

  bool is_compressed() const { return (flags & FLAG_COMPRESSED) != 0; }

  /// Build a header parcel. `algorithm` is ignored unless `flags` has FLAG_COMPRESSED.
  static Parcel header(const MsgIdStr& id, uint16_t total, uint32_t checksum,
                       uint8_t flags = 0, uint8_t algorithm = 0);

  /// Build a data parcel carrying `chunk`.
  static Parcel data_parcel(const MsgIdStr& id, uint16_t num, Bytes chunk);

  /// Bytes this parcel occupies once encoded.
  size_t encoded_size() const;

  /**
   * @brief Human-readable one-liner for logs and debugging.
   *
   * Format: "HDR id=AB total=10 crc=DEADBEEF flags=0x00" or "DAT id=AB num=3 len=100".
   */
  void to_string(char* out, size_t max_len) const;
};

/// Serialize a parcel to its frame. An invalid msg id produces an empty vector.
Bytes encode(const Parcel& parcel);

/// Frame type of a raw buffer (Unknown for empty or unrecognized leading byte).
FrameType frame_type(const uint8_t* data, size_t len);
inline FrameType frame_type(const Bytes& b) { return frame_type(b.data(), b.size()); }

/// Decode `data` as a header frame; nullopt if it is anything else or malformed.
std::optional<Parcel> decode_as_header(const uint8_t* data, size_t len);
inline std::optional<Parcel> decode_as_header(const Bytes& b) { return decode_as_header(b.data(), b.size()); }

/// Decode `data` as a data frame; nullopt if it is anything else or malformed.
std::optional<Parcel> decode_as_data(const uint8_t* data, size_t len);
inline std::optional<Parcel> decode_as_data(const Bytes& b) { return decode_as_data(b.data(), b.size()); }

} // namespace parcelink

#endif // PARCELINK_PARCEL_HPP
