// -----------------------------------------------------------------------------
// @file parcel.cpp
// @brief Encode/decode for header and data parcels.
//
// Layout and field meanings are documented in include/parcelink/parcel.hpp.
// Everything here is bounds-checked against the caller's length; no decoder
// reads a byte it was not given and none of them throw.
// -----------------------------------------------------------------------------
#include "parcelink/parcel.hpp"

#include <stdio.h>
#include <utility>

namespace parcelink {

namespace {

// Big-endian helpers (network order, same as the rest of the frame).
void put_u16(Bytes& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(Bytes& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t get_u16(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8)  |
          static_cast<uint32_t>(p[3]);
}

void put_id(Bytes& out, const MsgIdStr& id) {
  out.push_back(static_cast<uint8_t>(id.size()));
  for (char c : id) out.push_back(static_cast<uint8_t>(c));
}

// Reads [id_len][id...] starting at data[1]. On success `offset` points just
// past the id bytes.
bool read_id(const uint8_t* data, size_t len, MsgIdStr& id, size_t& offset) {
  if (len < 2) return false;
  const size_t id_len = data[1];
  if (len < 2 + id_len) return false;
  if (!is_valid_msg_id(reinterpret_cast<const char*>(data + 2), id_len)) return false;

  id.clear();
  for (size_t i = 0; i < id_len; ++i) id += static_cast<char>(data[2 + i]);
  offset = 2 + id_len;
  return true;
}

} // namespace

// =============================================================================
// Message id validation
// =============================================================================

bool is_valid_msg_id(const char* id, size_t len) {
  if (!id || len == 0 || len > MSG_ID_MAX) return false;
  for (size_t i = 0; i < len; ++i) {
    const unsigned char c = static_cast<unsigned char>(id[i]);
    if (c < 0x21 || c > 0x7E) return false;     // printable, no space
  }
  return true;
}

bool is_valid_msg_id(const MsgIdStr& id) {
  return is_valid_msg_id(id.c_str(), id.size());
}

// =============================================================================
// Parcel builders
// =============================================================================

Parcel Parcel::header(const MsgIdStr& id, uint16_t total, uint32_t checksum,
                      uint8_t flags, uint8_t algorithm) {
  Parcel p;
  p.msg_id = id;
  p.is_header = true;
  p.total_parcels = total;
  p.checksum = checksum;
  p.flags = flags;
  // algorithm only means something when the compressed bit is set
  p.compression_algorithm = (flags & FLAG_COMPRESSED) ? algorithm : 0;
  return p;
}

Parcel Parcel::data_parcel(const MsgIdStr& id, uint16_t num, Bytes chunk) {
  Parcel p;
  p.msg_id = id;
  p.is_header = false;
  p.parcel_num = num;
  p.data = std::move(chunk);
  return p;
}

size_t Parcel::encoded_size() const {
  if (is_header) {
    return HEADER_FIXED_OVERHEAD + msg_id.size() + (is_compressed() ? 1 : 0);
  }
  return DATA_FIXED_OVERHEAD + msg_id.size() + data.size();
}

void Parcel::to_string(char* out, size_t max_len) const {
  if (!out || max_len == 0) return;
  if (is_header) {
    snprintf(out, max_len, "HDR id=%s total=%u crc=%08X flags=0x%02X",
             msg_id.c_str(), static_cast<unsigned>(total_parcels),
             static_cast<unsigned>(checksum), static_cast<unsigned>(flags));
  } else {
    snprintf(out, max_len, "DAT id=%s num=%u len=%u",
             msg_id.c_str(), static_cast<unsigned>(parcel_num),
             static_cast<unsigned>(data.size()));
  }
}

// =============================================================================
// Encoding
// =============================================================================

Bytes encode(const Parcel& parcel) {
  Bytes out;
  if (!is_valid_msg_id(parcel.msg_id)) return out;   // refuse to put garbage on the air

  out.reserve(parcel.encoded_size());

  if (parcel.is_header) {
    out.push_back(static_cast<uint8_t>(FrameType::Header));
    put_id(out, parcel.msg_id);
    put_u16(out, parcel.total_parcels);
    put_u32(out, parcel.checksum);
    out.push_back(parcel.flags);
    if (parcel.is_compressed()) out.push_back(parcel.compression_algorithm);
    return out;
  }

  out.push_back(static_cast<uint8_t>(FrameType::Data));
  put_id(out, parcel.msg_id);
  put_u16(out, parcel.parcel_num);
  out.insert(out.end(), parcel.data.begin(), parcel.data.end());
  return out;
}

// =============================================================================
// Decoding
// =============================================================================

FrameType frame_type(const uint8_t* data, size_t len) {
  if (!data || len == 0) return FrameType::Unknown;
  switch (data[0]) {
    case static_cast<uint8_t>(FrameType::Header):  return FrameType::Header;
    case static_cast<uint8_t>(FrameType::Data):    return FrameType::Data;
    case static_cast<uint8_t>(FrameType::Receipt): return FrameType::Receipt;
    default: return FrameType::Unknown;
  }
}

std::optional<Parcel> decode_as_header(const uint8_t* data, size_t len) {
  if (frame_type(data, len) != FrameType::Header) return std::nullopt;

  Parcel p;
  size_t off = 0;
  if (!read_id(data, len, p.msg_id, off)) return std::nullopt;

  // total(2) + crc(4) + flags(1)
  if (len < off + 7) return std::nullopt;
  p.is_header     = true;
  p.total_parcels = get_u16(data + off);
  p.checksum      = get_u32(data + off + 2);
  p.flags         = data[off + 6];
  off += 7;

  if (p.is_compressed()) {
    if (len < off + 1) return std::nullopt;     // flag set but algorithm byte missing
    p.compression_algorithm = data[off];
    off += 1;
  }

  // Headers carry no payload; trailing bytes mean this is not a header we wrote.
  if (off != len) return std::nullopt;
  return p;
}

std::optional<Parcel> decode_as_data(const uint8_t* data, size_t len) {
  if (frame_type(data, len) != FrameType::Data) return std::nullopt;

  Parcel p;
  size_t off = 0;
  if (!read_id(data, len, p.msg_id, off)) return std::nullopt;

  if (len < off + 2) return std::nullopt;
  p.is_header  = false;
  p.parcel_num = get_u16(data + off);
  off += 2;

  p.data.assign(data + off, data + len);       // empty chunk is legal on the wire
  return p;
}

} // namespace parcelink
