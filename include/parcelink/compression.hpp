/**
 * @file compression.hpp
 * @brief Optional payload compression, tagged in the header parcel.
 *
 * @details
 * When the peer supports it, a sender may deflate the payload before splitting
 * it into parcels. The header then sets `FLAG_COMPRESSED` and carries the
 * algorithm byte. The checksum always covers the bytes actually transmitted,
 * so integrity is checked before decompression is attempted.
 *
 * Compression is skipped when:
 *   - the payload is shorter than the threshold (default 300 bytes),
 *   - the payload already looks compressed (PNG, JPEG, GZIP, ZLIB, ZIP magic),
 *   - the deflated result is not strictly smaller than the input.
 */
#ifndef PARCELINK_COMPRESSION_HPP
#define PARCELINK_COMPRESSION_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>

namespace parcelink {
namespace compression {

static constexpr uint8_t NONE    = 0x00;
static constexpr uint8_t DEFLATE = 0x01;    ///< zlib stream (RFC 1950)

static constexpr size_t DEFAULT_THRESHOLD = 300;

/// Refuse to inflate past this many bytes (guards against decompression bombs).
static constexpr size_t MAX_INFLATED_SIZE = 16u * 1024u * 1024u;

/// Magic-number sniffing for formats that will not deflate further.
bool looks_compressed(const std::vector<uint8_t>& data);

/// True if compressing `data` is worth trying.
bool should_compress(const std::vector<uint8_t>& data, size_t threshold = DEFAULT_THRESHOLD);

/// Compress with `algorithm`. nullopt on failure or unsupported algorithm.
std::optional<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data, uint8_t algorithm);

/// Decompress with `algorithm`. nullopt on corrupt input, unsupported algorithm,
/// or output larger than MAX_INFLATED_SIZE.
std::optional<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& data, uint8_t algorithm);

} // namespace compression
} // namespace parcelink

#endif // PARCELINK_COMPRESSION_HPP
