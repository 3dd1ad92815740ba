// -----------------------------------------------------------------------------
// compression.cpp: deflate/inflate through zlib.
//
// compress(): one-shot compress2() into a compressBound() sized buffer.
// decompress(): streaming inflate, because the header does not carry the
//               uncompressed size. Output is capped at MAX_INFLATED_SIZE.
// -----------------------------------------------------------------------------
#include "parcelink/compression.hpp"

#include <zlib.h>
#include <limits>

namespace parcelink {
namespace compression {

bool looks_compressed(const std::vector<uint8_t>& d) {
  if (d.size() < 4) return false;

  if (d[0] == 0x89 && d[1] == 0x50 && d[2] == 0x4E && d[3] == 0x47) return true;   // PNG
  if (d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF) return true;                   // JPEG
  if (d[0] == 0x1F && d[1] == 0x8B) return true;                                   // GZIP
  if (d[0] == 0x78 &&
      (d[1] == 0x01 || d[1] == 0x5E || d[1] == 0x9C || d[1] == 0xDA)) return true;  // ZLIB
  if (d[0] == 0x50 && d[1] == 0x4B && d[2] == 0x03 && d[3] == 0x04) return true;   // ZIP
  return false;
}

bool should_compress(const std::vector<uint8_t>& data, size_t threshold) {
  if (data.size() < threshold) return false;
  return !looks_compressed(data);
}

std::optional<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data, uint8_t algorithm) {
  if (algorithm == NONE) return data;
  if (algorithm != DEFLATE) return std::nullopt;
  if (data.size() > std::numeric_limits<uLong>::max()) return std::nullopt;

  uLongf out_len = compressBound(static_cast<uLong>(data.size()));
  std::vector<uint8_t> out(out_len);

  // Fixed level keeps output byte-identical for the same input, which is what
  // lets a resend reuse the same checksum and parcel set.
  const int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                           reinterpret_cast<const Bytef*>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_COMPRESSION);
  if (rc != Z_OK) return std::nullopt;

  out.resize(out_len);
  return out;
}

std::optional<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& data, uint8_t algorithm) {
  if (algorithm == NONE) return data;
  if (algorithm != DEFLATE) return std::nullopt;
  if (data.empty()) return std::nullopt;
  if (data.size() > std::numeric_limits<uInt>::max()) return std::nullopt;

  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) return std::nullopt;

  zs.next_in  = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<uint8_t> out;
  uint8_t chunk[4096];
  int rc = Z_OK;

  while (rc != Z_STREAM_END) {
    zs.next_out  = chunk;
    zs.avail_out = sizeof(chunk);

    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      return std::nullopt;                       // corrupt or truncated stream
    }

    const size_t produced = sizeof(chunk) - zs.avail_out;
    if (out.size() + produced > MAX_INFLATED_SIZE) {
      inflateEnd(&zs);
      return std::nullopt;
    }
    out.insert(out.end(), chunk, chunk + produced);

    // Input exhausted without reaching the end of the stream: truncated.
    if (rc == Z_OK && zs.avail_in == 0 && produced == 0) {
      inflateEnd(&zs);
      return std::nullopt;
    }
  }

  inflateEnd(&zs);
  return out;
}

} // namespace compression
} // namespace parcelink
