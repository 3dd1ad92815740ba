// -----------------------------------------------------------------------------
// checksum.cpp: CRC-32 via zlib.
//
// zlib's crc32() takes a uInt length, so large buffers are fed in slices.
// -----------------------------------------------------------------------------
#include "parcelink/checksum.hpp"

#include <zlib.h>
#include <limits>

namespace parcelink {

uint32_t crc32(const uint8_t* data, size_t len) {
  uLong crc = ::crc32(0L, Z_NULL, 0);
  if (!data) return static_cast<uint32_t>(crc);

  const size_t slice_max = std::numeric_limits<uInt>::max();
  while (len > 0) {
    const size_t n = len > slice_max ? slice_max : len;
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n));
    data += n;
    len  -= n;
  }
  return static_cast<uint32_t>(crc);
}

} // namespace parcelink
