/**
 * @file checksum.hpp
 * @brief Message-level integrity check (CRC-32) shared by sender and receiver.
 *
 * @details
 * Standard CRC-32 (reflected polynomial 0xEDB88320, init and final XOR
 * 0xFFFFFFFF) as computed by zlib. It is computed once over the whole payload
 * as transmitted, never per parcel. This protects against corruption and
 * truncation on the link; it is not a security mechanism.
 *
 * Known value: crc32("123456789") == 0xCBF43926.
 */
#ifndef PARCELINK_CHECKSUM_HPP
#define PARCELINK_CHECKSUM_HPP

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace parcelink {

uint32_t crc32(const uint8_t* data, size_t len);

inline uint32_t crc32(const std::vector<uint8_t>& data) {
  return crc32(data.data(), data.size());
}

} // namespace parcelink

#endif // PARCELINK_CHECKSUM_HPP
