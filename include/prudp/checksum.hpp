#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace prudp {

/**
 * PRUDPv0 packet checksum
 *
 * Complete 4-byte little-endian words are summed into a 32-bit
 * accumulator; the result is the low byte of
 *   seed + sum(trailing 0-3 bytes) + sum(bytes of the accumulator).
 * The value always fits in 8 bits; the wire width (1 or 4 bytes)
 * is chosen by the connection's checksum version.
 */
uint32_t calculateChecksum(const uint8_t* data, size_t length, uint32_t seed);
uint32_t calculateChecksum(const std::vector<uint8_t>& data, uint32_t seed);

} // namespace prudp
