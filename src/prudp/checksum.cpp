#include "prudp/checksum.hpp"
#include "utils/crypto.hpp"

namespace prudp {

uint32_t calculateChecksum(const uint8_t* data, size_t length, uint32_t seed) {
    size_t words = length / 4;
    uint32_t accumulator = 0;

    for (size_t i = 0; i < words; i++) {
        const uint8_t* p = data + i * 4;
        accumulator += static_cast<uint32_t>(p[0]) |
                      (static_cast<uint32_t>(p[1]) << 8) |
                      (static_cast<uint32_t>(p[2]) << 16) |
                      (static_cast<uint32_t>(p[3]) << 24);
    }

    uint8_t accumulatorBytes[4] = {
        static_cast<uint8_t>(accumulator & 0xFF),
        static_cast<uint8_t>((accumulator >> 8) & 0xFF),
        static_cast<uint8_t>((accumulator >> 16) & 0xFF),
        static_cast<uint8_t>((accumulator >> 24) & 0xFF),
    };

    uint32_t checksum = seed;
    checksum += utils::Crypto::byteSum(data + words * 4, length - words * 4);
    checksum += utils::Crypto::byteSum(accumulatorBytes, sizeof(accumulatorBytes));

    return checksum & 0xFF;
}

uint32_t calculateChecksum(const std::vector<uint8_t>& data, uint32_t seed) {
    return calculateChecksum(data.data(), data.size(), seed);
}

} // namespace prudp
