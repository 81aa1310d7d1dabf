#pragma once

#include <cstdint>
#include <vector>
#include <string>

namespace prudp::utils {

/**
 * Cryptographic and byte helpers
 * Used for packet signatures, signature keys and diagnostics.
 */
class Crypto {
public:
    /**
     * Calculate MD5 hash
     */
    static std::vector<uint8_t> md5(const uint8_t* data, size_t length);
    static std::vector<uint8_t> md5(const std::string& str);

    /**
     * Calculate HMAC-MD5 of data keyed with key
     */
    static std::vector<uint8_t> hmacMd5(const std::vector<uint8_t>& key,
                                        const uint8_t* data, size_t length);
    static std::vector<uint8_t> hmacMd5(const std::vector<uint8_t>& key,
                                        const std::vector<uint8_t>& data);

    /**
     * Unsigned sum of all bytes
     */
    static uint32_t byteSum(const uint8_t* data, size_t length);
    static uint32_t byteSum(const std::string& str);

    /**
     * Convert bytes to hex string
     */
    static std::string toHex(const uint8_t* data, size_t length);
    static std::string toHex(const std::vector<uint8_t>& data);

    /**
     * Convert hex string to bytes, whitespace is ignored
     * @throws std::invalid_argument on odd length or non-hex characters
     */
    static std::vector<uint8_t> fromHex(const std::string& hex);
};

} // namespace prudp::utils
