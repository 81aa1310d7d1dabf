#include "utils/crypto.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/md5.h>
#include <cctype>
#include <stdexcept>

namespace prudp::utils {

std::vector<uint8_t> Crypto::md5(const uint8_t* data, size_t length) {
    std::vector<uint8_t> digest(MD5_DIGEST_LENGTH);
    unsigned int digestLen = 0;

    if (EVP_Digest(data, length, digest.data(), &digestLen, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    digest.resize(digestLen);
    return digest;
}

std::vector<uint8_t> Crypto::md5(const std::string& str) {
    return md5(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::vector<uint8_t> Crypto::hmacMd5(const std::vector<uint8_t>& key,
                                     const uint8_t* data, size_t length) {
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int macLen = 0;

    if (HMAC(EVP_md5(), key.data(), static_cast<int>(key.size()),
             data, length, mac.data(), &macLen) == nullptr) {
        throw std::runtime_error("HMAC-MD5 failed");
    }

    mac.resize(macLen);
    return mac;
}

std::vector<uint8_t> Crypto::hmacMd5(const std::vector<uint8_t>& key,
                                     const std::vector<uint8_t>& data) {
    return hmacMd5(key, data.data(), data.size());
}

uint32_t Crypto::byteSum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;
    for (size_t i = 0; i < length; i++) {
        sum += data[i];
    }
    return sum;
}

uint32_t Crypto::byteSum(const std::string& str) {
    return byteSum(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::string Crypto::toHex(const uint8_t* data, size_t length) {
    static const char digits[] = "0123456789abcdef";

    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; i++) {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0F];
    }
    return result;
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

std::vector<uint8_t> Crypto::fromHex(const std::string& hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string digits;
    digits.reserve(hex.size());
    for (char c : hex) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }

    std::vector<uint8_t> result;
    result.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = nibble(digits[i]);
        int lo = nibble(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character in: " + hex);
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

} // namespace prudp::utils
