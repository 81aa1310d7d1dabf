#pragma once

#include "prudp/checksum.hpp"
#include "prudp/connection.hpp"
#include "prudp/packet_error.hpp"
#include "utils/buffer.hpp"

#include <string>
#include <vector>

namespace prudp {
namespace test {

inline CodecConfig makeConfig(const std::string& accessKey, uint8_t checksumVersion,
                              uint8_t flagsVersion) {
    CodecConfig config;
    config.access_key = accessKey;
    config.checksum_version = checksumVersion;
    config.flags_version = flagsVersion;
    return config;
}

/**
 * Hand-built inbound datagram
 */
class RawPacket {
public:
    RawPacket(uint8_t source, uint8_t destination, uint16_t typeFlags,
              uint8_t sessionId, uint16_t sequenceId,
              const std::vector<uint8_t>& signature = {0xAA, 0xBB, 0xCC, 0xDD}) {
        m_writer.writeU8(source);
        m_writer.writeU8(destination);
        m_writer.writeU16(typeFlags);
        m_writer.writeU8(sessionId);
        m_writer.writeBytes(signature);
        m_writer.writeU16(sequenceId);
    }

    RawPacket& u8(uint8_t value) { m_writer.writeU8(value); return *this; }
    RawPacket& u16(uint16_t value) { m_writer.writeU16(value); return *this; }
    RawPacket& bytes(const std::vector<uint8_t>& data) { m_writer.writeBytes(data); return *this; }

    // Body without checksum
    std::vector<uint8_t> body() const { return m_writer.data(); }

    // Body followed by its checksum in the connection's width
    std::vector<uint8_t> build(const Connection& connection) const {
        std::vector<uint8_t> data = m_writer.data();
        uint32_t checksum = calculateChecksum(data, connection.getSignatureBase());

        utils::BufferWriter tail;
        if (connection.getChecksumVersion() == 0) {
            tail.writeU32(checksum);
        } else {
            tail.writeU8(static_cast<uint8_t>(checksum));
        }
        data.insert(data.end(), tail.data().begin(), tail.data().end());
        return data;
    }

private:
    utils::BufferWriter m_writer;
};

inline std::vector<uint8_t> truncate(const std::vector<uint8_t>& data, size_t length) {
    return std::vector<uint8_t>(data.begin(), data.begin() + length);
}

// Expect a PacketError with the given code
#define ASSERT_DECODE_ERROR(expr, expected) \
    try { \
        (void)(expr); \
        _msg = "Expected " #expected " from: " #expr; \
        return false; \
    } catch (const prudp::PacketError& _e) { \
        if (_e.code() != (expected)) { \
            _msg = std::string("Expected " #expected ", got ") + \
                   prudp::decodeErrorName(_e.code()) + ": " + _e.what(); \
            return false; \
        } \
    }

} // namespace test
} // namespace prudp
