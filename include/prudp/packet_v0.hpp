#pragma once

#include "prudp/packet_codec.hpp"
#include "rmc/request.hpp"
#include <cstdint>
#include <vector>

namespace prudp {

/**
 * PRUDPv0 codec
 *
 * Wire layout (little-endian):
 *   u8  source
 *   u8  destination
 *   u16 type | flags << 3 (flags version 0) or type | flags << 4 (version 1)
 *   u8  session id
 *   4   signature
 *   u16 sequence id
 *   4   connection signature          SYN, CONNECT
 *   u8  fragment id                   DATA
 *   u16 payload size                  HAS_SIZE flag
 *   ... payload (RC4 encrypted for DATA)
 *   u32 or u8 checksum                checksum version 0 or other
 */
class PacketV0Codec : public PacketCodec {
public:
    /**
     * rmcParser runs on decrypted DATA payloads. It is called after the
     * decode lock is released, so it may decode on the same connection.
     */
    explicit PacketV0Codec(rmc::RequestParser rmcParser = &rmc::Request::parse);

    uint8_t getVersion() const override { return 0; }

    using PacketCodec::decode;
    Packet decode(const uint8_t* data, size_t length, Connection& connection) override;

    std::vector<uint8_t> encode(const Packet& packet, Connection& connection,
                                Packet* outbound = nullptr) override;

    /**
     * Type-specific fields between the fixed header and the payload
     */
    static std::vector<uint8_t> encodeOptions(const Packet& packet, const Connection& connection);

    // Type / flags bit packing
    static uint16_t packTypeFlags(uint16_t type, uint16_t flags, uint8_t flagsVersion);
    static void unpackTypeFlags(uint16_t typeFlags, uint8_t flagsVersion,
                                uint16_t& type, uint16_t& flags);

private:
    rmc::RequestParser m_rmcParser;
};

} // namespace prudp
