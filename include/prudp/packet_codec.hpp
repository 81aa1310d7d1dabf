#pragma once

#include "prudp/packet.hpp"
#include <cstdint>
#include <vector>

namespace prudp {

class Connection;

/**
 * Base class for PRUDP wire codecs
 *
 * Each protocol version frames the shared packet fields with its own
 * header layout, options, signature and checksum rules.
 */
class PacketCodec {
public:
    virtual ~PacketCodec() = default;

    // PRUDP version handled by this codec
    virtual uint8_t getVersion() const = 0;

    /**
     * Decode a datagram received on connection
     * @throws PacketError if the datagram must be dropped
     */
    virtual Packet decode(const uint8_t* data, size_t length, Connection& connection) = 0;

    Packet decode(const std::vector<uint8_t>& data, Connection& connection) {
        return decode(data.data(), data.size(), connection);
    }

    /**
     * Encode a packet for sending on connection.
     * The input packet is left untouched; when outbound is given it receives
     * the packet as it went on the wire (encrypted payload, final flags).
     */
    virtual std::vector<uint8_t> encode(const Packet& packet, Connection& connection,
                                        Packet* outbound = nullptr) = 0;
};

} // namespace prudp
