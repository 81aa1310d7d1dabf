#pragma once

#include "prudp/types.hpp"
#include "rmc/request.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prudp {

using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

/**
 * PRUDP Packet
 *
 * Header fields shared by every PRUDP version plus the DATA payload.
 * Version-specific framing lives in the codecs (see packet_codec.hpp).
 * DATA payloads are kept as plaintext; the codec encrypts on the way out
 * and decrypts on the way in.
 */
class Packet {
public:
    Packet() = default;
    Packet(PacketType type, uint16_t flags = 0);

    // Header access
    uint8_t getSource() const { return m_source; }
    void setSource(uint8_t source) { m_source = source; }

    uint8_t getDestination() const { return m_destination; }
    void setDestination(uint8_t destination) { m_destination = destination; }

    PacketType getType() const { return m_type; }
    void setType(PacketType type) { m_type = type; }

    uint16_t getFlags() const { return m_flags; }
    void setFlags(uint16_t flags) { m_flags = flags; }
    bool hasFlag(uint16_t flag) const { return (m_flags & flag) != 0; }
    void addFlag(uint16_t flag) { m_flags |= flag; }
    void clearFlag(uint16_t flag) { m_flags &= ~flag; }

    uint8_t getSessionId() const { return m_sessionId; }
    void setSessionId(uint8_t sessionId) { m_sessionId = sessionId; }

    // Anti-spoof signature as read from the wire
    const Signature& getSignature() const { return m_signature; }
    void setSignature(const Signature& signature) { m_signature = signature; }

    uint16_t getSequenceId() const { return m_sequenceId; }
    void setSequenceId(uint16_t sequenceId) { m_sequenceId = sequenceId; }

    // SYN and CONNECT only
    const Signature& getConnectionSignature() const { return m_connectionSignature; }
    void setConnectionSignature(const Signature& signature) { m_connectionSignature = signature; }

    // DATA only
    uint8_t getFragmentId() const { return m_fragmentId; }
    void setFragmentId(uint8_t fragmentId) { m_fragmentId = fragmentId; }

    // Payload access
    std::vector<uint8_t>& payload() { return m_payload; }
    const std::vector<uint8_t>& payload() const { return m_payload; }
    void setPayload(std::vector<uint8_t> payload) { m_payload = std::move(payload); }

    uint32_t getChecksum() const { return m_checksum; }
    void setChecksum(uint32_t checksum) { m_checksum = checksum; }

    // Parsed RMC request of a decoded DATA packet
    const std::optional<rmc::Request>& getRmcRequest() const { return m_rmcRequest; }
    void setRmcRequest(rmc::Request request) { m_rmcRequest = std::move(request); }

    bool hasConnectionSignature() const {
        return m_type == PacketType::Syn || m_type == PacketType::Connect;
    }
    bool hasFragmentId() const { return m_type == PacketType::Data; }

    // One line summary for logs
    std::string toString() const;

private:
    uint8_t m_source = 0;
    uint8_t m_destination = 0;
    PacketType m_type = PacketType::Syn;
    uint16_t m_flags = 0;
    uint8_t m_sessionId = 0;
    Signature m_signature{};
    uint16_t m_sequenceId = 0;
    Signature m_connectionSignature{};
    uint8_t m_fragmentId = 0;
    std::vector<uint8_t> m_payload;
    uint32_t m_checksum = 0;
    std::optional<rmc::Request> m_rmcRequest;
};

} // namespace prudp
