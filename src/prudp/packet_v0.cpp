#include "prudp/packet_v0.hpp"
#include "prudp/checksum.hpp"
#include "prudp/connection.hpp"
#include "prudp/packet_error.hpp"
#include "prudp/signature.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <string>

namespace prudp {

PacketV0Codec::PacketV0Codec(rmc::RequestParser rmcParser)
    : m_rmcParser(std::move(rmcParser))
{
}

uint16_t PacketV0Codec::packTypeFlags(uint16_t type, uint16_t flags, uint8_t flagsVersion) {
    if (flagsVersion == 0) {
        return static_cast<uint16_t>(type | (flags << 3));
    }
    return static_cast<uint16_t>(type | (flags << 4));
}

void PacketV0Codec::unpackTypeFlags(uint16_t typeFlags, uint8_t flagsVersion,
                                    uint16_t& type, uint16_t& flags) {
    if (flagsVersion == 0) {
        type = typeFlags & 0x7;
        flags = typeFlags >> 3;
    } else {
        type = typeFlags & 0xF;
        flags = typeFlags >> 4;
    }
}

Packet PacketV0Codec::decode(const uint8_t* data, size_t length, Connection& connection) {
    std::unique_lock<std::mutex> lock(connection.decodeMutex());

    // Also rejects everything below MIN_PACKET_SIZE
    if (length < FIXED_HEADER_SIZE) {
        throw PacketError(DecodeError::TooShort,
            "Packet length less than header minimum: " + std::to_string(length));
    }

    const size_t checksumSize = connection.getChecksumSize();
    utils::BufferReader reader(data, length);
    Packet packet;

    // Fixed header
    packet.setSource(reader.readU8());
    packet.setDestination(reader.readU8());
    uint16_t typeFlags = reader.readU16();
    packet.setSessionId(reader.readU8());

    Signature signature;
    reader.readBytes(signature.data(), signature.size());
    packet.setSignature(signature);

    packet.setSequenceId(reader.readU16());

    uint16_t type = 0;
    uint16_t flags = 0;
    unpackTypeFlags(typeFlags, connection.getFlagsVersion(), type, flags);

    if (!isValidPacketType(type)) {
        throw PacketError(DecodeError::InvalidType,
            "Packet type not valid type: " + std::to_string(type));
    }

    packet.setType(static_cast<PacketType>(type));
    packet.setFlags(flags);

    // Options
    if (packet.hasConnectionSignature()) {
        if (reader.remaining() < CONNECTION_SIGNATURE_SIZE) {
            throw PacketError(DecodeError::InsufficientConnectionSignature,
                "Packet specific data not large enough for connection signature");
        }

        Signature connectionSignature;
        reader.readBytes(connectionSignature.data(), connectionSignature.size());
        packet.setConnectionSignature(connectionSignature);
    }

    if (packet.hasFragmentId()) {
        if (reader.remaining() < 1) {
            throw PacketError(DecodeError::InsufficientFragmentID,
                "Packet specific data not large enough for fragment ID");
        }

        packet.setFragmentId(reader.readU8());
    }

    size_t payloadSize = 0;

    if (packet.hasFlag(PacketFlag::HasSize)) {
        if (reader.remaining() < 2) {
            throw PacketError(DecodeError::InsufficientPayloadSize,
                "Packet specific data not large enough for payload size");
        }

        payloadSize = reader.readU16();
    } else if (reader.remaining() > checksumSize) {
        payloadSize = reader.remaining() - checksumSize;
    }

    // Payload
    if (payloadSize > 0) {
        if (reader.remaining() < payloadSize) {
            throw PacketError(DecodeError::InsufficientPayload,
                "Packet data length less than payload length: have " +
                std::to_string(reader.remaining()) + ", need " + std::to_string(payloadSize));
        }

        std::vector<uint8_t> payload = reader.readBytes(payloadSize);

        if (packet.getType() == PacketType::Data) {
            connection.getDecipher().apply(payload);

            // Keystream is advanced; the parser may re-enter decode on this connection
            lock.unlock();

            try {
                packet.setRmcRequest(m_rmcParser(payload));
            }
            catch (const std::exception& e) {
                throw PacketError(DecodeError::RemoteCallPayloadError,
                    std::string("Error parsing RMC request: ") + e.what());
            }
        }

        packet.setPayload(std::move(payload));
    }

    // Checksum
    if (reader.remaining() < checksumSize) {
        throw PacketError(DecodeError::InsufficientChecksum,
            "Packet data length less than checksum length");
    }

    if (checksumSize == 1) {
        packet.setChecksum(reader.readU8());
    } else {
        packet.setChecksum(reader.readU32());
    }

    if (reader.hasMore()) {
        LOG_DEBUG("Ignoring {} trailing bytes after checksum", reader.remaining());
    }

    uint32_t calculated = calculateChecksum(data, reader.position() - checksumSize,
                                            connection.getSignatureBase());

    if (calculated != packet.getChecksum()) {
        if (connection.getChecksumPolicy() == ChecksumPolicy::Strict) {
            throw PacketError(DecodeError::ChecksumMismatch,
                "Calculated checksum did not match: calculated " + std::to_string(calculated) +
                ", stored " + std::to_string(packet.getChecksum()));
        }

        LOG_WARN("Calculated checksum did not match: calculated 0x{:02X}, stored 0x{:02X} ({})",
                 calculated, packet.getChecksum(), packetTypeName(packet.getType()));
    }

    LOG_DEBUG("Decoded {}", packet.toString());

    return packet;
}

std::vector<uint8_t> PacketV0Codec::encode(const Packet& packet, Connection& connection,
                                           Packet* outbound) {
    std::lock_guard<std::mutex> lock(connection.encodeMutex());

    Packet out = packet;

    if (out.getType() == PacketType::Data) {
        if (out.hasFlag(PacketFlag::Ack)) {
            out.payload().clear();
        }

        out.addFlag(PacketFlag::HasSize);
    }

    // Signed over the plaintext payload
    std::vector<uint8_t> signature = calculateSignature(out, connection);

    if (out.getType() == PacketType::Data && !out.payload().empty()) {
        connection.getCipher().apply(out.payload());
    }

    uint16_t typeFlags = packTypeFlags(static_cast<uint16_t>(out.getType()), out.getFlags(),
                                       connection.getFlagsVersion());

    std::vector<uint8_t> options = encodeOptions(out, connection);

    utils::BufferWriter writer(FIXED_HEADER_SIZE + options.size() + out.payload().size() + 4);
    writer.writeU8(out.getSource());
    writer.writeU8(out.getDestination());
    writer.writeU16(typeFlags);
    writer.writeU8(out.getSessionId());
    writer.writeBytes(signature);
    writer.writeU16(out.getSequenceId());
    writer.writeBytes(options);

    if (!out.payload().empty()) {
        writer.writeBytes(out.payload());
    }

    uint32_t checksum = calculateChecksum(writer.data(), connection.getSignatureBase());
    out.setChecksum(checksum);

    if (connection.getChecksumVersion() == 0) {
        writer.writeU32(checksum);
    } else {
        writer.writeU8(static_cast<uint8_t>(checksum));
    }

    LOG_TRACE("Encoded {} ({} bytes)", packetTypeName(out.getType()), writer.size());

    if (outbound) {
        if (signature.size() == SIGNATURE_SIZE) {
            Signature wireSignature;
            std::copy(signature.begin(), signature.end(), wireSignature.begin());
            out.setSignature(wireSignature);
        }
        *outbound = std::move(out);
    }

    return writer.take();
}

std::vector<uint8_t> PacketV0Codec::encodeOptions(const Packet& packet, const Connection& connection) {
    utils::BufferWriter writer(8);

    auto writeSignature = [&writer](const std::optional<Signature>& signature) {
        if (signature) {
            writer.writeBytes(signature->data(), signature->size());
        } else {
            writer.writeBytes(Signature{}.data(), SIGNATURE_SIZE);
        }
    };

    switch (packet.getType()) {
        case PacketType::Syn:
            writeSignature(connection.getServerConnectionSignature());
            break;
        case PacketType::Connect:
            writeSignature(connection.getClientConnectionSignature());
            break;
        case PacketType::Data:
            writer.writeU8(packet.getFragmentId());
            break;
        default:
            break;
    }

    if (packet.hasFlag(PacketFlag::HasSize)) {
        writer.writeU16(static_cast<uint16_t>(packet.payload().size()));
    }

    return writer.take();
}

} // namespace prudp
