#include "prudp/types.hpp"

#include <fmt/format.h>

namespace prudp {

bool isValidPacketType(uint16_t type) {
    switch (static_cast<PacketType>(type)) {
        case PacketType::Syn:
        case PacketType::Connect:
        case PacketType::Data:
        case PacketType::Disconnect:
        case PacketType::Ping:
            return true;
    }
    return false;
}

const char* packetTypeName(PacketType type) {
    switch (type) {
        case PacketType::Syn:        return "SYN";
        case PacketType::Connect:    return "CONNECT";
        case PacketType::Data:       return "DATA";
        case PacketType::Disconnect: return "DISCONNECT";
        case PacketType::Ping:       return "PING";
    }
    return "UNKNOWN";
}

const char* decodeErrorName(DecodeError error) {
    switch (error) {
        case DecodeError::TooShort:                        return "TooShort";
        case DecodeError::InvalidType:                     return "InvalidType";
        case DecodeError::InsufficientConnectionSignature: return "InsufficientConnectionSignature";
        case DecodeError::InsufficientFragmentID:          return "InsufficientFragmentID";
        case DecodeError::InsufficientPayloadSize:         return "InsufficientPayloadSize";
        case DecodeError::InsufficientPayload:             return "InsufficientPayload";
        case DecodeError::InsufficientChecksum:            return "InsufficientChecksum";
        case DecodeError::RemoteCallPayloadError:          return "RemoteCallPayloadError";
        case DecodeError::ChecksumMismatch:                return "ChecksumMismatch";
    }
    return "Unknown";
}

std::string flagsToString(uint16_t flags) {
    struct FlagName {
        uint16_t bit;
        const char* name;
    };
    static const FlagName names[] = {
        {PacketFlag::Ack,      "ACK"},
        {PacketFlag::Reliable, "RELIABLE"},
        {PacketFlag::NeedAck,  "NEED_ACK"},
        {PacketFlag::HasSize,  "HAS_SIZE"},
        {PacketFlag::MultiAck, "MULTI_ACK"},
    };

    std::string result;
    uint16_t known = 0;
    for (const auto& flag : names) {
        known |= flag.bit;
        if (flags & flag.bit) {
            if (!result.empty()) result += "|";
            result += flag.name;
        }
    }

    uint16_t other = flags & ~known;
    if (other) {
        if (!result.empty()) result += "|";
        result += fmt::format("0x{:03X}", other);
    }

    return result.empty() ? "NONE" : result;
}

} // namespace prudp
