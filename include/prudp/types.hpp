#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace prudp {

// =============================================================================
// Packet Types
// =============================================================================
enum class PacketType : uint16_t {
    Syn               = 0,
    Connect           = 1,
    Data              = 2,
    Disconnect        = 3,
    Ping              = 4,
};

// =============================================================================
// Packet Flags
// =============================================================================
namespace PacketFlag {
    constexpr uint16_t Ack       = 0x001;
    constexpr uint16_t Reliable  = 0x002;
    constexpr uint16_t NeedAck   = 0x004;
    constexpr uint16_t HasSize   = 0x008;
    constexpr uint16_t MultiAck  = 0x200;
}

// =============================================================================
// Decode Errors
// =============================================================================
enum class DecodeError {
    TooShort,
    InvalidType,
    InsufficientConnectionSignature,
    InsufficientFragmentID,
    InsufficientPayloadSize,
    InsufficientPayload,
    InsufficientChecksum,
    RemoteCallPayloadError,
    ChecksumMismatch,           // Strict checksum policy only
};

// What the decoder does when the stored checksum does not match
enum class ChecksumPolicy {
    Permissive,                 // Log a warning and accept the packet
    Strict,                     // Reject with DecodeError::ChecksumMismatch
};

// =============================================================================
// Wire Constants (version 0)
// =============================================================================
constexpr size_t MIN_PACKET_SIZE = 9;
constexpr size_t FIXED_HEADER_SIZE = 11;
constexpr size_t SIGNATURE_SIZE = 4;
constexpr size_t CONNECTION_SIGNATURE_SIZE = 4;

constexpr uint32_t FRIENDS_EMPTY_DATA_SIGNATURE = 0x12345678;

// Access key of the Friends service, which signs packets differently
constexpr const char* FRIENDS_ACCESS_KEY = "ridfebb9";

// Default RC4 key for both cipher directions
constexpr const char* DEFAULT_RC4_KEY = "CD&ML";

// =============================================================================
// Codec Configuration
// =============================================================================
struct CodecConfig {
    std::string access_key;
    uint8_t checksum_version = 1;   // 0 -> 4 byte checksum, otherwise 1 byte
    uint8_t flags_version = 1;      // 0 -> 3 bit type, 1 -> 4 bit type
    ChecksumPolicy checksum_policy = ChecksumPolicy::Permissive;
    std::string rc4_key = DEFAULT_RC4_KEY;
};

// Type validation and names for logging
bool isValidPacketType(uint16_t type);
const char* packetTypeName(PacketType type);
const char* decodeErrorName(DecodeError error);
std::string flagsToString(uint16_t flags);

} // namespace prudp
