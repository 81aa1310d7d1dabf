#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>
#include <functional>

namespace prudp::rmc {

/**
 * Error raised when a DATA payload is not a valid RMC request
 */
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const std::string& message)
        : std::runtime_error("[RMC] " + message) {}
};

/**
 * RMC (remote method call) request
 *
 * Envelope carried in the decrypted payload of DATA packets:
 *   u32 size        bytes following this field
 *   u8  protocol    request bit 0x80 | protocol id
 *   u16 extended    only when protocol id is 0x7F
 *   u32 call id
 *   u32 method id
 *   ... parameters (protocol specific, not interpreted here)
 */
struct Request {
    static constexpr uint8_t REQUEST_BIT = 0x80;
    static constexpr uint8_t EXTENDED_PROTOCOL_ID = 0x7F;
    static constexpr size_t MIN_SIZE = 13;

    uint16_t protocolId = 0;
    uint32_t callId = 0;
    uint32_t methodId = 0;
    std::vector<uint8_t> parameters;

    /**
     * Parse a request envelope
     * @throws RequestError if the data is not a well formed request
     */
    static Request parse(const std::vector<uint8_t>& data);

    /**
     * Build the request envelope
     */
    std::vector<uint8_t> toBytes() const;

    bool operator==(const Request& other) const {
        return protocolId == other.protocolId &&
               callId == other.callId &&
               methodId == other.methodId &&
               parameters == other.parameters;
    }
};

/**
 * Parser invoked by the packet decoder on decrypted DATA payloads.
 * Must throw (RequestError or any std::exception) on malformed input.
 */
using RequestParser = std::function<Request(const std::vector<uint8_t>&)>;

} // namespace prudp::rmc
