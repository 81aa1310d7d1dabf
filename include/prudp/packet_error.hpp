#pragma once

#include "prudp/types.hpp"
#include <stdexcept>
#include <string>

namespace prudp {

/**
 * Error raised when an inbound datagram cannot be decoded.
 * The datagram must be dropped; no partial packet is produced.
 */
class PacketError : public std::runtime_error {
public:
    PacketError(DecodeError code, const std::string& message)
        : std::runtime_error("[PRUDPv0] " + message)
        , m_code(code)
    {}

    DecodeError code() const { return m_code; }

private:
    DecodeError m_code;
};

} // namespace prudp
