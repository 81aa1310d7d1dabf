#include "prudp/packet.hpp"
#include "utils/crypto.hpp"

#include <fmt/format.h>

namespace prudp {

Packet::Packet(PacketType type, uint16_t flags)
    : m_type(type)
    , m_flags(flags)
{
}

std::string Packet::toString() const {
    std::string out = fmt::format(
        "{} src=0x{:02X} dst=0x{:02X} flags={} session=0x{:02X} sig={} seq={}",
        packetTypeName(m_type), m_source, m_destination, flagsToString(m_flags),
        m_sessionId, utils::Crypto::toHex(m_signature.data(), m_signature.size()),
        m_sequenceId);

    if (hasConnectionSignature()) {
        out += fmt::format(" conn_sig={}",
            utils::Crypto::toHex(m_connectionSignature.data(), m_connectionSignature.size()));
    }
    if (hasFragmentId()) {
        out += fmt::format(" fragment={}", m_fragmentId);
    }

    out += fmt::format(" payload={} bytes checksum=0x{:02X}", m_payload.size(), m_checksum);

    if (m_rmcRequest) {
        out += fmt::format(" rmc(protocol=0x{:X} call={} method={} params={} bytes)",
            m_rmcRequest->protocolId, m_rmcRequest->callId, m_rmcRequest->methodId,
            m_rmcRequest->parameters.size());
    }

    return out;
}

} // namespace prudp
