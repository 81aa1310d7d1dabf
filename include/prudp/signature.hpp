#pragma once

#include "prudp/packet.hpp"
#include <cstdint>
#include <vector>

namespace prudp {

class Connection;

/**
 * Signature written into the header of an outbound v0 packet.
 *
 * Only the Friends service signs v0 packets:
 *   DATA, empty payload     -> 0x12345678 (little-endian)
 *   DATA, payload           -> HMAC-MD5(signature key, plaintext payload)[0..4)
 *   any other type          -> client connection signature, or 4 zero bytes
 * Every other access key yields an empty signature, so the header is sent
 * without a signature field.
 */
std::vector<uint8_t> calculateSignature(const Packet& packet, const Connection& connection);

} // namespace prudp
