#include "prudp/signature.hpp"
#include "prudp/connection.hpp"
#include "utils/buffer.hpp"
#include "utils/crypto.hpp"

namespace prudp {

std::vector<uint8_t> calculateSignature(const Packet& packet, const Connection& connection) {
    if (!connection.isFriendsService()) {
        return {};
    }

    if (packet.getType() == PacketType::Data) {
        const auto& payload = packet.payload();

        if (payload.empty()) {
            utils::BufferWriter writer(SIGNATURE_SIZE);
            writer.writeU32(FRIENDS_EMPTY_DATA_SIGNATURE);
            return writer.take();
        }

        auto mac = utils::Crypto::hmacMd5(connection.getSignatureKey(), payload);
        mac.resize(SIGNATURE_SIZE);
        return mac;
    }

    const auto& clientSignature = connection.getClientConnectionSignature();
    if (clientSignature) {
        return std::vector<uint8_t>(clientSignature->begin(), clientSignature->end());
    }

    return std::vector<uint8_t>(SIGNATURE_SIZE, 0);
}

} // namespace prudp
