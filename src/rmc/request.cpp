#include "rmc/request.hpp"
#include "utils/buffer.hpp"

namespace prudp::rmc {

Request Request::parse(const std::vector<uint8_t>& data) {
    if (data.size() < MIN_SIZE) {
        throw RequestError("Data size less than minimum: " + std::to_string(data.size()));
    }

    utils::BufferReader reader(data);

    uint32_t size = reader.readU32();
    if (size != data.size() - 4) {
        throw RequestError("Data size does not match: header says " + std::to_string(size) +
                           ", have " + std::to_string(data.size() - 4));
    }

    uint8_t protocol = reader.readU8();
    if (!(protocol & REQUEST_BIT)) {
        throw RequestError("Packet is not a request");
    }

    Request request;
    request.protocolId = static_cast<uint16_t>(protocol & ~REQUEST_BIT);

    if (request.protocolId == EXTENDED_PROTOCOL_ID) {
        if (reader.remaining() < 2 + 8) {
            throw RequestError("Data too short for extended protocol ID");
        }
        request.protocolId = reader.readU16();
    }

    request.callId = reader.readU32();
    request.methodId = reader.readU32();
    request.parameters = reader.readBytes(reader.remaining());

    return request;
}

std::vector<uint8_t> Request::toBytes() const {
    bool extended = protocolId >= EXTENDED_PROTOCOL_ID;

    utils::BufferWriter body;
    if (extended) {
        body.writeU8(REQUEST_BIT | EXTENDED_PROTOCOL_ID);
        body.writeU16(protocolId);
    } else {
        body.writeU8(REQUEST_BIT | static_cast<uint8_t>(protocolId));
    }
    body.writeU32(callId);
    body.writeU32(methodId);
    body.writeBytes(parameters);

    utils::BufferWriter writer(body.size() + 4);
    writer.writeU32(static_cast<uint32_t>(body.size()));
    writer.writeBytes(body.data());
    return writer.take();
}

} // namespace prudp::rmc
