#include <pumpevents/core/frame/header_codec.hpp>
#include <pumpevents/core/frame/byte_order.hpp>
#include <pumpevents/core/events/errors.hpp>

namespace PumpEvents {

FrameHeader decodeHeader(const uint8_t* data, size_t len) {
    if (data == nullptr || len < HEADER_SIZE)
        throw MalformedHeaderError(data == nullptr ? 0 : len);

    // Source and type id share the first big-endian word
    uint16_t word = detail::readUint16BE(data);

    FrameHeader header;
    header.source = static_cast<uint8_t>(word >> 12);
    header.type_id = static_cast<uint16_t>(word & MAX_EVENT_TYPE_ID);
    header.raw_timestamp = detail::readUint32BE(data + TIMESTAMP_OFFSET);
    header.sequence_number = detail::readUint32BE(data + SEQUENCE_OFFSET);
    return header;
}

void encodeHeader(const FrameHeader& header, uint8_t* out) {
    uint16_t word = static_cast<uint16_t>(((header.source & 0x0F) << 12) |
                                          (header.type_id & MAX_EVENT_TYPE_ID));
    out[0] = static_cast<uint8_t>((word >> 8) & 0xFF);
    out[1] = static_cast<uint8_t>(word & 0xFF);

    for (int i = 0; i < 4; ++i) {
        out[TIMESTAMP_OFFSET + i] = static_cast<uint8_t>((header.raw_timestamp >> (24 - 8 * i)) & 0xFF);
        out[SEQUENCE_OFFSET + i] = static_cast<uint8_t>((header.sequence_number >> (24 - 8 * i)) & 0xFF);
    }
}

} // namespace PumpEvents
