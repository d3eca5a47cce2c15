// ============================================================================
// TEST HELPERS: synthetic frames and a small event catalog
// ============================================================================

#pragma once

#include <pumpevents/core/events/event_registry.hpp>
#include <pumpevents/core/events/payload_schema.hpp>
#include <pumpevents/core/frame/frame.hpp>
#include <pumpevents/core/frame/header_codec.hpp>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

namespace TestFrames {

using namespace PumpEvents;

constexpr uint16_t GLUCOSE_ID = 256;
constexpr uint16_t BASAL_CHANGE_ID = 3;
constexpr uint16_t BASAL_DELIVERY_ID = 279;
constexpr uint16_t CARBS_ID = 48;

inline RawFrame buildFrame(uint8_t source, uint16_t typeId, uint32_t rawTimestamp,
                           uint32_t sequence, const std::vector<uint8_t>& payload = {}) {
    RawFrame frame{};
    FrameHeader header;
    header.source = source;
    header.type_id = typeId;
    header.raw_timestamp = rawTimestamp;
    header.sequence_number = sequence;
    encodeHeader(header, frame.data());
    for (size_t i = 0; i < payload.size() && i < PAYLOAD_SIZE; ++i)
        frame[HEADER_SIZE + i] = payload[i];
    return frame;
}

inline void putUint16(std::vector<uint8_t>& payload, size_t offset, uint16_t v) {
    if (payload.size() < offset + 2) payload.resize(offset + 2, 0);
    payload[offset] = static_cast<uint8_t>(v >> 8);
    payload[offset + 1] = static_cast<uint8_t>(v & 0xFF);
}

inline void putFloat(std::vector<uint8_t>& payload, size_t offset, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    if (payload.size() < offset + 4) payload.resize(offset + 4, 0);
    for (int i = 0; i < 4; ++i)
        payload[offset + i] = static_cast<uint8_t>((bits >> (24 - 8 * i)) & 0xFF);
}

/// Glucose frame: display value at payload offset 6, trend rate (tenths) at 3
inline RawFrame glucoseFrame(uint32_t rawTimestamp, uint32_t sequence, uint16_t mgdl,
                             int8_t rateTenths = 0) {
    std::vector<uint8_t> payload(PAYLOAD_SIZE, 0);
    payload[3] = static_cast<uint8_t>(rateTenths);
    putUint16(payload, 6, mgdl);
    return buildFrame(0, GLUCOSE_ID, rawTimestamp, sequence, payload);
}

inline void append(std::vector<uint8_t>& buffer, const RawFrame& frame) {
    buffer.insert(buffer.end(), frame.begin(), frame.end());
}

inline PayloadSchema glucoseSchema() {
    PayloadSchema s;
    s.type_id = GLUCOSE_ID;
    s.name = "LID_CGM_DATA_GXB";
    s.kind = RecordKind::GLUCOSE_READING;
    s.fields = {
        {"rate", 3, 1, FieldEncoding::SIGNED, 10.0},
        {"currentglucosedisplayvalue", 6, 2, FieldEncoding::UNSIGNED, 1.0},
    };
    return s;
}

inline PayloadSchema basalChangeSchema() {
    PayloadSchema s;
    s.type_id = BASAL_CHANGE_ID;
    s.name = "LID_BASAL_RATE_CHANGE";
    s.kind = RecordKind::BASAL_RATE_CHANGE;
    s.fields = {
        {"commandedbasalrate", 0, 4, FieldEncoding::FLOAT, 1.0},
        {"basebasalrate", 4, 4, FieldEncoding::FLOAT, 1.0},
        {"maxbasalrate", 8, 4, FieldEncoding::FLOAT, 1.0},
        {"changetype", 15, 1, FieldEncoding::UNSIGNED, 1.0},
    };
    return s;
}

inline PayloadSchema basalDeliverySchema() {
    PayloadSchema s;
    s.type_id = BASAL_DELIVERY_ID;
    s.name = "LID_BASAL_DELIVERY";
    s.kind = RecordKind::BASAL_DELIVERY;
    s.fields = {
        {"profileBasalRate", 4, 2, FieldEncoding::UNSIGNED, 1000.0},
        {"algorithmRate", 6, 2, FieldEncoding::UNSIGNED, 1000.0},
        {"tempRate", 8, 2, FieldEncoding::UNSIGNED, 1000.0},
    };
    return s;
}

inline PayloadSchema carbsSchema() {
    PayloadSchema s;
    s.type_id = CARBS_ID;
    s.name = "LID_CARB_ENTERED";
    s.fields = {{"carbs", 0, 4, FieldEncoding::FLOAT, 1.0}};
    return s;
}

inline std::shared_ptr<const EventRegistry> testRegistry() {
    return std::make_shared<const EventRegistry>(std::vector<PayloadSchema>{
        glucoseSchema(), basalChangeSchema(), basalDeliverySchema(), carbsSchema()});
}

} // namespace TestFrames
