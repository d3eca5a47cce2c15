#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace PumpEvents {

// Wire layout of one record:
// [2B source(4b)|type_id(12b)][4B raw timestamp][4B sequence number][16B payload]
constexpr size_t FRAME_SIZE = 26;
constexpr size_t HEADER_SIZE = 10;
constexpr size_t PAYLOAD_SIZE = FRAME_SIZE - HEADER_SIZE;

constexpr size_t TIMESTAMP_OFFSET = 2;
constexpr size_t SEQUENCE_OFFSET = 6;

constexpr uint16_t MAX_EVENT_TYPE_ID = 0x0FFF;

using RawFrame = std::array<uint8_t, FRAME_SIZE>;

struct FrameHeader {
    uint8_t source = 0;          // high nibble of the first word
    uint16_t type_id = 0;        // low 12 bits of the first word
    uint32_t raw_timestamp = 0;  // seconds since the vendor epoch
    uint32_t sequence_number = 0;
};

inline bool operator==(const FrameHeader& a, const FrameHeader& b) {
    return a.source == b.source && a.type_id == b.type_id &&
           a.raw_timestamp == b.raw_timestamp && a.sequence_number == b.sequence_number;
}

inline bool operator!=(const FrameHeader& a, const FrameHeader& b) {
    return !(a == b);
}

} // namespace PumpEvents
