#pragma once
#include <pumpevents/core/frame/frame.hpp>
#include <cstddef>
#include <cstdint>

namespace PumpEvents {

/**
 * @brief Parse the common header present at the start of every frame
 * @param data Pointer to frame start
 * @param len Bytes available from data; the frame size is not assumed
 * @return FrameHeader with source, type id, raw timestamp and sequence number
 * @throws MalformedHeaderError if fewer than HEADER_SIZE bytes are available
 */
FrameHeader decodeHeader(const uint8_t* data, size_t len);

inline FrameHeader decodeHeader(const RawFrame& frame) {
    return decodeHeader(frame.data(), frame.size());
}

/**
 * @brief Inverse of decodeHeader, used by tooling and tests to build frames
 * @note source is truncated to 4 bits, type_id to 12 bits
 */
void encodeHeader(const FrameHeader& header, uint8_t* out);

} // namespace PumpEvents
