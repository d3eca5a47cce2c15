#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace PumpEvents {
namespace Base64 {

/**
 * @brief Decode standard (RFC 4648 section 4) base64
 *
 * ASCII whitespace is ignored. Padding is required; '=' may only appear
 * as the last one or two characters.
 *
 * @throws InvalidEncodingError on any other character, bad padding or a
 *         length that is not a multiple of four
 */
std::vector<uint8_t> decode(const std::string& text);

std::string encode(const uint8_t* data, size_t len);

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

} // namespace Base64
} // namespace PumpEvents
