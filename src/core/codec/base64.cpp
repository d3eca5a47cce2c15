#include <pumpevents/core/codec/base64.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <spdlog/fmt/fmt.h>
#include <array>

namespace PumpEvents {
namespace Base64 {

namespace {

constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int8_t INVALID = -1;

const std::array<int8_t, 256>& reverseTable() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t;
        t.fill(INVALID);
        for (int i = 0; i < 64; ++i)
            t[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
        return t;
    }();
    return table;
}

inline bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // anonymous namespace

std::vector<uint8_t> decode(const std::string& text) {
    const auto& table = reverseTable();

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t quad = 0;
    size_t inQuad = 0;     // sextets collected in the current quantum
    size_t padding = 0;
    size_t position = 0;

    for (char c : text) {
        ++position;
        if (isSpace(c)) continue;

        if (c == '=') {
            // Only the 3rd and 4th place of the final quantum may be padding
            if (inQuad < 2)
                throw InvalidEncodingError(fmt::format("Misplaced padding at position {}", position));
            ++padding;
            ++inQuad;
        } else {
            if (padding > 0)
                throw InvalidEncodingError(fmt::format("Data after padding at position {}", position));
            int8_t v = table[static_cast<uint8_t>(c)];
            if (v == INVALID)
                throw InvalidEncodingError(fmt::format("Invalid base64 character 0x{:02x} at position {}",
                                                       static_cast<uint8_t>(c), position));
            quad = (quad << 6) | static_cast<uint32_t>(v);
            ++inQuad;
        }

        if (inQuad == 4) {
            quad <<= 6 * padding;
            out.push_back(static_cast<uint8_t>((quad >> 16) & 0xFF));
            if (padding < 2) out.push_back(static_cast<uint8_t>((quad >> 8) & 0xFF));
            if (padding < 1) out.push_back(static_cast<uint8_t>(quad & 0xFF));
            quad = 0;
            inQuad = 0;
            if (padding > 0) padding = 3;   // any further data is an error
        }
    }

    if (inQuad != 0)
        throw InvalidEncodingError("Base64 input length is not a multiple of 4");
    return out;
}

std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve((len + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out += ALPHABET[(v >> 18) & 0x3F];
        out += ALPHABET[(v >> 12) & 0x3F];
        out += ALPHABET[(v >> 6) & 0x3F];
        out += ALPHABET[v & 0x3F];
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t v = static_cast<uint32_t>(data[i]) << 16;
        out += ALPHABET[(v >> 18) & 0x3F];
        out += ALPHABET[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8);
        out += ALPHABET[(v >> 18) & 0x3F];
        out += ALPHABET[(v >> 12) & 0x3F];
        out += ALPHABET[(v >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace Base64
} // namespace PumpEvents
