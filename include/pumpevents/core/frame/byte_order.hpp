#pragma once
#include <cstdint>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace PumpEvents {
namespace detail {

inline uint32_t readUint32BE(const uint8_t* data) {
    uint32_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohl(v);
}

inline uint16_t readUint16BE(const uint8_t* data) {
    uint16_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohs(v);
}

inline uint8_t readUint8(const uint8_t* data) {
    return *data;
}

} // namespace detail
} // namespace PumpEvents
