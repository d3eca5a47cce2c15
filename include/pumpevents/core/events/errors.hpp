#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace PumpEvents {

/**
 * @brief Base class for every failure raised while decoding a blob
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The base64 input could not be decoded; fatal to the whole call
 */
class InvalidEncodingError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/**
 * @brief Buffer length is not a multiple of the frame size (reject policy only)
 */
class TruncatedFrameError : public DecodeError {
public:
    TruncatedFrameError(size_t bufferSize, size_t trailingBytes);

    size_t trailingBytes() const { return trailing_bytes_; }

private:
    size_t trailing_bytes_;
};

/**
 * @brief Failure confined to a single frame.
 *
 * The pipeline isolates these: under the skip policy the frame is logged and
 * the sequence continues with the next frame.
 */
class FrameDecodeError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

class MalformedHeaderError : public FrameDecodeError {
public:
    explicit MalformedHeaderError(size_t available);
};

class UnknownEventTypeError : public FrameDecodeError {
public:
    explicit UnknownEventTypeError(uint16_t typeId);

    uint16_t typeId() const { return type_id_; }

private:
    uint16_t type_id_;
};

class MalformedPayloadError : public FrameDecodeError {
public:
    MalformedPayloadError(const std::string& eventName, size_t available, size_t required);
};

// Start-up errors: the registry refuses to be built from an inconsistent catalog.

class DuplicateEventTypeError : public std::logic_error {
public:
    explicit DuplicateEventTypeError(uint16_t typeId);
};

class SchemaError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace PumpEvents
