#include <pumpevents/core/events/errors.hpp>
#include <spdlog/fmt/fmt.h>

namespace PumpEvents {

TruncatedFrameError::TruncatedFrameError(size_t bufferSize, size_t trailingBytes)
    : DecodeError(fmt::format("Buffer of {} bytes ends with a partial frame of {} bytes",
                              bufferSize, trailingBytes)),
      trailing_bytes_(trailingBytes) {}

MalformedHeaderError::MalformedHeaderError(size_t available)
    : FrameDecodeError(fmt::format("Frame too small for header: {} bytes available", available)) {}

UnknownEventTypeError::UnknownEventTypeError(uint16_t typeId)
    : FrameDecodeError(fmt::format("Unknown event type id {}", typeId)),
      type_id_(typeId) {}

MalformedPayloadError::MalformedPayloadError(const std::string& eventName,
                                             size_t available, size_t required)
    : FrameDecodeError(fmt::format("Payload of {} too small: {} bytes available, {} required",
                                   eventName, available, required)) {}

DuplicateEventTypeError::DuplicateEventTypeError(uint16_t typeId)
    : std::logic_error(fmt::format("Event type id {} registered twice", typeId)) {}

} // namespace PumpEvents
