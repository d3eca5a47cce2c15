#pragma once
#include <pumpevents/core/events/decoded_event.hpp>
#include <pumpevents/core/events/payload_schema.hpp>
#include <pumpevents/core/frame/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace PumpEvents {

/**
 * @class PayloadDecoder
 * @brief Applies one declarative PayloadSchema to the payload region of a frame.
 *
 * Every registered event kind gets one decoder. The schema is validated on
 * construction, so a decoder that exists never reads past PAYLOAD_SIZE and
 * always finds the fields its record kind needs.
 */
class PayloadDecoder {
public:
    /**
     * @throws SchemaError if the layout is out of bounds, uses an unsupported
     *         width/encoding, repeats a field name or lacks a required field
     */
    explicit PayloadDecoder(PayloadSchema schema);

    /**
     * @brief Build the typed record for one frame
     * @param payload Pointer to the payload region (frame byte HEADER_SIZE)
     * @param len Bytes available from payload
     * @throws MalformedPayloadError if len is smaller than the schema extent
     */
    DecodedEvent decode(const uint8_t* payload, size_t len,
                        const FrameHeader& header, ResolvedTimestamp timestamp) const;

    /// Generic part of decode(): every declared field, in declaration order
    std::vector<FieldValue> decodeFields(const uint8_t* payload, size_t len) const;

    const PayloadSchema& schema() const { return schema_; }
    size_t extent() const { return extent_; }

private:
    using Builder = DecodedEvent (*)(EventCommon&&, std::vector<FieldValue>&&);

    PayloadSchema schema_;
    size_t extent_;
    Builder build_;
};

} // namespace PumpEvents
