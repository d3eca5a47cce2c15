#include <pumpevents/core/events/payload_decoder.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <pumpevents/core/frame/byte_order.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <cstring>
#include <unordered_set>
#include <utility>

namespace PumpEvents {

namespace {

constexpr const char* GLUCOSE_DISPLAY_FIELD = "currentglucosedisplayvalue";

FieldValue readField(const FieldSpec& spec, const uint8_t* payload) {
    const uint8_t* p = payload + spec.offset;

    uint32_t bits = 0;
    switch (spec.width) {
        case 1: bits = detail::readUint8(p); break;
        case 2: bits = detail::readUint16BE(p); break;
        default: bits = detail::readUint32BE(p); break;
    }

    FieldValue out;
    out.name = spec.name;
    out.encoding = spec.encoding;

    switch (spec.encoding) {
        case FieldEncoding::UNSIGNED:
            out.raw = static_cast<int64_t>(bits);
            out.value = static_cast<double>(bits) / spec.scale;
            break;
        case FieldEncoding::SIGNED:
            if (spec.width == 1)      out.raw = static_cast<int8_t>(bits);
            else if (spec.width == 2) out.raw = static_cast<int16_t>(bits);
            else                      out.raw = static_cast<int32_t>(bits);
            out.value = static_cast<double>(out.raw) / spec.scale;
            break;
        case FieldEncoding::FLOAT: {
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            out.raw = static_cast<int64_t>(bits);
            out.value = static_cast<double>(f) / spec.scale;
            break;
        }
    }
    return out;
}

// Schema validation has already guaranteed the field exists
const FieldValue& requireField(const std::vector<FieldValue>& fields, const char* name) {
    return *findField(fields, name);
}

DecodedEvent buildGlucoseReading(EventCommon&& common, std::vector<FieldValue>&& fields) {
    GlucoseReading r;
    r.common = std::move(common);
    r.glucose_mg_dl = static_cast<int>(std::lround(requireField(fields, GLUCOSE_DISPLAY_FIELD).value));
    if (const FieldValue* rate = findField(fields, "rate"))
        r.trend_rate = rate->value;
    r.fields = std::move(fields);
    return r;
}

DecodedEvent buildBasalRateChange(EventCommon&& common, std::vector<FieldValue>&& fields) {
    BasalRateChange r;
    r.common = std::move(common);
    r.commanded_rate = requireField(fields, "commandedbasalrate").value;
    r.base_rate = requireField(fields, "basebasalrate").value;
    r.max_rate = requireField(fields, "maxbasalrate").value;
    if (const FieldValue* change = findField(fields, "changetype"))
        r.change_type = static_cast<uint32_t>(change->raw);
    r.fields = std::move(fields);
    return r;
}

DecodedEvent buildBasalDelivery(EventCommon&& common, std::vector<FieldValue>&& fields) {
    BasalDelivery r;
    r.common = std::move(common);
    r.profile_rate = requireField(fields, "profileBasalRate").value;
    r.algorithm_rate = requireField(fields, "algorithmRate").value;
    r.temp_rate = requireField(fields, "tempRate").value;
    r.fields = std::move(fields);
    return r;
}

DecodedEvent buildGeneric(EventCommon&& common, std::vector<FieldValue>&& fields) {
    GenericEvent r;
    r.common = std::move(common);
    r.fields = std::move(fields);
    return r;
}

void validateSchema(const PayloadSchema& schema) {
    if (schema.name.empty())
        throw SchemaError(fmt::format("Event type {} has no name", schema.type_id));
    if (schema.type_id > MAX_EVENT_TYPE_ID)
        throw SchemaError(fmt::format("Event type id {} ({}) exceeds 12 bits", schema.type_id, schema.name));

    std::unordered_set<std::string> seen;
    for (const auto& f : schema.fields) {
        if (f.name.empty())
            throw SchemaError(fmt::format("{}: field without a name", schema.name));
        if (!seen.insert(f.name).second)
            throw SchemaError(fmt::format("{}: field {} declared twice", schema.name, f.name));
        if (f.width != 1 && f.width != 2 && f.width != 4)
            throw SchemaError(fmt::format("{}.{}: width {} not in {{1, 2, 4}}", schema.name, f.name, f.width));
        if (f.encoding == FieldEncoding::FLOAT && f.width != 4)
            throw SchemaError(fmt::format("{}.{}: float fields must be 4 bytes wide", schema.name, f.name));
        if (static_cast<size_t>(f.offset) + f.width > PAYLOAD_SIZE)
            throw SchemaError(fmt::format("{}.{}: bytes {}..{} lie outside the {}-byte payload",
                                          schema.name, f.name, f.offset, f.offset + f.width - 1, PAYLOAD_SIZE));
        if (!std::isfinite(f.scale) || f.scale <= 0.0)
            throw SchemaError(fmt::format("{}.{}: scale must be a positive number", schema.name, f.name));
    }

    for (const auto& required : requiredFields(schema.kind)) {
        if (!seen.count(required))
            throw SchemaError(fmt::format("{}: kind {} requires field {}",
                                          schema.name, toString(schema.kind), required));
    }

    // The display value lands in an int: at most 16 integer bits, never scaled up
    if (schema.kind == RecordKind::GLUCOSE_READING) {
        for (const auto& f : schema.fields) {
            if (f.name != GLUCOSE_DISPLAY_FIELD) continue;
            if (f.encoding == FieldEncoding::FLOAT || f.width > 2 || f.scale < 1.0)
                throw SchemaError(fmt::format("{}.{}: must be a 1 or 2 byte integer with scale >= 1",
                                              schema.name, f.name));
        }
    }
}

} // anonymous namespace

PayloadDecoder::PayloadDecoder(PayloadSchema schema)
    : schema_(std::move(schema)), extent_(0), build_(nullptr) {
    validateSchema(schema_);
    extent_ = schema_.extent();

    switch (schema_.kind) {
        case RecordKind::GLUCOSE_READING:   build_ = &buildGlucoseReading; break;
        case RecordKind::BASAL_RATE_CHANGE: build_ = &buildBasalRateChange; break;
        case RecordKind::BASAL_DELIVERY:    build_ = &buildBasalDelivery; break;
        case RecordKind::GENERIC:           build_ = &buildGeneric; break;
    }
    if (build_ == nullptr)
        throw SchemaError(fmt::format("{}: unsupported record kind", schema_.name));
}

std::vector<FieldValue> PayloadDecoder::decodeFields(const uint8_t* payload, size_t len) const {
    if (payload == nullptr || len < extent_)
        throw MalformedPayloadError(schema_.name, payload == nullptr ? 0 : len, extent_);

    std::vector<FieldValue> values;
    values.reserve(schema_.fields.size());
    for (const auto& spec : schema_.fields)
        values.push_back(readField(spec, payload));
    return values;
}

DecodedEvent PayloadDecoder::decode(const uint8_t* payload, size_t len,
                                    const FrameHeader& header, ResolvedTimestamp timestamp) const {
    std::vector<FieldValue> values = decodeFields(payload, len);

    EventCommon common;
    common.type_id = header.type_id;
    common.name = schema_.name;
    common.source = header.source;
    common.timestamp = std::move(timestamp);
    common.sequence_number = header.sequence_number;

    return build_(std::move(common), std::move(values));
}

} // namespace PumpEvents
