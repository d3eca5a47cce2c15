#pragma once
#include <pumpevents/core/events/payload_schema.hpp>
#include <pumpevents/core/frame/frame.hpp>
#include <pumpevents/core/time/timestamp_resolver.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace PumpEvents {

struct FieldValue {
    std::string name;
    FieldEncoding encoding = FieldEncoding::UNSIGNED;
    int64_t raw = 0;      // integer as read; bit pattern for FLOAT
    double value = 0.0;   // natural units (raw / scale)
};

/**
 * @brief Fields shared by every decoded record
 */
struct EventCommon {
    uint16_t type_id = 0;
    std::string name;
    uint8_t source = 0;
    ResolvedTimestamp timestamp;
    uint32_t sequence_number = 0;
    RawFrame raw{};   // copy of the originating frame, kept for persistence
};

struct GlucoseReading {
    EventCommon common;
    int glucose_mg_dl = 0;
    std::optional<double> trend_rate;   // mg/dL per minute when the layout carries it
    std::vector<FieldValue> fields;
};

struct BasalRateChange {
    EventCommon common;
    double commanded_rate = 0.0;   // U/h
    double base_rate = 0.0;
    double max_rate = 0.0;
    std::optional<uint32_t> change_type;
    std::vector<FieldValue> fields;
};

struct BasalDelivery {
    EventCommon common;
    double profile_rate = 0.0;     // U/h
    double algorithm_rate = 0.0;
    double temp_rate = 0.0;
    std::vector<FieldValue> fields;
};

struct GenericEvent {
    EventCommon common;
    std::vector<FieldValue> fields;
};

using DecodedEvent = std::variant<GlucoseReading, BasalRateChange, BasalDelivery, GenericEvent>;

const EventCommon& commonOf(const DecodedEvent& event);
EventCommon& commonOf(DecodedEvent& event);
const std::vector<FieldValue>& fieldsOf(const DecodedEvent& event);

/// nullptr when no field carries that name
const FieldValue* findField(const std::vector<FieldValue>& fields, const std::string& name);

/// One-line human readable rendering, used by the CLI and in log messages
std::string describe(const DecodedEvent& event);

bool operator==(const FieldValue& a, const FieldValue& b);
bool operator==(const EventCommon& a, const EventCommon& b);
bool operator==(const GlucoseReading& a, const GlucoseReading& b);
bool operator==(const BasalRateChange& a, const BasalRateChange& b);
bool operator==(const BasalDelivery& a, const BasalDelivery& b);
bool operator==(const GenericEvent& a, const GenericEvent& b);

inline bool operator!=(const FieldValue& a, const FieldValue& b) { return !(a == b); }
inline bool operator!=(const EventCommon& a, const EventCommon& b) { return !(a == b); }
inline bool operator!=(const GlucoseReading& a, const GlucoseReading& b) { return !(a == b); }
inline bool operator!=(const BasalRateChange& a, const BasalRateChange& b) { return !(a == b); }
inline bool operator!=(const BasalDelivery& a, const BasalDelivery& b) { return !(a == b); }
inline bool operator!=(const GenericEvent& a, const GenericEvent& b) { return !(a == b); }

} // namespace PumpEvents
