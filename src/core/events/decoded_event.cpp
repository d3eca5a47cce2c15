#include <pumpevents/core/events/decoded_event.hpp>
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace PumpEvents {

const EventCommon& commonOf(const DecodedEvent& event) {
    return std::visit([](const auto& e) -> const EventCommon& { return e.common; }, event);
}

EventCommon& commonOf(DecodedEvent& event) {
    return std::visit([](auto& e) -> EventCommon& { return e.common; }, event);
}

const std::vector<FieldValue>& fieldsOf(const DecodedEvent& event) {
    return std::visit([](const auto& e) -> const std::vector<FieldValue>& { return e.fields; }, event);
}

const FieldValue* findField(const std::vector<FieldValue>& fields, const std::string& name) {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

std::string describe(const DecodedEvent& event) {
    const EventCommon& c = commonOf(event);
    std::string head = fmt::format("{} seq={} {}({})", c.timestamp.toIsoString(),
                                   c.sequence_number, c.name, c.type_id);

    return std::visit([&head](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, GlucoseReading>) {
            return fmt::format("{} glucose={} mg/dL", head, e.glucose_mg_dl);
        } else if constexpr (std::is_same_v<T, BasalRateChange>) {
            return fmt::format("{} commanded={:.3f} base={:.3f} max={:.3f} U/h",
                               head, e.commanded_rate, e.base_rate, e.max_rate);
        } else if constexpr (std::is_same_v<T, BasalDelivery>) {
            return fmt::format("{} profile={:.3f} algorithm={:.3f} temp={:.3f} U/h",
                               head, e.profile_rate, e.algorithm_rate, e.temp_rate);
        } else {
            std::string out = head;
            for (const auto& f : e.fields)
                out += fmt::format(" {}={}", f.name, f.value);
            return out;
        }
    }, event);
}

bool operator==(const FieldValue& a, const FieldValue& b) {
    // raw carries the exact bits, so two decodes of the same bytes compare equal
    return a.name == b.name && a.encoding == b.encoding && a.raw == b.raw;
}

bool operator==(const EventCommon& a, const EventCommon& b) {
    return a.type_id == b.type_id && a.name == b.name && a.source == b.source &&
           a.timestamp == b.timestamp && a.sequence_number == b.sequence_number &&
           a.raw == b.raw;
}

bool operator==(const GlucoseReading& a, const GlucoseReading& b) {
    return a.common == b.common && a.glucose_mg_dl == b.glucose_mg_dl &&
           a.trend_rate == b.trend_rate && a.fields == b.fields;
}

bool operator==(const BasalRateChange& a, const BasalRateChange& b) {
    return a.common == b.common && a.commanded_rate == b.commanded_rate &&
           a.base_rate == b.base_rate && a.max_rate == b.max_rate &&
           a.change_type == b.change_type && a.fields == b.fields;
}

bool operator==(const BasalDelivery& a, const BasalDelivery& b) {
    return a.common == b.common && a.profile_rate == b.profile_rate &&
           a.algorithm_rate == b.algorithm_rate && a.temp_rate == b.temp_rate &&
           a.fields == b.fields;
}

bool operator==(const GenericEvent& a, const GenericEvent& b) {
    return a.common == b.common && a.fields == b.fields;
}

} // namespace PumpEvents
