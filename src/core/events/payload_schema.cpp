#include <pumpevents/core/events/payload_schema.hpp>
#include <algorithm>

namespace PumpEvents {

size_t PayloadSchema::extent() const {
    size_t end = 0;
    for (const auto& f : fields)
        end = std::max(end, static_cast<size_t>(f.offset) + f.width);
    return end;
}

const char* toString(FieldEncoding encoding) {
    switch (encoding) {
        case FieldEncoding::UNSIGNED: return "unsigned";
        case FieldEncoding::SIGNED:   return "signed";
        case FieldEncoding::FLOAT:    return "float";
    }
    return "unknown";
}

const char* toString(RecordKind kind) {
    switch (kind) {
        case RecordKind::GLUCOSE_READING:   return "glucose_reading";
        case RecordKind::BASAL_RATE_CHANGE: return "basal_rate_change";
        case RecordKind::BASAL_DELIVERY:    return "basal_delivery";
        case RecordKind::GENERIC:           return "generic";
    }
    return "unknown";
}

bool parseFieldEncoding(const std::string& text, FieldEncoding& out) {
    if (text == "unsigned")      out = FieldEncoding::UNSIGNED;
    else if (text == "signed")   out = FieldEncoding::SIGNED;
    else if (text == "float")    out = FieldEncoding::FLOAT;
    else return false;
    return true;
}

bool parseRecordKind(const std::string& text, RecordKind& out) {
    if (text == "glucose_reading")        out = RecordKind::GLUCOSE_READING;
    else if (text == "basal_rate_change") out = RecordKind::BASAL_RATE_CHANGE;
    else if (text == "basal_delivery")    out = RecordKind::BASAL_DELIVERY;
    else if (text == "generic")           out = RecordKind::GENERIC;
    else return false;
    return true;
}

const std::vector<std::string>& requiredFields(RecordKind kind) {
    static const std::vector<std::string> glucose = {"currentglucosedisplayvalue"};
    static const std::vector<std::string> basalChange = {
        "commandedbasalrate", "basebasalrate", "maxbasalrate"};
    static const std::vector<std::string> basalDelivery = {
        "profileBasalRate", "algorithmRate", "tempRate"};
    static const std::vector<std::string> none;

    switch (kind) {
        case RecordKind::GLUCOSE_READING:   return glucose;
        case RecordKind::BASAL_RATE_CHANGE: return basalChange;
        case RecordKind::BASAL_DELIVERY:    return basalDelivery;
        case RecordKind::GENERIC:           return none;
    }
    return none;
}

} // namespace PumpEvents
