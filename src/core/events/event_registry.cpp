#include <pumpevents/core/events/event_registry.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PumpEvents {

EventRegistry::EventRegistry(const std::vector<PayloadSchema>& schemas) {
    decoders_.reserve(schemas.size());
    for (const auto& schema : schemas) {
        if (decoders_.count(schema.type_id))
            throw DuplicateEventTypeError(schema.type_id);
        decoders_.emplace(schema.type_id, PayloadDecoder(schema));
        spdlog::debug("[EventRegistry] {} -> {} ({}, {} fields)", schema.type_id, schema.name,
                      toString(schema.kind), schema.fields.size());
    }
    spdlog::info("[EventRegistry] Registered {} event kinds", decoders_.size());
}

const PayloadDecoder& EventRegistry::lookup(uint16_t typeId) const {
    auto it = decoders_.find(typeId);
    if (it == decoders_.end())
        throw UnknownEventTypeError(typeId);
    return it->second;
}

const PayloadDecoder* EventRegistry::find(uint16_t typeId) const {
    auto it = decoders_.find(typeId);
    return it == decoders_.end() ? nullptr : &it->second;
}

std::vector<uint16_t> EventRegistry::registeredIds() const {
    std::vector<uint16_t> ids;
    ids.reserve(decoders_.size());
    for (const auto& entry : decoders_)
        ids.push_back(entry.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string EventRegistry::eventIdsQuery() const {
    std::string out;
    for (uint16_t id : registeredIds()) {
        if (!out.empty()) out += ',';
        out += std::to_string(id);
    }
    return out;
}

const std::string& EventRegistry::nameOf(uint16_t typeId) const {
    return lookup(typeId).schema().name;
}

} // namespace PumpEvents
