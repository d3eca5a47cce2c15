#pragma once
#include <pumpevents/core/events/payload_decoder.hpp>
#include <pumpevents/core/events/payload_schema.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace PumpEvents {

/**
 * @class EventRegistry
 * @brief Closed mapping from event type id to its PayloadDecoder.
 *
 * Built once at start-up from the event catalog and never modified
 * afterwards; share it as std::shared_ptr<const EventRegistry> between
 * threads decoding different blobs.
 */
class EventRegistry {
public:
    /**
     * @throws DuplicateEventTypeError if two schemas share a type id
     * @throws SchemaError if any schema is invalid
     */
    explicit EventRegistry(const std::vector<PayloadSchema>& schemas);

    /**
     * @throws UnknownEventTypeError if typeId is not registered
     */
    const PayloadDecoder& lookup(uint16_t typeId) const;

    /// nullptr if typeId is not registered
    const PayloadDecoder* find(uint16_t typeId) const;

    bool contains(uint16_t typeId) const { return decoders_.count(typeId) != 0; }
    size_t size() const { return decoders_.size(); }

    /// Registered ids, ascending
    std::vector<uint16_t> registeredIds() const;

    /// Comma-joined ids, the eventIds filter sent with pump event fetches
    std::string eventIdsQuery() const;

    /// @throws UnknownEventTypeError if typeId is not registered
    const std::string& nameOf(uint16_t typeId) const;

private:
    std::unordered_map<uint16_t, PayloadDecoder> decoders_;
};

using EventRegistryPtr = std::shared_ptr<const EventRegistry>;

} // namespace PumpEvents
