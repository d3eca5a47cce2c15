#pragma once
#include <pumpevents/core/events/payload_schema.hpp>
#include <string>
#include <vector>

namespace PumpEvents {

/**
 * @brief Reads per-kind payload layouts from a YAML event catalog.
 *
 * Format:
 *   events:
 *     - id: 256
 *       name: LID_CGM_DATA_GXB
 *       kind: glucose_reading        # optional, defaults to generic
 *       fields:
 *         - { name: currentglucosedisplayvalue, offset: 6, width: 2 }
 *         - { name: rate, offset: 3, width: 1, encoding: signed, scale: 10 }
 *
 * Structural problems (missing keys, wrong types, unknown kind/encoding)
 * throw std::runtime_error. Layout consistency is checked later, when the
 * EventRegistry is built.
 */
class EventCatalogLoader {
public:
    static std::vector<PayloadSchema> loadFile(const std::string& path);
    static std::vector<PayloadSchema> loadString(const std::string& yaml);
};

} // namespace PumpEvents
