#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace PumpEvents {

enum struct FieldEncoding {
    UNSIGNED,
    SIGNED,
    FLOAT,   // IEEE-754 binary32, width 4 only
};

/**
 * @brief Closed set of record shapes a schema can produce.
 *
 * Each kind except GENERIC requires specific field names in its schema
 * (see requiredFields()).
 */
enum struct RecordKind {
    GLUCOSE_READING,
    BASAL_RATE_CHANGE,
    BASAL_DELIVERY,
    GENERIC,
};

/**
 * @brief One field of a payload layout
 *
 * offset is relative to the payload region (frame byte 10). All multi-byte
 * values are big-endian. The decoded value is raw / scale.
 */
struct FieldSpec {
    std::string name;
    uint8_t offset = 0;
    uint8_t width = 1;
    FieldEncoding encoding = FieldEncoding::UNSIGNED;
    double scale = 1.0;
};

struct PayloadSchema {
    uint16_t type_id = 0;
    std::string name;
    RecordKind kind = RecordKind::GENERIC;
    std::vector<FieldSpec> fields;

    /// Number of payload bytes the layout touches (max offset + width)
    size_t extent() const;
};

const char* toString(FieldEncoding encoding);
const char* toString(RecordKind kind);

bool parseFieldEncoding(const std::string& text, FieldEncoding& out);
bool parseRecordKind(const std::string& text, RecordKind& out);

/// Field names a schema of the given kind must declare
const std::vector<std::string>& requiredFields(RecordKind kind);

} // namespace PumpEvents
