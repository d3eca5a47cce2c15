#pragma once
#include <absl/time/time.h>
#include <cstdint>
#include <string>

namespace PumpEvents {

// 2008-01-01T00:00:00Z, the instant the pump's timestamp counter starts from
constexpr int64_t VENDOR_EPOCH_UNIX = 1199145600;

struct CivilTime {
    int year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
};

/**
 * @brief Wall-clock time as recorded by the pump, attached to a zone.
 *
 * wall_seconds counts seconds since 1970-01-01T00:00:00 of the wall clock,
 * not of UTC, so the civil fields are exactly what the device displayed.
 * utc_offset_seconds is the zone's offset in effect at that wall time; the
 * absolute instant is wall_seconds - utc_offset_seconds.
 */
struct ResolvedTimestamp {
    int64_t wall_seconds = 0;
    std::string zone;
    int32_t utc_offset_seconds = 0;

    CivilTime civil() const;

    /// Seconds since the Unix epoch of the absolute instant
    int64_t unixSeconds() const { return wall_seconds - utc_offset_seconds; }

    /// "YYYY-MM-DDTHH:MM:SS+HH:MM"
    std::string toIsoString() const;
};

inline bool operator==(const ResolvedTimestamp& a, const ResolvedTimestamp& b) {
    return a.wall_seconds == b.wall_seconds && a.zone == b.zone &&
           a.utc_offset_seconds == b.utc_offset_seconds;
}

inline bool operator!=(const ResolvedTimestamp& a, const ResolvedTimestamp& b) {
    return !(a == b);
}

/**
 * @class TimestampResolver
 * @brief Converts raw header timestamps to zone-attached wall-clock time.
 *
 * The raw counter is added to the vendor epoch as if it were UTC; the
 * resulting civil fields are kept and only the zone (and its offset at that
 * wall time) is attached. A wall time skipped by a DST change takes the
 * offset in effect before the change; a repeated wall time takes the
 * earlier of its two instants.
 *
 * The zone is loaded once at construction and never changes during a run.
 * Any u32 input resolves.
 */
class TimestampResolver {
public:
    /**
     * @throws std::invalid_argument if zone is empty or not in the zone database
     */
    explicit TimestampResolver(std::string zone);

    ResolvedTimestamp resolve(uint32_t rawTimestamp) const;

    const std::string& zone() const { return zone_; }

private:
    std::string zone_;
    absl::TimeZone tz_;
};

} // namespace PumpEvents
