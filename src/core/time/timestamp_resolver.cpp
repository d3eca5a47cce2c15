#include <pumpevents/core/time/timestamp_resolver.hpp>
#include <absl/time/civil_time.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace PumpEvents {

namespace {

// Default-constructed CivilSecond is 1970-01-01T00:00:00
absl::CivilSecond toCivil(int64_t wallSeconds) {
    return absl::CivilSecond() + wallSeconds;
}

} // anonymous namespace

CivilTime ResolvedTimestamp::civil() const {
    absl::CivilSecond cs = toCivil(wall_seconds);

    CivilTime c{};
    c.year = static_cast<int>(cs.year());
    c.month = static_cast<unsigned>(cs.month());
    c.day = static_cast<unsigned>(cs.day());
    c.hour = static_cast<unsigned>(cs.hour());
    c.minute = static_cast<unsigned>(cs.minute());
    c.second = static_cast<unsigned>(cs.second());
    return c;
}

std::string ResolvedTimestamp::toIsoString() const {
    CivilTime c = civil();
    const char sign = utc_offset_seconds < 0 ? '-' : '+';
    const int32_t offset = utc_offset_seconds < 0 ? -utc_offset_seconds : utc_offset_seconds;
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}{}{:02d}:{:02d}",
                       c.year, c.month, c.day, c.hour, c.minute, c.second,
                       sign, offset / 3600, (offset % 3600) / 60);
}

TimestampResolver::TimestampResolver(std::string zone) : zone_(std::move(zone)) {
    if (zone_.empty())
        throw std::invalid_argument("Timestamp zone identifier cannot be empty");
    if (!absl::LoadTimeZone(zone_, &tz_))
        throw std::invalid_argument("Unknown time zone: " + zone_);
}

ResolvedTimestamp TimestampResolver::resolve(uint32_t rawTimestamp) const {
    // Computed as if UTC, then attached to the zone: the device stores local wall time
    ResolvedTimestamp ts;
    ts.wall_seconds = VENDOR_EPOCH_UNIX + static_cast<int64_t>(rawTimestamp);
    ts.zone = zone_;

    const absl::TimeZone::TimeInfo info = tz_.At(toCivil(ts.wall_seconds));
    ts.utc_offset_seconds = static_cast<int32_t>(ts.wall_seconds - absl::ToUnixSeconds(info.pre));
    return ts;
}

} // namespace PumpEvents
