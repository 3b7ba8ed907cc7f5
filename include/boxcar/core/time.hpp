#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>

namespace boxcar {

/// Instant in milliseconds since 1970-01-01T00:00:00Z (Unix epoch).
///
/// Calendar dates are stored as the timestamp of their midnight, since some
/// Parquet consumers cannot read DATE columns.
struct Timestamp {
    std::int64_t millis = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Timestamp of `date` at the given wall-clock time (UTC).
[[nodiscard]] inline auto make_timestamp(std::chrono::year_month_day date, int hours = 0,
                                         int minutes = 0, int seconds = 0) -> Timestamp {
    using namespace std::chrono;
    auto day_point = sys_days{date};
    auto tp = time_point_cast<milliseconds>(day_point) + hours * 1h + minutes * 1min +
              seconds * 1s;
    return Timestamp{tp.time_since_epoch().count()};
}

}  // namespace boxcar

namespace std {

template <>
struct hash<boxcar::Timestamp> {
    auto operator()(const boxcar::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.millis);
    }
};

}  // namespace std
