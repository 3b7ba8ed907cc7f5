#pragma once

#include <boxcar/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace boxcar::convert {

/// "1"/"T" → true, "0"/"F" → false, nullopt for anything else.
[[nodiscard]] auto parse_bool(std::string_view text) noexcept -> std::optional<bool>;

/// Base-10 integer covering the whole of `text`, range-checked.
[[nodiscard]] auto parse_int16(std::string_view text) noexcept -> std::optional<std::int16_t>;
[[nodiscard]] auto parse_int32(std::string_view text) noexcept -> std::optional<std::int32_t>;

/// Decimal floating literal covering the whole of `text`.
[[nodiscard]] auto parse_float64(std::string_view text) noexcept -> std::optional<double>;

/// Tries, in order: `YYYYMMDD`, `YYYY-MM-DD`, `M/D/YYYY` and
/// `YYYY-MM-DD HH:MM:SS`. The first pattern matching the whole field wins;
/// the calendar date must exist.
[[nodiscard]] auto parse_timestamp(std::string_view text) noexcept -> std::optional<Timestamp>;

}  // namespace boxcar::convert
