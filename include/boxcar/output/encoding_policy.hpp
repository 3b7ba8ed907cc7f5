#pragma once

#include <boxcar/schema/field_type.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace boxcar::output {

/// Parquet's default row-group length, in rows.
inline constexpr std::int64_t kDefaultRowGroupLength = std::int64_t{1} << 20;
inline constexpr std::int64_t kDefaultWriteBatchSize = 1024;

enum class ColumnEncoding : std::uint8_t {
    /// Dictionary pages with a plain fallback.
    Dictionary,
    /// DELTA_BINARY_PACKED; int16, int32 and timestamp columns only.
    Delta,
    Plain,
};

[[nodiscard]] auto to_string(ColumnEncoding encoding) -> std::string_view;

/// How one entity's artifact is encoded. zstd is the only codec.
struct ColumnEncodingPolicy {
    /// Columns not listed use dictionary encoding.
    std::map<std::string, ColumnEncoding, std::less<>> overrides;
    std::optional<int> zstd_level;
    /// Stable ascending sort applied before writing.
    std::optional<std::string> sort_key;
    std::int64_t row_group_length = kDefaultRowGroupLength;
    std::int64_t write_batch_size = kDefaultWriteBatchSize;

    [[nodiscard]] auto encoding_for(std::string_view column) const -> ColumnEncoding;
};

/// Throws schema::SchemaError when the policy names a column missing from
/// `schema`, asks for delta encoding on an unsupported type, or carries an
/// out-of-range level or size.
void validate_policy(const ColumnEncodingPolicy& policy, const schema::EntitySchema& schema);

}  // namespace boxcar::output
