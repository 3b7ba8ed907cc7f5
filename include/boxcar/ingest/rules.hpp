#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace boxcar::ingest {

enum class FilterMode : std::uint8_t {
    /// Keep a record when the marker occurs anywhere in its unquoted last field.
    TrailingField,
    /// Keep a record when its last non-quote character is the marker.
    LastCharacter,
};

/// Keep-only filter on the trailing field of a record.
struct RowFilter {
    char marker = 'N';
    FilterMode mode = FilterMode::TrailingField;

    [[nodiscard]] auto accepts(std::string_view record) const -> bool;
};

inline constexpr std::size_t kDefaultMaxRecordLines = 16;

/// Per-entity normalization rules.
struct EntityRules {
    /// Suppress textually identical records across all of the entity's files.
    bool dedupe = true;
    /// Discard the first physical line of every file.
    bool strip_header = false;
    /// Prepend each file's tag as a new leading field.
    bool prepend_tag = false;
    std::optional<RowFilter> row_filter;
    /// Accept records one field short of the schema by appending an empty
    /// field. When off such records are dropped like any other width mismatch.
    bool repair_short_rows = true;
    /// Most physical lines one quoted record may span.
    std::size_t max_record_lines = kDefaultMaxRecordLines;
};

}  // namespace boxcar::ingest
