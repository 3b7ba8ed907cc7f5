#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boxcar::schema {

/// Semantic columnar type of a field in the artifact.
enum class FieldType : std::uint8_t {
    Int16,
    Int32,
    Float64,
    Utf8,
    Boolean,
    TimestampMillis,
};

[[nodiscard]] auto to_string(FieldType type) -> std::string_view;

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::Utf8;
    bool nullable = true;
};

/// Ordered field list of one entity. Order is both the column order of the
/// intermediate stream and the physical column order of the artifact.
struct EntitySchema {
    std::string entity;
    std::vector<FieldSpec> fields;

    [[nodiscard]] auto width() const noexcept -> std::size_t { return fields.size(); }
    [[nodiscard]] auto find(std::string_view name) const -> const FieldSpec*;
    [[nodiscard]] auto position(std::string_view name) const -> std::optional<std::size_t>;
};

}  // namespace boxcar::schema
