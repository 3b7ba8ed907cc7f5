#pragma once

#include <boxcar/schema/field_type.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace boxcar::schema {

/// Relational column types accepted from schema declarations.
///
/// The set is closed: a declaration naming any other type is rejected when
/// it is parsed, and `to_field_type` must handle every alternative.
namespace relational {

struct Integer {};
struct SmallInteger {};
struct Float {};
struct String {
    std::optional<std::size_t> length;
};
struct Char {
    std::optional<std::size_t> length;
};
struct Text {};
struct Boolean {};
struct Date {};
struct DateTime {};

}  // namespace relational

using RelationalType =
    std::variant<relational::Integer, relational::SmallInteger, relational::Float,
                 relational::String, relational::Char, relational::Text, relational::Boolean,
                 relational::Date, relational::DateTime>;

/// Parse a declared type name such as `INTEGER`, `varchar(8)` or `DateTime`.
/// Names are case-insensitive; the error names the offending text.
[[nodiscard]] auto parse_relational_type(std::string_view name)
    -> std::expected<RelationalType, std::string>;

/// Map a relational type onto its columnar field type.
[[nodiscard]] auto to_field_type(const RelationalType& type) -> FieldType;

}  // namespace boxcar::schema
