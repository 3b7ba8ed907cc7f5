#pragma once

#include <boxcar/schema/field_type.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace boxcar::schema {

/// A static defect in the schema or pipeline configuration.
///
/// Raised before any source file is read; it aborts the whole run.
class SchemaError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// One column as declared by an external schema source.
struct ColumnDeclaration {
    std::string name;
    /// Relational type name, e.g. "SMALLINT" or "VARCHAR(8)".
    std::string type;
    bool nullable = true;
    /// Synthetic keys are not part of the record stream.
    bool autoincrement = false;
};

/// Ordered column declarations of one entity.
struct TableDeclaration {
    std::string entity;
    std::vector<ColumnDeclaration> columns;
};

/// Translate one declaration. Throws SchemaError on an unmapped type, a
/// duplicate column or an empty result.
[[nodiscard]] auto translate(const TableDeclaration& declaration) -> EntitySchema;

/// Immutable entity → schema lookup, built once at startup.
class SchemaRegistry {
   public:
    /// Translates every declaration eagerly. Throws SchemaError on the first
    /// invalid declaration or on a repeated entity name.
    explicit SchemaRegistry(const std::vector<TableDeclaration>& declarations);

    /// Schema of `entity`. Throws SchemaError when it was never declared.
    [[nodiscard]] auto schema(std::string_view entity) const -> const EntitySchema&;

    [[nodiscard]] auto contains(std::string_view entity) const -> bool;

    /// Entity names in declaration order.
    [[nodiscard]] auto entities() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return schemas_.size(); }

   private:
    std::vector<EntitySchema> schemas_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace boxcar::schema
