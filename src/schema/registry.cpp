#include <boxcar/schema/registry.hpp>
#include <boxcar/schema/relational_type.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unordered_set>

namespace boxcar::schema {

auto translate(const TableDeclaration& declaration) -> EntitySchema {
    if (declaration.entity.empty()) {
        throw SchemaError("table declaration without an entity name");
    }

    EntitySchema schema;
    schema.entity = declaration.entity;
    schema.fields.reserve(declaration.columns.size());

    std::unordered_set<std::string> seen;
    for (const auto& column : declaration.columns) {
        if (column.name.empty()) {
            throw SchemaError(fmt::format("{}: column declaration without a name",
                                          declaration.entity));
        }
        if (!seen.insert(column.name).second) {
            throw SchemaError(
                fmt::format("{}: duplicate column '{}'", declaration.entity, column.name));
        }
        // Excluded columns are type-checked too.
        auto type = parse_relational_type(column.type);
        if (!type) {
            throw SchemaError(fmt::format("{}.{}: {}", declaration.entity, column.name,
                                          type.error()));
        }
        if (column.autoincrement) {
            spdlog::debug("{}: excluding synthetic key column '{}'", declaration.entity,
                          column.name);
            continue;
        }
        schema.fields.push_back(FieldSpec{.name = column.name,
                                          .type = to_field_type(*type),
                                          .nullable = column.nullable});
    }

    if (schema.fields.empty()) {
        throw SchemaError(fmt::format("{}: schema has no columns", declaration.entity));
    }
    return schema;
}

SchemaRegistry::SchemaRegistry(const std::vector<TableDeclaration>& declarations) {
    schemas_.reserve(declarations.size());
    for (const auto& declaration : declarations) {
        if (index_.contains(declaration.entity)) {
            throw SchemaError(fmt::format("duplicate declaration for entity '{}'",
                                          declaration.entity));
        }
        schemas_.push_back(translate(declaration));
        index_.emplace(declaration.entity, schemas_.size() - 1);
    }
}

auto SchemaRegistry::schema(std::string_view entity) const -> const EntitySchema& {
    if (auto it = index_.find(std::string(entity)); it != index_.end()) {
        return schemas_[it->second];
    }
    throw SchemaError(fmt::format("no schema declared for entity '{}'", entity));
}

auto SchemaRegistry::contains(std::string_view entity) const -> bool {
    return index_.contains(std::string(entity));
}

auto SchemaRegistry::entities() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& schema : schemas_) {
        names.push_back(schema.entity);
    }
    return names;
}

}  // namespace boxcar::schema
