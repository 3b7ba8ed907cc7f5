#pragma once

#include <boxcar/schema/registry.hpp>

#include <filesystem>
#include <vector>

namespace boxcar::schema {

/// Load table declarations from a CSV file with the header
///
///     entity,column,type[,nullable][,autoincrement]
///
/// One row per column, in column order. Entities appear in order of their
/// first row. `nullable` defaults to true and `autoincrement` to false; both
/// accept true/false, 1/0, yes/no or an empty cell.
///
/// Throws SchemaError when the file is unreadable or malformed.
[[nodiscard]] auto load_declarations(const std::filesystem::path& path)
    -> std::vector<TableDeclaration>;

}  // namespace boxcar::schema
