#pragma once

#include <boxcar/schema/registry.hpp>

#include <vector>

namespace boxcar::schema {

/// Relational declarations of the retrosheet "simple" files: gamelog,
/// schedule, park, roster and bio, in that order.
[[nodiscard]] auto retrosheet_declarations() -> std::vector<TableDeclaration>;

}  // namespace boxcar::schema
