#pragma once

#include <boxcar/core/table.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace boxcar::output {

struct ArtifactColumn {
    std::string name;
    /// Arrow type, e.g. "int16" or "timestamp[ms]".
    std::string type;
    bool nullable = true;
    /// Distinct Parquet encodings used by the column chunks, sorted.
    std::vector<std::string> encodings;
    std::string compression;
};

struct ArtifactInfo {
    std::int64_t rows = 0;
    int row_groups = 0;
    std::vector<ArtifactColumn> columns;
};

/// Load a Parquet artifact into a typed Table. Nulls become validity entries.
/// Throws std::runtime_error on I/O failure or an unsupported column type.
[[nodiscard]] auto read_artifact(const std::filesystem::path& path) -> Table;

/// Schema and footer summary of a Parquet artifact.
[[nodiscard]] auto inspect_artifact(const std::filesystem::path& path) -> ArtifactInfo;

}  // namespace boxcar::output
