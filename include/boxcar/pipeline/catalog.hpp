#pragma once

#include <boxcar/ingest/rules.hpp>
#include <boxcar/output/encoding_policy.hpp>
#include <boxcar/pipeline/config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace boxcar::pipeline {

/// Where an entity's files live under the input root and how they are treated.
struct CatalogEntry {
    std::string entity;
    std::filesystem::path subdirectory;
    /// Shell wildcard matched against file names.
    std::string pattern;
    ingest::EntityRules rules;
    output::ColumnEncodingPolicy encoding;
};

/// gamelog, schedule, park, roster and bio, in processing order.
[[nodiscard]] auto retrosheet_catalog() -> std::vector<CatalogEntry>;

[[nodiscard]] auto find_entry(const std::vector<CatalogEntry>& catalog, std::string_view entity)
    -> const CatalogEntry*;

/// Discover `entry`'s files under `input_root` and build its EntitySpec.
[[nodiscard]] auto resolve(const CatalogEntry& entry, const std::filesystem::path& input_root)
    -> EntitySpec;

}  // namespace boxcar::pipeline
