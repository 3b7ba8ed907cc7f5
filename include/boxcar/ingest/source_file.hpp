#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace boxcar::ingest {

/// Default number of trailing filename-stem characters forming a source tag.
inline constexpr std::size_t kDefaultTagLength = 4;

/// One input file of a logical entity.
struct SourceFile {
    std::filesystem::path path;
    /// Provenance tag derived from the filename, typically a year.
    std::string tag;
};

/// The last `length` characters of the filename stem (`BOS1901.ROS` → `1901`).
/// Shorter stems yield the whole stem.
[[nodiscard]] auto derive_tag(const std::filesystem::path& path,
                              std::size_t length = kDefaultTagLength) -> std::string;

/// Build source descriptors sorted by path. Sorting fixes both the output
/// order and which copy of a duplicate row survives.
[[nodiscard]] auto make_sources(std::vector<std::filesystem::path> paths,
                                std::size_t tag_length = kDefaultTagLength)
    -> std::vector<SourceFile>;

/// Regular files directly under `directory` whose names match the shell
/// wildcard `pattern`, sorted by path. A missing directory yields no files.
[[nodiscard]] auto discover_sources(const std::filesystem::path& directory,
                                    std::string_view pattern,
                                    std::size_t tag_length = kDefaultTagLength)
    -> std::vector<SourceFile>;

}  // namespace boxcar::ingest
