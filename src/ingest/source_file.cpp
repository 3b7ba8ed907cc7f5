#include <boxcar/ingest/source_file.hpp>

#include <fnmatch.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace boxcar::ingest {

auto derive_tag(const std::filesystem::path& path, std::size_t length) -> std::string {
    auto stem = path.stem().string();
    if (stem.size() <= length) {
        return stem;
    }
    return stem.substr(stem.size() - length);
}

auto make_sources(std::vector<std::filesystem::path> paths, std::size_t tag_length)
    -> std::vector<SourceFile> {
    std::ranges::sort(paths);
    std::vector<SourceFile> sources;
    sources.reserve(paths.size());
    for (auto& path : paths) {
        auto tag = derive_tag(path, tag_length);
        sources.push_back(SourceFile{.path = std::move(path), .tag = std::move(tag)});
    }
    return sources;
}

auto discover_sources(const std::filesystem::path& directory, std::string_view pattern,
                      std::size_t tag_length) -> std::vector<SourceFile> {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        spdlog::debug("source directory not found: {}", directory.string());
        return {};
    }

    const std::string glob(pattern);
    std::vector<std::filesystem::path> paths;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (::fnmatch(glob.c_str(), name.c_str(), 0) == 0) {
            paths.push_back(entry.path());
        }
    }
    return make_sources(std::move(paths), tag_length);
}

}  // namespace boxcar::ingest
