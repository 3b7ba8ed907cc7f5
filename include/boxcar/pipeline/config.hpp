#pragma once

#include <boxcar/convert/typed_reader.hpp>
#include <boxcar/ingest/rules.hpp>
#include <boxcar/ingest/source_file.hpp>
#include <boxcar/output/encoding_policy.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace boxcar::pipeline {

/// One logical entity of a run.
struct EntitySpec {
    std::string name;
    /// Already resolved, sorted by path.
    std::vector<ingest::SourceFile> sources;
    ingest::EntityRules rules;
    output::ColumnEncodingPolicy encoding;
};

/// Everything a run needs. Entities are processed in the listed order.
struct PipelineConfig {
    std::filesystem::path output_dir;
    /// Holds `<entity>.csv` intermediate streams.
    std::filesystem::path work_dir;
    bool keep_intermediate = false;
    convert::ReaderOptions reader;
    std::vector<EntitySpec> entities;
};

}  // namespace boxcar::pipeline
