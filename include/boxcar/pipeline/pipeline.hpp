#pragma once

#include <boxcar/ingest/line_normalizer.hpp>
#include <boxcar/output/columnar_writer.hpp>
#include <boxcar/pipeline/config.hpp>
#include <boxcar/schema/registry.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace boxcar::pipeline {

enum class FailureKind : std::uint8_t {
    Io,
    Conversion,
    Write,
};

[[nodiscard]] auto to_string(FailureKind kind) -> std::string_view;

struct EntityFailure {
    FailureKind kind = FailureKind::Io;
    std::string message;
};

struct EntityReport {
    ingest::NormalizeStats normalize;
    std::int64_t rows = 0;
    output::WriteResult artifact;
};

struct EntityResult {
    std::string entity;
    std::expected<EntityReport, EntityFailure> outcome;

    [[nodiscard]] auto ok() const noexcept -> bool { return outcome.has_value(); }
};

/// Per-entity outcomes in processing order.
struct RunSummary {
    std::vector<EntityResult> results;

    [[nodiscard]] auto succeeded() const noexcept -> std::size_t;
    [[nodiscard]] auto failed() const noexcept -> std::size_t;
    [[nodiscard]] auto ok() const noexcept -> bool { return failed() == 0; }
};

/// Check `config` against `registry` before any file is touched. Throws
/// schema::SchemaError on an undeclared entity, a repeated entity or an
/// invalid encoding policy.
void validate(const PipelineConfig& config, const schema::SchemaRegistry& registry);

/// Normalize, convert and write one entity. Failures are returned, not thrown.
[[nodiscard]] auto run_entity(const EntitySpec& spec, const schema::EntitySchema& schema,
                              const PipelineConfig& config) -> EntityResult;

/// Validate `config`, then run every entity in order. A failing entity does
/// not stop the others. Throws schema::SchemaError from validation only.
[[nodiscard]] auto run_pipeline(const PipelineConfig& config,
                                const schema::SchemaRegistry& registry) -> RunSummary;

}  // namespace boxcar::pipeline
