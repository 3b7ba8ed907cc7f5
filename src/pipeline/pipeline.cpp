#include <boxcar/convert/typed_reader.hpp>
#include <boxcar/pipeline/pipeline.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace boxcar::pipeline {

namespace {

auto run_stages(const EntitySpec& spec, const schema::EntitySchema& schema,
                const PipelineConfig& config, const std::filesystem::path& intermediate)
    -> std::expected<EntityReport, EntityFailure> {
    EntityReport report;

    try {
        std::filesystem::create_directories(config.work_dir);
        std::ofstream out(intermediate, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot create " + intermediate.string());
        }
        ingest::LineNormalizer normalizer(spec.name, spec.sources, spec.rules, schema.width());
        normalizer.write_to(out);
        out.close();
        if (!out) {
            throw std::runtime_error("failed to flush " + intermediate.string());
        }
        report.normalize = normalizer.stats();
    } catch (const std::exception& e) {
        return std::unexpected(EntityFailure{.kind = FailureKind::Io, .message = e.what()});
    }

    Table table;
    try {
        convert::TypedReader reader(schema, config.reader);
        auto parsed = reader.read_file(intermediate);
        if (!parsed) {
            return std::unexpected(
                EntityFailure{.kind = FailureKind::Conversion, .message = parsed.error().format()});
        }
        table = std::move(*parsed);
    } catch (const std::exception& e) {
        return std::unexpected(EntityFailure{.kind = FailureKind::Io, .message = e.what()});
    }

    try {
        output::ColumnarWriter writer(config.output_dir);
        report.artifact = writer.write(table, schema, spec.encoding);
        report.rows = report.artifact.rows;
    } catch (const std::exception& e) {
        return std::unexpected(EntityFailure{.kind = FailureKind::Write, .message = e.what()});
    }
    return report;
}

}  // namespace

auto to_string(FailureKind kind) -> std::string_view {
    switch (kind) {
        case FailureKind::Io:
            return "io";
        case FailureKind::Conversion:
            return "conversion";
        case FailureKind::Write:
            return "write";
    }
    return "unknown";
}

auto RunSummary::succeeded() const noexcept -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        results.begin(), results.end(), [](const EntityResult& r) { return r.ok(); }));
}

auto RunSummary::failed() const noexcept -> std::size_t {
    return results.size() - succeeded();
}

void validate(const PipelineConfig& config, const schema::SchemaRegistry& registry) {
    if (config.output_dir.empty()) {
        throw schema::SchemaError("no output directory configured");
    }
    if (config.work_dir.empty()) {
        throw schema::SchemaError("no work directory configured");
    }
    std::unordered_set<std::string> seen;
    for (const auto& spec : config.entities) {
        if (!seen.insert(spec.name).second) {
            throw schema::SchemaError(fmt::format("entity '{}' is listed twice", spec.name));
        }
        output::validate_policy(spec.encoding, registry.schema(spec.name));
    }
}

auto run_entity(const EntitySpec& spec, const schema::EntitySchema& schema,
                const PipelineConfig& config) -> EntityResult {
    const auto intermediate = config.work_dir / (spec.name + ".csv");
    if (spec.sources.empty()) {
        spdlog::warn("{}: no source files", spec.name);
    }
    spdlog::info("{}: normalizing {} source files", spec.name, spec.sources.size());

    EntityResult result{.entity = spec.name,
                        .outcome = run_stages(spec, schema, config, intermediate)};

    if (!config.keep_intermediate) {
        std::error_code ec;
        std::filesystem::remove(intermediate, ec);
        if (ec) {
            spdlog::warn("{}: could not remove {}: {}", spec.name, intermediate.string(),
                         ec.message());
        }
    }

    if (result.ok()) {
        const auto& report = *result.outcome;
        const auto& stats = report.normalize;
        spdlog::info(
            "{}: {} lines from {} files, {} records ({} duplicates, {} repaired, {} dropped, "
            "{} filtered)",
            spec.name, stats.lines_read, stats.files, stats.records_emitted, stats.duplicates,
            stats.repaired, stats.dropped, stats.filtered);
        spdlog::info("{}: wrote {} rows to {}", spec.name, report.rows,
                     report.artifact.path.string());
    } else {
        spdlog::error("{}: {} failure: {}", spec.name, to_string(result.outcome.error().kind),
                      result.outcome.error().message);
    }
    return result;
}

auto run_pipeline(const PipelineConfig& config, const schema::SchemaRegistry& registry)
    -> RunSummary {
    validate(config, registry);

    RunSummary summary;
    summary.results.reserve(config.entities.size());
    for (const auto& spec : config.entities) {
        summary.results.push_back(run_entity(spec, registry.schema(spec.name), config));
    }
    spdlog::info("run finished: {} succeeded, {} failed", summary.succeeded(), summary.failed());
    return summary;
}

}  // namespace boxcar::pipeline
