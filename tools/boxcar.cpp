#include <boxcar/pipeline/catalog.hpp>
#include <boxcar/pipeline/pipeline.hpp>
#include <boxcar/schema/declaration_file.hpp>
#include <boxcar/schema/retrosheet.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitFailed = 1;
constexpr int kExitConfig = 2;

void print_summary(const boxcar::pipeline::RunSummary& summary) {
    fmt::print("{:<10} {:<8} {:>10}  {}\n", "entity", "status", "rows", "detail");
    for (const auto& result : summary.results) {
        if (result.ok()) {
            const auto& report = *result.outcome;
            fmt::print("{:<10} {:<8} {:>10}  {}\n", result.entity, "ok", report.rows,
                       report.artifact.path.string());
        } else {
            const auto& failure = result.outcome.error();
            fmt::print("{:<10} {:<8} {:>10}  {}: {}\n", result.entity, "FAILED", "-",
                       boxcar::pipeline::to_string(failure.kind), failure.message);
        }
    }
    fmt::print("{} succeeded, {} failed\n", summary.succeeded(), summary.failed());
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"boxcar: build typed Parquet artifacts from retrosheet record files"};
    app.set_version_flag("--version", "boxcar 0.1.0");

    std::string input_root;
    std::string output_dir;
    std::string work_dir;
    std::string schema_path;
    std::vector<std::string> entities;
    bool keep_intermediate = false;
    bool verbose = false;
    std::size_t block_size = boxcar::convert::kDefaultBlockSize;
    std::int64_t row_group_size = boxcar::output::kDefaultRowGroupLength;
    std::int64_t write_batch_size = boxcar::output::kDefaultWriteBatchSize;
    int zstd_level = 0;

    app.add_option("--input-root", input_root,
                   "Directory holding the entity subdirectories. "
                   "Defaults to the BOXCAR_INPUT_ROOT environment variable.");
    app.add_option("-o,--output-dir", output_dir, "Directory receiving <entity>.parquet")
        ->required();
    app.add_option("--work-dir", work_dir,
                   "Directory for intermediate streams (default: output directory)");
    app.add_option("--schema", schema_path,
                   "Declaration CSV (entity,column,type,nullable,autoincrement) replacing the "
                   "built-in declarations");
    app.add_option("-e,--entity", entities, "Entity to build; repeatable (default: all)");
    app.add_flag("--keep-intermediate", keep_intermediate, "Keep <work-dir>/<entity>.csv");
    app.add_option("--block-size", block_size, "Bytes parsed per read block")
        ->check(CLI::PositiveNumber);
    app.add_option("--row-group-size", row_group_size, "Maximum rows per row group")
        ->check(CLI::PositiveNumber);
    app.add_option("--write-batch-size", write_batch_size, "Parquet write batch size")
        ->check(CLI::PositiveNumber);
    auto* level_opt =
        app.add_option("--zstd-level", zstd_level, "zstd compression level (default: codec's)")
            ->check(CLI::Range(1, 22));
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (input_root.empty()) {
        const char* env = std::getenv("BOXCAR_INPUT_ROOT");
        if (env != nullptr) {
            input_root = env;
        }
    }
    if (input_root.empty()) {
        spdlog::error("no input root: pass --input-root or set BOXCAR_INPUT_ROOT");
        return kExitConfig;
    }
    if (work_dir.empty()) {
        work_dir = output_dir;
    }

    try {
        auto declarations = schema_path.empty() ? boxcar::schema::retrosheet_declarations()
                                                : boxcar::schema::load_declarations(schema_path);
        const boxcar::schema::SchemaRegistry registry(declarations);
        const auto catalog = boxcar::pipeline::retrosheet_catalog();

        if (entities.empty()) {
            for (const auto& entry : catalog) {
                entities.push_back(entry.entity);
            }
        }

        boxcar::pipeline::PipelineConfig config{
            .output_dir = output_dir,
            .work_dir = work_dir,
            .keep_intermediate = keep_intermediate,
            .reader = {.block_size = block_size},
        };
        for (const auto& name : entities) {
            const auto* entry = boxcar::pipeline::find_entry(catalog, name);
            if (entry == nullptr) {
                throw boxcar::schema::SchemaError(fmt::format("unknown entity '{}'", name));
            }
            auto spec = boxcar::pipeline::resolve(*entry, input_root);
            spec.encoding.row_group_length = row_group_size;
            spec.encoding.write_batch_size = write_batch_size;
            if (level_opt->count() > 0) {
                spec.encoding.zstd_level = zstd_level;
            }
            config.entities.push_back(std::move(spec));
        }

        auto summary = boxcar::pipeline::run_pipeline(config, registry);
        print_summary(summary);
        return summary.ok() ? 0 : kExitFailed;
    } catch (const boxcar::schema::SchemaError& e) {
        spdlog::error("configuration error: {}", e.what());
        return kExitConfig;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitFailed;
    }
}
