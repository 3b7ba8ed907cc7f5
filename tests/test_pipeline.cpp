#include "log_capture.hpp"

#include <boxcar/output/artifact_reader.hpp>
#include <boxcar/pipeline/catalog.hpp>
#include <boxcar/pipeline/pipeline.hpp>
#include <boxcar/schema/retrosheet.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace boxcar;
using namespace boxcar::pipeline;
using schema::ColumnDeclaration;
using schema::SchemaRegistry;
using schema::TableDeclaration;

namespace {

struct Workspace {
    std::filesystem::path root;
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path work;
};

auto make_workspace(const char* name) -> Workspace {
    auto root = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(root);
    Workspace ws{.root = root, .input = root / "in", .output = root / "out", .work = root / "work"};
    std::filesystem::create_directories(ws.input);
    return ws;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

auto file_bytes(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

auto schedule_declaration() -> TableDeclaration {
    return TableDeclaration{
        .entity = "schedule",
        .columns =
            {
                ColumnDeclaration{.name = "id", .type = "INTEGER", .nullable = false,
                                  .autoincrement = true},
                ColumnDeclaration{.name = "date", .type = "DATE", .nullable = false},
                ColumnDeclaration{.name = "double_header", .type = "SMALLINT"},
                ColumnDeclaration{.name = "visiting_team", .type = "CHAR(3)"},
                ColumnDeclaration{.name = "home_team", .type = "CHAR(3)"},
            },
    };
}

auto park_declaration() -> TableDeclaration {
    return TableDeclaration{
        .entity = "park",
        .columns =
            {
                ColumnDeclaration{.name = "park_id", .type = "CHAR(5)", .nullable = false},
                ColumnDeclaration{.name = "opened", .type = "DATE"},
            },
    };
}

auto entity(const std::string& name, const Workspace& ws, const std::string& pattern)
    -> EntitySpec {
    return EntitySpec{.name = name, .sources = ingest::discover_sources(ws.input, pattern)};
}

auto config_for(const Workspace& ws, std::vector<EntitySpec> entities) -> PipelineConfig {
    return PipelineConfig{.output_dir = ws.output,
                          .work_dir = ws.work,
                          .entities = std::move(entities)};
}

}  // namespace

TEST_CASE("Duplicate schedule rows across files yield one typed row", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_schedule");
    write_file(ws.input / "SKED1901.TXT", "19010415,0,CLE,PHA\r\n");
    write_file(ws.input / "SKED1902.TXT", "19010415,0,CLE,PHA\r\n\x1A");

    SchemaRegistry registry({schedule_declaration()});
    LogCapture log;
    auto summary = run_pipeline(config_for(ws, {entity("schedule", ws, "SKED*.TXT")}), registry);

    REQUIRE(summary.ok());
    REQUIRE(summary.succeeded() == 1);
    const auto& report = *summary.results.front().outcome;
    REQUIRE(report.normalize.records_emitted == 1);
    REQUIRE(report.normalize.duplicates == 1);
    REQUIRE(report.rows == 1);
    REQUIRE(log.contains("duplicate row in"));

    auto table = output::read_artifact(ws.output / "schedule.parquet");
    REQUIRE(table.rows() == 1);
    REQUIRE(table.columns.size() == 4);
    REQUIRE(table.find("id") == nullptr);

    using namespace std::chrono;
    REQUIRE(std::get<Column<Timestamp>>(*table.find("date"))[0] ==
            make_timestamp(1901y / April / 15d));
    REQUIRE(std::get<Column<std::int16_t>>(*table.find("double_header"))[0] == 0);
    REQUIRE(std::get<Column<std::string>>(*table.find("home_team"))[0] == "PHA");
}

TEST_CASE("Booleans and empty fields survive the round trip", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_roundtrip");
    write_file(ws.input / "games.txt", "19010415,T,0,,\n19010416,F,1,3200,rain\n");

    SchemaRegistry registry({TableDeclaration{
        .entity = "games",
        .columns =
            {
                ColumnDeclaration{.name = "date", .type = "DATE", .nullable = false},
                ColumnDeclaration{.name = "night", .type = "BOOLEAN"},
                ColumnDeclaration{.name = "forfeit", .type = "BOOLEAN"},
                ColumnDeclaration{.name = "attendance", .type = "INTEGER"},
                ColumnDeclaration{.name = "notes", .type = "VARCHAR(40)"},
            },
    }});
    REQUIRE(run_pipeline(config_for(ws, {entity("games", ws, "*.txt")}), registry).ok());

    auto table = output::read_artifact(ws.output / "games.parquet");
    REQUIRE(table.rows() == 2);

    const auto& night = std::get<Column<bool>>(*table.find("night"));
    const auto& forfeit = std::get<Column<bool>>(*table.find("forfeit"));
    REQUIRE(night[0]);
    REQUIRE_FALSE(night[1]);
    REQUIRE_FALSE(forfeit[0]);
    REQUIRE(forfeit[1]);

    const auto* attendance = table.find_entry("attendance");
    REQUIRE(is_null(*attendance, 0));
    REQUIRE(std::get<Column<std::int32_t>>(*attendance->column)[1] == 3200);
    const auto* notes = table.find_entry("notes");
    REQUIRE(is_null(*notes, 0));
    REQUIRE_FALSE(is_null(*notes, 1));
    REQUIRE(std::get<Column<std::string>>(*notes->column)[1] == "rain");
}

TEST_CASE("Re-running on unchanged inputs rewrites an identical artifact", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_rerun");
    write_file(ws.input / "SKED1901.TXT", "19010416,0,BOS,NY1\n19010415,0,CLE,PHA\n");

    SchemaRegistry registry({schedule_declaration()});
    auto spec = entity("schedule", ws, "*.TXT");
    spec.encoding.sort_key = "date";
    spec.encoding.overrides.emplace("date", output::ColumnEncoding::Delta);
    const auto config = config_for(ws, {spec});

    REQUIRE(run_pipeline(config, registry).ok());
    auto first = file_bytes(ws.output / "schedule.parquet");
    REQUIRE(run_pipeline(config, registry).ok());

    REQUIRE(first == file_bytes(ws.output / "schedule.parquet"));
}

TEST_CASE("A conversion failure is isolated to its entity", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_isolated");
    write_file(ws.input / "SKED1901.TXT", "19010415,0,CLE,PHA\n");
    write_file(ws.input / "parks.txt", "BOS07,19120420\nCHI11,April 1914\n");

    SchemaRegistry registry({schedule_declaration(), park_declaration()});
    LogCapture log;
    auto summary = run_pipeline(
        config_for(ws, {entity("park", ws, "parks.txt"), entity("schedule", ws, "SKED*.TXT")}),
        registry);

    REQUIRE_FALSE(summary.ok());
    REQUIRE(summary.failed() == 1);
    REQUIRE(summary.succeeded() == 1);

    const auto& park = summary.results[0];
    REQUIRE(park.entity == "park");
    REQUIRE_FALSE(park.ok());
    REQUIRE(park.outcome.error().kind == FailureKind::Conversion);
    REQUIRE(park.outcome.error().message.find("record 2") != std::string::npos);
    REQUIRE(park.outcome.error().message.find("opened") != std::string::npos);
    REQUIRE_FALSE(std::filesystem::exists(ws.output / "park.parquet"));

    REQUIRE(summary.results[1].ok());
    REQUIRE(std::filesystem::exists(ws.output / "schedule.parquet"));
    REQUIRE(log.contains("conversion failure"));
}

TEST_CASE("Configuration defects abort before any file is read", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_invalid");
    write_file(ws.input / "SKED1901.TXT", "19010415,0,CLE,PHA\n");
    SchemaRegistry registry({schedule_declaration()});

    SECTION("undeclared entity") {
        auto config = config_for(ws, {entity("schedule", ws, "*.TXT"), entity("team", ws, "*")});
        REQUIRE_THROWS_AS(static_cast<void>(run_pipeline(config, registry)),
                          schema::SchemaError);
    }
    SECTION("repeated entity") {
        auto config =
            config_for(ws, {entity("schedule", ws, "*.TXT"), entity("schedule", ws, "*.TXT")});
        REQUIRE_THROWS_AS(static_cast<void>(run_pipeline(config, registry)),
                          schema::SchemaError);
    }
    SECTION("encoding for an unknown column") {
        auto spec = entity("schedule", ws, "*.TXT");
        spec.encoding.overrides.emplace("attendance", output::ColumnEncoding::Plain);
        REQUIRE_THROWS_AS(static_cast<void>(run_pipeline(config_for(ws, {spec}), registry)),
                          schema::SchemaError);
    }
    REQUIRE_FALSE(std::filesystem::exists(ws.output));
    REQUIRE_FALSE(std::filesystem::exists(ws.work));
}

TEST_CASE("Intermediate streams are removed unless kept", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_intermediate");
    write_file(ws.input / "SKED1901.TXT", "19010415,0,CLE,PHA\n");
    SchemaRegistry registry({schedule_declaration()});
    auto config = config_for(ws, {entity("schedule", ws, "*.TXT")});

    SECTION("removed by default") {
        REQUIRE(run_pipeline(config, registry).ok());
        REQUIRE_FALSE(std::filesystem::exists(ws.work / "schedule.csv"));
    }
    SECTION("kept on request") {
        config.keep_intermediate = true;
        REQUIRE(run_pipeline(config, registry).ok());
        REQUIRE(file_bytes(ws.work / "schedule.csv") == "19010415,0,CLE,PHA\n");
    }
}

TEST_CASE("An entity without source files writes an empty artifact", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_nosources");
    SchemaRegistry registry({schedule_declaration()});
    LogCapture log;

    auto summary = run_pipeline(config_for(ws, {entity("schedule", ws, "*.TXT")}), registry);

    REQUIRE(summary.ok());
    REQUIRE(summary.results.front().outcome->rows == 0);
    REQUIRE(std::filesystem::exists(ws.output / "schedule.parquet"));
    REQUIRE(log.contains("no source files"));
}

TEST_CASE("A missing source file is an io failure", "[pipeline]") {
    auto ws = make_workspace("boxcar_test_pipeline_missing");
    SchemaRegistry registry({schedule_declaration()});
    EntitySpec spec{.name = "schedule",
                    .sources = ingest::make_sources({ws.input / "SKED1901.TXT"})};

    auto summary = run_pipeline(config_for(ws, {spec}), registry);

    REQUIRE(summary.failed() == 1);
    REQUIRE(summary.results.front().outcome.error().kind == FailureKind::Io);
    REQUIRE(to_string(FailureKind::Io) == "io");
}

TEST_CASE("Catalog resolves retrosheet entities under an input root", "[pipeline][catalog]") {
    auto ws = make_workspace("boxcar_test_pipeline_catalog");
    write_file(ws.input / "rosters" / "PHA1901.ROS", "x\n");
    write_file(ws.input / "rosters" / "BOS1901.ROS", "x\n");
    write_file(ws.input / "rosters" / "readme.txt", "x\n");

    const auto catalog = retrosheet_catalog();
    REQUIRE(catalog.size() == 5);
    REQUIRE(find_entry(catalog, "stadium") == nullptr);

    const auto* roster = find_entry(catalog, "roster");
    REQUIRE(roster != nullptr);
    REQUIRE(roster->rules.prepend_tag);

    auto spec = resolve(*roster, ws.input);
    REQUIRE(spec.name == "roster");
    REQUIRE(spec.sources.size() == 2);
    REQUIRE(spec.sources[0].path.filename() == "BOS1901.ROS");
    REQUIRE(spec.sources[0].tag == "1901");

    const auto* gamelog = find_entry(catalog, "gamelog");
    REQUIRE(gamelog->rules.row_filter.has_value());
    REQUIRE_FALSE(gamelog->rules.dedupe);
}

TEST_CASE("Catalog encodings agree with the built-in schemas", "[pipeline][catalog]") {
    SchemaRegistry registry(schema::retrosheet_declarations());
    for (const auto& entry : retrosheet_catalog()) {
        REQUIRE(registry.contains(entry.entity));
        REQUIRE_NOTHROW(output::validate_policy(entry.encoding, registry.schema(entry.entity)));
    }
}
