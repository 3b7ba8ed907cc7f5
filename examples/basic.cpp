#include <boxcar/boxcar.hpp>

#include <fmt/core.h>

#include <filesystem>
#include <sstream>

auto main() -> int {
    // Declare a small entity and translate it
    boxcar::schema::SchemaRegistry registry({boxcar::schema::TableDeclaration{
        .entity = "games",
        .columns = {{.name = "id", .type = "INTEGER", .autoincrement = true},
                    {.name = "date", .type = "DATE", .nullable = false},
                    {.name = "home_team", .type = "CHAR(3)"},
                    {.name = "attendance", .type = "INTEGER"},
                    {.name = "night", .type = "BOOLEAN"}},
    }});
    const auto& schema = registry.schema("games");

    fmt::print("=== Schema ===\n");
    for (const auto& field : schema.fields) {
        fmt::print("{}: {}{}\n", field.name, boxcar::schema::to_string(field.type),
                   field.nullable ? "" : " not null");
    }

    // Parse a normalized stream
    std::istringstream stream("19010415,CLE,9000,F\n19010416,PHA,,T\n");
    boxcar::convert::TypedReader reader(schema);
    auto table = reader.read(stream, "<memory>");
    if (!table) {
        fmt::print("conversion failed: {}\n", table.error().format());
        return 1;
    }
    fmt::print("\n=== Typed table ===\n");
    fmt::print("{} rows, {} columns\n", table->rows(), table->columns.size());

    // Write the artifact
    boxcar::output::ColumnEncodingPolicy policy;
    policy.overrides.emplace("date", boxcar::output::ColumnEncoding::Delta);
    boxcar::output::ColumnarWriter writer(std::filesystem::temp_directory_path() / "boxcar_basic");
    auto result = writer.write(*table, schema, policy);
    fmt::print("\n=== Artifact ===\n");
    fmt::print("{} rows, {} bytes at {}\n", result.rows, result.bytes, result.path.string());
    return 0;
}
