#include <boxcar/convert/typed_reader.hpp>
#include <boxcar/ingest/line_normalizer.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace boxcar;
using namespace boxcar::convert;
using schema::EntitySchema;
using schema::FieldSpec;
using schema::FieldType;

namespace {

auto schedule_schema() -> EntitySchema {
    return EntitySchema{
        .entity = "schedule",
        .fields =
            {
                FieldSpec{.name = "date", .type = FieldType::TimestampMillis, .nullable = false},
                FieldSpec{.name = "double_header", .type = FieldType::Int16},
                FieldSpec{.name = "visiting_team", .type = FieldType::Utf8},
                FieldSpec{.name = "home_team", .type = FieldType::Utf8, .nullable = false},
            },
    };
}

auto read_text(const EntitySchema& schema, const std::string& text, ReaderOptions options = {})
    -> std::expected<Table, ConversionError> {
    std::istringstream input(text);
    return TypedReader(schema, options).read(input, "schedule.csv");
}

}  // namespace

TEST_CASE("Records become typed columns in schema order", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,0,CLE,PHA\n19010416,1,BOS,NY1\n");

    REQUIRE(result.has_value());
    const auto& table = *result;
    REQUIRE(table.rows() == 2);
    REQUIRE(table.columns.size() == 4);
    REQUIRE(table.columns[0].name == "date");
    REQUIRE(table.columns[3].name == "home_team");

    using namespace std::chrono;
    const auto* date = std::get_if<Column<Timestamp>>(table.find("date"));
    REQUIRE(date != nullptr);
    REQUIRE((*date)[0] == make_timestamp(1901y / April / 15d));

    const auto* dh = std::get_if<Column<std::int16_t>>(table.find("double_header"));
    REQUIRE(dh != nullptr);
    REQUIRE((*dh)[1] == 1);

    const auto* home = std::get_if<Column<std::string>>(table.find("home_team"));
    REQUIRE(home != nullptr);
    REQUIRE((*home)[1] == "NY1");

    REQUIRE_FALSE(table.find_entry("double_header")->validity.has_value());
}

TEST_CASE("Empty values in nullable columns become nulls", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,,CLE,PHA\n19010416,2,,BOS\n");

    REQUIRE(result.has_value());
    const auto* dh = result->find_entry("double_header");
    REQUIRE(dh->validity.has_value());
    REQUIRE(is_null(*dh, 0));
    REQUIRE_FALSE(is_null(*dh, 1));
    const auto* visitor = result->find_entry("visiting_team");
    REQUIRE(is_null(*visitor, 1));
}

TEST_CASE("Empty text in a non-nullable column is the empty string", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,0,CLE,\n");

    REQUIRE(result.has_value());
    const auto* home = result->find_entry("home_team");
    REQUIRE_FALSE(home->validity.has_value());
    REQUIRE(std::get<Column<std::string>>(*home->column)[0].empty());
}

TEST_CASE("Empty non-text value in a non-nullable column is an error", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,0,CLE,PHA\n,0,CLE,PHA\n");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().record == 2);
    REQUIRE(result.error().column == "date");
    REQUIRE(result.error().message == "empty value in non-nullable column");
}

TEST_CASE("An unparseable field reports its position", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,0,CLE,PHA\n19010415,x,CLE,PHA\n");

    REQUIRE_FALSE(result.has_value());
    const auto& error = result.error();
    REQUIRE(error.source == "schedule.csv");
    REQUIRE(error.record == 2);
    REQUIRE(error.column == "double_header");
    REQUIRE(error.raw == "x");
    REQUIRE(error.message == "cannot parse value as int16");
    REQUIRE(error.format() ==
            "schedule.csv: record 2: column 'double_header': cannot parse value as int16 "
            "(raw \"x\")");
}

TEST_CASE("Records of the wrong width are rejected", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,0,CLE\n");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().column.empty());
    REQUIRE(result.error().message == "record has 3 fields, expected 4");
}

TEST_CASE("Quoted fields may hold separators and line breaks", "[convert][reader]") {
    EntitySchema schema{
        .entity = "park",
        .fields =
            {
                FieldSpec{.name = "park_id", .type = FieldType::Utf8, .nullable = false},
                FieldSpec{.name = "notes", .type = FieldType::Utf8},
            },
    };
    auto result = read_text(schema, "BOS07,\"Fenway, Boston\"\nCHI11,\"line one\nline two\"\n");

    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 2);
    const auto& notes = std::get<Column<std::string>>(*result->find("notes"));
    REQUIRE(notes[0] == "Fenway, Boston");
    REQUIRE(notes[1] == "line one\nline two");
}

TEST_CASE("Small blocks give the same table as one block", "[convert][reader]") {
    std::string text;
    for (int day = 10; day < 30; ++day) {
        text += "190104" + std::to_string(day) + ",0,CLE,PHA\n";
    }

    auto whole = read_text(schedule_schema(), text);
    auto blocked = read_text(schedule_schema(), text, ReaderOptions{.block_size = 40});

    REQUIRE(whole.has_value());
    REQUIRE(blocked.has_value());
    REQUIRE(blocked->rows() == 20);
    REQUIRE(std::ranges::equal(std::get<Column<Timestamp>>(*blocked->find("date")),
                               std::get<Column<Timestamp>>(*whole->find("date"))));
}

TEST_CASE("Record numbers continue across blocks", "[convert][reader]") {
    auto result = read_text(schedule_schema(),
                            "19010415,0,CLE,PHA\n19010416,0,CLE,PHA\nbad,0,a,b\n",
                            ReaderOptions{.block_size = 1});

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().record == 3);
}

TEST_CASE("An unterminated quote at end of stream is an error", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "19010415,0,\"CLE,PHA\n");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message == "unterminated quoted field at end of stream");
}

TEST_CASE("Every column type parses", "[convert][reader]") {
    EntitySchema schema{
        .entity = "mixed",
        .fields =
            {
                FieldSpec{.name = "flag", .type = FieldType::Boolean},
                FieldSpec{.name = "count", .type = FieldType::Int32},
                FieldSpec{.name = "ratio", .type = FieldType::Float64},
            },
    };
    auto result = read_text(schema, "T,40000,0.25\n0,-1,1e2\n");

    REQUIRE(result.has_value());
    const auto& flag = std::get<Column<bool>>(*result->find("flag"));
    REQUIRE(flag[0]);
    REQUIRE_FALSE(flag[1]);
    REQUIRE(std::get<Column<std::int32_t>>(*result->find("count"))[0] == 40000);
    REQUIRE(std::get<Column<double>>(*result->find("ratio"))[1] == Catch::Approx(100.0));
}

TEST_CASE("An empty stream yields an empty table with every column", "[convert][reader]") {
    auto result = read_text(schedule_schema(), "");

    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 0);
    REQUIRE(result->columns.size() == 4);
}

TEST_CASE("Normalized records with inner quotes keep their width", "[convert][reader]") {
    auto dir = std::filesystem::temp_directory_path() / "boxcar_test_reader_inner_quote";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "bio.csv", std::ios::binary);
        out << "a,b\"c,d\"e,f\nx,5\" rain,z\n";
    }
    EntitySchema schema{
        .entity = "bio",
        .fields =
            {
                FieldSpec{.name = "w", .type = FieldType::Utf8},
                FieldSpec{.name = "x", .type = FieldType::Utf8},
                FieldSpec{.name = "y", .type = FieldType::Utf8},
                FieldSpec{.name = "z", .type = FieldType::Utf8},
            },
    };

    ingest::LineNormalizer normalizer("bio", ingest::make_sources({dir / "bio.csv"}),
                                      ingest::EntityRules{}, schema.width());
    std::stringstream stream;
    REQUIRE(normalizer.write_to(stream) == 2);

    auto result = TypedReader(schema).read(stream, "bio.csv");

    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 2);
    const auto& x = std::get<Column<std::string>>(*result->find("x"));
    const auto& y = std::get<Column<std::string>>(*result->find("y"));
    REQUIRE(x[0] == "b\"c");
    REQUIRE(y[0] == "d\"e");
    REQUIRE(x[1] == "5\" rain");
    REQUIRE(is_null(*result->find_entry("z"), 1));
}
