#include <boxcar/schema/declaration_file.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using boxcar::schema::SchemaError;

namespace {

auto write_file(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

}  // namespace

TEST_CASE("Load declarations with every flag column", "[schema][declarations]") {
    auto path = tmp("boxcar_test_decl_full.csv");
    write_file(path,
               "entity,column,type,nullable,autoincrement\n"
               "schedule,id,INTEGER,false,true\n"
               "schedule,date,DATE,no,\n"
               "schedule,home_team,CHAR(3),,\n"
               "park,park_id,VARCHAR(5),0,0\n"
               "schedule,attendance,integer,yes,no\n");

    auto tables = boxcar::schema::load_declarations(path);

    REQUIRE(tables.size() == 2);
    REQUIRE(tables[0].entity == "schedule");
    REQUIRE(tables[1].entity == "park");

    const auto& schedule = tables[0].columns;
    REQUIRE(schedule.size() == 4);
    REQUIRE(schedule[0].name == "id");
    REQUIRE(schedule[0].autoincrement);
    REQUIRE_FALSE(schedule[1].nullable);
    REQUIRE(schedule[2].type == "CHAR(3)");
    REQUIRE(schedule[2].nullable);
    REQUIRE_FALSE(schedule[2].autoincrement);
    REQUIRE(schedule[3].name == "attendance");

    REQUIRE_FALSE(tables[1].columns[0].nullable);
}

TEST_CASE("Flag columns are optional", "[schema][declarations]") {
    auto path = tmp("boxcar_test_decl_min.csv");
    write_file(path, "entity,column,type\nroster,year,SMALLINT\nroster,player_id,CHAR(8)\n");

    auto tables = boxcar::schema::load_declarations(path);

    REQUIRE(tables.size() == 1);
    REQUIRE(tables[0].columns.size() == 2);
    REQUIRE(tables[0].columns[0].nullable);
    REQUIRE_FALSE(tables[0].columns[1].autoincrement);
}

TEST_CASE("Malformed declaration files raise SchemaError", "[schema][declarations]") {
    SECTION("missing file") {
        REQUIRE_THROWS_AS(boxcar::schema::load_declarations(tmp("boxcar_no_such_file.csv")),
                          SchemaError);
    }
    SECTION("invalid flag") {
        auto path = tmp("boxcar_test_decl_flag.csv");
        write_file(path, "entity,column,type,nullable\npark,park_id,TEXT,maybe\n");
        REQUIRE_THROWS_AS(boxcar::schema::load_declarations(path), SchemaError);
    }
    SECTION("missing type column") {
        auto path = tmp("boxcar_test_decl_header.csv");
        write_file(path, "entity,column\npark,park_id\n");
        REQUIRE_THROWS_AS(boxcar::schema::load_declarations(path), SchemaError);
    }
    SECTION("no rows") {
        auto path = tmp("boxcar_test_decl_empty.csv");
        write_file(path, "entity,column,type\n");
        REQUIRE_THROWS_AS(boxcar::schema::load_declarations(path), SchemaError);
    }
}
