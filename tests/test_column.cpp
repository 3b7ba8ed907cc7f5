#include <boxcar/core/column.hpp>
#include <boxcar/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <string>

TEST_CASE("Column<int32_t> basic operations", "[core][column]") {
    boxcar::Column<std::int32_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column gather reorders and repeats rows", "[core][column]") {
    boxcar::Column<std::string> col{"a", "b", "c"};

    auto out = col.gather({2, 0, 0});

    REQUIRE(out.size() == 3);
    REQUIRE(out[0] == "c");
    REQUIRE(out[1] == "a");
    REQUIRE(out[2] == "a");
}

TEST_CASE("Column<bool> stores flags", "[core][column]") {
    boxcar::Column<bool> col;
    col.push_back(true);
    col.emplace_back();
    col.push_back(false);

    REQUIRE(col.size() == 3);
    REQUIRE(col[0]);
    REQUIRE_FALSE(col[1]);
    REQUIRE_FALSE(col.at(2));
}

TEST_CASE("Column<Timestamp> holds calendar dates", "[core][column]") {
    using namespace std::chrono;
    boxcar::Column<boxcar::Timestamp> col;
    col.push_back(boxcar::make_timestamp(1970y / January / 2d));
    col.push_back(boxcar::make_timestamp(1901y / April / 15d));

    REQUIRE(col[0].millis == 86'400'000);
    REQUIRE(col[1] < col[0]);
    REQUIRE(col[1].millis == -2'168'467'200'000);
}

TEST_CASE("make_timestamp adds the time of day", "[core][time]") {
    using namespace std::chrono;
    auto ts = boxcar::make_timestamp(1970y / January / 1d, 1, 2, 3);
    REQUIRE(ts.millis == (3600 + 120 + 3) * 1000);
}
