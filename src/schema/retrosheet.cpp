#include <boxcar/schema/retrosheet.hpp>

#include <fmt/format.h>

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace boxcar::schema {

namespace {

class DeclarationBuilder {
   public:
    explicit DeclarationBuilder(std::string entity) { table_.entity = std::move(entity); }

    auto add(std::string name, std::string type, bool nullable = true) -> DeclarationBuilder& {
        table_.columns.push_back(ColumnDeclaration{
            .name = std::move(name), .type = std::move(type), .nullable = nullable});
        return *this;
    }

    [[nodiscard]] auto build() && -> TableDeclaration { return std::move(table_); }

   private:
    TableDeclaration table_;
};

// Per-team offensive (17), pitching (5) and defensive (6) totals, in game log order.
constexpr std::array<std::string_view, 28> kTeamStats{
    "at_bats",
    "hits",
    "doubles",
    "triples",
    "homeruns",
    "rbi",
    "sacrifice_hits",
    "sacrifice_flies",
    "hit_by_pitch",
    "walks",
    "intentional_walks",
    "strikeouts",
    "stolen_bases",
    "caught_stealing",
    "grounded_into_double_plays",
    "awarded_first_on_interference",
    "left_on_base",
    "pitchers_used",
    "individual_earned_runs",
    "team_earned_runs",
    "wild_pitches",
    "balks",
    "putouts",
    "assists",
    "errors",
    "passed_balls",
    "double_plays",
    "triple_plays",
};

constexpr std::array<std::string_view, 6> kUmpirePositions{"hp", "1b", "2b", "3b", "lf", "rf"};
constexpr std::array<std::string_view, 2> kSides{"visiting", "home"};

auto add_person(DeclarationBuilder& builder, std::string_view role) -> void {
    builder.add(fmt::format("{}_id", role), "CHAR(8)");
    builder.add(fmt::format("{}_name", role), "VARCHAR");
}

auto gamelog() -> TableDeclaration {
    DeclarationBuilder b("gamelog");
    b.add("date", "DATE", false)
        .add("double_header", "SMALLINT")
        .add("day_of_week", "CHAR(3)")
        .add("visiting_team", "CHAR(3)")
        .add("visiting_team_league", "CHAR(2)")
        .add("visiting_team_game_number", "SMALLINT")
        .add("home_team", "CHAR(3)")
        .add("home_team_league", "CHAR(2)")
        .add("home_team_game_number", "SMALLINT")
        .add("visiting_score", "SMALLINT")
        .add("home_score", "SMALLINT")
        .add("length_outs", "SMALLINT")
        .add("day_night", "CHAR(1)")
        .add("completion_info", "VARCHAR")
        .add("forfeit_info", "CHAR(1)")
        .add("protest_info", "CHAR(1)")
        .add("park_id", "CHAR(5)")
        .add("attendance", "INTEGER")
        .add("time_of_game_minutes", "SMALLINT")
        .add("visiting_line_score", "VARCHAR")
        .add("home_line_score", "VARCHAR");
    for (auto side : kSides) {
        for (auto stat : kTeamStats) {
            b.add(fmt::format("{}_{}", side, stat), "SMALLINT");
        }
    }
    for (auto position : kUmpirePositions) {
        add_person(b, fmt::format("{}_umpire", position));
    }
    for (auto side : kSides) {
        add_person(b, fmt::format("{}_manager", side));
    }
    add_person(b, "winning_pitcher");
    add_person(b, "losing_pitcher");
    add_person(b, "saving_pitcher");
    add_person(b, "game_winning_rbi");
    for (auto side : kSides) {
        add_person(b, fmt::format("{}_starting_pitcher", side));
    }
    for (auto side : kSides) {
        for (int slot = 1; slot <= 9; ++slot) {
            add_person(b, fmt::format("{}_lineup_{}", side, slot));
            b.add(fmt::format("{}_lineup_{}_position", side, slot), "SMALLINT");
        }
    }
    b.add("additional_info", "TEXT").add("acquisition_info", "CHAR(1)");
    return std::move(b).build();
}

auto schedule() -> TableDeclaration {
    DeclarationBuilder b("schedule");
    b.add("date", "DATE", false)
        .add("double_header", "SMALLINT")
        .add("day_of_week", "CHAR(3)")
        .add("visiting_team", "CHAR(3)")
        .add("visiting_team_league", "CHAR(2)")
        .add("visiting_team_game_number", "SMALLINT")
        .add("home_team", "CHAR(3)")
        .add("home_team_league", "CHAR(2)")
        .add("home_team_game_number", "SMALLINT")
        .add("day_night", "CHAR(1)")
        .add("postponement_indicator", "VARCHAR")
        .add("makeup_dates", "VARCHAR");
    return std::move(b).build();
}

auto park() -> TableDeclaration {
    DeclarationBuilder b("park");
    b.add("park_id", "CHAR(5)", false)
        .add("name", "VARCHAR")
        .add("aka", "VARCHAR")
        .add("city", "VARCHAR")
        .add("state", "VARCHAR")
        .add("start_date", "DATE")
        .add("end_date", "DATE")
        .add("league", "CHAR(2)")
        .add("notes", "TEXT");
    return std::move(b).build();
}

auto roster() -> TableDeclaration {
    DeclarationBuilder b("roster");
    b.add("year", "SMALLINT", false)
        .add("player_id", "CHAR(8)", false)
        .add("last_name", "VARCHAR")
        .add("first_name", "VARCHAR")
        .add("bats", "CHAR(1)")
        .add("throws", "CHAR(1)")
        .add("team_id", "CHAR(3)")
        .add("position", "VARCHAR(2)");
    return std::move(b).build();
}

auto bio() -> TableDeclaration {
    DeclarationBuilder b("bio");
    b.add("player_id", "CHAR(8)", false)
        .add("last_name", "VARCHAR")
        .add("first_name", "VARCHAR")
        .add("nickname", "VARCHAR")
        .add("birth_date", "DATE")
        .add("birth_city", "VARCHAR")
        .add("birth_state", "VARCHAR")
        .add("birth_country", "VARCHAR")
        .add("player_debut", "DATE")
        .add("player_last_game", "DATE")
        .add("manager_debut", "DATE")
        .add("manager_last_game", "DATE")
        .add("coach_debut", "DATE")
        .add("coach_last_game", "DATE")
        .add("umpire_debut", "DATE")
        .add("umpire_last_game", "DATE")
        .add("death_date", "DATE")
        .add("death_city", "VARCHAR")
        .add("death_state", "VARCHAR")
        .add("death_country", "VARCHAR")
        .add("bats", "CHAR(1)")
        .add("throws", "CHAR(1)")
        .add("height", "VARCHAR(5)")
        .add("weight", "SMALLINT")
        .add("cemetery", "VARCHAR")
        .add("cemetery_city", "VARCHAR")
        .add("cemetery_state", "VARCHAR")
        .add("cemetery_country", "VARCHAR")
        .add("cemetery_note", "TEXT")
        .add("birth_name", "VARCHAR")
        .add("name_change", "VARCHAR")
        .add("bat_change", "VARCHAR")
        .add("hall_of_fame", "VARCHAR");
    return std::move(b).build();
}

}  // namespace

auto retrosheet_declarations() -> std::vector<TableDeclaration> {
    std::vector<TableDeclaration> tables;
    tables.reserve(5);
    tables.push_back(gamelog());
    tables.push_back(schedule());
    tables.push_back(park());
    tables.push_back(roster());
    tables.push_back(bio());
    return tables;
}

}  // namespace boxcar::schema
