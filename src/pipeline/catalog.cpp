#include <boxcar/pipeline/catalog.hpp>

#include <boxcar/ingest/source_file.hpp>

#include <utility>

namespace boxcar::pipeline {

using output::ColumnEncoding;

auto retrosheet_catalog() -> std::vector<CatalogEntry> {
    std::vector<CatalogEntry> catalog;

    // Game logs repeat legitimately across sources, so no dedupe. Keep only
    // games without event or box score coverage.
    CatalogEntry gamelog{.entity = "gamelog", .subdirectory = "gamelog", .pattern = "*.TXT"};
    gamelog.rules.dedupe = false;
    gamelog.rules.row_filter = ingest::RowFilter{.marker = 'N'};
    gamelog.encoding.sort_key = "date";
    gamelog.encoding.overrides = {{"date", ColumnEncoding::Delta},
                                  {"visiting_line_score", ColumnEncoding::Plain},
                                  {"home_line_score", ColumnEncoding::Plain},
                                  {"additional_info", ColumnEncoding::Plain}};
    catalog.push_back(std::move(gamelog));

    CatalogEntry schedule{.entity = "schedule", .subdirectory = "schedule", .pattern = "*.TXT"};
    schedule.encoding.sort_key = "date";
    schedule.encoding.overrides = {{"date", ColumnEncoding::Delta},
                                   {"makeup_dates", ColumnEncoding::Plain}};
    catalog.push_back(std::move(schedule));

    CatalogEntry park{.entity = "park", .subdirectory = "misc", .pattern = "parkcode.txt"};
    park.rules.strip_header = true;
    park.encoding.overrides = {{"name", ColumnEncoding::Plain},
                               {"aka", ColumnEncoding::Plain},
                               {"notes", ColumnEncoding::Plain}};
    catalog.push_back(std::move(park));

    CatalogEntry roster{.entity = "roster", .subdirectory = "rosters", .pattern = "*.ROS"};
    roster.rules.prepend_tag = true;
    roster.encoding.sort_key = "year";
    roster.encoding.overrides = {{"year", ColumnEncoding::Delta}};
    catalog.push_back(std::move(roster));

    CatalogEntry bio{.entity = "bio", .subdirectory = "misc", .pattern = "biofile.csv"};
    bio.rules.strip_header = true;
    bio.encoding.overrides = {{"player_id", ColumnEncoding::Plain},
                              {"cemetery_note", ColumnEncoding::Plain}};
    catalog.push_back(std::move(bio));

    return catalog;
}

auto find_entry(const std::vector<CatalogEntry>& catalog, std::string_view entity)
    -> const CatalogEntry* {
    for (const auto& entry : catalog) {
        if (entry.entity == entity) {
            return &entry;
        }
    }
    return nullptr;
}

auto resolve(const CatalogEntry& entry, const std::filesystem::path& input_root) -> EntitySpec {
    return EntitySpec{
        .name = entry.entity,
        .sources = ingest::discover_sources(input_root / entry.subdirectory, entry.pattern),
        .rules = entry.rules,
        .encoding = entry.encoding,
    };
}

}  // namespace boxcar::pipeline
