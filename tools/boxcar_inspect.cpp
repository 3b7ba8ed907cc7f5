#include <boxcar/output/artifact_reader.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace {

auto format_timestamp(boxcar::Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<milliseconds> tp{milliseconds{ts.millis}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<milliseconds> hms{tp - day};
    if (hms.to_duration().count() == 0) {
        return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                           static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    }
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

auto format_double(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::general, 7);
    if (ec == std::errc{}) {
        return std::string(buffer.data(), ptr);
    }
    return fmt::format("{:.7g}", value);
}

auto quote_and_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        switch (ch) {
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    out.push_back('"');
    return out;
}

auto format_cell(const boxcar::ColumnEntry& entry, std::size_t row) -> std::string {
    if (boxcar::is_null(entry, row)) {
        return "null";
    }
    return std::visit(
        [row](const auto& col) -> std::string {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, boxcar::Timestamp>) {
                return format_timestamp(col[row]);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote_and_escape(col[row]);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(col[row]);
            } else if constexpr (std::is_same_v<T, bool>) {
                return col[row] ? "true" : "false";
            } else {
                return fmt::format("{}", col[row]);
            }
        },
        *entry.column);
}

void print_schema(const boxcar::output::ArtifactInfo& info) {
    fmt::print("rows: {}, row groups: {}\n", info.rows, info.row_groups);
    fmt::print("columns:\n");
    for (const auto& column : info.columns) {
        fmt::print("  {}: {}{} [{}] {}\n", column.name, column.type,
                   column.nullable ? "" : " not null", fmt::join(column.encodings, ", "),
                   column.compression);
    }
}

void print_table(const std::vector<const boxcar::ColumnEntry*>& columns, std::size_t rows,
                 std::size_t max_rows) {
    if (columns.empty()) {
        fmt::print("<empty>\n");
        return;
    }
    const std::size_t col_count = columns.size();
    const std::size_t shown_rows = std::min(rows, max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = columns[c]->name.size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = format_cell(*columns[c], r);
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto print_sep = [&]() {
        fmt::print("+");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::print("{:-<{}}+", "", widths[c] + 2);
        }
        fmt::print("\n");
    };

    print_sep();
    fmt::print("|");
    for (std::size_t c = 0; c < col_count; ++c) {
        fmt::print(" {:<{}} |", columns[c]->name, widths[c]);
    }
    fmt::print("\n");
    print_sep();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        fmt::print("|");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::print(" {:<{}} |", cells[c][r], widths[c]);
        }
        fmt::print("\n");
    }
    print_sep();

    if (rows > shown_rows) {
        fmt::print("... ({} more rows)\n", rows - shown_rows);
    }
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"boxcar_inspect: print the schema and leading rows of a boxcar artifact"};
    app.set_version_flag("--version", "boxcar_inspect 0.1.0");

    std::string path;
    std::vector<std::string> selected;
    std::size_t max_rows = 10;
    bool schema_only = false;

    app.add_option("artifact", path, "Parquet artifact to inspect")->required();
    app.add_option("-c,--column", selected, "Column to show; repeatable (default: all)");
    app.add_option("-n,--rows", max_rows, "Rows to show (default: 10)");
    app.add_flag("--schema-only", schema_only, "Print the schema without rows");

    CLI11_PARSE(app, argc, argv);

    try {
        print_schema(boxcar::output::inspect_artifact(path));
        if (schema_only) {
            return 0;
        }

        auto table = boxcar::output::read_artifact(path);
        std::vector<const boxcar::ColumnEntry*> columns;
        if (selected.empty()) {
            for (const auto& entry : table.columns) {
                columns.push_back(&entry);
            }
        } else {
            for (const auto& name : selected) {
                const auto* entry = table.find_entry(name);
                if (entry == nullptr) {
                    spdlog::error("no column '{}' in {}", name, path);
                    return 1;
                }
                columns.push_back(entry);
            }
        }
        print_table(columns, table.rows(), max_rows);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
