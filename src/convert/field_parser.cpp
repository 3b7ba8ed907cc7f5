#include <boxcar/convert/field_parser.hpp>

#include <charconv>
#include <chrono>
#include <system_error>

namespace boxcar::convert {

namespace {

template <typename Int>
auto parse_whole(std::string_view text) noexcept -> std::optional<Int> {
    if (text.empty()) {
        return std::nullopt;
    }
    Int value{};
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto is_digits(std::string_view text) noexcept -> bool {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

auto to_int(std::string_view digits) noexcept -> int {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

auto make_date(int year, int month, int day) noexcept
    -> std::optional<std::chrono::year_month_day> {
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return ymd;
}

// YYYYMMDD
auto parse_compact_date(std::string_view text) noexcept -> std::optional<Timestamp> {
    if (text.size() != 8 || !is_digits(text)) {
        return std::nullopt;
    }
    auto ymd = make_date(to_int(text.substr(0, 4)), to_int(text.substr(4, 2)),
                         to_int(text.substr(6, 2)));
    if (!ymd) {
        return std::nullopt;
    }
    return make_timestamp(*ymd);
}

// YYYY-MM-DD
auto parse_iso_date(std::string_view text) noexcept
    -> std::optional<std::chrono::year_month_day> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto year = text.substr(0, 4);
    auto month = text.substr(5, 2);
    auto day = text.substr(8, 2);
    if (!is_digits(year) || !is_digits(month) || !is_digits(day)) {
        return std::nullopt;
    }
    return make_date(to_int(year), to_int(month), to_int(day));
}

// M/D/YYYY with one or two digit month and day.
auto parse_us_date(std::string_view text) noexcept -> std::optional<Timestamp> {
    auto first = text.find('/');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = text.find('/', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }
    auto month = text.substr(0, first);
    auto day = text.substr(first + 1, second - first - 1);
    auto year = text.substr(second + 1);
    if (month.size() > 2 || day.size() > 2 || year.size() != 4) {
        return std::nullopt;
    }
    if (!is_digits(month) || !is_digits(day) || !is_digits(year)) {
        return std::nullopt;
    }
    auto ymd = make_date(to_int(year), to_int(month), to_int(day));
    if (!ymd) {
        return std::nullopt;
    }
    return make_timestamp(*ymd);
}

// YYYY-MM-DD HH:MM:SS
auto parse_iso_datetime(std::string_view text) noexcept -> std::optional<Timestamp> {
    if (text.size() != 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    auto ymd = parse_iso_date(text.substr(0, 10));
    if (!ymd) {
        return std::nullopt;
    }
    auto hh = text.substr(11, 2);
    auto mm = text.substr(14, 2);
    auto ss = text.substr(17, 2);
    if (!is_digits(hh) || !is_digits(mm) || !is_digits(ss)) {
        return std::nullopt;
    }
    const int hours = to_int(hh);
    const int minutes = to_int(mm);
    const int seconds = to_int(ss);
    if (hours > 23 || minutes > 59 || seconds > 59) {
        return std::nullopt;
    }
    return make_timestamp(*ymd, hours, minutes, seconds);
}

}  // namespace

auto parse_bool(std::string_view text) noexcept -> std::optional<bool> {
    if (text == "1" || text == "T") {
        return true;
    }
    if (text == "0" || text == "F") {
        return false;
    }
    return std::nullopt;
}

auto parse_int16(std::string_view text) noexcept -> std::optional<std::int16_t> {
    return parse_whole<std::int16_t>(text);
}

auto parse_int32(std::string_view text) noexcept -> std::optional<std::int32_t> {
    return parse_whole<std::int32_t>(text);
}

auto parse_float64(std::string_view text) noexcept -> std::optional<double> {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value, std::chars_format::general);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parse_timestamp(std::string_view text) noexcept -> std::optional<Timestamp> {
    if (auto ts = parse_compact_date(text)) {
        return ts;
    }
    if (auto ymd = parse_iso_date(text)) {
        return make_timestamp(*ymd);
    }
    if (auto ts = parse_us_date(text)) {
        return ts;
    }
    return parse_iso_datetime(text);
}

}  // namespace boxcar::convert
