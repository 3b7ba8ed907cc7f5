#include <boxcar/schema/relational_type.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace boxcar::schema {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto to_upper(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return out;
}

enum class BaseType : std::uint8_t {
    Integer,
    SmallInteger,
    Float,
    String,
    Char,
    Text,
    Boolean,
    Date,
    DateTime,
};

constexpr std::array<std::pair<std::string_view, BaseType>, 15> kTypeNames{{
    {"INTEGER", BaseType::Integer},
    {"INT", BaseType::Integer},
    {"SMALLINT", BaseType::SmallInteger},
    {"FLOAT", BaseType::Float},
    {"REAL", BaseType::Float},
    {"DOUBLE", BaseType::Float},
    {"VARCHAR", BaseType::String},
    {"STRING", BaseType::String},
    {"CHAR", BaseType::Char},
    {"TEXT", BaseType::Text},
    {"BOOLEAN", BaseType::Boolean},
    {"BOOL", BaseType::Boolean},
    {"DATE", BaseType::Date},
    {"DATETIME", BaseType::DateTime},
    {"TIMESTAMP", BaseType::DateTime},
}};

auto lookup(std::string_view name) -> std::optional<BaseType> {
    for (const auto& [candidate, base] : kTypeNames) {
        if (candidate == name) {
            return base;
        }
    }
    return std::nullopt;
}

}  // namespace

auto parse_relational_type(std::string_view name) -> std::expected<RelationalType, std::string> {
    const auto text = to_upper(trim(name));
    if (text.empty()) {
        return std::unexpected("empty relational type");
    }

    std::string_view base_name = text;
    std::optional<std::size_t> length;
    if (auto open = base_name.find('('); open != std::string_view::npos) {
        if (base_name.back() != ')') {
            return std::unexpected("malformed relational type: " + std::string(name));
        }
        auto digits = trim(base_name.substr(open + 1, base_name.size() - open - 2));
        std::size_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
            return std::unexpected("malformed length in relational type: " + std::string(name));
        }
        length = value;
        base_name = trim(base_name.substr(0, open));
    }

    auto base = lookup(base_name);
    if (!base.has_value()) {
        return std::unexpected("unmapped relational type: " + std::string(name));
    }
    if (length.has_value() && *base != BaseType::String && *base != BaseType::Char) {
        return std::unexpected("relational type does not take a length: " + std::string(name));
    }

    switch (*base) {
        case BaseType::Integer:
            return relational::Integer{};
        case BaseType::SmallInteger:
            return relational::SmallInteger{};
        case BaseType::Float:
            return relational::Float{};
        case BaseType::String:
            return relational::String{.length = length};
        case BaseType::Char:
            return relational::Char{.length = length};
        case BaseType::Text:
            return relational::Text{};
        case BaseType::Boolean:
            return relational::Boolean{};
        case BaseType::Date:
            return relational::Date{};
        case BaseType::DateTime:
            return relational::DateTime{};
    }
    return std::unexpected("unmapped relational type: " + std::string(name));
}

auto to_field_type(const RelationalType& type) -> FieldType {
    return std::visit(
        [](const auto& alt) -> FieldType {
            using T = std::decay_t<decltype(alt)>;
            if constexpr (std::is_same_v<T, relational::Integer>) {
                return FieldType::Int32;
            } else if constexpr (std::is_same_v<T, relational::SmallInteger>) {
                return FieldType::Int16;
            } else if constexpr (std::is_same_v<T, relational::Float>) {
                return FieldType::Float64;
            } else if constexpr (std::is_same_v<T, relational::String> ||
                                 std::is_same_v<T, relational::Char> ||
                                 std::is_same_v<T, relational::Text>) {
                return FieldType::Utf8;
            } else if constexpr (std::is_same_v<T, relational::Boolean>) {
                return FieldType::Boolean;
            } else if constexpr (std::is_same_v<T, relational::Date>) {
                // Some Parquet targets cannot read DATE columns; dates travel as timestamps.
                return FieldType::TimestampMillis;
            } else {
                static_assert(std::is_same_v<T, relational::DateTime>,
                              "unhandled relational type in to_field_type");
                return FieldType::TimestampMillis;
            }
        },
        type);
}

}  // namespace boxcar::schema
