#include <boxcar/schema/declaration_file.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace boxcar::schema {

namespace {

auto decl_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto decl_parse_flag(std::string_view text, bool fallback) -> std::optional<bool> {
    std::string value(decl_trim(text));
    std::ranges::transform(value, value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (value.empty()) {
        return fallback;
    }
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return std::nullopt;
}

auto optional_column(const rapidcsv::Document& doc, const std::string& name, std::size_t rows)
    -> std::vector<std::string> {
    if (doc.GetColumnIdx(name) < 0) {
        return std::vector<std::string>(rows);
    }
    return doc.GetColumn<std::string>(name);
}

}  // namespace

auto load_declarations(const std::filesystem::path& path) -> std::vector<TableDeclaration> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw SchemaError("schema declaration file not found: " + path.string());
    }

    std::vector<std::string> entities;
    std::vector<std::string> columns;
    std::vector<std::string> types;
    std::vector<std::string> nullables;
    std::vector<std::string> autoincrements;
    try {
        rapidcsv::Document doc(path.string(), rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(','));
        entities = doc.GetColumn<std::string>("entity");
        columns = doc.GetColumn<std::string>("column");
        types = doc.GetColumn<std::string>("type");
        nullables = optional_column(doc, "nullable", entities.size());
        autoincrements = optional_column(doc, "autoincrement", entities.size());
    } catch (const std::exception& e) {
        throw SchemaError(fmt::format("cannot read schema declarations from {}: {}",
                                      path.string(), e.what()));
    }

    std::vector<TableDeclaration> tables;
    std::unordered_map<std::string, std::size_t> positions;
    for (std::size_t row = 0; row < entities.size(); ++row) {
        // Header is line 1.
        const std::size_t line = row + 2;
        std::string entity(decl_trim(entities[row]));
        if (entity.empty()) {
            throw SchemaError(fmt::format("{}:{}: missing entity name", path.string(), line));
        }
        auto nullable = decl_parse_flag(nullables[row], true);
        if (!nullable) {
            throw SchemaError(fmt::format("{}:{}: invalid nullable flag '{}'", path.string(),
                                          line, nullables[row]));
        }
        auto autoincrement = decl_parse_flag(autoincrements[row], false);
        if (!autoincrement) {
            throw SchemaError(fmt::format("{}:{}: invalid autoincrement flag '{}'",
                                          path.string(), line, autoincrements[row]));
        }

        auto [it, inserted] = positions.try_emplace(entity, tables.size());
        if (inserted) {
            tables.push_back(TableDeclaration{.entity = entity});
        }
        tables[it->second].columns.push_back(
            ColumnDeclaration{.name = std::string(decl_trim(columns[row])),
                              .type = std::string(decl_trim(types[row])),
                              .nullable = *nullable,
                              .autoincrement = *autoincrement});
    }

    if (tables.empty()) {
        throw SchemaError("schema declaration file has no rows: " + path.string());
    }
    return tables;
}

}  // namespace boxcar::schema
