#include <boxcar/convert/field_parser.hpp>
#include <boxcar/convert/typed_reader.hpp>
#include <boxcar/ingest/text.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace boxcar::convert {

namespace {

struct PendingColumn {
    ColumnValue values;
    std::vector<bool> validity;
    bool has_null = false;
};

auto empty_column(schema::FieldType type) -> ColumnValue {
    switch (type) {
        case schema::FieldType::Int16:
            return Column<std::int16_t>{};
        case schema::FieldType::Int32:
            return Column<std::int32_t>{};
        case schema::FieldType::Float64:
            return Column<double>{};
        case schema::FieldType::Utf8:
            return Column<std::string>{};
        case schema::FieldType::Boolean:
            return Column<bool>{};
        case schema::FieldType::TimestampMillis:
            return Column<Timestamp>{};
    }
    throw std::runtime_error("unhandled field type");
}

/// Appends `raw` to `pending`; returns a message when it does not fit `field`.
auto append_field(PendingColumn& pending, const schema::FieldSpec& field, const std::string& raw)
    -> std::optional<std::string> {
    if (raw.empty()) {
        if (field.nullable) {
            std::visit([](auto& col) { col.emplace_back(); }, pending.values);
            pending.validity.push_back(false);
            pending.has_null = true;
            return std::nullopt;
        }
        if (field.type != schema::FieldType::Utf8) {
            return std::string("empty value in non-nullable column");
        }
    }

    const bool parsed = std::visit(
        [&](auto& col) -> bool {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int16_t>>) {
                auto value = parse_int16(raw);
                if (!value) return false;
                col.push_back(*value);
            } else if constexpr (std::is_same_v<ColT, Column<std::int32_t>>) {
                auto value = parse_int32(raw);
                if (!value) return false;
                col.push_back(*value);
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                auto value = parse_float64(raw);
                if (!value) return false;
                col.push_back(*value);
            } else if constexpr (std::is_same_v<ColT, Column<bool>>) {
                auto value = parse_bool(raw);
                if (!value) return false;
                col.push_back(*value);
            } else if constexpr (std::is_same_v<ColT, Column<Timestamp>>) {
                auto value = parse_timestamp(raw);
                if (!value) return false;
                col.push_back(*value);
            } else {
                static_assert(std::is_same_v<ColT, Column<std::string>>,
                              "unhandled column type in append_field");
                col.push_back(raw);
            }
            return true;
        },
        pending.values);

    if (!parsed) {
        return fmt::format("cannot parse value as {}", schema::to_string(field.type));
    }
    pending.validity.push_back(true);
    return std::nullopt;
}

}  // namespace

auto ConversionError::format() const -> std::string {
    if (column.empty()) {
        return fmt::format("{}: record {}: {}", source, record, message);
    }
    return fmt::format("{}: record {}: column '{}': {} (raw \"{}\")", source, record, column,
                       message, raw);
}

TypedReader::TypedReader(schema::EntitySchema schema, ReaderOptions options)
    : schema_(std::move(schema)), options_(options) {}

auto TypedReader::read(std::istream& input, std::string_view source) const
    -> std::expected<Table, ConversionError> {
    std::vector<PendingColumn> pending;
    pending.reserve(schema_.width());
    for (const auto& field : schema_.fields) {
        pending.push_back(PendingColumn{.values = empty_column(field.type)});
    }

    std::size_t record = 0;

    auto parse_block = [&](const std::string& block) -> std::optional<ConversionError> {
        std::istringstream stream(block);
        // No header row or row labels; quoted spans may hold line breaks.
        rapidcsv::Document doc(stream, rapidcsv::LabelParams(-1, -1),
                               rapidcsv::SeparatorParams(',', false, false, true, true));
        for (std::size_t row = 0; row < doc.GetRowCount(); ++row) {
            ++record;
            auto cells = doc.GetRow<std::string>(row);
            if (cells.size() != schema_.width()) {
                return ConversionError{
                    .message = fmt::format("record has {} fields, expected {}", cells.size(),
                                           schema_.width()),
                    .source = std::string(source),
                    .record = record,
                };
            }
            for (std::size_t col = 0; col < cells.size(); ++col) {
                const auto& field = schema_.fields[col];
                if (auto message = append_field(pending[col], field, cells[col])) {
                    return ConversionError{.message = std::move(*message),
                                           .source = std::string(source),
                                           .record = record,
                                           .column = field.name,
                                           .raw = cells[col]};
                }
            }
        }
        return std::nullopt;
    };

    std::string block;
    std::string line;
    ingest::QuoteTracker quotes;
    while (std::getline(input, line)) {
        for (char c : line) {
            quotes.feed(c);
        }
        const bool record_complete = quotes.end_line();
        block.append(line);
        block.push_back('\n');
        if (record_complete && block.size() >= options_.block_size) {
            if (auto error = parse_block(block)) {
                return std::unexpected(std::move(*error));
            }
            block.clear();
        }
    }
    if (input.bad()) {
        throw std::runtime_error(fmt::format("{}: read error", source));
    }
    if (quotes.quoted()) {
        return std::unexpected(ConversionError{
            .message = "unterminated quoted field at end of stream",
            .source = std::string(source),
            .record = record + 1,
        });
    }
    if (!block.empty()) {
        if (auto error = parse_block(block)) {
            return std::unexpected(std::move(*error));
        }
    }

    Table table;
    for (std::size_t col = 0; col < pending.size(); ++col) {
        auto& column = pending[col];
        const auto& name = schema_.fields[col].name;
        if (column.has_null) {
            table.add_column(name, std::move(column.values), std::move(column.validity));
        } else {
            table.add_column(name, std::move(column.values));
        }
    }
    spdlog::debug("{}: parsed {} records into {} columns", source, record, table.columns.size());
    return table;
}

auto TypedReader::read_file(const std::filesystem::path& path) const
    -> std::expected<Table, ConversionError> {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return read(input, path.string());
}

}  // namespace boxcar::convert
