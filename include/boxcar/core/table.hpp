#pragma once

#include <boxcar/core/column.hpp>
#include <boxcar/core/time.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace boxcar {

using ColumnValue = std::variant<Column<std::int16_t>, Column<std::int32_t>, Column<double>,
                                 Column<std::string>, Column<bool>, Column<Timestamp>>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// Number of rows held by a column, whatever its element type.
[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// An in-memory typed table. Column order is insertion order.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

/// Stable ascending sort of every column by `key`. Nulls sort first; rows
/// with equal keys keep their input order.
[[nodiscard]] auto sort_rows(const Table& input, const std::string& key)
    -> std::expected<Table, std::string>;

}  // namespace boxcar
