#include <boxcar/core/table.hpp>

#include <algorithm>
#include <numeric>
#include <type_traits>

namespace boxcar {

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data.
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column))});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    add_column(name, std::move(column));
    columns[index.at(name)].validity = std::move(validity);
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto sort_rows(const Table& input, const std::string& key) -> std::expected<Table, std::string> {
    const auto* key_entry = input.find_entry(key);
    if (key_entry == nullptr) {
        return std::unexpected("sort key column not found: " + key);
    }

    const std::size_t rows = input.rows();
    std::vector<std::size_t> idx(rows);
    std::iota(idx.begin(), idx.end(), 0);

    std::visit(
        [&](const auto& col) {
            auto compare_row = [&](std::size_t lhs, std::size_t rhs) -> bool {
                const bool lhs_null = is_null(*key_entry, lhs);
                const bool rhs_null = is_null(*key_entry, rhs);
                if (lhs_null || rhs_null) {
                    return lhs_null && !rhs_null;
                }
                return col[lhs] < col[rhs];
            };
            std::stable_sort(idx.begin(), idx.end(), compare_row);
        },
        *key_entry->column);

    Table output;
    output.columns.reserve(input.columns.size());
    for (const auto& entry : input.columns) {
        ColumnValue gathered =
            std::visit([&](const auto& src) -> ColumnValue { return src.gather(idx); },
                       *entry.column);
        if (entry.validity.has_value()) {
            std::vector<bool> validity(rows);
            for (std::size_t pos = 0; pos < rows; ++pos) {
                validity[pos] = (*entry.validity)[idx[pos]];
            }
            output.add_column(entry.name, std::move(gathered), std::move(validity));
        } else {
            output.add_column(entry.name, std::move(gathered));
        }
    }
    return output;
}

}  // namespace boxcar
