#include <boxcar/output/columnar_writer.hpp>

#include <arrow/io/api.h>
#include <fmt/format.h>
#include <parquet/arrow/writer.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace boxcar::output {

namespace {

auto arrow_type(schema::FieldType type) -> std::shared_ptr<arrow::DataType> {
    switch (type) {
        case schema::FieldType::Int16:
            return arrow::int16();
        case schema::FieldType::Int32:
            return arrow::int32();
        case schema::FieldType::Float64:
            return arrow::float64();
        case schema::FieldType::Utf8:
            return arrow::utf8();
        case schema::FieldType::Boolean:
            return arrow::boolean();
        case schema::FieldType::TimestampMillis:
            return arrow::timestamp(arrow::TimeUnit::MILLI);
    }
    throw std::runtime_error("unhandled field type");
}

/// Field type a column variant holds.
auto held_type(const ColumnValue& column) -> schema::FieldType {
    return std::visit(
        [](const auto& col) -> schema::FieldType {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int16_t>>) {
                return schema::FieldType::Int16;
            } else if constexpr (std::is_same_v<ColT, Column<std::int32_t>>) {
                return schema::FieldType::Int32;
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                return schema::FieldType::Float64;
            } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                return schema::FieldType::Utf8;
            } else if constexpr (std::is_same_v<ColT, Column<bool>>) {
                return schema::FieldType::Boolean;
            } else {
                static_assert(std::is_same_v<ColT, Column<Timestamp>>,
                              "unhandled column type in held_type");
                return schema::FieldType::TimestampMillis;
            }
        },
        column);
}

void check(const arrow::Status& st, std::string_view what) {
    if (!st.ok()) {
        throw std::runtime_error(fmt::format("write_parquet: {} failed ({})", what, st.ToString()));
    }
}

template <typename Builder, typename ColT, typename Convert>
auto fill_array(Builder& builder, const ColumnEntry& entry, const ColT& col, Convert convert)
    -> std::shared_ptr<arrow::Array> {
    check(builder.Reserve(static_cast<int64_t>(col.size())), "reserve");
    for (std::size_t i = 0; i < col.size(); ++i) {
        if (is_null(entry, i)) {
            check(builder.AppendNull(), "append null");
        } else {
            check(builder.Append(convert(col[i])), "append");
        }
    }
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), "finish");
    return arr;
}

/// Build an Arrow array from a ColumnEntry, preserving null values.
auto build_arrow_array(const ColumnEntry& entry) -> std::shared_ptr<arrow::Array> {
    return std::visit(
        [&](const auto& col) -> std::shared_ptr<arrow::Array> {
            using ColT = std::decay_t<decltype(col)>;
            auto same = [](const auto& value) { return value; };

            if constexpr (std::is_same_v<ColT, Column<std::int16_t>>) {
                arrow::Int16Builder builder;
                return fill_array(builder, entry, col, same);
            } else if constexpr (std::is_same_v<ColT, Column<std::int32_t>>) {
                arrow::Int32Builder builder;
                return fill_array(builder, entry, col, same);
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                arrow::DoubleBuilder builder;
                return fill_array(builder, entry, col, same);
            } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                arrow::StringBuilder builder;
                return fill_array(builder, entry, col,
                                  [](const std::string& s) { return std::string_view(s); });
            } else if constexpr (std::is_same_v<ColT, Column<bool>>) {
                arrow::BooleanBuilder builder;
                return fill_array(builder, entry, col, [](bool b) { return b; });
            } else {
                static_assert(std::is_same_v<ColT, Column<Timestamp>>,
                              "unhandled column type in write_parquet");
                arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::MILLI),
                                                arrow::default_memory_pool());
                return fill_array(builder, entry, col,
                                  [](const Timestamp& ts) { return ts.millis; });
            }
        },
        *entry.column);
}

auto has_nulls(const ColumnEntry& entry) -> bool {
    if (!entry.validity.has_value()) {
        return false;
    }
    for (bool valid : *entry.validity) {
        if (!valid) {
            return true;
        }
    }
    return false;
}

}  // namespace

auto to_arrow_schema(const schema::EntitySchema& schema) -> std::shared_ptr<arrow::Schema> {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.reserve(schema.width());
    for (const auto& spec : schema.fields) {
        fields.push_back(arrow::field(spec.name, arrow_type(spec.type), spec.nullable));
    }
    return arrow::schema(std::move(fields));
}

auto to_arrow_table(const Table& table, const schema::EntitySchema& schema)
    -> std::shared_ptr<arrow::Table> {
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(schema.width());
    for (const auto& spec : schema.fields) {
        const auto* entry = table.find_entry(spec.name);
        if (entry == nullptr) {
            throw std::runtime_error(
                fmt::format("{}: table has no column '{}'", schema.entity, spec.name));
        }
        if (held_type(*entry->column) != spec.type) {
            throw std::runtime_error(fmt::format("{}: column '{}' holds {}, declared {}",
                                                 schema.entity, spec.name,
                                                 schema::to_string(held_type(*entry->column)),
                                                 schema::to_string(spec.type)));
        }
        if (!spec.nullable && has_nulls(*entry)) {
            throw std::runtime_error(fmt::format("{}: non-nullable column '{}' holds nulls",
                                                 schema.entity, spec.name));
        }
        arrays.push_back(build_arrow_array(*entry));
    }
    return arrow::Table::Make(to_arrow_schema(schema), arrays,
                              static_cast<int64_t>(table.rows()));
}

auto writer_properties(const ColumnEncodingPolicy& policy, const schema::EntitySchema& schema)
    -> std::shared_ptr<parquet::WriterProperties> {
    parquet::WriterProperties::Builder builder;
    builder.compression(parquet::Compression::ZSTD);
    if (policy.zstd_level.has_value()) {
        builder.compression_level(*policy.zstd_level);
    }
    builder.enable_dictionary();
    builder.max_row_group_length(policy.row_group_length);
    builder.write_batch_size(policy.write_batch_size);

    for (const auto& spec : schema.fields) {
        switch (policy.encoding_for(spec.name)) {
            case ColumnEncoding::Dictionary:
                break;
            case ColumnEncoding::Delta:
                builder.disable_dictionary(spec.name);
                builder.encoding(spec.name, parquet::Encoding::DELTA_BINARY_PACKED);
                break;
            case ColumnEncoding::Plain:
                builder.disable_dictionary(spec.name);
                builder.encoding(spec.name, parquet::Encoding::PLAIN);
                break;
        }
    }
    return builder.build();
}

ColumnarWriter::ColumnarWriter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

auto ColumnarWriter::artifact_path(std::string_view entity) const -> std::filesystem::path {
    return output_dir_ / (std::string(entity) + ".parquet");
}

auto ColumnarWriter::write(const Table& table, const schema::EntitySchema& schema,
                           const ColumnEncodingPolicy& policy) const -> WriteResult {
    const Table* source = &table;
    Table sorted;
    if (policy.sort_key.has_value()) {
        auto result = sort_rows(table, *policy.sort_key);
        if (!result) {
            throw std::runtime_error(fmt::format("{}: {}", schema.entity, result.error()));
        }
        sorted = std::move(*result);
        source = &sorted;
    }

    auto arrow_table = to_arrow_table(*source, schema);

    std::filesystem::create_directories(output_dir_);
    const auto target = artifact_path(schema.entity);
    const std::filesystem::path tmp_path = target.string() + ".tmp";
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);

    auto sink_result = arrow::io::FileOutputStream::Open(tmp_path.string());
    if (!sink_result.ok()) {
        throw std::runtime_error("write_parquet: cannot open for writing: " + tmp_path.string() +
                                 " (" + sink_result.status().ToString() + ")");
    }
    auto sink = sink_result.ValueOrDie();

    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto st = parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), sink,
                                         policy.row_group_length,
                                         writer_properties(policy, schema), arrow_props);
    auto close_status = sink->Close();
    if (st.ok()) {
        st = close_status;
    }
    if (!st.ok()) {
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("write_parquet: failed to write: " + tmp_path.string() + " (" +
                                 st.ToString() + ")");
    }

    std::filesystem::rename(tmp_path, target);

    WriteResult result{.path = target,
                       .rows = arrow_table->num_rows(),
                       .bytes = std::filesystem::file_size(target)};
    spdlog::debug("{}: wrote {} rows ({} bytes) to {}", schema.entity, result.rows, result.bytes,
                  target.string());
    return result;
}

}  // namespace boxcar::output
