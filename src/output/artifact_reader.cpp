#include <boxcar/output/artifact_reader.hpp>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/util/compression.h>
#include <parquet/arrow/reader.h>
#include <parquet/metadata.h>
#include <parquet/types.h>

#include <memory>
#include <set>
#include <stdexcept>
#include <utility>

namespace boxcar::output {

namespace {

auto open_reader(const std::filesystem::path& path) -> std::unique_ptr<parquet::arrow::FileReader> {
    auto input_result = arrow::io::ReadableFile::Open(path.string());
    if (!input_result.ok()) {
        throw std::runtime_error("read_parquet: failed to open: " + path.string() + " (" +
                                 input_result.status().ToString() + ")");
    }

    std::unique_ptr<parquet::arrow::FileReader> reader;
    auto st = parquet::arrow::OpenFile(input_result.ValueOrDie(), arrow::default_memory_pool(),
                                       &reader);
    if (!st.ok()) {
        throw std::runtime_error("read_parquet: failed to read: " + path.string() + " (" +
                                 st.ToString() + ")");
    }
    return reader;
}

/// Collected values of one column plus its validity.
template <typename T>
struct Collected {
    std::vector<T> values;
    std::vector<bool> validity;
    bool has_null = false;
};

template <typename ArrayT, typename T, typename Convert>
void collect_chunks(const std::shared_ptr<arrow::ChunkedArray>& chunked, Collected<T>& out,
                    Convert convert) {
    out.values.reserve(static_cast<std::size_t>(chunked->length()));
    out.validity.reserve(static_cast<std::size_t>(chunked->length()));
    for (const auto& chunk : chunked->chunks()) {
        auto arr = std::static_pointer_cast<ArrayT>(chunk);
        for (int64_t i = 0; i < arr->length(); ++i) {
            if (arr->IsNull(i)) {
                out.values.emplace_back();
                out.validity.push_back(false);
                out.has_null = true;
            } else {
                out.values.push_back(convert(*arr, i));
                out.validity.push_back(true);
            }
        }
    }
}

template <typename T>
void add_collected(Table& table, const std::string& name, Collected<T>&& collected) {
    if (collected.has_null) {
        table.add_column(name, Column<T>{std::move(collected.values)},
                         std::move(collected.validity));
    } else {
        table.add_column(name, Column<T>{std::move(collected.values)});
    }
}

/// Milliseconds per tick of `unit`, as a multiplier (>= 1) or divisor (< 0).
auto millis_per_tick(arrow::TimeUnit::type unit) -> std::int64_t {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return 1000;
        case arrow::TimeUnit::MILLI:
            return 1;
        case arrow::TimeUnit::MICRO:
            return -1000;
        case arrow::TimeUnit::NANO:
            return -1000000;
    }
    return 1;
}

}  // namespace

auto read_artifact(const std::filesystem::path& path) -> Table {
    auto reader = open_reader(path);

    std::shared_ptr<arrow::Table> table;
    auto st = reader->ReadTable(&table);
    if (!st.ok()) {
        throw std::runtime_error("read_parquet: failed to load table: " + path.string() + " (" +
                                 st.ToString() + ")");
    }

    auto value_of = [](const auto& arr, int64_t i) { return arr.Value(i); };

    Table out;
    for (int i = 0; i < table->num_columns(); ++i) {
        const auto& field = table->field(i);
        const auto& col = table->column(i);
        switch (col->type()->id()) {
            case arrow::Type::INT16: {
                Collected<std::int16_t> collected;
                collect_chunks<arrow::Int16Array>(col, collected, value_of);
                add_collected(out, field->name(), std::move(collected));
                break;
            }
            case arrow::Type::INT32: {
                Collected<std::int32_t> collected;
                collect_chunks<arrow::Int32Array>(col, collected, value_of);
                add_collected(out, field->name(), std::move(collected));
                break;
            }
            case arrow::Type::DOUBLE: {
                Collected<double> collected;
                collect_chunks<arrow::DoubleArray>(col, collected, value_of);
                add_collected(out, field->name(), std::move(collected));
                break;
            }
            case arrow::Type::STRING: {
                Collected<std::string> collected;
                collect_chunks<arrow::StringArray>(
                    col, collected,
                    [](const arrow::StringArray& arr, int64_t row) { return arr.GetString(row); });
                add_collected(out, field->name(), std::move(collected));
                break;
            }
            case arrow::Type::BOOL: {
                Collected<bool> collected;
                collect_chunks<arrow::BooleanArray>(col, collected, value_of);
                add_collected(out, field->name(), std::move(collected));
                break;
            }
            case arrow::Type::TIMESTAMP: {
                const auto& ts_type = static_cast<const arrow::TimestampType&>(*col->type());
                const std::int64_t scale = millis_per_tick(ts_type.unit());
                Collected<Timestamp> collected;
                collect_chunks<arrow::TimestampArray>(
                    col, collected, [scale](const arrow::TimestampArray& arr, int64_t row) {
                        const std::int64_t ticks = arr.Value(row);
                        return Timestamp{scale > 0 ? ticks * scale : ticks / -scale};
                    });
                add_collected(out, field->name(), std::move(collected));
                break;
            }
            default:
                throw std::runtime_error("read_parquet: unsupported column type for " +
                                         field->name() + ": " + col->type()->ToString());
        }
    }
    return out;
}

auto inspect_artifact(const std::filesystem::path& path) -> ArtifactInfo {
    auto reader = open_reader(path);

    std::shared_ptr<arrow::Schema> schema;
    auto st = reader->GetSchema(&schema);
    if (!st.ok()) {
        throw std::runtime_error("read_parquet: failed to read schema: " + path.string() + " (" +
                                 st.ToString() + ")");
    }
    auto metadata = reader->parquet_reader()->metadata();

    ArtifactInfo info{.rows = metadata->num_rows(), .row_groups = metadata->num_row_groups()};
    for (int col = 0; col < schema->num_fields(); ++col) {
        const auto& field = schema->field(col);
        ArtifactColumn column{.name = field->name(),
                              .type = field->type()->ToString(),
                              .nullable = field->nullable()};
        std::set<std::string> encodings;
        for (int rg = 0; rg < metadata->num_row_groups(); ++rg) {
            auto chunk = metadata->RowGroup(rg)->ColumnChunk(col);
            for (auto encoding : chunk->encodings()) {
                encodings.insert(parquet::EncodingToString(encoding));
            }
            column.compression = arrow::util::Codec::GetCodecAsString(chunk->compression());
        }
        column.encodings.assign(encodings.begin(), encodings.end());
        info.columns.push_back(std::move(column));
    }
    return info;
}

}  // namespace boxcar::output
