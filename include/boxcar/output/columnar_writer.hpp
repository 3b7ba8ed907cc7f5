#pragma once

#include <boxcar/core/table.hpp>
#include <boxcar/output/encoding_policy.hpp>
#include <boxcar/schema/field_type.hpp>

#include <arrow/api.h>
#include <parquet/properties.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace boxcar::output {

struct WriteResult {
    std::filesystem::path path;
    std::int64_t rows = 0;
    std::uintmax_t bytes = 0;
};

/// Arrow schema of `schema`: one field per FieldSpec, nullability preserved.
[[nodiscard]] auto to_arrow_schema(const schema::EntitySchema& schema)
    -> std::shared_ptr<arrow::Schema>;

/// Arrow table holding `table`'s columns in schema order.
/// Throws std::runtime_error when a column is missing or mistyped.
[[nodiscard]] auto to_arrow_table(const Table& table, const schema::EntitySchema& schema)
    -> std::shared_ptr<arrow::Table>;

/// zstd writer properties with per-column encodings from `policy`.
[[nodiscard]] auto writer_properties(const ColumnEncodingPolicy& policy,
                                     const schema::EntitySchema& schema)
    -> std::shared_ptr<parquet::WriterProperties>;

/// Writes typed tables as `<output_dir>/<entity>.parquet`.
///
/// Every write replaces the prior artifact: the file is produced as
/// `<entity>.parquet.tmp` and renamed over the target only once complete.
class ColumnarWriter {
   public:
    explicit ColumnarWriter(std::filesystem::path output_dir);

    /// Throws std::runtime_error on any I/O or Arrow failure.
    auto write(const Table& table, const schema::EntitySchema& schema,
               const ColumnEncodingPolicy& policy) const -> WriteResult;

    [[nodiscard]] auto artifact_path(std::string_view entity) const -> std::filesystem::path;

   private:
    std::filesystem::path output_dir_;
};

}  // namespace boxcar::output
