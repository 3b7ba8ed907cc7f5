#pragma once

#include <boxcar/core/table.hpp>
#include <boxcar/schema/field_type.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace boxcar::convert {

inline constexpr std::size_t kDefaultBlockSize = std::size_t{1} << 20;

struct ReaderOptions {
    /// Approximate bytes parsed per block. Blocks end on record boundaries.
    std::size_t block_size = kDefaultBlockSize;
};

/// A field that could not be coerced to its declared type, or a record of the
/// wrong width. Fatal for the owning entity.
struct ConversionError {
    std::string message;
    std::string source;
    /// 1-based record number within the stream.
    std::size_t record = 0;
    /// Empty for record-level errors.
    std::string column;
    std::string raw;

    [[nodiscard]] auto format() const -> std::string;
};

/// Parses a header-less, normalized record stream into a typed Table whose
/// columns follow the schema order.
class TypedReader {
   public:
    explicit TypedReader(schema::EntitySchema schema, ReaderOptions options = {});

    /// `source` names the stream in errors.
    [[nodiscard]] auto read(std::istream& input, std::string_view source) const
        -> std::expected<Table, ConversionError>;

    /// Throws std::runtime_error when `path` cannot be opened.
    [[nodiscard]] auto read_file(const std::filesystem::path& path) const
        -> std::expected<Table, ConversionError>;

    [[nodiscard]] auto entity_schema() const noexcept -> const schema::EntitySchema& {
        return schema_;
    }

   private:
    schema::EntitySchema schema_;
    ReaderOptions options_;
};

}  // namespace boxcar::convert
