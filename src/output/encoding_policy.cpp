#include <boxcar/output/encoding_policy.hpp>
#include <boxcar/schema/registry.hpp>

#include <fmt/format.h>

namespace boxcar::output {

namespace {

constexpr int kMinZstdLevel = 1;
constexpr int kMaxZstdLevel = 22;

auto supports_delta(schema::FieldType type) -> bool {
    return type == schema::FieldType::Int16 || type == schema::FieldType::Int32 ||
           type == schema::FieldType::TimestampMillis;
}

}  // namespace

auto to_string(ColumnEncoding encoding) -> std::string_view {
    switch (encoding) {
        case ColumnEncoding::Dictionary:
            return "dictionary";
        case ColumnEncoding::Delta:
            return "delta";
        case ColumnEncoding::Plain:
            return "plain";
    }
    return "unknown";
}

auto ColumnEncodingPolicy::encoding_for(std::string_view column) const -> ColumnEncoding {
    if (auto it = overrides.find(column); it != overrides.end()) {
        return it->second;
    }
    return ColumnEncoding::Dictionary;
}

void validate_policy(const ColumnEncodingPolicy& policy, const schema::EntitySchema& schema) {
    for (const auto& [column, encoding] : policy.overrides) {
        const auto* field = schema.find(column);
        if (field == nullptr) {
            throw schema::SchemaError(fmt::format("{}: encoding set for unknown column '{}'",
                                                  schema.entity, column));
        }
        if (encoding == ColumnEncoding::Delta && !supports_delta(field->type)) {
            throw schema::SchemaError(
                fmt::format("{}: delta encoding is not available for {} column '{}'",
                            schema.entity, schema::to_string(field->type), column));
        }
    }
    if (policy.sort_key.has_value() && schema.find(*policy.sort_key) == nullptr) {
        throw schema::SchemaError(
            fmt::format("{}: unknown sort key '{}'", schema.entity, *policy.sort_key));
    }
    if (policy.zstd_level.has_value() &&
        (*policy.zstd_level < kMinZstdLevel || *policy.zstd_level > kMaxZstdLevel)) {
        throw schema::SchemaError(fmt::format("{}: zstd level {} outside [{}, {}]",
                                              schema.entity, *policy.zstd_level, kMinZstdLevel,
                                              kMaxZstdLevel));
    }
    if (policy.row_group_length <= 0) {
        throw schema::SchemaError(fmt::format("{}: row-group length must be positive",
                                              schema.entity));
    }
    if (policy.write_batch_size <= 0) {
        throw schema::SchemaError(fmt::format("{}: write batch size must be positive",
                                              schema.entity));
    }
}

}  // namespace boxcar::output
