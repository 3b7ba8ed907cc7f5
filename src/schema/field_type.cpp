#include <boxcar/schema/field_type.hpp>

namespace boxcar::schema {

auto to_string(FieldType type) -> std::string_view {
    switch (type) {
        case FieldType::Int16:
            return "int16";
        case FieldType::Int32:
            return "int32";
        case FieldType::Float64:
            return "float64";
        case FieldType::Utf8:
            return "utf8";
        case FieldType::Boolean:
            return "bool";
        case FieldType::TimestampMillis:
            return "timestamp[ms]";
    }
    return "unknown";
}

auto EntitySchema::find(std::string_view name) const -> const FieldSpec* {
    for (const auto& field : fields) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

auto EntitySchema::position(std::string_view name) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace boxcar::schema
