#include <boxcar/ingest/rules.hpp>
#include <boxcar/ingest/text.hpp>

#include <string>

namespace boxcar::ingest {

auto RowFilter::accepts(std::string_view record) const -> bool {
    switch (mode) {
        case FilterMode::TrailingField:
            return trailing_field(record).find(marker) != std::string::npos;
        case FilterMode::LastCharacter: {
            auto pos = record.find_last_not_of('"');
            return pos != std::string_view::npos && record[pos] == marker;
        }
    }
    return false;
}

}  // namespace boxcar::ingest
