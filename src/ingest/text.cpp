#include <boxcar/ingest/text.hpp>

#include <cctype>
#include <cstdint>

namespace boxcar::ingest {

auto strip_sentinel(std::string_view line) -> std::string_view {
    while (!line.empty() && line.front() == kDosEof) {
        line.remove_prefix(1);
    }
    while (!line.empty() && line.back() == kDosEof) {
        line.remove_suffix(1);
    }
    return line;
}

auto strip_terminator(std::string_view line) -> std::string_view {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    return line;
}

auto is_blank(std::string_view line) noexcept -> bool {
    for (char ch : line) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
    }
    return true;
}

auto QuoteTracker::feed(char ch) noexcept -> bool {
    if (ch == '"') {
        if (field_empty_) {
            field_opened_quoted_ = true;
            quoted_ = !quoted_;
        } else if (field_opened_quoted_) {
            quoted_ = !quoted_;
        }
        field_empty_ = false;
        return false;
    }
    if (ch == ',' && !quoted_) {
        field_empty_ = true;
        field_opened_quoted_ = false;
        return true;
    }
    field_empty_ = false;
    return false;
}

auto QuoteTracker::end_line() noexcept -> bool {
    if (quoted_) {
        field_empty_ = false;
        return false;
    }
    field_empty_ = true;
    field_opened_quoted_ = false;
    return true;
}

auto quotes_balanced(std::string_view text) noexcept -> bool {
    QuoteTracker tracker;
    for (char ch : text) {
        if (ch == '\n') {
            tracker.end_line();
        } else {
            tracker.feed(ch);
        }
    }
    return !tracker.quoted();
}

auto count_fields(std::string_view record) noexcept -> std::size_t {
    QuoteTracker tracker;
    std::size_t fields = 1;
    for (char ch : record) {
        if (ch == '\n') {
            tracker.end_line();
        } else if (tracker.feed(ch)) {
            ++fields;
        }
    }
    return fields;
}

auto trailing_field(std::string_view record) -> std::string {
    QuoteTracker tracker;
    std::size_t start = 0;
    for (std::size_t i = 0; i < record.size(); ++i) {
        if (record[i] == '\n') {
            tracker.end_line();
        } else if (tracker.feed(record[i])) {
            start = i + 1;
        }
    }
    std::string_view field = record.substr(start);
    if (field.size() < 2 || field.front() != '"' || field.back() != '"') {
        return std::string(field);
    }
    field = field.substr(1, field.size() - 2);
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        out.push_back(field[i]);
        if (field[i] == '"' && i + 1 < field.size() && field[i + 1] == '"') {
            ++i;
        }
    }
    return out;
}

auto is_valid_utf8(std::string_view text) noexcept -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<std::uint8_t>(text[i]);
        std::size_t extra = 0;
        std::uint32_t min_value = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            min_value = 0x10000;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        std::uint32_t value = lead & (0x3F >> extra);
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cont = static_cast<std::uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            value = (value << 6) | (cont & 0x3F);
        }
        if (value < min_value || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

auto latin1_to_utf8(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (char ch : text) {
        auto byte = static_cast<std::uint8_t>(ch);
        if (byte < 0x80) {
            out.push_back(ch);
        } else {
            out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return out;
}

}  // namespace boxcar::ingest
