#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace boxcar::ingest {

/// MS-DOS end-of-file marker (Ctrl+Z) found at the end of older source files.
inline constexpr char kDosEof = '\x1A';

/// UTF-8 encoded byte-order mark.
inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// Remove DOS end-of-file markers from both ends of `line`.
[[nodiscard]] auto strip_sentinel(std::string_view line) -> std::string_view;

/// Remove a trailing "\r" left by CRLF line endings.
[[nodiscard]] auto strip_terminator(std::string_view line) -> std::string_view;

/// True when `line` is empty or whitespace only.
[[nodiscard]] auto is_blank(std::string_view line) noexcept -> bool;

/// Quote state of a comma-separated record, scanned one character at a time.
///
/// A double quote opens or closes a quoted span only in a field that is empty
/// or began with a quote, so `b"c` is plain text. This is the rule rapidcsv
/// applies when the TypedReader parses the intermediate stream.
class QuoteTracker {
   public:
    /// Returns true when `ch` is a field separator.
    auto feed(char ch) noexcept -> bool;

    /// Line break. Returns true when it ends the record, false when it falls
    /// inside a quoted span.
    auto end_line() noexcept -> bool;

    [[nodiscard]] auto quoted() const noexcept -> bool { return quoted_; }

   private:
    bool quoted_ = false;
    bool field_empty_ = true;
    bool field_opened_quoted_ = false;
};

/// True when `text` leaves no double-quoted span open.
[[nodiscard]] auto quotes_balanced(std::string_view text) noexcept -> bool;

/// Number of comma-separated fields in `record`. Commas inside quoted spans do
/// not separate fields. An empty record has one (empty) field.
[[nodiscard]] auto count_fields(std::string_view record) noexcept -> std::size_t;

/// The last field of `record`. A field enclosed in quotes is unquoted and its
/// doubled quotes collapsed.
[[nodiscard]] auto trailing_field(std::string_view record) -> std::string;

[[nodiscard]] auto is_valid_utf8(std::string_view text) noexcept -> bool;

/// Reinterpret `text` as ISO-8859-1 and encode it as UTF-8.
[[nodiscard]] auto latin1_to_utf8(std::string_view text) -> std::string;

}  // namespace boxcar::ingest
