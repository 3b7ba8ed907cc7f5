#pragma once

#include <boxcar/ingest/deduplicator.hpp>
#include <boxcar/ingest/rules.hpp>
#include <boxcar/ingest/source_file.hpp>

#include <cstddef>
#include <deque>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace boxcar::ingest {

/// One cleaned record, ready for the intermediate stream.
struct NormalizedRecord {
    /// Record text without a line terminator. Quoted spans may contain "\n".
    std::string text;
    const SourceFile* source = nullptr;
    /// 1-based physical line where the record starts.
    std::size_t line = 0;
};

struct NormalizeStats {
    std::size_t files = 0;
    std::size_t lines_read = 0;
    std::size_t records_emitted = 0;
    std::size_t blank_lines = 0;
    std::size_t header_lines = 0;
    std::size_t filtered = 0;
    std::size_t repaired = 0;
    std::size_t dropped = 0;
    std::size_t duplicates = 0;
    std::size_t transcoded = 0;
};

/// Merges the source files of one entity into a single cleaned record stream.
///
/// Files are read in the order given (callers pass them sorted), one record
/// at a time. Rules apply in this order: end-of-file markers and line
/// terminators are stripped, blank lines skipped, the header line skipped,
/// the row filter applied, the file tag prepended, short rows repaired, and
/// duplicates suppressed. Every dropped, repaired or suppressed record is
/// logged with its source file and line; a bad record never stops the pass.
///
/// A record with an open quote is joined with the following lines until the
/// quote closes. The join gives up once the record grows wider than the
/// schema or spans `EntityRules::max_record_lines` lines; then only the first
/// line is dropped and the lines after it are read again as records.
///
/// The stream is single-pass. A new normalizer starts a new pass.
class LineNormalizer {
   public:
    LineNormalizer(std::string entity, std::vector<SourceFile> sources, EntityRules rules,
                   std::size_t schema_width);

    LineNormalizer(const LineNormalizer&) = delete;
    auto operator=(const LineNormalizer&) -> LineNormalizer& = delete;

    /// Next emitted record, or nullopt once every file is exhausted.
    /// Throws std::runtime_error when a source file cannot be opened.
    [[nodiscard]] auto next() -> std::optional<NormalizedRecord>;

    /// Drain the remaining records into `out`, one per line. Returns the
    /// number of records written.
    auto write_to(std::ostream& out) -> std::size_t;

    [[nodiscard]] auto stats() const noexcept -> const NormalizeStats& { return stats_; }
    [[nodiscard]] auto entity() const noexcept -> const std::string& { return entity_; }

   private:
    struct PhysicalLine {
        std::string text;
        std::size_t number = 0;
    };

    auto open_next_file() -> bool;
    void finish_file();
    auto read_physical_line(PhysicalLine& line) -> bool;
    auto take_line(PhysicalLine& line) -> bool;
    auto read_record(std::string& record, std::size_t& first_line) -> bool;
    auto apply_rules(std::string record, std::size_t line) -> std::optional<std::string>;
    /// Fields a record carries before the tag is prepended.
    [[nodiscard]] auto raw_width() const noexcept -> std::size_t;

    std::string entity_;
    std::vector<SourceFile> sources_;
    EntityRules rules_;
    std::size_t schema_width_;
    Deduplicator dedup_;
    NormalizeStats stats_;

    std::ifstream input_;
    std::size_t next_source_ = 0;
    const SourceFile* current_ = nullptr;
    std::size_t physical_line_ = 0;
    std::size_t filtered_at_open_ = 0;
    /// Lines read ahead by a failed quoted join, rescanned before the file.
    std::deque<PhysicalLine> pending_;
};

}  // namespace boxcar::ingest
