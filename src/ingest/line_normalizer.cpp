#include <boxcar/ingest/line_normalizer.hpp>
#include <boxcar/ingest/text.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace boxcar::ingest {

LineNormalizer::LineNormalizer(std::string entity, std::vector<SourceFile> sources,
                               EntityRules rules, std::size_t schema_width)
    : entity_(std::move(entity)),
      sources_(std::move(sources)),
      rules_(std::move(rules)),
      schema_width_(schema_width),
      dedup_(rules_.dedupe) {}

auto LineNormalizer::open_next_file() -> bool {
    if (next_source_ >= sources_.size()) {
        return false;
    }
    current_ = &sources_[next_source_++];
    input_.close();
    input_.clear();
    input_.open(current_->path, std::ios::in | std::ios::binary);
    if (!input_) {
        throw std::runtime_error(
            fmt::format("{}: cannot open source {}", entity_, current_->path.string()));
    }
    physical_line_ = 0;
    filtered_at_open_ = stats_.filtered;
    ++stats_.files;
    spdlog::debug("{}: reading {}", entity_, current_->path.string());
    return true;
}

void LineNormalizer::finish_file() {
    const std::size_t filtered = stats_.filtered - filtered_at_open_;
    if (filtered > 0) {
        spdlog::info("{}: filtered {} rows in {}", entity_, filtered, current_->path.string());
    }
    input_.close();
    current_ = nullptr;
}

auto LineNormalizer::read_physical_line(PhysicalLine& line) -> bool {
    if (!std::getline(input_, line.text)) {
        return false;
    }
    line.number = ++physical_line_;
    ++stats_.lines_read;

    std::string_view view = line.text;
    if (line.number == 1 && view.starts_with(kUtf8Bom)) {
        view.remove_prefix(kUtf8Bom.size());
    }
    view = strip_sentinel(strip_terminator(view));

    if (is_valid_utf8(view)) {
        line.text = std::string(view);
    } else {
        line.text = latin1_to_utf8(view);
        ++stats_.transcoded;
        spdlog::debug("{}: transcoded latin-1 line {}:{}", entity_, current_->path.string(),
                      line.number);
    }
    return true;
}

auto LineNormalizer::take_line(PhysicalLine& line) -> bool {
    if (!pending_.empty()) {
        line = std::move(pending_.front());
        pending_.pop_front();
        return true;
    }
    return read_physical_line(line);
}

auto LineNormalizer::raw_width() const noexcept -> std::size_t {
    if (rules_.prepend_tag && schema_width_ > 0) {
        return schema_width_ - 1;
    }
    return schema_width_;
}

auto LineNormalizer::read_record(std::string& record, std::size_t& first_line) -> bool {
    PhysicalLine first;
    if (!take_line(first)) {
        return false;
    }
    first_line = first.number;
    record = std::move(first.text);
    if (quotes_balanced(record)) {
        return true;
    }

    // A quoted value may span physical lines; join until it closes.
    std::vector<PhysicalLine> joined;
    std::string candidate = record;
    while (joined.size() + 1 < rules_.max_record_lines && count_fields(candidate) <= raw_width()) {
        PhysicalLine next;
        if (!take_line(next)) {
            break;
        }
        candidate.push_back('\n');
        candidate.append(next.text);
        joined.push_back(std::move(next));
        if (quotes_balanced(candidate)) {
            if (count_fields(candidate) <= raw_width()) {
                record = std::move(candidate);
                return true;
            }
            break;
        }
    }

    // No plausible close: the first line stands alone, the rest is read again.
    for (auto it = joined.rbegin(); it != joined.rend(); ++it) {
        pending_.push_front(std::move(*it));
    }
    return true;
}

auto LineNormalizer::apply_rules(std::string record, std::size_t line)
    -> std::optional<std::string> {
    const auto source = current_->path.string();

    if (is_blank(record)) {
        ++stats_.blank_lines;
        return std::nullopt;
    }
    if (rules_.strip_header && line == 1) {
        ++stats_.header_lines;
        return std::nullopt;
    }
    if (!quotes_balanced(record)) {
        ++stats_.dropped;
        spdlog::warn("{}: dropping row with unterminated quote in {}:{}: {}", entity_, source,
                     line, record);
        return std::nullopt;
    }
    if (rules_.row_filter.has_value() && !rules_.row_filter->accepts(record)) {
        ++stats_.filtered;
        spdlog::debug("{}: filtered row in {}:{}: {}", entity_, source, line, record);
        return std::nullopt;
    }
    if (rules_.prepend_tag) {
        record = current_->tag + "," + record;
    }

    const std::size_t width = count_fields(record);
    if (width + 1 == schema_width_ && rules_.repair_short_rows) {
        record.push_back(',');
        ++stats_.repaired;
        spdlog::warn("{}: appended empty trailing field to short row in {}:{}: {}", entity_,
                     source, line, record);
    } else if (width != schema_width_) {
        ++stats_.dropped;
        spdlog::warn("{}: dropping row with {} fields (expected {}) in {}:{}: {}", entity_,
                     width, schema_width_, source, line, record);
        return std::nullopt;
    }

    if (!dedup_.admit(record)) {
        ++stats_.duplicates;
        spdlog::warn("{}: duplicate row in {}:{}: {}", entity_, source, line, record);
        return std::nullopt;
    }
    return record;
}

auto LineNormalizer::next() -> std::optional<NormalizedRecord> {
    while (true) {
        if (current_ == nullptr && !open_next_file()) {
            return std::nullopt;
        }
        std::string record;
        std::size_t line = 0;
        if (!read_record(record, line)) {
            finish_file();
            continue;
        }
        if (auto text = apply_rules(std::move(record), line)) {
            ++stats_.records_emitted;
            return NormalizedRecord{.text = std::move(*text), .source = current_, .line = line};
        }
    }
}

auto LineNormalizer::write_to(std::ostream& out) -> std::size_t {
    std::size_t written = 0;
    while (auto record = next()) {
        out << record->text << '\n';
        if (!out) {
            throw std::runtime_error(
                fmt::format("{}: failed to write normalized stream", entity_));
        }
        ++written;
    }
    return written;
}

}  // namespace boxcar::ingest
