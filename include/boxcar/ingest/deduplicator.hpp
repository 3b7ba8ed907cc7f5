#pragma once

#include <robin_hood.h>

#include <cstddef>
#include <string>

namespace boxcar::ingest {

/// Run-local duplicate suppression for one entity's normalization pass.
///
/// Holds owned copies of every admitted record. Create one per entity pass
/// and drop it when the pass ends; nothing is shared between entities.
class Deduplicator {
   public:
    explicit Deduplicator(bool enabled) : enabled_(enabled) {}

    /// True when `record` has not been admitted before (and remembers it).
    /// Always true when deduplication is disabled.
    [[nodiscard]] auto admit(const std::string& record) -> bool {
        if (!enabled_) {
            return true;
        }
        return seen_.insert(record).second;
    }

    [[nodiscard]] auto enabled() const noexcept -> bool { return enabled_; }

    /// Number of distinct records admitted so far.
    [[nodiscard]] auto size() const noexcept -> std::size_t { return seen_.size(); }

   private:
    bool enabled_;
    robin_hood::unordered_flat_set<std::string> seen_;
};

}  // namespace boxcar::ingest
