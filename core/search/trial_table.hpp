#pragma once

#include <cstddef>
#include <cstdint>
#include <map>

namespace wrc {

/// Outcome of the trials run at one quality value.
struct TrialRecord {
    double score = 0.0;     // last similarity score seen at this quality
    uintmax_t size = 0;     // last encoded size seen at this quality
    int attempts = 0;       // loop iterations that landed on this quality
};

// ─── Trial Table ───────────────────────────────────────────────
// Memoizes every quality tried during one top-level search. Shared by
// reference across threshold relaxations so no result is lost.
// Ordered by quality so scans are deterministic.

class TrialTable {
public:
    using Entries = std::map<int, TrialRecord>;

    /// Record an observation at `quality`: create the entry with zero
    /// attempts if absent, store score and size, bump the attempt count.
    TrialRecord& record(int quality, double score, uintmax_t size);

    /// Entry for `quality`, or nullptr if never tried.
    const TrialRecord* find(int quality) const;

    bool contains(int quality) const { return entries_.count(quality) > 0; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    /// Sum of attempts over every entry.
    int totalAttempts() const;

    const Entries& entries() const { return entries_; }
    Entries::const_iterator begin() const { return entries_.begin(); }
    Entries::const_iterator end() const { return entries_.end(); }

private:
    Entries entries_;
};

} // namespace wrc
