#include "search/trial_table.hpp"

namespace wrc {

TrialRecord& TrialTable::record(int quality, double score, uintmax_t size) {
    auto it = entries_.find(quality);
    if (it == entries_.end()) {
        it = entries_.emplace(quality, TrialRecord{score, size, 0}).first;
    }
    TrialRecord& rec = it->second;
    rec.score = score;
    rec.size = size;
    rec.attempts++;
    return rec;
}

const TrialRecord* TrialTable::find(int quality) const {
    auto it = entries_.find(quality);
    return it != entries_.end() ? &it->second : nullptr;
}

int TrialTable::totalAttempts() const {
    int total = 0;
    for (const auto& [quality, rec] : entries_) {
        total += rec.attempts;
    }
    return total;
}

} // namespace wrc
