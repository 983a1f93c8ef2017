#pragma once

#include "search/trial_table.hpp"
#include "util/errors.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace wrc {

/// Live state of one controller invocation.
struct SearchState {
    int quality = 0;            // candidate, mutated each iteration
    double threshold = 0.0;     // fixed for the invocation, inclusive
    uintmax_t input_size = 0;   // baseline the output must beat
    TrialTable* trials = nullptr;
};

/// Controller parameters for one attempt.
struct SearchConfig {
    double threshold = 0.01;
    int max_attempts = 3;       // visits to one quality before escaping
    int escape_nudge = 2;       // quality shift applied on escape
};

enum class SearchOutcome {
    CONVERGED,      // score within threshold and smaller than the input
    ESCAPED         // oscillation detected, best-effort last state
};

/// Result of one controller invocation.
struct AttemptResult {
    SearchOutcome outcome = SearchOutcome::ESCAPED;
    int quality = 0;            // on escape: after the nudge, unclamped
    double score = 0.0;
    uintmax_t size = 0;
    double threshold = 0.0;
    int trials_run = 0;

    /// The compound success check applied by the relaxation driver.
    bool accepted(uintmax_t input_size) const {
        return outcome == SearchOutcome::CONVERGED &&
               score <= threshold && size < input_size;
    }
};

/// Result of a full search across every relaxation.
struct SearchResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    int final_quality = 0;
    uintmax_t final_size = 0;
    double final_threshold = 0.0;
    int relaxations = 0;
    int total_trials = 0;
    double elapsed_seconds = 0.0;
    std::vector<double> thresholds_tried;
};

} // namespace wrc
