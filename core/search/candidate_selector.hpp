#pragma once

#include "search/trial_table.hpp"
#include "trial/trial_evaluator.hpp"
#include "tools/image_tools.hpp"
#include "util/logger.hpp"

namespace wrc {

/// The candidate reported after a successful attempt.
struct FinalCandidate {
    int quality = 0;
    uintmax_t size = 0;
};

// ─── Candidate Selector ────────────────────────────────────────
// Picks the smallest passing record across the whole trial history,
// not just the quality that converged, then re-encodes once at that
// quality so the output file on disk matches the report, then cleans
// up the working files.

class CandidateSelector {
public:
    CandidateSelector(TrialEvaluator& evaluator, ImageTools& tools, Logger& logger)
        : evaluator_(evaluator), tools_(tools), logger_(logger) {}

    /// Throws RecompressError(TRIAL_FAILURE) if nothing in `trials`
    /// passes `threshold` or the confirming trial fails. Cleanup
    /// failures are only logged.
    FinalCandidate select(const TrialContext& context,
                          double threshold,
                          const TrialTable& trials,
                          bool keep_intermediates = false);

private:
    TrialEvaluator& evaluator_;
    ImageTools& tools_;
    Logger& logger_;
};

} // namespace wrc
