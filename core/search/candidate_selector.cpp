#include "search/candidate_selector.hpp"
#include "quality/quality_policy.hpp"
#include "util/errors.hpp"
#include <string>

namespace wrc {

FinalCandidate CandidateSelector::select(const TrialContext& context,
                                         double threshold,
                                         const TrialTable& trials,
                                         bool keep_intermediates) {
    auto best = getFinalQuality(threshold, trials);
    if (!best) {
        throw RecompressError(ErrorKind::TRIAL_FAILURE,
            "no recorded trial satisfies the threshold");
    }

    // Final mode: forced quiet, no history, result not fed back.
    TrialRequest request;
    request.context = &context;
    request.quality = best->quality;
    request.quiet = true;
    request.history = nullptr;

    try {
        evaluator_.run(request);
    } catch (const RecompressError& e) {
        throw RecompressError(ErrorKind::TRIAL_FAILURE, e.what());
    }

    if (!keep_intermediates) {
        cleanupQuietly(tools_, context.files, logger_);
    }

    logger_.verbose("Selected q" + std::to_string(best->quality) +
                    " from " + std::to_string(trials.size()) + " tried qualities");
    return {best->quality, best->size};
}

} // namespace wrc
