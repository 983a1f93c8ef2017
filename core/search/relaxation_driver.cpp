#include "search/relaxation_driver.hpp"
#include "quality/quality_policy.hpp"
#include "util/format.hpp"

namespace wrc {

SearchResult RelaxationDriver::run(const TrialContext& context,
                                   int start_quality,
                                   const RecompressConfig& config,
                                   TrialTable& trials) {
    BudgetManager budget(config.max_relaxations);
    budget.start();

    SearchConfig search;
    search.threshold = config.threshold;
    search.max_attempts = config.max_attempts;
    search.escape_nudge = config.escape_nudge;

    SearchResult result;
    int start = clampQuality(start_quality);

    auto finish = [&](SearchResult& r) -> SearchResult& {
        r.relaxations = budget.relaxations();
        r.total_trials = budget.trials();
        r.elapsed_seconds = budget.elapsedSeconds();
        return r;
    };

    while (true) {
        if (!thresholdInRange(search.threshold)) {
            result.error = ErrorKind::THRESHOLD_OUT_OF_RANGE;
            result.message = kThresholdRangeMessage;
            return finish(result);
        }

        logger_.verbose("Trying for threshold: " + formatDecimal(search.threshold, kThresholdDigits) + "...");
        result.thresholds_tried.push_back(search.threshold);
        result.final_threshold = search.threshold;

        AttemptResult attempt = controller_.run(context, start, search, trials, &budget);

        if (attempt.accepted(context.input_size)) {
            FinalCandidate chosen = selector_.select(context, search.threshold, trials,
                                                    config.keep_intermediates);
            result.success = true;
            result.final_quality = chosen.quality;
            result.final_size = chosen.size;
            return finish(result);
        }

        if (!budget.canRelax()) {
            result.error = ErrorKind::RELAXATION_LIMIT;
            result.message = "No candidate found within " +
                std::to_string(budget.maxRelaxations()) + " threshold relaxations.";
            return finish(result);
        }

        budget.recordRelaxation();
        search.threshold = relaxThreshold(search.threshold, config.threshold_multiplier);
        start = clampQuality(attempt.quality);
    }
}

} // namespace wrc
