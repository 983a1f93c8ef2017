#include "search/search_controller.hpp"
#include "quality/quality_policy.hpp"
#include <string>

namespace wrc {

TrialMeasurement SearchController::probe(const TrialContext& context,
                                         const SearchState& state,
                                         BudgetManager* budget) {
    TrialRequest request;
    request.context = &context;
    request.quality = state.quality;
    request.quiet = context.quiet;
    request.history = state.trials;

    if (budget) budget->recordTrial();
    try {
        return evaluator_.run(request);
    } catch (const RecompressError& e) {
        throw RecompressError(ErrorKind::TRIAL_FAILURE, e.what());
    }
}

AttemptResult SearchController::run(const TrialContext& context,
                                    int start_quality,
                                    const SearchConfig& config,
                                    TrialTable& trials,
                                    BudgetManager* budget) {
    SearchState state;
    state.quality = clampQuality(start_quality);
    state.threshold = config.threshold;
    state.input_size = context.input_size;
    state.trials = &trials;

    AttemptResult result;
    result.threshold = state.threshold;

    while (true) {
        TrialMeasurement m = probe(context, state, budget);
        result.trials_run++;
        result.score = m.score;
        result.size = m.size;

        const TrialRecord& record = trials.record(state.quality, m.score, m.size);

        if (record.attempts > config.max_attempts) {
            logger_.verbose("Oscillating at q" + std::to_string(state.quality) + ", escaping");
            state.quality += (m.size >= state.input_size) ? -config.escape_nudge
                                                          : config.escape_nudge;
            result.outcome = SearchOutcome::ESCAPED;
            result.quality = state.quality;
            return result;
        }

        int interval = getQualityInterval(m.score, state.threshold, state.quality);

        // An output larger than the source is rejected whatever its score.
        if (m.size >= state.input_size) {
            state.quality = clampQuality(state.quality - interval);
            continue;
        }

        if (m.score <= state.threshold) {
            result.outcome = SearchOutcome::CONVERGED;
            result.quality = state.quality;
            return result;
        }

        state.quality = clampQuality(state.quality + interval);
    }
}

} // namespace wrc
