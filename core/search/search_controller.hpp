#pragma once

#include "search/search_state.hpp"
#include "search/budget_manager.hpp"
#include "search/trial_table.hpp"
#include "trial/trial_evaluator.hpp"
#include "util/logger.hpp"

namespace wrc {

/// Search Controller: the probe / adjust loop of one attempt.
///
/// Each iteration runs a trial at the current quality and records it.
/// A quality visited more than `max_attempts` times is an oscillation:
/// the quality is nudged and the attempt escapes. Otherwise an output
/// at least as large as the input moves quality down, a passing score
/// converges, and a failing score moves quality up. Step sizes come
/// from getQualityInterval.
class SearchController {
public:
    SearchController(TrialEvaluator& evaluator, Logger& logger)
        : evaluator_(evaluator), logger_(logger) {}

    /// Run one attempt from `start_quality`. Trials are recorded into
    /// `trials`, which the caller keeps across attempts.
    /// Throws RecompressError(TRIAL_FAILURE) if a trial fails.
    AttemptResult run(const TrialContext& context,
                      int start_quality,
                      const SearchConfig& config,
                      TrialTable& trials,
                      BudgetManager* budget = nullptr);

private:
    TrialEvaluator& evaluator_;
    Logger& logger_;

    TrialMeasurement probe(const TrialContext& context,
                           const SearchState& state,
                           BudgetManager* budget);
};

} // namespace wrc
