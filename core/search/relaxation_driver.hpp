#pragma once

#include "search/search_controller.hpp"
#include "search/candidate_selector.hpp"
#include "search/search_state.hpp"
#include "search/trial_table.hpp"
#include "config/config.hpp"
#include "util/logger.hpp"

namespace wrc {

// ─── Relaxation Driver ─────────────────────────────────────────
// Runs the controller until an attempt is accepted. After each
// rejected attempt the threshold is multiplied by the configured
// factor and the next attempt starts from the last quality reached,
// with the same trial table. An explicit loop, so many relaxations do
// not grow the stack.
//
// Ends in one of:
//   success                   the candidate selector has run
//   THRESHOLD_OUT_OF_RANGE    the relaxed threshold passed 1
//   RELAXATION_LIMIT          config.max_relaxations reached
// Trial failures propagate as RecompressError.

class RelaxationDriver {
public:
    RelaxationDriver(SearchController& controller, CandidateSelector& selector, Logger& logger)
        : controller_(controller), selector_(selector), logger_(logger) {}

    SearchResult run(const TrialContext& context,
                     int start_quality,
                     const RecompressConfig& config,
                     TrialTable& trials);

private:
    SearchController& controller_;
    CandidateSelector& selector_;
    Logger& logger_;
};

} // namespace wrc
