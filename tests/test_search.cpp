#include <gtest/gtest.h>
#include "search/budget_manager.hpp"
#include "search/search_controller.hpp"
#include "search/search_state.hpp"
#include "search/trial_table.hpp"
#include "util/logger.hpp"
#include "test_stubs.hpp"

#include <sstream>

using namespace wrc;
using namespace wrc::stubs;

namespace {

TrialContext makeContext(uintmax_t input_size) {
    TrialContext ctx;
    ctx.source = "photo.jpg";
    ctx.input_size = input_size;
    ctx.files = {"/tmp/photo.png", "/tmp/photo.webp", "/tmp/photo-webp.png"};
    return ctx;
}

SearchConfig makeConfig(double threshold) {
    SearchConfig config;
    config.threshold = threshold;
    return config;
}

} // namespace

// ─── Budget Manager ────────────────────────────────────────────

TEST(SearchTest, BudgetManagerRelaxationLimit) {
    BudgetManager budget(2);
    budget.start();

    EXPECT_TRUE(budget.canRelax());
    budget.recordRelaxation();
    EXPECT_TRUE(budget.canRelax());
    budget.recordRelaxation();
    EXPECT_FALSE(budget.canRelax());
    EXPECT_EQ(budget.relaxations(), 2);
}

TEST(SearchTest, BudgetManagerUnlimitedByDefault) {
    BudgetManager budget;
    budget.start();
    for (int i = 0; i < 1000; i++) budget.recordRelaxation();
    EXPECT_TRUE(budget.canRelax());
    EXPECT_GE(budget.elapsedSeconds(), 0.0);
}

TEST(SearchTest, BudgetManagerCountsTrials) {
    BudgetManager budget;
    budget.start();
    budget.recordTrial();
    budget.recordTrial();
    EXPECT_EQ(budget.trials(), 2);
    budget.start();
    EXPECT_EQ(budget.trials(), 0);
}

// ─── Search Controller ─────────────────────────────────────────

TEST(SearchTest, ConvergesOnFirstPassingTrial) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.01, 60000));
    SearchController controller(evaluator, logger);

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(100000), 80, makeConfig(0.02), trials);

    EXPECT_EQ(result.outcome, SearchOutcome::CONVERGED);
    EXPECT_EQ(result.quality, 80);
    EXPECT_EQ(result.size, 60000u);
    EXPECT_EQ(result.trials_run, 1);
    EXPECT_TRUE(result.accepted(100000));
    EXPECT_EQ(evaluator.qualities, (std::vector<int>{80}));
}

TEST(SearchTest, EscapesAfterFourTrialsAtSameQuality) {
    std::ostringstream out;
    Logger logger(out);
    // Always too different, always small: pushes quality up into the ceiling.
    ScriptedEvaluator evaluator(constant(0.5, 100));
    SearchController controller(evaluator, logger);

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(1000), 100, makeConfig(0.01), trials);

    EXPECT_EQ(result.outcome, SearchOutcome::ESCAPED);
    EXPECT_EQ(result.trials_run, 4);
    EXPECT_EQ(evaluator.calls(), 4);
    ASSERT_NE(trials.find(100), nullptr);
    EXPECT_EQ(trials.find(100)->attempts, 4);
    EXPECT_EQ(result.quality, 102);  // size < input: nudged up
    EXPECT_FALSE(result.accepted(1000));
}

TEST(SearchTest, EscapeNudgesDownWhenTooLarge) {
    std::ostringstream out;
    Logger logger(out);
    // Never smaller than the input: pushes quality down into the floor.
    ScriptedEvaluator evaluator(constant(0.0, 5000));
    SearchController controller(evaluator, logger);

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(1000), 0, makeConfig(0.01), trials);

    EXPECT_EQ(result.outcome, SearchOutcome::ESCAPED);
    EXPECT_EQ(result.trials_run, 4);
    EXPECT_EQ(result.quality, -2);
}

TEST(SearchTest, EscapeConstantsAreConfigurable) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.5, 100));
    SearchController controller(evaluator, logger);

    SearchConfig config = makeConfig(0.01);
    config.max_attempts = 1;
    config.escape_nudge = 5;

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(1000), 100, config, trials);

    EXPECT_EQ(result.outcome, SearchOutcome::ESCAPED);
    EXPECT_EQ(result.trials_run, 2);
    EXPECT_EQ(result.quality, 105);
}

TEST(SearchTest, SizeRegressionTakesPriorityOverScore) {
    std::ostringstream out;
    Logger logger(out);
    // Bigger than the input above q59 even though the score passes there.
    ScriptedEvaluator evaluator([](int q) {
        return TrialMeasurement{(100 - q) / 1000.0, static_cast<uintmax_t>(q) * 1000};
    });
    SearchController controller(evaluator, logger);

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(60000), 80, makeConfig(0.05), trials);

    ASSERT_EQ(result.outcome, SearchOutcome::CONVERGED);
    EXPECT_LT(result.size, 60000u);
    EXPECT_LE(result.score, 0.05);
    EXPECT_GE(result.quality, 50);
    EXPECT_LT(result.quality, 60);
    // every step was downward
    for (size_t i = 1; i < evaluator.qualities.size(); i++) {
        EXPECT_LT(evaluator.qualities[i], evaluator.qualities[i - 1]);
    }
}

TEST(SearchTest, ClimbsUntilScorePasses) {
    std::ostringstream out;
    Logger logger(out);
    // Score improves with quality; output always small.
    ScriptedEvaluator evaluator([](int q) {
        return TrialMeasurement{(100 - q) / 1000.0, 100};
    });
    SearchController controller(evaluator, logger);

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(1000), 10, makeConfig(0.02), trials);

    ASSERT_EQ(result.outcome, SearchOutcome::CONVERGED);
    EXPECT_GE(result.quality, 80);
    for (size_t i = 1; i < evaluator.qualities.size(); i++) {
        EXPECT_GT(evaluator.qualities[i], evaluator.qualities[i - 1]);
    }
}

TEST(SearchTest, ConvergedStateMatchesRecordedTrial) {
    std::ostringstream out;
    Logger logger(out);
    const int starts[] = {0, 25, 50, 75, 100};

    for (int start : starts) {
        ScriptedEvaluator evaluator([](int q) {
            return TrialMeasurement{(100 - q) / 2000.0, static_cast<uintmax_t>(q) * 97};
        });
        SearchController controller(evaluator, logger);

        TrialTable trials;
        AttemptResult result = controller.run(makeContext(8000), start, makeConfig(0.015), trials);
        if (result.outcome != SearchOutcome::CONVERGED) continue;

        const TrialRecord* rec = trials.find(result.quality);
        ASSERT_NE(rec, nullptr) << "start = " << start;
        EXPECT_LE(rec->score, 0.015);
        EXPECT_LT(rec->size, 8000u);
    }
}

TEST(SearchTest, CarriedTableKeepsCountingAttempts) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.01, 500));
    SearchController controller(evaluator, logger);

    TrialTable trials;
    controller.run(makeContext(1000), 70, makeConfig(0.02), trials);
    controller.run(makeContext(1000), 70, makeConfig(0.02), trials);
    EXPECT_EQ(trials.find(70)->attempts, 2);

    controller.run(makeContext(1000), 70, makeConfig(0.02), trials);
    AttemptResult fourth = controller.run(makeContext(1000), 70, makeConfig(0.02), trials);
    EXPECT_EQ(fourth.outcome, SearchOutcome::ESCAPED);
    EXPECT_EQ(fourth.trials_run, 1);
}

TEST(SearchTest, StartQualityIsClamped) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.01, 500));
    SearchController controller(evaluator, logger);

    TrialTable trials;
    AttemptResult result = controller.run(makeContext(1000), 140, makeConfig(0.02), trials);
    EXPECT_EQ(result.quality, 100);
    EXPECT_EQ(evaluator.qualities.front(), 100);
}

TEST(SearchTest, TrialFailureAbortsAttempt) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.5, 100));
    evaluator.fail_on_call = 2;
    SearchController controller(evaluator, logger);

    TrialTable trials;
    try {
        controller.run(makeContext(1000), 50, makeConfig(0.01), trials);
        FAIL() << "expected a trial failure";
    } catch (const RecompressError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRIAL_FAILURE);
        EXPECT_NE(std::string(e.what()).find("cwebp"), std::string::npos);
    }
    EXPECT_EQ(evaluator.calls(), 2);
    EXPECT_EQ(trials.size(), 1u);
}

TEST(SearchTest, TrialsAreCountedInBudget) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.5, 100));
    SearchController controller(evaluator, logger);

    BudgetManager budget;
    budget.start();
    TrialTable trials;
    AttemptResult result = controller.run(makeContext(1000), 100, makeConfig(0.01), trials, &budget);

    EXPECT_EQ(budget.trials(), result.trials_run);
}

TEST(SearchTest, TrialsReceiveHistory) {
    std::ostringstream out;
    Logger logger(out);
    ScriptedEvaluator evaluator(constant(0.01, 500));
    SearchController controller(evaluator, logger);

    TrialTable trials;
    controller.run(makeContext(1000), 60, makeConfig(0.02), trials);
    ASSERT_EQ(evaluator.had_history.size(), 1u);
    EXPECT_TRUE(evaluator.had_history[0]);
}
