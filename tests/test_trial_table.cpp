#include <gtest/gtest.h>
#include <cstddef>
#include "search/trial_table.hpp"

using namespace wrc;

TEST(TrialTableTest, FirstRecordCountsOneAttempt) {
    TrialTable trials;
    const TrialRecord& rec = trials.record(75, 0.012, 4096);

    EXPECT_EQ(rec.attempts, 1);
    EXPECT_DOUBLE_EQ(rec.score, 0.012);
    EXPECT_EQ(rec.size, 4096u);
    EXPECT_TRUE(trials.contains(75));
    EXPECT_EQ(trials.size(), std::size_t{1});
}

TEST(TrialTableTest, RevisitIncrementsAttempts) {
    TrialTable trials;
    for (int i = 1; i <= 5; i++) {
        EXPECT_EQ(trials.record(60, 0.02, 1000).attempts, i);
    }
    EXPECT_EQ(trials.size(), 1u);
    EXPECT_EQ(trials.totalAttempts(), 5);
}

TEST(TrialTableTest, RevisitKeepsLastObservation) {
    TrialTable trials;
    trials.record(60, 0.02, 1000);
    trials.record(60, 0.03, 900);

    const TrialRecord* rec = trials.find(60);
    ASSERT_NE(rec, nullptr);
    EXPECT_DOUBLE_EQ(rec->score, 0.03);
    EXPECT_EQ(rec->size, 900u);
    EXPECT_EQ(rec->attempts, 2);
}

TEST(TrialTableTest, FindMissing) {
    TrialTable trials;
    trials.record(10, 0.1, 10);
    EXPECT_EQ(trials.find(11), nullptr);
    EXPECT_FALSE(trials.contains(11));
}

TEST(TrialTableTest, IteratesInQualityOrder) {
    TrialTable trials;
    trials.record(90, 0.01, 900);
    trials.record(30, 0.05, 300);
    trials.record(60, 0.02, 600);

    std::vector<int> order;
    for (const auto& [quality, rec] : trials) {
        order.push_back(quality);
    }
    EXPECT_EQ(order, (std::vector<int>{30, 60, 90}));

    trials.clear();
    EXPECT_TRUE(trials.empty());
}
