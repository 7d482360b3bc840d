// File: tests/core/DueSelectorTest.cpp
#include "core/DueSelector.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace testing_helpers;

namespace {

class DueSelectorTest : public ::testing::Test {
protected:
    DueSelectorTest() : clock(referenceNow()), selector(clock) {}

    void SetUp() override { quietLogs(); }

    TimePoint daysAgo(int d) const { return TimeUtils::addDays(clock.now(), -d); }

    ManualClock clock;
    DueSelector selector;
};

// ============================================================================
// getCardsDueForReview
// ============================================================================

TEST_F(DueSelectorTest, MostOverdueFirstThenHarderFirst) {
    MemorySnapshot states = {
        makeState("two-days-easy", daysAgo(2), 2.0),
        makeState("five-days", daysAgo(5), 2.5),
        makeState("two-days-hard", daysAgo(2), 1.5),
    };

    auto due = selector.getCardsDueForReview(states, 20);

    ASSERT_EQ(3u, due.size());
    EXPECT_EQ("five-days", due[0].item_id);
    EXPECT_EQ("two-days-hard", due[1].item_id);
    EXPECT_EQ("two-days-easy", due[2].item_id);
}

TEST_F(DueSelectorTest, FutureItemsAreNotDue) {
    MemorySnapshot states = {
        makeState("tomorrow", TimeUtils::addDays(clock.now(), 1)),
        makeState("right-now", clock.now()),
        makeState("one-second-ahead", clock.now() + std::chrono::seconds(1)),
    };

    auto due = selector.getCardsDueForReview(states);

    ASSERT_EQ(1u, due.size());
    EXPECT_EQ("right-now", due[0].item_id);
}

TEST_F(DueSelectorTest, LimitKeepsHighestPriority) {
    MemorySnapshot states;
    for (int i = 1; i <= 10; ++i) {
        states.push_back(makeState("item-" + std::to_string(i), daysAgo(i)));
    }

    auto due = selector.getCardsDueForReview(states, 3);

    ASSERT_EQ(3u, due.size());
    EXPECT_EQ("item-10", due[0].item_id);
    EXPECT_EQ("item-9", due[1].item_id);
    EXPECT_EQ("item-8", due[2].item_id);
}

TEST_F(DueSelectorTest, NegativeOrZeroLimitSelectsNothing) {
    MemorySnapshot states = { makeState("a", daysAgo(1)) };

    EXPECT_TRUE(selector.getCardsDueForReview(states, 0).empty());
    EXPECT_TRUE(selector.getCardsDueForReview(states, -5).empty());
}

TEST_F(DueSelectorTest, EmptySnapshotHasNothingDue) {
    EXPECT_TRUE(selector.getCardsDueForReview({}).empty());
}

// ============================================================================
// getNewCards
// ============================================================================

TEST_F(DueSelectorTest, NewCardsPreservePoolOrder) {
    MemorySnapshot states = { makeState("b", daysAgo(1)), makeState("d", daysAgo(1)) };
    std::vector<std::string> pool = { "a", "b", "c", "d", "e", "f" };

    auto fresh = selector.getNewCards(pool, states, 3);

    ASSERT_EQ(3u, fresh.size());
    EXPECT_EQ("a", fresh[0]);
    EXPECT_EQ("c", fresh[1]);
    EXPECT_EQ("e", fresh[2]);
}

TEST_F(DueSelectorTest, NewCardsWhenEverythingStudied) {
    MemorySnapshot states = { makeState("a", daysAgo(1)) };

    EXPECT_TRUE(selector.getNewCards({ "a" }, states).empty());
    EXPECT_TRUE(selector.getNewCards({ "z" }, states, -1).empty());
}

}  // namespace
