// File: tests/core/MemoryModelTest.cpp
#include "core/MemoryModel.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>
#include <random>

using namespace testing_helpers;

namespace {

class MemoryModelTest : public ::testing::Test {
protected:
    MemoryModelTest() : clock(referenceNow()), model(clock) {}

    void SetUp() override { quietLogs(); }

    ManualClock clock;
    MemoryModel model;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(MemoryModelTest, InitializeCardMemoryUsesDefaults) {
    CardMemoryState s = model.initializeCardMemory("card-1");

    EXPECT_EQ("card-1", s.item_id);
    EXPECT_EQ(1, s.interval);
    EXPECT_DOUBLE_EQ(2.5, s.ease_factor);
    EXPECT_EQ(0, s.repetitions);
    EXPECT_EQ(0, s.total_reviews);
    EXPECT_DOUBLE_EQ(0.0, s.average_quality);
    EXPECT_EQ(0, s.streak);
    EXPECT_EQ(TimeUtils::addDays(clock.now(), 1), s.next_review_date);
    EXPECT_EQ(clock.now(), s.last_review_date);
    EXPECT_EQ(clock.now(), s.created);
}

// ============================================================================
// Update rule
// ============================================================================

TEST_F(MemoryModelTest, WorkedExampleMatchesSm2Table) {
    CardMemoryState s = model.initializeCardMemory("card");

    s = model.calculateNextReview(s, 5);
    EXPECT_EQ(1, s.interval);
    EXPECT_EQ(1, s.repetitions);
    EXPECT_DOUBLE_EQ(2.5, s.ease_factor);  // 2.6 clamped

    s = model.calculateNextReview(s, 5);
    EXPECT_EQ(6, s.interval);
    EXPECT_EQ(2, s.repetitions);
    EXPECT_DOUBLE_EQ(2.5, s.ease_factor);

    s = model.calculateNextReview(s, 5);
    EXPECT_EQ(15, s.interval);
    EXPECT_EQ(3, s.repetitions);
    EXPECT_EQ(3, s.streak);

    s = model.calculateNextReview(s, 2);
    EXPECT_EQ(0, s.repetitions);
    EXPECT_EQ(1, s.interval);
    EXPECT_EQ(0, s.streak);
    EXPECT_NEAR(2.18, s.ease_factor, 1e-9);
}

TEST_F(MemoryModelTest, EaseFactorMovesOnSuccessAsWell) {
    CardMemoryState s = model.initializeCardMemory("card");

    // q=3: 0.1 - 2 * (0.08 + 0.04) = -0.14
    s = model.calculateNextReview(s, 3);
    EXPECT_NEAR(2.36, s.ease_factor, 1e-9);
    EXPECT_EQ(1, s.repetitions);

    // q=4 leaves EF unchanged
    s = model.calculateNextReview(s, 4);
    EXPECT_NEAR(2.36, s.ease_factor, 1e-9);
    EXPECT_EQ(6, s.interval);

    // third success uses the pre-update interval and EF
    s = model.calculateNextReview(s, 4);
    EXPECT_EQ(14, s.interval);  // round(6 * 2.36) = round(14.16)
}

TEST_F(MemoryModelTest, FailureAlwaysResetsProgress) {
    std::mt19937 gen(7);
    std::uniform_int_distribution<int> reps(0, 20);
    std::uniform_int_distribution<int> interval(1, 365);
    std::uniform_real_distribution<double> ease(1.3, 2.5);

    for (int i = 0; i < 200; ++i) {
        CardMemoryState s = makeState("x", clock.now(), ease(gen), interval(gen));
        s.repetitions = reps(gen);
        s.streak = s.repetitions;

        for (int q = 0; q < 3; ++q) {
            CardMemoryState next = model.calculateNextReview(s, q);
            EXPECT_EQ(0, next.repetitions);
            EXPECT_EQ(1, next.interval);
            EXPECT_EQ(0, next.streak);
        }
    }
}

TEST_F(MemoryModelTest, BoundsHoldOverLongRandomSequences) {
    std::mt19937 gen(12345);
    std::uniform_int_distribution<int> quality(0, 5);

    for (int run = 0; run < 5; ++run) {
        CardMemoryState s = model.initializeCardMemory("card");
        for (int step = 0; step < 1000; ++step) {
            s = model.calculateNextReview(s, quality(gen));
            ASSERT_GE(s.ease_factor, 1.3);
            ASSERT_LE(s.ease_factor, 2.5);
            ASSERT_GE(s.interval, 1);
            ASSERT_LE(s.interval, 365);
        }
        EXPECT_EQ(1000, s.total_reviews);
    }
}

TEST_F(MemoryModelTest, IntervalIsCappedAtOneYear) {
    CardMemoryState s = makeState("old", clock.now(), 2.5, 300);
    s.repetitions = 8;

    CardMemoryState next = model.calculateNextReview(s, 5);

    EXPECT_EQ(365, next.interval);
    EXPECT_EQ(TimeUtils::addDays(clock.now(), 365), next.next_review_date);
}

TEST_F(MemoryModelTest, EaseFactorBottomsOutAtMinimum) {
    CardMemoryState s = model.initializeCardMemory("card");
    for (int i = 0; i < 10; ++i) s = model.calculateNextReview(s, 0);

    EXPECT_DOUBLE_EQ(1.3, s.ease_factor);
}

TEST_F(MemoryModelTest, AverageQualityIsExactRunningMean) {
    const int qualities[] = { 5, 3, 0, 4, 4, 1, 2, 5, 5, 3 };
    CardMemoryState s = model.initializeCardMemory("card");

    double sum = 0.0;
    int k = 0;
    for (int q : qualities) {
        s = model.calculateNextReview(s, q);
        sum += q;
        ++k;
        EXPECT_NEAR(sum / k, s.average_quality, 1e-12);
        EXPECT_EQ(k, s.total_reviews);
    }
}

TEST_F(MemoryModelTest, ReviewDatesFollowTheClock) {
    CardMemoryState s = model.initializeCardMemory("card");
    clock.advanceDays(3);

    CardMemoryState next = model.calculateNextReview(s, 4);

    EXPECT_EQ(clock.now(), next.last_review_date);
    EXPECT_EQ(clock.now(), next.updated);
    EXPECT_EQ(s.created, next.created);
    EXPECT_EQ(TimeUtils::addDays(clock.now(), next.interval), next.next_review_date);
}

TEST_F(MemoryModelTest, InputStateIsLeftUntouched) {
    const CardMemoryState s = makeState("card", clock.now(), 2.0, 10);
    CardMemoryState copy = s;

    model.calculateNextReview(s, 1);

    EXPECT_EQ(copy.interval, s.interval);
    EXPECT_EQ(copy.repetitions, s.repetitions);
    EXPECT_DOUBLE_EQ(copy.ease_factor, s.ease_factor);
    EXPECT_EQ(copy.next_review_date, s.next_review_date);
}

// ============================================================================
// Out-of-range quality
// ============================================================================

TEST_F(MemoryModelTest, QualityAboveRangeIsTreatedAsFive) {
    CardMemoryState s = model.initializeCardMemory("card");

    CardMemoryState high = model.calculateNextReview(s, 9);
    CardMemoryState five = model.calculateNextReview(s, 5);

    EXPECT_EQ(five.interval, high.interval);
    EXPECT_DOUBLE_EQ(five.ease_factor, high.ease_factor);
    EXPECT_DOUBLE_EQ(5.0, high.average_quality);
}

TEST_F(MemoryModelTest, QualityBelowRangeIsTreatedAsZero) {
    CardMemoryState s = model.initializeCardMemory("card");

    CardMemoryState low = model.calculateNextReview(s, -4);

    EXPECT_EQ(0, low.repetitions);
    EXPECT_DOUBLE_EQ(0.0, low.average_quality);
    EXPECT_NEAR(1.7, low.ease_factor, 1e-9);  // 2.5 + 0.1 - 5 * 0.18
}

TEST(QualityDescriptionTest, NamesEveryRating) {
    EXPECT_EQ("Complete blackout - no memory", qualityDescription(0));
    EXPECT_EQ("Correct with serious difficulty",
        qualityDescription(static_cast<int>(QualityRating::CORRECT_HARD)));
    EXPECT_EQ("Perfect response", qualityDescription(5));
    EXPECT_EQ("Unknown rating", qualityDescription(6));
}

}  // namespace
