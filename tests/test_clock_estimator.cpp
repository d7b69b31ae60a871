#include <tandem/sync/clock_estimator.hpp>

#include <gtest/gtest.h>

#include "test_helpers.hpp"

using namespace tandem;
using namespace tandem::sync;
using tandem::test::makeSnapshot;

namespace {
constexpr EpochMs kT0 = 1'700'000'000'000;
}

TEST(ClockEstimatorTest, PausedHostDoesNotAdvance) {
    auto snapshot = makeSnapshot(42.0, false, kT0);
    EXPECT_DOUBLE_EQ(estimateHostPosition(snapshot, kT0 + 5000), 42.0);
}

TEST(ClockEstimatorTest, PlayingHostAdvancesByElapsedTime) {
    auto snapshot = makeSnapshot(10.0, true, kT0);
    EXPECT_DOUBLE_EQ(estimateHostPosition(snapshot, kT0 + 2000), 12.0);
}

TEST(ClockEstimatorTest, LateJoinerEstimate) {
    auto snapshot = makeSnapshot(120.3, true, kT0);
    EXPECT_NEAR(estimateHostPosition(snapshot, kT0 + 300), 120.6, 1e-9);
}

TEST(ClockEstimatorTest, ClockSkewNeverMovesEstimateBackwards) {
    // Sender clock ahead of ours: elapsed is negative
    auto snapshot = makeSnapshot(10.0, true, kT0 + 800);
    EXPECT_DOUBLE_EQ(estimateHostPosition(snapshot, kT0), 10.0);
}

TEST(ClockEstimatorTest, EstimateIgnoresReportedRate) {
    auto snapshot = makeSnapshot(10.0, true, kT0);
    snapshot.rate = 1.05;
    EXPECT_DOUBLE_EQ(estimateHostPosition(snapshot, kT0 + 1000), 11.0);
}
