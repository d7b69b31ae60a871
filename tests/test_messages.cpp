#include <tandem/sync/messages.hpp>

#include <gtest/gtest.h>

#include <limits>

#include "test_helpers.hpp"

using namespace tandem;
using namespace tandem::sync;
using tandem::test::makeSnapshot;

TEST(MessagesTest, WellFormedSnapshotValidates) {
    EXPECT_TRUE(validate(makeSnapshot(12.5, true, 1'700'000'000'000)));
    EXPECT_TRUE(validate(makeSnapshot(0.0, false, 0)));
}

TEST(MessagesTest, SnapshotWithBadPositionIsRejected) {
    auto negative = validate(makeSnapshot(-1.0, true, 1000));
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidData);

    EXPECT_FALSE(validate(makeSnapshot(std::numeric_limits<double>::quiet_NaN(), true, 1000)));
    EXPECT_FALSE(validate(makeSnapshot(std::numeric_limits<double>::infinity(), true, 1000)));
}

TEST(MessagesTest, SnapshotWithBadRateOrTimestampIsRejected) {
    auto zeroRate = makeSnapshot(1.0, true, 1000);
    zeroRate.rate = 0.0;
    EXPECT_FALSE(validate(zeroRate));

    EXPECT_FALSE(validate(makeSnapshot(1.0, true, -5)));
}

TEST(MessagesTest, DiscreteEventPositionsAreChecked) {
    EXPECT_TRUE(validate(DiscreteEvent::play(25.0)));
    EXPECT_TRUE(validate(DiscreteEvent::seek(0.0)));
    EXPECT_FALSE(validate(DiscreteEvent::pause(-0.5)));
    EXPECT_FALSE(validate(DiscreteEvent::seek(std::numeric_limits<double>::quiet_NaN())));
}

TEST(MessagesTest, NonPositionalEventsAlwaysValidate) {
    EXPECT_TRUE(validate(DiscreteEvent::bufferingChanged(true)));
    EXPECT_TRUE(validate(DiscreteEvent::sourceChanged(std::nullopt)));
    EXPECT_TRUE(validate(DiscreteEvent::sourceChanged("magnet:?xt=urn:btih:abc")));
}

TEST(MessagesTest, FactoriesSetType) {
    EXPECT_EQ(DiscreteEvent::play(1.0).type, DiscreteEventType::Play);
    EXPECT_EQ(DiscreteEvent::pause(1.0).type, DiscreteEventType::Pause);
    EXPECT_EQ(DiscreteEvent::seek(1.0).type, DiscreteEventType::Seek);
    EXPECT_EQ(DiscreteEvent::bufferingChanged(true).buffering, true);
    EXPECT_EQ(DiscreteEvent::sourceChanged("x").contentRef, "x");
}
