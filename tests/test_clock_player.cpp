#include <tandem/core/manual_scheduler.hpp>
#include <tandem/player/clock_player.hpp>

#include <gtest/gtest.h>

using namespace tandem;
using tandem::player::ClockPlayer;

class ClockPlayerTest : public ::testing::Test {
protected:
    ManualScheduler clock;
    ClockPlayer player{clock};
};

TEST_F(ClockPlayerTest, LoadStartsPausedAtZero) {
    player.load("movie.mkv", 120.0);

    EXPECT_EQ(player.contentRef(), "movie.mkv");
    EXPECT_DOUBLE_EQ(player.currentTime(), 0.0);
    EXPECT_FALSE(player.isPlaying());

    clock.advance(Milliseconds(1000));
    EXPECT_DOUBLE_EQ(player.currentTime(), 0.0);
}

TEST_F(ClockPlayerTest, PositionAdvancesWithWallTimeWhilePlaying) {
    player.load("movie.mkv");
    player.play();

    clock.advance(Milliseconds(2500));
    EXPECT_NEAR(player.currentTime(), 2.5, 1e-9);
    EXPECT_TRUE(player.isPlaying());
}

TEST_F(ClockPlayerTest, RateScalesProgress) {
    player.load("movie.mkv");
    player.seek(10.0);
    player.play();
    player.setPlaybackRate(1.05);

    clock.advance(Milliseconds(2000));
    EXPECT_NEAR(player.currentTime(), 12.1, 1e-9);
    EXPECT_DOUBLE_EQ(player.playbackRate(), 1.05);
}

TEST_F(ClockPlayerTest, RateIsClamped) {
    player.setPlaybackRate(100.0);
    EXPECT_DOUBLE_EQ(player.playbackRate(), ClockPlayer::kMaxRate);

    player.setPlaybackRate(0.0);
    EXPECT_DOUBLE_EQ(player.playbackRate(), ClockPlayer::kMinRate);
}

TEST_F(ClockPlayerTest, PauseFreezesPosition) {
    player.load("movie.mkv");
    player.play();
    clock.advance(Milliseconds(3000));
    player.pause();

    clock.advance(Milliseconds(5000));
    EXPECT_NEAR(player.currentTime(), 3.0, 1e-9);
    EXPECT_FALSE(player.isPlaying());
}

TEST_F(ClockPlayerTest, SeekIsClampedToDuration) {
    player.load("clip.mp4", 30.0);
    player.seek(45.0);
    EXPECT_DOUBLE_EQ(player.currentTime(), 30.0);

    player.seek(-4.0);
    EXPECT_DOUBLE_EQ(player.currentTime(), 0.0);
}

TEST_F(ClockPlayerTest, PlaybackStopsAtEnd) {
    player.load("clip.mp4", 5.0);
    player.play();
    clock.advance(Milliseconds(8000));

    EXPECT_TRUE(player.ended());
    EXPECT_FALSE(player.isPlaying());
    EXPECT_DOUBLE_EQ(player.currentTime(), 5.0);
}

TEST_F(ClockPlayerTest, UnloadClearsContent) {
    player.load("clip.mp4", 5.0);
    player.unload();

    EXPECT_FALSE(player.contentRef().has_value());
    EXPECT_FALSE(player.duration().has_value());
}
