#include <tandem/sync/sync_config.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace tandem;
using namespace tandem::sync;
using json = nlohmann::json;

TEST(SyncConfigTest, DefaultsAreReferenceValues) {
    SyncConfig config;

    EXPECT_EQ(config.broadcastInterval, Milliseconds(1500));
    EXPECT_DOUBLE_EQ(config.convergenceThreshold, 0.1);
    EXPECT_DOUBLE_EQ(config.hardSeekThreshold, 0.5);
    EXPECT_DOUBLE_EQ(config.nudgeMagnitude, 0.05);
    EXPECT_EQ(config.nudgeDuration, Milliseconds(2000));
    EXPECT_EQ(config.suppressionWindow, Milliseconds(500));
    EXPECT_TRUE(config.validate());
}

TEST(SyncConfigTest, FromJsonMergesOverDefaults) {
    auto config = SyncConfig::fromJson(json::parse(R"({"sync": {"broadcastIntervalMs": 1000, "nudgeMagnitude": 0.1}})"));

    ASSERT_TRUE(config);
    EXPECT_EQ(config.value().broadcastInterval, Milliseconds(1000));
    EXPECT_DOUBLE_EQ(config.value().nudgeMagnitude, 0.1);
    EXPECT_EQ(config.value().suppressionWindow, Milliseconds(500));
}

TEST(SyncConfigTest, SectionMayBeOmitted) {
    auto config = SyncConfig::fromJson(json::parse(R"({"suppressionWindowMs": 750})"));

    ASSERT_TRUE(config);
    EXPECT_EQ(config.value().suppressionWindow, Milliseconds(750));
}

TEST(SyncConfigTest, WrongTypeIsInvalidData) {
    auto config = SyncConfig::fromJson(json::parse(R"({"sync": {"hardSeekThresholdSec": "half"}})"));

    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidData);
}

TEST(SyncConfigTest, InconsistentThresholdsAreRejected) {
    auto config = SyncConfig::fromJson(json::parse(R"({"convergenceThresholdSec": 0.6, "hardSeekThresholdSec": 0.5})"));

    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidArgument);
}

TEST(SyncConfigTest, NonPositiveIntervalIsRejected) {
    SyncConfig config;
    config.broadcastInterval = Milliseconds(0);
    EXPECT_FALSE(config.validate());

    config = SyncConfig{};
    config.nudgeMagnitude = 1.5;
    EXPECT_FALSE(config.validate());
}

TEST(SyncConfigTest, ToJsonReadsBack) {
    SyncConfig original;
    original.nudgeDuration = Milliseconds(3000);
    original.convergenceThreshold = 0.2;

    auto parsed = SyncConfig::fromJson(original.toJson());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value(), original);
}

TEST(SyncConfigTest, LoadMissingFileFails) {
    auto config = SyncConfig::load("/nonexistent/tandem/sync.json");

    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::FileNotFound);
}

TEST(SyncConfigTest, LoadReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "tandem_sync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"sync": {"broadcastIntervalMs": 2000}})";
    }

    auto config = SyncConfig::load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config);
    EXPECT_EQ(config.value().broadcastInterval, Milliseconds(2000));
}

TEST(SyncConfigTest, LoadMalformedFileIsInvalidData) {
    const auto path = std::filesystem::temp_directory_path() / "tandem_sync_config_bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    auto config = SyncConfig::load(path);
    std::filesystem::remove(path);

    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidData);
}
