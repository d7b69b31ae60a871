/**
 * @file sync_config.cpp
 * @brief SyncConfig serialization and validation
 */

#include <tandem/sync/sync_config.hpp>
#include <tandem/core/logger.hpp>

#include <fstream>

using json = nlohmann::json;

namespace tandem::sync {

namespace {

constexpr const char* kSection = "sync";

Milliseconds msFromJson(const json& j, const char* key, Milliseconds fallback) {
    return Milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

} // namespace

Result<void> SyncConfig::validate() const {
    if (broadcastInterval.count() <= 0) {
        return Err(ErrorCode::InvalidArgument, "broadcastIntervalMs must be positive");
    }
    if (nudgeDuration.count() <= 0) {
        return Err(ErrorCode::InvalidArgument, "nudgeDurationMs must be positive");
    }
    if (suppressionWindow.count() < 0) {
        return Err(ErrorCode::InvalidArgument, "suppressionWindowMs must not be negative");
    }
    if (!(convergenceThreshold > 0.0) || !(hardSeekThreshold > convergenceThreshold)) {
        return Err(ErrorCode::InvalidArgument,
                   "thresholds must satisfy 0 < convergenceThresholdSec < hardSeekThresholdSec");
    }
    if (!(nudgeMagnitude > 0.0) || !(nudgeMagnitude < 1.0)) {
        return Err(ErrorCode::InvalidArgument, "nudgeMagnitude must be in (0, 1)");
    }
    return Ok();
}

Result<SyncConfig> SyncConfig::fromJson(const json& j) {
    const json& section = (j.is_object() && j.contains(kSection)) ? j[kSection] : j;
    if (!section.is_object()) {
        return Err<SyncConfig>(ErrorCode::InvalidData, "Sync config must be a JSON object");
    }

    SyncConfig config;
    try {
        config.broadcastInterval = msFromJson(section, "broadcastIntervalMs", config.broadcastInterval);
        config.convergenceThreshold = section.value("convergenceThresholdSec", config.convergenceThreshold);
        config.hardSeekThreshold = section.value("hardSeekThresholdSec", config.hardSeekThreshold);
        config.nudgeMagnitude = section.value("nudgeMagnitude", config.nudgeMagnitude);
        config.nudgeDuration = msFromJson(section, "nudgeDurationMs", config.nudgeDuration);
        config.suppressionWindow = msFromJson(section, "suppressionWindowMs", config.suppressionWindow);
    } catch (const json::exception& e) {
        return Err<SyncConfig>(ErrorCode::InvalidData,
                               std::string("Malformed sync config: ") + e.what());
    }

    auto valid = config.validate();
    if (!valid) {
        return Err<SyncConfig>(valid.error());
    }
    return config;
}

Result<SyncConfig> SyncConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open sync config file: {}", path.string());
        return Err<SyncConfig>(ErrorCode::FileNotFound,
                               "Failed to open sync config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse sync config file: {} - {}", path.string(), e.what());
        return Err<SyncConfig>(ErrorCode::InvalidData,
                               std::string("Failed to parse sync config: ") + e.what());
    }

    auto config = fromJson(j);
    if (config) {
        LOG_INFO("Sync configuration loaded from file: {}", path.string());
    } else {
        LOG_WARN("Rejected sync config {}: {}", path.string(), config.error().what());
    }
    return config;
}

json SyncConfig::toJson() const {
    return {
        {kSection, {
            {"broadcastIntervalMs", broadcastInterval.count()},
            {"convergenceThresholdSec", convergenceThreshold},
            {"hardSeekThresholdSec", hardSeekThreshold},
            {"nudgeMagnitude", nudgeMagnitude},
            {"nudgeDurationMs", nudgeDuration.count()},
            {"suppressionWindowMs", suppressionWindow.count()}
        }}
    };
}

} // namespace tandem::sync
