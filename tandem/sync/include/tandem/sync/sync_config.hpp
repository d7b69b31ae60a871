/**
 * @file sync_config.hpp
 * @brief Protocol constants of a watch session
 *
 * Every participant of a session must run with identical values or peers
 * will fight the host's corrections. Defaults are the reference values.
 *
 * JSON form (keys optional, missing ones keep their default):
 * @code
 *   {
 *     "sync": {
 *       "broadcastIntervalMs": 1500,
 *       "convergenceThresholdSec": 0.1,
 *       "hardSeekThresholdSec": 0.5,
 *       "nudgeMagnitude": 0.05,
 *       "nudgeDurationMs": 2000,
 *       "suppressionWindowMs": 500
 *     }
 *   }
 * @endcode
 * The enclosing "sync" object may be omitted.
 */

#pragma once

#include <tandem/core/result.hpp>
#include <tandem/core/types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace tandem::sync {

struct SyncConfig {
    /// Host snapshot period
    Milliseconds broadcastInterval{1500};

    /// Drift at or below this is converged
    Seconds convergenceThreshold = 0.1;

    /// Drift above this triggers a hard seek
    Seconds hardSeekThreshold = 0.5;

    /// Rate offset for gentle correction (0.05 -> 1.05 / 0.95)
    double nudgeMagnitude = 0.05;

    /// Rate nudge auto-reset delay
    Milliseconds nudgeDuration{2000};

    /// Feedback suppression window after programmatic mutations
    Milliseconds suppressionWindow{500};

    /// Check internal consistency
    [[nodiscard]] Result<void> validate() const;

    /// Merge present keys over defaults, then validate
    static Result<SyncConfig> fromJson(const nlohmann::json& json);

    /// Load from a JSON file
    static Result<SyncConfig> load(const std::filesystem::path& path);

    [[nodiscard]] nlohmann::json toJson() const;

    bool operator==(const SyncConfig&) const = default;
};

} // namespace tandem::sync
