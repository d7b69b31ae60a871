/**
 * @file clock_estimator.hpp
 * @brief Where the host is right now, given a stale snapshot
 *
 * A playing host has moved on by the delivery delay since the snapshot
 * was captured; a paused host has not moved at all. Compensating a paused
 * snapshot makes every peer overshoot permanently, so the playing branch
 * is the only one that adds elapsed time.
 */

#pragma once

#include <tandem/sync/messages.hpp>

#include <algorithm>

namespace tandem::sync {

/**
 * @brief Estimate the host's current position
 *
 * @param snapshot Host state as captured
 * @param nowEpochMs Local wall clock at receipt
 * @return position + elapsed seconds if playing, position otherwise.
 *         Elapsed time is clamped at zero when the receiver's clock runs
 *         behind the sender's.
 */
[[nodiscard]] inline Seconds estimateHostPosition(const PlaybackSnapshot& snapshot, EpochMs nowEpochMs) {
    if (!snapshot.isPlaying) {
        return snapshot.position;
    }
    const EpochMs elapsedMs = std::max<EpochMs>(0, nowEpochMs - snapshot.capturedAtEpochMs);
    return snapshot.position + static_cast<double>(elapsedMs) / kMsPerSecond;
}

} // namespace tandem::sync
