/**
 * @file snapshot_broadcaster.hpp
 * @brief Host-side periodic publication of PlaybackSnapshot
 *
 * While running, reads the local player every interval, stamps the state
 * with the wall clock and sends it. stop() is final for every tick already
 * queued: once it returns, nothing more is sent until start() is called
 * again.
 */

#pragma once

#include <tandem/core/scheduler.hpp>
#include <tandem/player/player_adapter.hpp>
#include <tandem/sync/messages.hpp>
#include <tandem/sync/transport.hpp>

#include <optional>

namespace tandem::sync {

class SnapshotBroadcaster {
public:
    SnapshotBroadcaster(Scheduler& scheduler,
                        const WallClock& wallClock,
                        Transport& transport,
                        Milliseconds interval);
    ~SnapshotBroadcaster();

    // Non-copyable (timer callback captures this)
    SnapshotBroadcaster(const SnapshotBroadcaster&) = delete;
    SnapshotBroadcaster& operator=(const SnapshotBroadcaster&) = delete;

    void setPlayer(player::PlayerAdapter* player) { m_player = player; }

    // ========== Lifecycle ==========

    /// Begin periodic broadcasting; no-op if already running
    void start();

    /// Cancel the timer synchronously
    void stop();

    [[nodiscard]] bool running() const { return m_running; }

    // ========== Publication ==========

    /**
     * @brief Send one snapshot immediately, outside the periodic cadence
     * @return false when no player is attached
     */
    bool broadcastNow();

    /**
     * @brief Read the player into a snapshot
     *
     * capturedAtEpochMs never goes below the previous capture, even if
     * the wall clock steps backwards.
     */
    [[nodiscard]] std::optional<PlaybackSnapshot> capture();

private:
    void tick();

    Scheduler& m_scheduler;
    const WallClock& m_wallClock;
    Transport& m_transport;
    Milliseconds m_interval;

    player::PlayerAdapter* m_player = nullptr;
    TimerHandle m_timer;
    bool m_running = false;
    EpochMs m_lastCapturedAt = 0;
};

} // namespace tandem::sync
