/**
 * @file snapshot_broadcaster.cpp
 * @brief SnapshotBroadcaster implementation
 */

#include <tandem/sync/snapshot_broadcaster.hpp>
#include <tandem/core/logger.hpp>

#include <algorithm>

namespace tandem::sync {

SnapshotBroadcaster::SnapshotBroadcaster(Scheduler& scheduler,
                                         const WallClock& wallClock,
                                         Transport& transport,
                                         Milliseconds interval)
    : m_scheduler(scheduler)
    , m_wallClock(wallClock)
    , m_transport(transport)
    , m_interval(interval) {}

SnapshotBroadcaster::~SnapshotBroadcaster() {
    stop();
}

void SnapshotBroadcaster::start() {
    if (m_running) return;

    m_running = true;
    m_timer = m_scheduler.scheduleEvery(m_interval, [this] {
        tick();
    });

    LOG_DEBUG("[Broadcaster] Started, every {} ms", m_interval.count());
}

void SnapshotBroadcaster::stop() {
    if (!m_running) return;

    m_running = false;
    m_timer.cancel();

    LOG_DEBUG("[Broadcaster] Stopped");
}

bool SnapshotBroadcaster::broadcastNow() {
    auto snapshot = capture();
    if (!snapshot) {
        LOG_DEBUG("[Broadcaster] No player attached, nothing to send");
        return false;
    }
    m_transport.send(*snapshot);
    return true;
}

std::optional<PlaybackSnapshot> SnapshotBroadcaster::capture() {
    if (!m_player) {
        return std::nullopt;
    }

    PlaybackSnapshot snapshot;
    snapshot.position = std::max(0.0, m_player->currentTime());
    snapshot.isPlaying = m_player->isPlaying();
    snapshot.rate = m_player->playbackRate();
    snapshot.contentRef = m_player->contentRef();

    m_lastCapturedAt = std::max(m_lastCapturedAt, m_wallClock.nowEpochMs());
    snapshot.capturedAtEpochMs = m_lastCapturedAt;

    return snapshot;
}

void SnapshotBroadcaster::tick() {
    // A tick dequeued in the same turn as stop() must not send
    if (!m_running) return;
    broadcastNow();
}

} // namespace tandem::sync
