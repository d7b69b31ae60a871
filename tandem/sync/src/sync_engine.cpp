/**
 * @file sync_engine.cpp
 * @brief SyncEngine implementation
 */

#include <tandem/sync/sync_engine.hpp>
#include <tandem/sync/clock_estimator.hpp>
#include <tandem/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace tandem::sync {

namespace {

SyncConfig sanitize(SyncConfig config) {
    auto valid = config.validate();
    if (!valid) {
        LOG_WARN("Invalid sync config ({}), using defaults", valid.error().what());
        return SyncConfig{};
    }
    return config;
}

bool isValidPosition(Seconds position) {
    return std::isfinite(position) && position >= 0.0;
}

} // namespace

SyncEngine::SyncEngine(std::string localParticipantId,
                       Scheduler& scheduler,
                       const WallClock& wallClock,
                       Transport& transport,
                       SyncConfig config)
    : m_config(sanitize(std::move(config)))
    , m_wallClock(wallClock)
    , m_transport(transport)
    , m_suppressor(wallClock, m_config.suppressionWindow)
    , m_broadcaster(scheduler, wallClock, transport, m_config.broadcastInterval)
    , m_reconciler(scheduler, m_suppressor, m_config)
    , m_roles(std::move(localParticipantId), m_broadcaster) {}

SyncEngine::~SyncEngine() {
    shutdown();
}

// ============================================================================
// Player
// ============================================================================

void SyncEngine::attachPlayer(player::PlayerAdapter* player) {
    if (m_shutDown) {
        LOG_WARN("[SyncEngine] {} attach after shutdown ignored", localParticipantId());
        return;
    }

    m_player = player;
    m_reconciler.setPlayer(player);
    m_broadcaster.setPlayer(player);

    LOG_INFO("[SyncEngine] {} player {}", localParticipantId(), player ? "attached" : "detached");
}

void SyncEngine::detachPlayer() {
    attachPlayer(nullptr);
}

// ============================================================================
// Inbound
// ============================================================================

void SyncEngine::onMessage(const SyncMessage& message) {
    std::visit([this](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PlaybackSnapshot>) {
            onSnapshot(m);
        } else if constexpr (std::is_same_v<T, DiscreteEvent>) {
            onDiscreteEvent(m);
        } else if constexpr (std::is_same_v<T, ResyncRequest>) {
            onResyncRequested();
        } else if constexpr (std::is_same_v<T, HostChanged>) {
            onHostChanged(m.hostId);
        }
    }, message);
}

SnapshotDisposition SyncEngine::onSnapshot(const PlaybackSnapshot& snapshot) {
    if (m_shutDown) {
        return SnapshotDisposition::ShutDown;
    }
    if (isHost()) {
        return SnapshotDisposition::IgnoredAsHost;
    }

    auto valid = validate(snapshot);
    if (!valid) {
        LOG_WARN("[SyncEngine] Rejected snapshot: {}", valid.error().what());
        return SnapshotDisposition::Invalid;
    }

    if (snapshot.capturedAtEpochMs < m_lastSnapshotEpochMs) {
        LOG_DEBUG("[SyncEngine] Stale snapshot ({} < {})",
                  snapshot.capturedAtEpochMs, m_lastSnapshotEpochMs);
        return SnapshotDisposition::Stale;
    }
    m_lastSnapshotEpochMs = snapshot.capturedAtEpochMs;

    if (!m_player) {
        LOG_DEBUG("[SyncEngine] Snapshot before player attached");
        return SnapshotDisposition::NoPlayer;
    }

    if (snapshot.contentRef && snapshot.contentRef != m_player->contentRef()) {
        LOG_INFO("[SyncEngine] Host switched content to '{}'", *snapshot.contentRef);
        sourceChanged.fire(snapshot.contentRef);
        return SnapshotDisposition::SourceMismatch;
    }

    if (m_suppressor.isSuppressed()) {
        LOG_DEBUG("[SyncEngine] Snapshot inside suppression window, skipped");
        return SnapshotDisposition::Suppressed;
    }

    const Seconds estimated = estimateHostPosition(snapshot, m_wallClock.nowEpochMs());
    Correction correction = m_reconciler.reconcile(estimated, snapshot.isPlaying);

    m_lastCorrection = correction;
    correctionApplied.fire(correction);
    return SnapshotDisposition::Applied;
}

void SyncEngine::onDiscreteEvent(const DiscreteEvent& event) {
    if (m_shutDown) {
        return;
    }
    if (isHost()) {
        LOG_DEBUG("[SyncEngine] Host ignores inbound {}", discreteEventTypeToString(event.type));
        return;
    }

    auto valid = validate(event);
    if (!valid) {
        LOG_WARN("[SyncEngine] Rejected event: {}", valid.error().what());
        return;
    }

    if (event.type == DiscreteEventType::SourceChanged) {
        LOG_INFO("[SyncEngine] Host changed source to '{}'", event.contentRef.value_or("<none>"));
        sourceChanged.fire(event.contentRef);
        return;
    }

    m_reconciler.applyDiscrete(event);
}

void SyncEngine::onHostChanged(const std::string& hostId) {
    if (m_shutDown) {
        return;
    }

    // A new host stamps snapshots with its own clock
    if (m_roles.hostId() != hostId) {
        m_lastSnapshotEpochMs = 0;
    }

    if (m_roles.onHostChanged(hostId) && isHost()) {
        m_reconciler.reset();
    }
}

void SyncEngine::onResyncRequested() {
    if (m_shutDown || !isHost()) {
        return;
    }
    LOG_DEBUG("[SyncEngine] Answering resync request");
    m_broadcaster.broadcastNow();
}

// ============================================================================
// Role
// ============================================================================

void SyncEngine::setRole(Role role) {
    if (m_shutDown) {
        return;
    }
    if (m_roles.setRole(role) && role == Role::Host) {
        m_reconciler.reset();
    }
}

// ============================================================================
// Outbound
// ============================================================================

bool SyncEngine::emitPlay() {
    if (!canEmit("play") || !m_player) {
        return false;
    }
    return send(DiscreteEvent::play(std::max(0.0, m_player->currentTime())));
}

bool SyncEngine::emitPlay(Seconds position) {
    if (!canEmit("play") || !isValidPosition(position)) {
        return false;
    }
    return send(DiscreteEvent::play(position));
}

bool SyncEngine::emitPause() {
    if (!canEmit("pause") || !m_player) {
        return false;
    }
    return send(DiscreteEvent::pause(std::max(0.0, m_player->currentTime())));
}

bool SyncEngine::emitPause(Seconds position) {
    if (!canEmit("pause") || !isValidPosition(position)) {
        return false;
    }
    return send(DiscreteEvent::pause(position));
}

bool SyncEngine::emitSeek(Seconds position) {
    if (!canEmit("seek") || !isValidPosition(position)) {
        return false;
    }
    return send(DiscreteEvent::seek(position));
}

bool SyncEngine::emitSourceChanged(std::optional<std::string> contentRef) {
    if (!canEmit("source")) {
        return false;
    }
    return send(DiscreteEvent::sourceChanged(std::move(contentRef)));
}

bool SyncEngine::emitBuffering(bool isBuffering) {
    if (!canEmit("buffer")) {
        return false;
    }
    return send(DiscreteEvent::bufferingChanged(isBuffering));
}

bool SyncEngine::requestSync() {
    if (m_shutDown) {
        return false;
    }
    LOG_DEBUG("[SyncEngine] {} requesting sync", localParticipantId());
    return send(ResyncRequest{});
}

bool SyncEngine::canEmit(const char* what) const {
    if (m_shutDown || !isHost()) {
        return false;
    }
    if (m_suppressor.isSuppressed()) {
        LOG_DEBUG("[SyncEngine] Dropped {} inside suppression window", what);
        return false;
    }
    return true;
}

bool SyncEngine::send(const SyncMessage& message) {
    m_transport.send(message);
    return true;
}

// ============================================================================
// State
// ============================================================================

EngineState SyncEngine::state() const {
    EngineState s;
    s.role = m_roles.role();
    s.suppressUntilEpochMs = m_suppressor.suppressUntilEpochMs();
    s.lastAppliedRate = m_reconciler.lastAppliedRate();
    s.broadcasting = m_broadcaster.running();
    s.nudgeActive = m_reconciler.nudgeActive();
    s.lastSnapshotEpochMs = m_lastSnapshotEpochMs;
    s.hostId = m_roles.hostId();
    return s;
}

void SyncEngine::shutdown() {
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;

    m_broadcaster.stop();
    m_broadcaster.setPlayer(nullptr);
    m_reconciler.cancelPending();
    m_reconciler.setPlayer(nullptr);
    m_player = nullptr;

    LOG_INFO("[SyncEngine] {} shut down", localParticipantId());
}

} // namespace tandem::sync
