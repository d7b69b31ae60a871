/**
 * @file sync_engine.hpp
 * @brief Session-scoped composition root of the sync protocol
 *
 * One SyncEngine per participant per watch session. As Host it broadcasts
 * snapshots on a timer and emits discrete events for local player actions;
 * as Peer it estimates the host position from inbound snapshots and
 * reconciles the local player toward it.
 *
 * Threading: every method must be called from the context that runs the
 * injected Scheduler. Inbound handlers never throw.
 *
 * Usage:
 * @code
 *   ManualScheduler scheduler;            // or EventLoop
 *   JsonTransport transport(sendToSocket);
 *   SyncEngine engine("user-7", scheduler, scheduler, transport);
 *   engine.attachPlayer(&player);
 *
 *   socket.onText([&](std::string text) {
 *       if (auto msg = WireCodec::decode(text)) engine.onMessage(msg.value());
 *   });
 *   engine.requestSync();                 // late joiner
 * @endcode
 */

#pragma once

#include <tandem/core/scheduler.hpp>
#include <tandem/core/signals.hpp>
#include <tandem/player/player_adapter.hpp>
#include <tandem/sync/drift_reconciler.hpp>
#include <tandem/sync/feedback_suppressor.hpp>
#include <tandem/sync/messages.hpp>
#include <tandem/sync/role_controller.hpp>
#include <tandem/sync/snapshot_broadcaster.hpp>
#include <tandem/sync/sync_config.hpp>
#include <tandem/sync/transport.hpp>

#include <optional>
#include <string>

namespace tandem::sync {

/**
 * @brief What happened to an inbound snapshot
 */
enum class SnapshotDisposition : uint8_t {
    Applied,        // Reconciled (see lastCorrection())
    IgnoredAsHost,  // Local participant is the host
    NoPlayer,       // No adapter attached
    Invalid,        // Failed validation
    Stale,          // Older than the newest accepted snapshot
    Suppressed,     // Arrived inside the suppression window
    SourceMismatch, // Host plays different content; sourceChanged fired
    ShutDown,       // Engine already torn down
};

/// Convert SnapshotDisposition to string
inline const char* snapshotDispositionToString(SnapshotDisposition d) {
    switch (d) {
        case SnapshotDisposition::Applied: return "Applied";
        case SnapshotDisposition::IgnoredAsHost: return "IgnoredAsHost";
        case SnapshotDisposition::NoPlayer: return "NoPlayer";
        case SnapshotDisposition::Invalid: return "Invalid";
        case SnapshotDisposition::Stale: return "Stale";
        case SnapshotDisposition::Suppressed: return "Suppressed";
        case SnapshotDisposition::SourceMismatch: return "SourceMismatch";
        case SnapshotDisposition::ShutDown: return "ShutDown";
        default: return "Unknown";
    }
}

/**
 * @brief Process-local engine state, for inspection
 */
struct EngineState {
    Role role = Role::Uninitialized;
    EpochMs suppressUntilEpochMs = 0;     ///< 0 when not suppressing
    double lastAppliedRate = 1.0;
    bool broadcasting = false;            ///< Broadcast timer present
    bool nudgeActive = false;             ///< Rate reset timer present
    EpochMs lastSnapshotEpochMs = 0;      ///< Newest accepted snapshot
    std::optional<std::string> hostId;
};

class SyncEngine {
public:
    SyncEngine(std::string localParticipantId,
               Scheduler& scheduler,
               const WallClock& wallClock,
               Transport& transport,
               SyncConfig config = {});
    ~SyncEngine();

    // Non-copyable (components hold references into this object)
    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // ========== Player ==========

    /// Attach the local player; replaces any previous one
    void attachPlayer(player::PlayerAdapter* player);

    /// Detach the player; pending corrections are cancelled
    void detachPlayer();

    [[nodiscard]] bool hasPlayer() const { return m_player != nullptr; }

    // ========== Inbound ==========

    /// Route any inbound message to its handler
    void onMessage(const SyncMessage& message);

    /// Periodic host state
    SnapshotDisposition onSnapshot(const PlaybackSnapshot& snapshot);

    /// Immediate host intent; applied regardless of drift
    void onDiscreteEvent(const DiscreteEvent& event);

    /// Room collaborator announced a host
    void onHostChanged(const std::string& hostId);

    /// Someone asked for a fresh snapshot; answered only when Host
    void onResyncRequested();

    // ========== Role ==========

    /// Direct role assignment (tests, single-user sessions)
    void setRole(Role role);

    [[nodiscard]] Role role() const { return m_roles.role(); }
    [[nodiscard]] bool isHost() const { return m_roles.isHost(); }

    // ========== Outbound (host intent) ==========

    /// Each returns true if a message was sent
    bool emitPlay();
    bool emitPlay(Seconds position);
    bool emitPause();
    bool emitPause(Seconds position);
    bool emitSeek(Seconds position);
    bool emitSourceChanged(std::optional<std::string> contentRef);
    bool emitBuffering(bool isBuffering);

    /// Ask for a fresh snapshot; allowed in any role
    bool requestSync();

    // ========== State ==========

    [[nodiscard]] bool isSuppressed() const { return m_suppressor.isSuppressed(); }
    [[nodiscard]] EngineState state() const;
    [[nodiscard]] const SyncConfig& config() const { return m_config; }
    [[nodiscard]] const std::optional<Correction>& lastCorrection() const { return m_lastCorrection; }
    [[nodiscard]] const std::string& localParticipantId() const { return m_roles.localParticipantId(); }

    /**
     * @brief Tear down the session
     *
     * Stops the broadcaster, cancels pending corrections and detaches the
     * player. Every later call is a no-op. Called by the destructor.
     */
    void shutdown();

    [[nodiscard]] bool isShutDown() const { return m_shutDown; }

    // ========== Signals ==========

    /// Role transitions
    Signal<Role>& roleChanged() { return m_roles.roleChanged; }

    /// Host switched content; the application should load it
    Signal<std::optional<std::string>> sourceChanged;

    /// Every reconciliation decision on an applied snapshot
    Signal<Correction> correctionApplied;

private:
    bool canEmit(const char* what) const;
    bool send(const SyncMessage& message);

    SyncConfig m_config;
    const WallClock& m_wallClock;
    Transport& m_transport;

    FeedbackSuppressor m_suppressor;
    SnapshotBroadcaster m_broadcaster;
    DriftReconciler m_reconciler;
    RoleController m_roles;

    player::PlayerAdapter* m_player = nullptr;
    EpochMs m_lastSnapshotEpochMs = 0;
    std::optional<Correction> m_lastCorrection;
    bool m_shutDown = false;
};

} // namespace tandem::sync
