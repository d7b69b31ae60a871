/**
 * @file drift_reconciler.hpp
 * @brief Three-tier drift correction for peers
 *
 * Given the estimated host position, decides between doing nothing,
 * nudging the playback rate, and hard seeking:
 *
 *   drift <= convergence          -> converged, restore rate 1.0
 *   convergence < drift <= hard   -> rate 1 +/- nudge for nudgeDuration
 *   drift > hard                  -> suppress, seek, rate 1.0, match play state
 *
 * Constant hard seeking is visible to the viewer; small drift is absorbed
 * by speed alone. Discrete host events skip the tiers and apply directly.
 *
 * At most one rate-reset timer is pending at a time; a new nudge replaces
 * it.
 */

#pragma once

#include <tandem/core/scheduler.hpp>
#include <tandem/player/player_adapter.hpp>
#include <tandem/sync/feedback_suppressor.hpp>
#include <tandem/sync/messages.hpp>
#include <tandem/sync/sync_config.hpp>

namespace tandem::sync {

/**
 * @brief Decision taken for one reconciliation
 */
enum class CorrectionAction : uint8_t {
    Converged,      // Within tolerance; rate restored if it was nudged
    NudgeFaster,    // Local behind host: sped up
    NudgeSlower,    // Local ahead of host: slowed down
    NudgeUnsupported, // Nudge tier, but the player has no rate control
    HardSeek,       // Seeked to the estimate
    NoPlayer,       // No adapter attached; nothing touched
};

/// Convert CorrectionAction to string
inline const char* correctionActionToString(CorrectionAction action) {
    switch (action) {
        case CorrectionAction::Converged: return "Converged";
        case CorrectionAction::NudgeFaster: return "NudgeFaster";
        case CorrectionAction::NudgeSlower: return "NudgeSlower";
        case CorrectionAction::NudgeUnsupported: return "NudgeUnsupported";
        case CorrectionAction::HardSeek: return "HardSeek";
        case CorrectionAction::NoPlayer: return "NoPlayer";
        default: return "Unknown";
    }
}

/**
 * @brief Outcome of one reconciliation, for logging and telemetry
 */
struct Correction {
    CorrectionAction action = CorrectionAction::NoPlayer;
    Seconds drift = 0.0;        ///< |local - estimated|
    Seconds estimated = 0.0;    ///< Estimated host position
    Seconds local = 0.0;        ///< Local position before correcting
    double rate = 1.0;          ///< Rate left on the player
};

class DriftReconciler {
public:
    /// Slack on threshold comparisons so 10.1 - 10.0 counts as 0.1
    static constexpr Seconds kThresholdEpsilon = 1e-6;

    DriftReconciler(Scheduler& scheduler, FeedbackSuppressor& suppressor, const SyncConfig& config);
    ~DriftReconciler();

    // Non-copyable (timer callbacks capture this)
    DriftReconciler(const DriftReconciler&) = delete;
    DriftReconciler& operator=(const DriftReconciler&) = delete;

    /// Attach (or detach with nullptr) the player to correct; cancels pending resets
    void setPlayer(player::PlayerAdapter* player);

    /**
     * @brief Correct the local player toward the host
     *
     * @param estimated Estimated host position (seconds)
     * @param hostPlaying Host's reported play state, matched on hard seeks
     */
    Correction reconcile(Seconds estimated, bool hostPlaying);

    /**
     * @brief Apply a Play/Pause/Seek/Buffering event unconditionally
     *
     * Opens the suppression window before touching the player. Other
     * event types are ignored here.
     */
    void applyDiscrete(const DiscreteEvent& event);

    /// Cancel any nudge and put the player back at rate 1.0
    void reset();

    /// Cancel the pending rate reset without touching the player
    void cancelPending();

    /// True while a rate nudge is in effect (reset timer pending)
    [[nodiscard]] bool nudgeActive() const { return m_rateReset.active(); }

    /// Last rate this reconciler set on the player
    [[nodiscard]] double lastAppliedRate() const { return m_lastAppliedRate; }

private:
    void nudge(double rate);
    void restoreRate();
    void matchPlayState(bool shouldPlay);

    Scheduler& m_scheduler;
    FeedbackSuppressor& m_suppressor;
    const SyncConfig& m_config;

    player::PlayerAdapter* m_player = nullptr;
    TimerHandle m_rateReset;
    double m_lastAppliedRate = 1.0;
};

} // namespace tandem::sync
