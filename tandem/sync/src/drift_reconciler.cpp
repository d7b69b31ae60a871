/**
 * @file drift_reconciler.cpp
 * @brief DriftReconciler implementation
 */

#include <tandem/sync/drift_reconciler.hpp>
#include <tandem/core/logger.hpp>

#include <cmath>

namespace tandem::sync {

DriftReconciler::DriftReconciler(Scheduler& scheduler,
                                 FeedbackSuppressor& suppressor,
                                 const SyncConfig& config)
    : m_scheduler(scheduler)
    , m_suppressor(suppressor)
    , m_config(config) {}

DriftReconciler::~DriftReconciler() {
    m_rateReset.cancel();
}

void DriftReconciler::setPlayer(player::PlayerAdapter* player) {
    m_rateReset.cancel();
    m_player = player;
    m_lastAppliedRate = 1.0;
}

Correction DriftReconciler::reconcile(Seconds estimated, bool hostPlaying) {
    Correction correction;
    correction.estimated = estimated;

    if (!m_player) {
        LOG_DEBUG("[Reconciler] No player attached, skipping correction");
        return correction;
    }

    correction.local = m_player->currentTime();
    correction.drift = std::abs(correction.local - estimated);

    if (correction.drift <= m_config.convergenceThreshold + kThresholdEpsilon) {
        restoreRate();
        correction.action = CorrectionAction::Converged;
    } else if (correction.drift <= m_config.hardSeekThreshold + kThresholdEpsilon) {
        if (!m_player->supportsPlaybackRate()) {
            correction.action = CorrectionAction::NudgeUnsupported;
        } else if (correction.local < estimated) {
            nudge(1.0 + m_config.nudgeMagnitude);
            correction.action = CorrectionAction::NudgeFaster;
        } else {
            nudge(1.0 - m_config.nudgeMagnitude);
            correction.action = CorrectionAction::NudgeSlower;
        }
    } else {
        m_suppressor.suppress();
        m_player->seek(estimated);
        restoreRate();
        matchPlayState(hostPlaying);
        correction.action = CorrectionAction::HardSeek;
    }

    correction.rate = m_lastAppliedRate;

    LOG_DEBUG("[Reconciler] {} drift={:.3f}s local={:.3f}s estimated={:.3f}s",
              correctionActionToString(correction.action),
              correction.drift, correction.local, correction.estimated);
    return correction;
}

void DriftReconciler::applyDiscrete(const DiscreteEvent& event) {
    if (!m_player) {
        LOG_DEBUG("[Reconciler] No player attached, dropping {}",
                  discreteEventTypeToString(event.type));
        return;
    }

    switch (event.type) {
        case DiscreteEventType::Play:
            m_suppressor.suppress();
            m_player->seek(event.position);
            restoreRate();
            matchPlayState(true);
            break;
        case DiscreteEventType::Pause:
            m_suppressor.suppress();
            m_player->seek(event.position);
            restoreRate();
            matchPlayState(false);
            break;
        case DiscreteEventType::Seek:
            m_suppressor.suppress();
            m_player->seek(event.position);
            restoreRate();
            break;
        case DiscreteEventType::Buffering:
            m_suppressor.suppress();
            matchPlayState(!event.buffering);
            break;
        case DiscreteEventType::SourceChanged:
            return;
    }

    LOG_DEBUG("[Reconciler] Applied {} at {:.3f}s",
              discreteEventTypeToString(event.type), m_player->currentTime());
}

void DriftReconciler::reset() {
    restoreRate();
}

void DriftReconciler::cancelPending() {
    m_rateReset.cancel();
}

void DriftReconciler::nudge(double rate) {
    m_rateReset.cancel();

    m_player->setPlaybackRate(rate);
    m_lastAppliedRate = rate;

    m_rateReset = m_scheduler.scheduleAfter(m_config.nudgeDuration, [this] {
        LOG_DEBUG("[Reconciler] Nudge expired, restoring rate");
        restoreRate();
    });
}

void DriftReconciler::restoreRate() {
    m_rateReset.cancel();
    m_lastAppliedRate = 1.0;

    if (m_player && m_player->supportsPlaybackRate() && m_player->playbackRate() != 1.0) {
        m_player->setPlaybackRate(1.0);
    }
}

void DriftReconciler::matchPlayState(bool shouldPlay) {
    if (shouldPlay && !m_player->isPlaying()) {
        m_player->play();
    } else if (!shouldPlay && m_player->isPlaying()) {
        m_player->pause();
    }
}

} // namespace tandem::sync
