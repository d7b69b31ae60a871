/**
 * @file media_clock.hpp
 * @brief Rate-aware media clock interpolated from wall time
 *
 * Stores a (media position, wall instant) base pair and extrapolates:
 *
 *   now = basePosition + (wallNow - baseWall) / 1000 * rate
 *
 * Every mutation (seek, pause, resume, rate change) rebases first so the
 * position stays continuous across it.
 *
 * Thread safety: none. Owned and driven by one player on one thread.
 */

#pragma once

#include <tandem/core/scheduler.hpp>
#include <tandem/core/types.hpp>

#include <algorithm>

namespace tandem::player {

class MediaClock {
public:
    explicit MediaClock(const WallClock& wallClock)
        : m_wallClock(wallClock)
        , m_baseWall(wallClock.nowEpochMs()) {}

    // Non-copyable (holds a clock reference)
    MediaClock(const MediaClock&) = delete;
    MediaClock& operator=(const MediaClock&) = delete;

    // ========== Writer Interface ==========

    /// Jump to position; keeps paused/running state
    void seek(Seconds position) {
        m_basePosition = std::max(0.0, position);
        m_baseWall = m_wallClock.nowEpochMs();
    }

    void pause() {
        if (m_paused) return;
        rebase();
        m_paused = true;
    }

    void resume() {
        if (!m_paused) return;
        m_baseWall = m_wallClock.nowEpochMs();
        m_paused = false;
    }

    void setRate(double rate) {
        rebase();
        m_rate = rate;
    }

    /// Back to position zero, paused, normal speed
    void reset() {
        m_basePosition = 0.0;
        m_baseWall = m_wallClock.nowEpochMs();
        m_paused = true;
        m_rate = 1.0;
    }

    // ========== Reader Interface ==========

    [[nodiscard]] Seconds now() const {
        if (m_paused) {
            return m_basePosition;
        }
        const EpochMs elapsed = m_wallClock.nowEpochMs() - m_baseWall;
        return m_basePosition + static_cast<double>(elapsed) / kMsPerSecond * m_rate;
    }

    [[nodiscard]] bool isPaused() const { return m_paused; }
    [[nodiscard]] double rate() const { return m_rate; }

private:
    void rebase() {
        m_basePosition = now();
        m_baseWall = m_wallClock.nowEpochMs();
    }

    const WallClock& m_wallClock;

    Seconds m_basePosition = 0.0;
    EpochMs m_baseWall = 0;
    bool m_paused = true;
    double m_rate = 1.0;
};

} // namespace tandem::player
