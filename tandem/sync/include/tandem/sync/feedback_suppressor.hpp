/**
 * @file feedback_suppressor.hpp
 * @brief Timed latch that mutes outward emission after programmatic mutations
 *
 * When the reconciler seeks or pauses the local player, the player reports
 * those changes back through the same callbacks a user action would. Every
 * outward emitter checks isSuppressed() and drops its send while the latch
 * is open, so a correction is never re-broadcast as host intent.
 *
 * The latch is a deadline, not a timer: it closes by time alone, even if
 * the follow-up message that was expected never arrives.
 */

#pragma once

#include <tandem/core/scheduler.hpp>

#include <algorithm>

namespace tandem::sync {

class FeedbackSuppressor {
public:
    FeedbackSuppressor(const WallClock& wallClock, Milliseconds window)
        : m_wallClock(wallClock)
        , m_window(window) {}

    /// Open (or extend) the window from now
    void suppress() {
        m_suppressUntil = std::max(m_suppressUntil, m_wallClock.nowEpochMs() + m_window.count());
    }

    /// True while now < deadline
    [[nodiscard]] bool isSuppressed() const {
        return m_suppressUntil != 0 && m_wallClock.nowEpochMs() < m_suppressUntil;
    }

    /// Deadline in epoch ms, 0 when the latch has never been opened or was cleared
    [[nodiscard]] EpochMs suppressUntilEpochMs() const {
        return isSuppressed() ? m_suppressUntil : 0;
    }

    void clear() { m_suppressUntil = 0; }

    [[nodiscard]] Milliseconds window() const { return m_window; }

private:
    const WallClock& m_wallClock;
    Milliseconds m_window;
    EpochMs m_suppressUntil = 0;
};

} // namespace tandem::sync
