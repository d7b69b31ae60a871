/**
 * @file manual_scheduler.hpp
 * @brief Deterministic virtual-time scheduler and clock
 *
 * Time only moves when advance() is called. Used by the test suite and by
 * applications that already own an event loop and want to pump Tandem's
 * timers from it.
 */

#pragma once

#include <tandem/core/scheduler.hpp>

#include <map>
#include <utility>

namespace tandem {

class ManualScheduler : public Scheduler, public WallClock {
public:
    /// Arbitrary but realistic epoch so timestamps look like real ones
    static constexpr EpochMs kDefaultStartEpochMs = 1'700'000'000'000;

    explicit ManualScheduler(EpochMs startEpochMs = kDefaultStartEpochMs)
        : m_now(startEpochMs) {}

    ManualScheduler(const ManualScheduler&) = delete;
    ManualScheduler& operator=(const ManualScheduler&) = delete;

    // ========== WallClock ==========

    [[nodiscard]] EpochMs nowEpochMs() const override { return m_now; }

    // ========== Scheduler ==========

    TimerHandle scheduleAfter(Milliseconds delay, Task task) override;
    TimerHandle scheduleEvery(Milliseconds interval, Task task) override;

    // ========== Time Control ==========

    /**
     * @brief Move virtual time forward, running due tasks in order
     *
     * Tasks run with nowEpochMs() equal to their due time. Ties run in
     * scheduling order.
     */
    void advance(Milliseconds delta);

    /// Run tasks due at the current instant without moving time
    void runDue();

    /// Number of timers still queued (cancelled ones included until reached)
    [[nodiscard]] size_t pendingCount() const { return m_timers.size(); }

private:
    struct Entry {
        int64_t intervalMs;   // 0 for one-shot
        Task task;
        std::shared_ptr<std::atomic<bool>> alive;
    };

    using Key = std::pair<EpochMs, uint64_t>;

    TimerHandle enqueue(EpochMs due, int64_t intervalMs, Task task);
    void runUntil(EpochMs target);

    EpochMs m_now;
    uint64_t m_nextSeq = 0;
    std::map<Key, Entry> m_timers;
};

} // namespace tandem
