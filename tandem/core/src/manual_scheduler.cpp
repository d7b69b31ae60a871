/**
 * @file manual_scheduler.cpp
 * @brief ManualScheduler implementation
 */

#include <tandem/core/manual_scheduler.hpp>

#include <algorithm>

namespace tandem {

TimerHandle ManualScheduler::scheduleAfter(Milliseconds delay, Task task) {
    const int64_t delayMs = std::max<int64_t>(0, delay.count());
    return enqueue(m_now + delayMs, 0, std::move(task));
}

TimerHandle ManualScheduler::scheduleEvery(Milliseconds interval, Task task) {
    const int64_t intervalMs = std::max<int64_t>(1, interval.count());
    return enqueue(m_now + intervalMs, intervalMs, std::move(task));
}

TimerHandle ManualScheduler::enqueue(EpochMs due, int64_t intervalMs, Task task) {
    auto alive = std::make_shared<std::atomic<bool>>(true);
    m_timers.emplace(Key{due, m_nextSeq++}, Entry{intervalMs, std::move(task), alive});
    return TimerHandle(alive);
}

void ManualScheduler::advance(Milliseconds delta) {
    runUntil(m_now + std::max<int64_t>(0, delta.count()));
}

void ManualScheduler::runDue() {
    runUntil(m_now);
}

void ManualScheduler::runUntil(EpochMs target) {
    while (!m_timers.empty()) {
        auto it = m_timers.begin();
        if (it->first.first > target) {
            break;
        }

        m_now = it->first.first;
        Entry entry = std::move(it->second);
        m_timers.erase(it);

        if (!entry.alive->load(std::memory_order_acquire)) {
            continue;
        }

        if (entry.intervalMs == 0) {
            // Mark fired before running so the task sees itself inactive
            entry.alive->store(false, std::memory_order_release);
            entry.task();
            continue;
        }

        entry.task();

        if (entry.alive->load(std::memory_order_acquire)) {
            m_timers.emplace(Key{m_now + entry.intervalMs, m_nextSeq++}, std::move(entry));
        }
    }

    m_now = std::max(m_now, target);
}

} // namespace tandem
