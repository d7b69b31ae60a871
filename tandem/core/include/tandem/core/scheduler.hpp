/**
 * @file scheduler.hpp
 * @brief Wall clock and timer scheduling interfaces
 *
 * Every piece of scheduled work in the sync engine (broadcast tick,
 * rate-nudge reset) goes through a Scheduler and is held by a TimerHandle.
 * Cancelling the handle guarantees the task body never runs afterwards,
 * even if the scheduler already dequeued it for the current turn.
 */

#pragma once

#include <tandem/core/types.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace tandem {

/// Unit of scheduled work
using Task = std::function<void()>;

/**
 * @brief Source of wall-clock time in epoch milliseconds
 */
class WallClock {
public:
    virtual ~WallClock() = default;

    [[nodiscard]] virtual EpochMs nowEpochMs() const = 0;
};

/**
 * @brief WallClock backed by std::chrono::system_clock
 */
class SystemWallClock : public WallClock {
public:
    [[nodiscard]] EpochMs nowEpochMs() const override {
        return std::chrono::duration_cast<Milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

/**
 * @brief Cancellation token for one scheduled task
 *
 * Copies share the same token. A default-constructed handle is inactive.
 * One-shot timers become inactive once they have fired.
 */
class TimerHandle {
public:
    TimerHandle() = default;

    explicit TimerHandle(std::shared_ptr<std::atomic<bool>> alive)
        : m_alive(std::move(alive)) {}

    /// Prevent the task from running; idempotent
    void cancel() {
        if (m_alive) {
            m_alive->store(false, std::memory_order_release);
        }
        m_alive.reset();
    }

    /// True while the task is still pending (or repeating)
    [[nodiscard]] bool active() const {
        return m_alive && m_alive->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_alive;
};

/**
 * @brief Single-threaded timer service
 *
 * Implementations run every task on one context, serially. Tasks are
 * never invoked re-entrantly from scheduleAfter()/scheduleEvery().
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /// Run task once after delay
    virtual TimerHandle scheduleAfter(Milliseconds delay, Task task) = 0;

    /// Run task every interval until cancelled (first run after one interval)
    virtual TimerHandle scheduleEvery(Milliseconds interval, Task task) = 0;
};

} // namespace tandem
