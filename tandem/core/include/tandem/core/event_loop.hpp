/**
 * @file event_loop.hpp
 * @brief Real-time single-threaded event loop
 *
 * Owns one worker thread that runs posted tasks and due timers serially.
 * Transport receive threads hand inbound messages to the sync engine via
 * post(), so the engine itself is only ever touched from the loop thread.
 *
 * CRITICAL: the destructor stops and joins the worker; pending tasks are
 * discarded, never run against a torn-down session. stop() may be called
 * from a loop task, but the destructor must not run on the loop thread.
 */

#pragma once

#include <tandem/core/scheduler.hpp>

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace tandem {

class EventLoop : public Scheduler {
public:
    EventLoop() = default;
    ~EventLoop() override;

    // Non-copyable, non-movable (owns thread)
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // ========== Lifecycle ==========

    /// Start the worker thread; no-op if running
    void start();

    /// Stop and join the worker; pending work is dropped.
    /// From the loop thread the join is deferred to the destructor.
    void stop();

    [[nodiscard]] bool running() const { return m_running.load(std::memory_order_acquire); }

    /// True when called from the worker thread
    [[nodiscard]] bool isInLoopThread() const {
        return std::this_thread::get_id() == m_worker.get_id();
    }

    // ========== Work Submission (any thread) ==========

    /// Queue task to run on the loop thread as soon as possible
    void post(Task task);

    TimerHandle scheduleAfter(Milliseconds delay, Task task) override;
    TimerHandle scheduleEvery(Milliseconds interval, Task task) override;

    /// Wall clock used for snapshot stamping alongside this loop
    [[nodiscard]] const WallClock& wallClock() const { return m_wallClock; }

private:
    using SteadyClock = std::chrono::steady_clock;
    using Key = std::pair<SteadyClock::time_point, uint64_t>;

    struct Timer {
        Milliseconds interval;   // zero for one-shot
        Task task;
        std::shared_ptr<std::atomic<bool>> alive;
    };

    TimerHandle enqueue(Milliseconds delay, Milliseconds interval, Task task);
    void workerLoop();

    SystemWallClock m_wallClock;

    std::thread m_worker;
    std::atomic<bool> m_running{false};

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_posted;
    std::map<Key, Timer> m_timers;
    uint64_t m_nextSeq = 0;
};

} // namespace tandem
