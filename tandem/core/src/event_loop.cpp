/**
 * @file event_loop.cpp
 * @brief EventLoop implementation
 */

#include <tandem/core/event_loop.hpp>
#include <tandem/core/logger.hpp>

#include <algorithm>

namespace tandem {

EventLoop::~EventLoop() {
    stop();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void EventLoop::start() {
    if (m_running.load(std::memory_order_acquire)) {
        return;  // Already running
    }

    if (m_worker.joinable()) {
        if (isInLoopThread()) {
            // Restarted from its own task; the worker simply keeps going
            m_running.store(true, std::memory_order_release);
            return;
        }
        m_worker.join();  // Reap a worker that stopped itself
    }

    m_running.store(true, std::memory_order_release);
    m_worker = std::thread([this] {
        workerLoop();
    });

    LOG_DEBUG("[EventLoop] Started");
}

void EventLoop::stop() {
    const bool wasRunning = m_running.exchange(false, std::memory_order_acq_rel);

    {
        std::lock_guard lock(m_mutex);
        m_cv.notify_all();
    }

    // From the loop thread the worker exits once the current task returns;
    // the join happens in a later stop(), start() or the destructor
    if (m_worker.joinable() && !isInLoopThread()) {
        m_worker.join();
    }

    if (!wasRunning) {
        return;  // Already stopped
    }

    std::lock_guard lock(m_mutex);
    for (auto& [key, timer] : m_timers) {
        timer.alive->store(false, std::memory_order_release);
    }
    m_timers.clear();
    m_posted.clear();

    LOG_DEBUG("[EventLoop] Stopped");
}

void EventLoop::post(Task task) {
    std::lock_guard lock(m_mutex);
    m_posted.push_back(std::move(task));
    m_cv.notify_one();
}

TimerHandle EventLoop::scheduleAfter(Milliseconds delay, Task task) {
    return enqueue(std::max(delay, Milliseconds(0)), Milliseconds(0), std::move(task));
}

TimerHandle EventLoop::scheduleEvery(Milliseconds interval, Task task) {
    interval = std::max(interval, Milliseconds(1));
    return enqueue(interval, interval, std::move(task));
}

TimerHandle EventLoop::enqueue(Milliseconds delay, Milliseconds interval, Task task) {
    auto alive = std::make_shared<std::atomic<bool>>(true);

    std::lock_guard lock(m_mutex);
    m_timers.emplace(Key{SteadyClock::now() + delay, m_nextSeq++},
                     Timer{interval, std::move(task), alive});
    m_cv.notify_one();

    return TimerHandle(alive);
}

void EventLoop::workerLoop() {
    std::unique_lock lock(m_mutex);

    while (m_running.load(std::memory_order_acquire)) {
        if (!m_posted.empty()) {
            Task task = std::move(m_posted.front());
            m_posted.pop_front();

            lock.unlock();
            task();
            lock.lock();
            continue;
        }

        if (m_timers.empty()) {
            m_cv.wait(lock);
            continue;
        }

        auto it = m_timers.begin();
        const auto due = it->first.first;
        if (SteadyClock::now() < due) {
            m_cv.wait_until(lock, due);
            continue;
        }

        Timer timer = std::move(it->second);
        m_timers.erase(it);

        if (!timer.alive->load(std::memory_order_acquire)) {
            continue;
        }

        const bool repeating = timer.interval.count() > 0;
        if (!repeating) {
            timer.alive->store(false, std::memory_order_release);
        }

        lock.unlock();
        timer.task();
        lock.lock();

        if (repeating && timer.alive->load(std::memory_order_acquire)) {
            m_timers.emplace(Key{due + timer.interval, m_nextSeq++}, std::move(timer));
        }
    }
}

} // namespace tandem
