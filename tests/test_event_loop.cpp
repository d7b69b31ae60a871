#include <tandem/core/event_loop.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace tandem;
using namespace std::chrono_literals;

TEST(EventLoopTest, PostedTaskRunsOnLoopThread) {
    EventLoop loop;
    loop.start();

    std::promise<bool> onLoop;
    auto result = onLoop.get_future();
    loop.post([&] { onLoop.set_value(loop.isInLoopThread()); });

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(result.get());
    EXPECT_FALSE(loop.isInLoopThread());

    loop.stop();
}

TEST(EventLoopTest, OneShotTimerFiresOnce) {
    EventLoop loop;
    loop.start();

    std::atomic<int> runs{0};
    std::promise<void> fired;
    auto done = fired.get_future();

    auto handle = loop.scheduleAfter(Milliseconds(20), [&] {
        if (runs.fetch_add(1) == 0) {
            fired.set_value();
        }
    });

    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_FALSE(handle.active());

    loop.stop();
}

TEST(EventLoopTest, RepeatingTimerRunsUntilCancelled) {
    EventLoop loop;
    loop.start();

    std::atomic<int> runs{0};
    std::promise<void> thirdRun;
    auto done = thirdRun.get_future();

    TimerHandle handle = loop.scheduleEvery(Milliseconds(5), [&] {
        if (runs.fetch_add(1) == 2) {
            thirdRun.set_value();
        }
    });

    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    handle.cancel();

    // Let a tick that was already dequeued drain, then check nothing follows
    std::this_thread::sleep_for(30ms);
    const int afterCancel = runs.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(runs.load(), afterCancel);

    loop.stop();
}

TEST(EventLoopTest, StopDropsPendingTimers) {
    EventLoop loop;
    loop.start();

    std::atomic<bool> ran{false};
    auto handle = loop.scheduleAfter(Milliseconds(200), [&] { ran = true; });

    loop.stop();
    EXPECT_FALSE(loop.running());
    EXPECT_FALSE(handle.active());

    std::this_thread::sleep_for(250ms);
    EXPECT_FALSE(ran.load());
}

TEST(EventLoopTest, StartAndStopAreIdempotent) {
    EventLoop loop;
    loop.start();
    loop.start();
    EXPECT_TRUE(loop.running());

    loop.stop();
    loop.stop();
    EXPECT_FALSE(loop.running());
}

TEST(EventLoopTest, StopFromLoopTaskThenDestroy) {
    auto loop = std::make_unique<EventLoop>();
    loop->start();

    std::promise<void> stopped;
    auto done = stopped.get_future();
    loop->post([&] {
        loop->stop();
        stopped.set_value();
        // Still inside the task while the owner tears the loop down
        std::this_thread::sleep_for(20ms);
    });

    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(loop->running());
    loop.reset();
}

TEST(EventLoopTest, RestartsAfterStoppingItself) {
    EventLoop loop;
    loop.start();

    std::promise<void> stopped;
    auto first = stopped.get_future();
    loop.post([&] {
        loop.stop();
        stopped.set_value();
    });
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);

    loop.start();
    std::promise<bool> onLoop;
    auto second = onLoop.get_future();
    loop.post([&] { onLoop.set_value(loop.isInLoopThread()); });

    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(second.get());
    loop.stop();
}
