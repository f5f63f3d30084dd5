#include <gtest/gtest.h>
#include "concurrency/MainLoop.hpp"
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <thread>

using namespace lv::concurrency;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsSubmittedWork) {
    ThreadPool pool(2, "t");
    std::atomic<int> n{0};
    for (int i = 0; i < 50; ++i) pool.submit([&] { ++n; });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (n.load() < 50 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    EXPECT_EQ(n.load(), 50);
    EXPECT_EQ(pool.workerCount(), 2u);
}

TEST(ThreadPoolTest, ZeroWorkersIsRejected) {
    EXPECT_THROW(ThreadPool(0, "empty"), std::invalid_argument);
}

TEST(ThreadPoolTest, StopDropsQueueAndRefusesWork) {
    ThreadPool pool(1, "t");
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};

    pool.submit([&] {
        ++ran;
        while (!release) std::this_thread::sleep_for(1ms);
    });
    while (pool.busyCount() == 0) std::this_thread::sleep_for(1ms);
    pool.submit([&] { ++ran; });
    EXPECT_EQ(pool.queueDepth(), 1u);

    std::thread stopper([&] { pool.stop(); });
    std::this_thread::sleep_for(10ms);
    release = true;
    stopper.join();

    EXPECT_TRUE(pool.isStopped());
    EXPECT_EQ(ran.load(), 1);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(ThreadPoolTest, ThrowingTaskKeepsWorkerAlive) {
    ThreadPool pool(1, "t");
    std::atomic<bool> after{false};
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&] { after = true; });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!after && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    EXPECT_TRUE(after.load());
}

TEST(MainLoopTest, RunsPostedCallbacksOnPumpingThread) {
    MainLoop loop;
    const auto self = std::this_thread::get_id();
    std::thread::id ranOn;

    std::thread producer([&] { loop.post([&] { ranOn = std::this_thread::get_id(); }); });
    producer.join();

    EXPECT_EQ(loop.pending(), 1u);
    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(ranOn, self);
    EXPECT_EQ(loop.pending(), 0u);
}

TEST(MainLoopTest, RunUntilWaitsForCondition) {
    MainLoop loop;
    bool done = false;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        loop.post([&] { done = true; });
    });

    EXPECT_TRUE(loop.runUntil([&] { return done; }, 5s));
    producer.join();
}

TEST(MainLoopTest, RunUntilTimesOut) {
    MainLoop loop;
    EXPECT_FALSE(loop.runUntil([] { return false; }, 20ms));
}

TEST(MainLoopTest, ThrowingCallbackDoesNotStopBatch) {
    MainLoop loop;
    int ran = 0;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { ++ran; });
    EXPECT_EQ(loop.runPending(), 2u);
    EXPECT_EQ(ran, 1);
}
