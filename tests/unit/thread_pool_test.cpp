#include "ppeguard/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <vector>

#include <gtest/gtest.h>

namespace ppeguard {
namespace {

TEST(ThreadPoolTest, RunsSubmittedTasksAndReturnsResults) {
    ThreadPool pool(2, 8);
    auto first = pool.trySubmit([](int a, int b) { return a + b; }, 2, 3);
    auto second = pool.trySubmit([] { return 7; });

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->get(), 5);
    EXPECT_EQ(second->get(), 7);
}

TEST(ThreadPoolTest, SingleWorkerPreservesSubmissionOrder) {
    ThreadPool pool(1, 64);
    std::mutex mutex;
    std::vector<int> order;

    for (int i = 0; i < 20; ++i) {
        auto queued = pool.trySubmit([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
        ASSERT_TRUE(queued.has_value());
    }
    pool.waitIdle();

    ASSERT_EQ(order.size(), 20U);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(ThreadPoolTest, FullQueueRejectsWithoutBlocking) {
    ThreadPool pool(1, 1);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    auto blocker = pool.trySubmit([gate, &started] {
        started.set_value();
        gate.wait();
    });
    ASSERT_TRUE(blocker.has_value());
    started.get_future().wait();

    auto queued = pool.trySubmit([] {});
    EXPECT_TRUE(queued.has_value());
    auto rejected = pool.trySubmit([] {});
    EXPECT_FALSE(rejected.has_value());
    EXPECT_EQ(pool.rejected(), 1U);

    release.set_value();
    pool.waitIdle();
    EXPECT_EQ(pool.pending(), 0U);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1, 16);
        for (int i = 0; i < 10; ++i) {
            pool.trySubmit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++done;
            });
        }
        pool.shutdown();
        EXPECT_FALSE(pool.trySubmit([] {}).has_value());
    }
    EXPECT_EQ(done.load(), 10);
}

}  // namespace
}  // namespace ppeguard
