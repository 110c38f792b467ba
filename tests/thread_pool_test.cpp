#include "huddle/utils/threading.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using namespace std::chrono_literals;
using huddle::utils::ThreadPool;
using huddle::utils::ThreadPoolError;

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);

    auto future = pool.submit([] { return 21 * 2; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, SubmitWithArguments) {
    ThreadPool pool(1);

    auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);

    auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ZeroThreadsStillRunsWork) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, TrySubmitAfterShutdownFails) {
    ThreadPool pool(1);
    pool.shutdown();

    auto result = pool.try_submit([] {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ThreadPoolError::Shutdown);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(ThreadPoolTest, BoundedQueueReportsFull) {
    ThreadPool pool(1, 1);
    std::atomic<bool> release{false};
    std::atomic<bool> running{false};

    auto blocker = pool.submit([&] {
        running = true;
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
    });
    ASSERT_TRUE(huddle::testing::wait_until([&] { return running.load(); }));

    auto queued = pool.try_submit([] {});
    ASSERT_TRUE(queued.has_value());

    auto rejected = pool.try_submit([] {});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), ThreadPoolError::QueueFull);

    release = true;
    blocker.get();
    queued->get();
}

TEST(ThreadPoolTest, RunsTasksConcurrently) {
    ThreadPool pool(4);
    std::atomic<int> done{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(pool.submit([&] { ++done; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(done.load(), 16);
}
