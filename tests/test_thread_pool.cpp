#include <gtest/gtest.h>
#include <paper_splitter/thread_pool.h>
#include <chrono>
#include <atomic>
#include <string>

using paper_splitter::ThreadPool;

TEST(ThreadPoolTest, BasicConstruction) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.thread_count(), 4u);
}

TEST(ThreadPoolTest, ZeroThreadsStillRunsTasks) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.thread_count(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, MultipleTasksKeepTheirResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ArgumentsAreForwarded) {
    ThreadPool pool(2);
    auto future = pool.submit([](const std::string& prefix, int page) {
        return prefix + std::to_string(page);
    }, std::string("page-"), 12);
    EXPECT_EQ(future.get(), "page-12");
}

TEST(ThreadPoolTest, DestructorRunsQueuedJobs) {
    std::atomic<int> completed{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&completed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                completed++;
            });
        }
    }
    EXPECT_EQ(completed.load(), 5);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(2);

    auto future = pool.submit([]() -> int {
        throw std::runtime_error("page extraction failed");
    });

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}
