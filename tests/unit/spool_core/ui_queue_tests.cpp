#include <gtest/gtest.h>

#include "spool/viewer/ui_queue.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using spool::viewer::UiQueue;

TEST(UiQueue, RunsTasksInPostOrder)
{
    UiQueue queue;
    std::vector<int> order;
    queue.post([&order]() { order.push_back(1); });
    queue.post([&order]() { order.push_back(2); });
    queue.post(nullptr);

    EXPECT_EQ(queue.pending(), 2u);
    EXPECT_EQ(queue.drain(), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(UiQueue, TasksPostedWhileDrainingRunNextPass)
{
    UiQueue queue;
    int runs = 0;
    queue.post([&]() {
        ++runs;
        queue.post([&runs]() { ++runs; });
    });

    EXPECT_EQ(queue.drain(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(queue.drain(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(UiQueue, ThrowingTaskKeepsRemainingWork)
{
    UiQueue queue;
    int runs = 0;
    queue.post([]() { throw std::runtime_error("boom"); });
    queue.post([&runs]() { ++runs; });

    EXPECT_THROW(queue.drain(), std::runtime_error);
    EXPECT_EQ(queue.pending(), 1u);
    queue.drain();
    EXPECT_EQ(runs, 1);
}

TEST(UiQueue, AcceptsPostsFromManyThreads)
{
    UiQueue queue;
    std::atomic<int> runs{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i)
                queue.post([&runs]() { ++runs; });
        });
    }
    for (auto &thread : threads)
        thread.join();

    queue.drain();
    EXPECT_EQ(runs.load(), 400);
}
