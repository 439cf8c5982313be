#include <gtest/gtest.h>
#include "common/parallel_task_manager.hpp"
#include <atomic>
#include <stdexcept>

TEST(ParallelTaskManagerTest, RunsTasksAndReturnsResults) {
    ParallelTaskManager manager(4);
    EXPECT_EQ(manager.getThreadCount(), 4u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; i++) {
        results.push_back(manager.addTask([i] { return i * i; }));
    }
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(results[i].get(), i * i);
    }

    manager.waitForAll();
    TaskStats stats = manager.getStats();
    EXPECT_EQ(stats.totalTasks, 20u);
    EXPECT_EQ(stats.completedTasks, 20u);
    EXPECT_EQ(stats.failedTasks, 0u);
    EXPECT_EQ(manager.getActiveTaskCount(), 0u);
}

TEST(ParallelTaskManagerTest, ExceptionsReachTheFuture) {
    ParallelTaskManager manager(1);
    auto failing = manager.addTask([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    manager.waitForAll();
    EXPECT_EQ(manager.getStats().failedTasks, 1u);
}

TEST(ParallelTaskManagerTest, HigherPriorityRunsFirst) {
    ParallelTaskManager manager(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();

    std::mutex orderMutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back(name);
    };

    // Occupies the single worker until the other tasks are queued
    manager.addTask([opened] { opened.wait(); });
    manager.addTask([&] { record("low"); }, TaskPriority::LOW);
    manager.addTask([&] { record("normal-1"); });
    manager.addTask([&] { record("high"); }, TaskPriority::HIGH);
    manager.addTask([&] { record("normal-2"); });
    gate.set_value();
    manager.waitForAll();

    EXPECT_EQ(order, (std::vector<std::string>{"high", "normal-1", "normal-2", "low"}));
}

TEST(ParallelTaskManagerTest, ZeroThreadsMeansAtLeastOne) {
    ParallelTaskManager manager(0);
    EXPECT_GE(manager.getThreadCount(), 1u);
    std::atomic<int> count{0};
    manager.addTask([&count] { count++; }).get();
    EXPECT_EQ(count.load(), 1);
}
