#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <type_traits>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t failedTasks{0};
    double averageTaskTime{0.0};
    size_t currentQueueSize{0};
};

enum class TaskPriority {
    LOW,
    NORMAL,
    HIGH
};

// Fixed size worker pool. Higher priority tasks are taken first, tasks of
// equal priority in submission order.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Exceptions thrown by the task are delivered through the future
    template<typename F>
    auto addTask(F&& f, TaskPriority priority = TaskPriority::NORMAL)
        -> std::future<typename std::result_of<F()>::type>;

    // Wait for all queued and running tasks to complete
    void waitForAll();

    size_t getThreadCount() const;
    size_t getActiveTaskCount() const;
    TaskStats getStats() const;

private:
    struct Task {
        std::function<bool()> func;  // false if the task ended with an exception
        TaskPriority priority;
        uint64_t sequence;
        std::chrono::steady_clock::time_point queuedTime;
    };

    struct TaskOrder {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    void workerThread();
    void stop();
    void updateStats(std::chrono::steady_clock::duration elapsed, bool success);

    std::vector<std::thread> workers_;
    std::priority_queue<Task, std::vector<Task>, TaskOrder> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    bool stop_{false};
    uint64_t nextSequence_{0};
    size_t activeTasks_{0};

    mutable std::mutex statsMutex_;
    TaskStats stats_;
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f, TaskPriority priority)
    -> std::future<typename std::result_of<F()>::type> {

    using return_type = typename std::result_of<F()>::type;

    auto succeeded = std::make_shared<std::atomic<bool>>(true);
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [fn = std::forward<F>(f), succeeded]() mutable -> return_type {
            try {
                return fn();
            } catch (...) {
                succeeded->store(false);
                throw;
            }
        }
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }

        Task t{
            [task, succeeded]() {
                (*task)();
                return succeeded->load();
            },
            priority,
            nextSequence_++,
            std::chrono::steady_clock::now()
        };

        tasks_.push(std::move(t));
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.totalTasks++;
        stats_.currentQueueSize++;
    }

    condition_.notify_one();
    return result;
}
