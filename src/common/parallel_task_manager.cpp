#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"

ParallelTaskManager::ParallelTaskManager(size_t numThreads) {
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
    }
    if (numThreads == 0) {
        numThreads = 1;
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
    Logger::debug("Started task manager with " + std::to_string(numThreads) + " workers");
}

ParallelTaskManager::~ParallelTaskManager() {
    stop();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = tasks_.top();
            tasks_.pop();
            ++activeTasks_;
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            if (stats_.currentQueueSize > 0) {
                stats_.currentQueueSize--;
            }
        }

        auto startTime = std::chrono::steady_clock::now();
        const bool success = task.func();
        updateStats(std::chrono::steady_clock::now() - startTime, success);

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
        }
        idle_.notify_all();
    }
}

void ParallelTaskManager::stop() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && activeTasks_ == 0; });
}

size_t ParallelTaskManager::getThreadCount() const {
    return workers_.size();
}

size_t ParallelTaskManager::getActiveTaskCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return activeTasks_;
}

TaskStats ParallelTaskManager::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void ParallelTaskManager::updateStats(std::chrono::steady_clock::duration elapsed, bool success) {
    std::lock_guard<std::mutex> lock(statsMutex_);
    if (success) {
        stats_.completedTasks++;
    } else {
        stats_.failedTasks++;
    }

    const double seconds = std::chrono::duration<double>(elapsed).count();
    const size_t finished = stats_.completedTasks + stats_.failedTasks;
    stats_.averageTaskTime += (seconds - stats_.averageTaskTime) / static_cast<double>(finished);
}
