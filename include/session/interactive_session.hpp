#pragma once

#include "scheduler/operation_scheduler.hpp"
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SessionStatus {
    bool running = false;
    std::vector<Operation> operations;  // plan of the active or last run
    StateSnapshot state;
};

// Runs the scheduler in the background and lets sources and targets be
// registered while it is working. New work is picked up by the running plan
// without waiting for it to drain.
class InteractiveSession {
public:
    InteractiveSession(StateStore& store, DiskResourceManager& disks,
                       StageExecutors executors, SchedulerOptions options = SchedulerOptions());
    // Stops the run and waits for running operations
    ~InteractiveSession();

    InteractiveSession(const InteractiveSession&) = delete;
    InteractiveSession& operator=(const InteractiveSession&) = delete;

    // Throws ConflictError if a run is already active
    void start(const RunScope& scope = RunScope::all());
    bool isRunning() const;

    EntityId addSource(const SourceSpec& spec);
    EntityId addTarget(EntityId sourceId, const TargetSpec& spec);
    SessionStatus statusSnapshot() const;

    // Stops dispatching and waits for running operations. Returns the report
    // of the run, or nothing if no run was started.
    std::optional<RunReport> stop();
    // Waits until everything registered so far is finished
    std::optional<RunReport> finish();

    StateStore& store() { return store_; }

private:
    std::optional<RunReport> collect();

    StateStore& store_;
    OperationScheduler scheduler_;
    mutable std::mutex mutex_;
    std::future<RunReport> run_;
};
