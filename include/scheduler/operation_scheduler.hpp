#pragma once

#include "backup/stage_executor.hpp"
#include "common/parallel_task_manager.hpp"
#include "scheduler/disk_resource_manager.hpp"
#include "scheduler/operation.hpp"
#include "state/state_store.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct SchedulerOptions {
    size_t workers = 0;        // 0 means hardware concurrency
    std::string logDirectory;  // hash logs are written here
    bool keepAlive = false;    // keep running when idle until stop() or drain()
};

// Drives hash, transfer and verify operations to completion. At most one
// operation runs per disk. Among runnable operations Hash goes before Transfer
// before Verify, ties by creation order. A Verify waits while a Transfer
// writing to the same disk is still queued or running.
class OperationScheduler {
public:
    OperationScheduler(StateStore& store, DiskResourceManager& disks,
                       StageExecutors executors, SchedulerOptions options = SchedulerOptions());
    ~OperationScheduler() = default;

    OperationScheduler(const OperationScheduler&) = delete;
    OperationScheduler& operator=(const OperationScheduler&) = delete;

    // Blocks until the scope is finished or a stop was requested.
    // ResourceError, NotFoundError and PersistenceError abort before any
    // operation starts. Throws ConflictError if a run is already active.
    RunReport run(const RunScope& scope = RunScope::all());

    // Safe to call at any time. While a run is active the registration is
    // applied between ticks and picked up by the running plan.
    EntityId addSource(const SourceSpec& spec);
    EntityId addTarget(EntityId sourceId, const TargetSpec& spec);

    // Stops dispatching, running operations finish
    void requestStop();
    // Lets a keep-alive run return once its work is finished
    void drain();

    bool isRunning() const;
    std::vector<Operation> operations() const;

private:
    struct Mutation {
        std::function<EntityId()> apply;
        std::promise<EntityId> result;
    };

    EntityId applyMutation(std::function<EntityId()> mutation);
    void applyPendingMutationsLocked(bool extendPlan);

    // Adds operations for every in-scope entity that has none yet
    void extendPlanLocked();
    size_t addOperationLocked(Operation op);
    static OperationStatus initialStatus(StageKind kind, const Source& source, const Target* target);

    // Returns true if any operation was started or completed without dispatch
    bool dispatchLocked(ParallelTaskManager& pool);
    bool prerequisitesDoneLocked(const Operation& op) const;
    bool isBlockedLocked(const Operation& op, std::string* cause = nullptr) const;
    bool isDeferredLocked(const Operation& op) const;
    bool hasPendingWorkLocked() const;

    void executeOperation(size_t index, const OperationContext& context, Lease& lease);
    StageExecutor& executorFor(StageKind kind) const;
    void markStarted(const OperationContext& context);
    void commitResult(const OperationContext& context, const StageResult& result,
                      bool success, const std::string& cause);
    void finishOperation(size_t index, bool success, const std::string& cause,
                         const std::optional<VerifiedInfo>& verified, std::exception_ptr fatal,
                         Lease& lease);

    RunReport buildReportLocked() const;
    void notifyChanged();

    StateStore& store_;
    DiskResourceManager& disks_;
    StageExecutors executors_;
    SchedulerOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable changedCondition_;
    bool changed_ = false;
    bool active_ = false;
    bool stopRequested_ = false;
    bool keepAlive_ = false;
    size_t running_ = 0;
    std::exception_ptr fatalError_;

    RunScope scope_;
    std::vector<Operation> operations_;
    std::map<EntityId, size_t> hashOps_;
    std::map<EntityId, size_t> transferOps_;
    std::map<EntityId, size_t> verifyOps_;
    std::deque<Mutation> inbox_;

    size_t executed_ = 0;
    VerifySummary summary_;
};
