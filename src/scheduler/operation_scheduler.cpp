#include "scheduler/operation_scheduler.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <tuple>

namespace {

int stageRank(StageKind kind) {
    return static_cast<int>(kind);
}

TaskPriority stagePriority(StageKind kind) {
    switch (kind) {
        case StageKind::Hash: return TaskPriority::HIGH;
        case StageKind::Transfer: return TaskPriority::NORMAL;
        case StageKind::Verify: return TaskPriority::LOW;
    }
    return TaskPriority::NORMAL;
}

std::string verificationProblem(const VerifiedInfo& info) {
    return std::to_string(info.crcErrors) + " checksum mismatches, " +
           std::to_string(info.missing) + " missing files, " +
           std::to_string(info.errors) + " read errors in " +
           std::to_string(info.files) + " files";
}

} // namespace

OperationScheduler::OperationScheduler(StateStore& store, DiskResourceManager& disks,
                                       StageExecutors executors, SchedulerOptions options)
    : store_(store)
    , disks_(disks)
    , executors_(std::move(executors))
    , options_(std::move(options))
    , keepAlive_(options_.keepAlive) {
    if (!executors_.hasher || !executors_.transporter || !executors_.verifier) {
        throw std::invalid_argument("OperationScheduler needs an executor for every stage");
    }
}

// Registration

EntityId OperationScheduler::addSource(const SourceSpec& spec) {
    // Unresolvable paths are rejected before anything is registered
    disks_.resolve(spec.path);
    return applyMutation([this, spec] { return store_.addSource(spec); });
}

EntityId OperationScheduler::addTarget(EntityId sourceId, const TargetSpec& spec) {
    disks_.resolveDestination(spec.path);
    return applyMutation([this, sourceId, spec] { return store_.addTarget(sourceId, spec); });
}

EntityId OperationScheduler::applyMutation(std::function<EntityId()> mutation) {
    std::future<EntityId> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            return mutation();
        }
        Mutation entry;
        entry.apply = std::move(mutation);
        result = entry.result.get_future();
        inbox_.push_back(std::move(entry));
        changed_ = true;
    }
    changedCondition_.notify_all();
    return result.get();
}

void OperationScheduler::applyPendingMutationsLocked(bool extendPlan) {
    while (!inbox_.empty()) {
        Mutation entry = std::move(inbox_.front());
        inbox_.pop_front();
        try {
            const EntityId id = entry.apply();
            if (extendPlan) {
                extendPlanLocked();
            }
            entry.result.set_value(id);
        } catch (...) {
            // Handed to the thread waiting in applyMutation()
            entry.result.set_exception(std::current_exception());
        }
    }
}

// Plan

OperationStatus OperationScheduler::initialStatus(StageKind kind, const Source& source, const Target* target) {
    switch (kind) {
        case StageKind::Hash:
            if (source.status == SourceStatus::Hashed) return OperationStatus::Done;
            if (source.status == SourceStatus::HashFailed) return OperationStatus::Failed;
            return OperationStatus::Queued;
        case StageKind::Transfer:
            if (target->isTransferred()) return OperationStatus::Done;
            if (target->status == TargetStatus::TransferFailed) return OperationStatus::Failed;
            return OperationStatus::Queued;
        case StageKind::Verify:
            if (target->status == TargetStatus::Verified) return OperationStatus::Done;
            if (target->status == TargetStatus::VerifyFailed) return OperationStatus::Failed;
            if (!target->verify && target->isTransferred()) return OperationStatus::Done;
            return OperationStatus::Queued;
    }
    return OperationStatus::Queued;
}

size_t OperationScheduler::addOperationLocked(Operation op) {
    op.index = operations_.size();
    operations_.push_back(std::move(op));
    return operations_.back().index;
}

void OperationScheduler::extendPlanLocked() {
    const StateSnapshot snapshot = store_.snapshot();

    std::map<EntityId, const Source*> sources;
    for (const auto& source : snapshot.sources) {
        sources[source.id] = &source;
        if (!scope_.includesSource(source.id) || hashOps_.count(source.id)) {
            continue;
        }

        Operation hash;
        hash.kind = StageKind::Hash;
        hash.sourceId = source.id;
        hash.sequence = source.id;
        hash.label = "Hash(" + source.label() + ")";
        hash.status = initialStatus(StageKind::Hash, source, nullptr);
        if (hash.status == OperationStatus::Failed) {
            hash.error = source.error.value_or("hash failed in an earlier run");
        } else if (hash.status == OperationStatus::Queued) {
            hash.disks = {disks_.resolve(source.path)};
        }
        hashOps_[source.id] = addOperationLocked(std::move(hash));
    }

    for (const auto& target : snapshot.targets) {
        if (!scope_.includesTarget(target.sourceId, target.id) || transferOps_.count(target.id)) {
            continue;
        }
        const Source& source = *sources.at(target.sourceId);
        const std::string pair = source.label() + "," + target.label();

        Operation transfer;
        transfer.kind = StageKind::Transfer;
        transfer.sourceId = source.id;
        transfer.targetId = target.id;
        transfer.sequence = target.id;
        transfer.prerequisites = {hashOps_.at(source.id)};
        transfer.label = "Transfer(" + pair + ")";
        transfer.status = initialStatus(StageKind::Transfer, source, &target);
        if (transfer.status == OperationStatus::Failed) {
            transfer.error = target.error.value_or("transfer failed in an earlier run");
        } else if (transfer.status == OperationStatus::Queued) {
            const DiskId targetDisk = disks_.resolveDestination(target.path);
            transfer.disks = {disks_.resolve(source.path), targetDisk};
            transfer.targetDisk = targetDisk;
        }
        const size_t transferIndex = addOperationLocked(std::move(transfer));
        transferOps_[target.id] = transferIndex;

        if (!scope_.includesStage(StageKind::Verify)) {
            continue;
        }

        Operation verify;
        verify.kind = StageKind::Verify;
        verify.sourceId = source.id;
        verify.targetId = target.id;
        verify.sequence = target.id;
        verify.prerequisites = {transferIndex};
        verify.label = "Verify(" + pair + ")";
        verify.status = initialStatus(StageKind::Verify, source, &target);
        if (verify.status == OperationStatus::Failed) {
            verify.error = target.error.value_or("verification failed in an earlier run");
        } else if (verify.status == OperationStatus::Queued) {
            verify.disks = {disks_.resolveDestination(target.path)};
        }
        verifyOps_[target.id] = addOperationLocked(std::move(verify));
    }
}

bool OperationScheduler::prerequisitesDoneLocked(const Operation& op) const {
    return std::all_of(op.prerequisites.begin(), op.prerequisites.end(), [this](size_t index) {
        return operations_[index].status == OperationStatus::Done;
    });
}

bool OperationScheduler::isBlockedLocked(const Operation& op, std::string* cause) const {
    for (size_t index : op.prerequisites) {
        const Operation& prerequisite = operations_[index];
        if (prerequisite.status == OperationStatus::Failed) {
            if (cause) {
                *cause = "skipped because " + prerequisite.label + " failed";
            }
            return true;
        }
        if (isBlockedLocked(prerequisite, cause)) {
            return true;
        }
    }
    return false;
}

bool OperationScheduler::isDeferredLocked(const Operation& op) const {
    for (const auto& other : operations_) {
        if (other.kind != StageKind::Transfer || !other.targetDisk || *other.targetDisk != op.disks.front()) {
            continue;
        }
        if (other.status == OperationStatus::Running) {
            return true;
        }
        if (other.status == OperationStatus::Queued && !isBlockedLocked(other)) {
            return true;
        }
    }
    return false;
}

bool OperationScheduler::hasPendingWorkLocked() const {
    return std::any_of(operations_.begin(), operations_.end(), [this](const Operation& op) {
        return op.status == OperationStatus::Queued && !isBlockedLocked(op);
    });
}

// Dispatch

bool OperationScheduler::dispatchLocked(ParallelTaskManager& pool) {
    bool progressed = false;

    std::vector<size_t> candidates;
    for (auto& op : operations_) {
        if (op.status != OperationStatus::Queued || !prerequisitesDoneLocked(op)) {
            continue;
        }
        if (op.kind == StageKind::Verify && store_.isTarget(*op.targetId) &&
            !store_.getTarget(*op.targetId).verify) {
            // Verification disabled, done as soon as the transfer is
            op.status = OperationStatus::Done;
            progressed = true;
            continue;
        }
        candidates.push_back(op.index);
    }

    std::sort(candidates.begin(), candidates.end(), [this](size_t a, size_t b) {
        const Operation& left = operations_[a];
        const Operation& right = operations_[b];
        return std::make_tuple(stageRank(left.kind), left.sequence, left.index) <
               std::make_tuple(stageRank(right.kind), right.sequence, right.index);
    });

    for (size_t index : candidates) {
        Operation& op = operations_[index];
        if (op.kind == StageKind::Verify && isDeferredLocked(op)) {
            Logger::debug(op.label + " deferred until transfers to " + op.disks.front().toString() + " finish");
            continue;
        }

        OperationContext context;
        context.kind = op.kind;
        context.logDirectory = options_.logDirectory;
        try {
            context.source = store_.getSource(op.sourceId);
            if (op.targetId) {
                context.target = store_.getTarget(*op.targetId);
            }
        } catch (const NotFoundError& e) {
            op.status = OperationStatus::Failed;
            op.error = e.what();
            progressed = true;
            continue;
        }

        std::optional<Lease> lease = disks_.tryAcquire(op.disks);
        if (!lease) {
            continue;
        }

        op.status = OperationStatus::Running;
        running_++;
        progressed = true;

        auto held = std::make_shared<Lease>(std::move(*lease));
        pool.addTask([this, index, context, held] {
            executeOperation(index, context, *held);
        }, stagePriority(op.kind));
    }
    return progressed;
}

RunReport OperationScheduler::run(const RunScope& requested) {
    RunScope scope = requested;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            throw ConflictError("A run is already in progress");
        }

        if (scope.targetId) {
            const Target target = store_.getTarget(*scope.targetId);
            if (scope.sourceId && *scope.sourceId != target.sourceId) {
                throw NotFoundError("Target '" + target.label() + "' does not belong to source #" +
                                    std::to_string(*scope.sourceId), target.path);
            }
            scope.sourceId = target.sourceId;
        }
        if (scope.sourceId && !store_.isSource(*scope.sourceId)) {
            throw NotFoundError("Source #" + std::to_string(*scope.sourceId) + " not found!",
                                std::to_string(*scope.sourceId));
        }

        scope_ = scope;
        operations_.clear();
        hashOps_.clear();
        transferOps_.clear();
        verifyOps_.clear();
        executed_ = 0;
        summary_ = VerifySummary();
        fatalError_ = nullptr;
        running_ = 0;

        // Any unresolvable disk aborts here, before an operation has started
        extendPlanLocked();
        active_ = true;
        changed_ = false;

        size_t done = 0;
        for (const auto& op : operations_) {
            if (op.status == OperationStatus::Done) {
                done++;
            }
        }
        Logger::info("Planned " + std::to_string(operations_.size()) + " operations, " +
                     std::to_string(done) + " already done");
    }

    ParallelTaskManager pool(options_.workers);
    const size_t listener = disks_.addReleaseListener([this] { notifyChanged(); });

    RunReport report;
    std::exception_ptr fatal;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            changed_ = false;
            applyPendingMutationsLocked(true);

            if (!stopRequested_ && dispatchLocked(pool)) {
                continue;
            }
            if (running_ == 0 && (stopRequested_ || (!keepAlive_ && !hasPendingWorkLocked()))) {
                break;
            }
            changedCondition_.wait(lock, [this] { return changed_; });
        }

        active_ = false;
        // Registrations that raced with the end of the run
        applyPendingMutationsLocked(false);

        report = buildReportLocked();
        fatal = fatalError_;
        stopRequested_ = false;
        keepAlive_ = options_.keepAlive;
    }

    disks_.removeReleaseListener(listener);
    pool.waitForAll();

    if (fatal) {
        std::rethrow_exception(fatal);
    }

    Logger::info("Run finished: " + std::to_string(report.executed) + " executed, " +
                 std::to_string(report.failed.size()) + " failed, " +
                 std::to_string(report.skipped.size()) + " skipped");
    return report;
}

// Execution, on a pool worker

StageExecutor& OperationScheduler::executorFor(StageKind kind) const {
    switch (kind) {
        case StageKind::Hash: return *executors_.hasher;
        case StageKind::Transfer: return *executors_.transporter;
        case StageKind::Verify: return *executors_.verifier;
    }
    return *executors_.verifier;
}

void OperationScheduler::markStarted(const OperationContext& context) {
    switch (context.kind) {
        case StageKind::Hash:
            store_.transition(context.source.id, SourceStatus::Hashing);
            break;
        case StageKind::Transfer:
            store_.transition(context.target->id, TargetStatus::Transferring);
            break;
        case StageKind::Verify:
            store_.transition(context.target->id, TargetStatus::Verifying);
            break;
    }
}

void OperationScheduler::commitResult(const OperationContext& context, const StageResult& result,
                                      bool success, const std::string& cause) {
    TransitionEvidence evidence = success ? TransitionEvidence() : TransitionEvidence::failure(cause);
    switch (context.kind) {
        case StageKind::Hash:
            evidence.hashFile = result.hashFile;
            evidence.hashLogFile = result.hashLogFile;
            store_.transition(context.source.id, success ? SourceStatus::Hashed : SourceStatus::HashFailed, evidence);
            break;
        case StageKind::Transfer:
            store_.transition(context.target->id,
                              success ? TargetStatus::Transferred : TargetStatus::TransferFailed, evidence);
            break;
        case StageKind::Verify:
            evidence.verified = result.verified;
            store_.transition(context.target->id, success ? TargetStatus::Verified : TargetStatus::VerifyFailed,
                              evidence);
            break;
    }
}

void OperationScheduler::executeOperation(size_t index, const OperationContext& context, Lease& lease) {
    const std::string label = context.label();
    bool success = false;
    std::string cause;
    StageResult result;
    std::exception_ptr fatal;

    // Anything but a BackupError from the store leaves its state unknown and stops the run
    bool started = false;
    try {
        markStarted(context);
        started = true;
    } catch (const PersistenceError& e) {
        cause = e.what();
        fatal = std::current_exception();
    } catch (const BackupError& e) {
        cause = e.what();
    } catch (const std::exception& e) {
        cause = e.what();
        fatal = std::current_exception();
    } catch (...) {
        cause = "unknown error while recording start";
        fatal = std::current_exception();
    }

    if (started) {
        Logger::info("Started " + label);
        try {
            result = executorFor(context.kind).execute(context);
            success = true;
        } catch (const PipelineError& e) {
            cause = e.cause();
        } catch (const std::exception& e) {
            cause = e.what();
        } catch (...) {
            cause = "unknown error in " + label;
            fatal = std::current_exception();
        }
        if (success && result.verified && !result.verified->passed()) {
            success = false;
            cause = verificationProblem(*result.verified);
        }

        try {
            commitResult(context, result, success, cause);
        } catch (const std::exception& e) {
            success = false;
            cause = std::string("could not record result: ") + e.what();
            fatal = std::current_exception();
        } catch (...) {
            success = false;
            cause = "could not record result";
            fatal = std::current_exception();
        }
    }

    if (success) {
        Logger::info("Finished " + label);
    } else {
        Logger::error(PipelineError(context.kind, label, cause).what());
    }
    finishOperation(index, success, cause, result.verified, fatal, lease);
}

void OperationScheduler::finishOperation(size_t index, bool success, const std::string& cause,
                                         const std::optional<VerifiedInfo>& verified, std::exception_ptr fatal,
                                         Lease& lease) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation& op = operations_[index];
        op.status = success ? OperationStatus::Done : OperationStatus::Failed;
        if (!success) {
            op.error = cause;
        }
        if (verified) {
            summary_.add(*verified);
        }
        if (fatal && !fatalError_) {
            fatalError_ = fatal;
            stopRequested_ = true;
        }
        running_--;
        executed_++;
        changed_ = true;
    }
    // The operation is no longer Running before its disks become available.
    // Release listeners take mutex_, so this happens after it is unlocked.
    lease.release();
    changedCondition_.notify_all();
}

// Control

void OperationScheduler::notifyChanged() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed_ = true;
    }
    changedCondition_.notify_all();
}

void OperationScheduler::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
        changed_ = true;
    }
    changedCondition_.notify_all();
    Logger::info("Stop requested, running operations will finish");
}

void OperationScheduler::drain() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        keepAlive_ = false;
        changed_ = true;
    }
    changedCondition_.notify_all();
}

bool OperationScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::vector<Operation> OperationScheduler::operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

RunReport OperationScheduler::buildReportLocked() const {
    RunReport report;
    report.executed = executed_;
    report.summary = summary_;
    report.stopped = stopRequested_;

    for (const auto& op : operations_) {
        OperationOutcome outcome;
        outcome.kind = op.kind;
        outcome.sourceId = op.sourceId;
        outcome.targetId = op.targetId;
        outcome.label = op.label;

        if (op.status == OperationStatus::Failed) {
            outcome.cause = op.error.value_or("failed");
            report.failed.push_back(outcome);
        } else if (op.status == OperationStatus::Queued) {
            if (isBlockedLocked(op, &outcome.cause)) {
                report.skipped.push_back(outcome);
            } else {
                report.notRun.push_back(op.label);
            }
        }
    }

    for (const auto& [targetId, index] : transferOps_) {
        (void)index;
        if (!store_.isTarget(targetId)) {
            continue;
        }
        const Target target = store_.getTarget(targetId);
        TargetResult result;
        result.targetId = target.id;
        result.label = store_.getSource(target.sourceId).label() + "," + target.label();
        result.status = target.status;
        result.verified = target.verified;
        report.targets.push_back(result);
    }
    return report;
}
