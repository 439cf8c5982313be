#pragma once

#include "common/errors.hpp"
#include "scheduler/disk_resource_manager.hpp"
#include "state/entities.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class OperationStatus {
    Queued,
    Running,
    Done,
    Failed
};

std::string toString(OperationStatus status);

// One pipeline step, derived from the status of its source or target.
// Operations live in a flat arena and refer to each other by index.
struct Operation {
    size_t index = 0;
    StageKind kind = StageKind::Hash;
    EntityId sourceId = 0;
    std::optional<EntityId> targetId;
    OperationStatus status = OperationStatus::Queued;
    std::vector<size_t> prerequisites;
    EntityId sequence = 0;  // creation sequence of the owning entity
    std::vector<DiskId> disks;
    std::optional<DiskId> targetDisk;
    std::string label;
    std::optional<std::string> error;
};

// What a run covers. Upstream stages of every selected operation are always included.
struct RunScope {
    std::optional<EntityId> sourceId;
    std::optional<EntityId> targetId;  // requires sourceId
    StageKind upTo = StageKind::Verify;

    static RunScope all() { return RunScope(); }

    bool includesSource(EntityId id) const;
    bool includesTarget(EntityId owner, EntityId id) const;
    bool includesStage(StageKind kind) const;
};

struct OperationOutcome {
    StageKind kind = StageKind::Hash;
    EntityId sourceId = 0;
    std::optional<EntityId> targetId;
    std::string label;
    std::string cause;
};

struct VerifySummary {
    uint64_t files = 0;
    uint64_t crcErrors = 0;
    uint64_t missing = 0;
    uint64_t errors = 0;

    void add(const VerifiedInfo& info);
};

struct TargetResult {
    EntityId targetId = 0;
    std::string label;
    TargetStatus status = TargetStatus::Pending;
    std::optional<VerifiedInfo> verified;
};

struct RunReport {
    size_t executed = 0;
    std::vector<OperationOutcome> failed;
    // Never dispatched because an upstream operation failed
    std::vector<OperationOutcome> skipped;
    // Not dispatched because the run was stopped
    std::vector<std::string> notRun;
    VerifySummary summary;  // verifications performed by this run
    std::vector<TargetResult> targets;
    bool stopped = false;

    bool anyFailed() const { return !failed.empty(); }
    std::string toString() const;
};
