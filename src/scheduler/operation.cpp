#include "scheduler/operation.hpp"
#include <sstream>

std::string toString(OperationStatus status) {
    switch (status) {
        case OperationStatus::Queued: return "Queued";
        case OperationStatus::Running: return "Running";
        case OperationStatus::Done: return "Done";
        case OperationStatus::Failed: return "Failed";
    }
    return "Unknown";
}

bool RunScope::includesSource(EntityId id) const {
    return !sourceId || *sourceId == id;
}

bool RunScope::includesTarget(EntityId owner, EntityId id) const {
    return includesSource(owner) && (!targetId || *targetId == id) && includesStage(StageKind::Transfer);
}

bool RunScope::includesStage(StageKind kind) const {
    return static_cast<int>(kind) <= static_cast<int>(upTo);
}

void VerifySummary::add(const VerifiedInfo& info) {
    files += info.files;
    crcErrors += info.crcErrors;
    missing += info.missing;
    errors += info.errors;
}

std::string RunReport::toString() const {
    std::ostringstream out;
    out << "Executed " << executed << " operations";
    if (stopped) {
        out << " (stopped)";
    }
    out << "\n";

    for (const auto& outcome : failed) {
        out << "  FAILED  " << outcome.label << ": " << outcome.cause << "\n";
    }
    for (const auto& outcome : skipped) {
        out << "  SKIPPED " << outcome.label << ": " << outcome.cause << "\n";
    }
    for (const auto& label : notRun) {
        out << "  NOT RUN " << label << "\n";
    }
    for (const auto& target : targets) {
        out << "  " << target.label << ": " << ::toString(target.status);
        if (target.verified) {
            out << " (" << target.verified->files << " files, "
                << target.verified->crcErrors << " crc errors, "
                << target.verified->missing << " missing)";
        }
        out << "\n";
    }

    out << "Verified " << summary.files << " files: " << summary.crcErrors << " crc errors, "
        << summary.missing << " missing, " << summary.errors << " errors";
    return out.str();
}
