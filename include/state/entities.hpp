#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Sources and targets share one id space; ids increase with creation order
using EntityId = uint64_t;

enum class SourceStatus {
    Unhashed,
    Hashing,
    Hashed,
    HashFailed
};

enum class TargetStatus {
    Pending,
    Transferring,
    Transferred,
    TransferFailed,
    Verifying,
    Verified,
    VerifyFailed
};

std::string toString(SourceStatus status);
std::string toString(TargetStatus status);
// Throw std::invalid_argument on unknown names
SourceStatus sourceStatusFromString(const std::string& name);
TargetStatus targetStatusFromString(const std::string& name);

struct VerifiedInfo {
    uint64_t files = 0;
    uint64_t errors = 0;
    uint64_t missing = 0;
    uint64_t crcErrors = 0;
    std::string logFile;

    bool passed() const { return errors == 0 && missing == 0 && crcErrors == 0; }
};

struct Source {
    EntityId id = 0;
    std::string path;
    std::optional<std::string> alias;
    SourceStatus status = SourceStatus::Unhashed;
    std::string hashAlgorithm = "sha512";
    bool forceSingleHash = false;
    // glob patterns, an allowlist takes precedence over the blocklist
    std::vector<std::string> allowlist;
    std::vector<std::string> blocklist;
    std::optional<std::string> hashFile;
    std::optional<std::string> hashLogFile;
    std::optional<std::string> error;
    std::vector<EntityId> targets;

    std::string label() const { return alias ? *alias : path; }
};

struct Target {
    EntityId id = 0;
    EntityId sourceId = 0;
    std::string path;
    std::optional<std::string> alias;
    TargetStatus status = TargetStatus::Pending;
    bool verify = true;
    std::optional<VerifiedInfo> verified;
    std::optional<std::string> error;

    std::string label() const { return alias ? *alias : path; }
    // Transfer has completed, regardless of what happened afterwards
    bool isTransferred() const;
};

// Evidence attached to a status transition, only the fields relevant to the
// transition are read
struct TransitionEvidence {
    std::optional<std::string> hashFile;
    std::optional<std::string> hashLogFile;
    std::optional<VerifiedInfo> verified;
    std::optional<std::string> error;

    static TransitionEvidence failure(const std::string& cause) {
        TransitionEvidence evidence;
        evidence.error = cause;
        return evidence;
    }
};
