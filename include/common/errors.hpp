#pragma once

#include <stdexcept>
#include <string>

enum class StageKind {
    Hash,
    Transfer,
    Verify
};

std::string stageKindToString(StageKind kind);

// Base of every error raised by the backup core
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message) : std::runtime_error(message) {}
};

// A path's disk cannot be resolved
class ResourceError : public BackupError {
public:
    ResourceError(const std::string& message, const std::string& path)
        : BackupError(message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Mutation would violate a dependency or alias invariant
class ConflictError : public BackupError {
public:
    explicit ConflictError(const std::string& message) : BackupError(message) {}
};

class NotFoundError : public BackupError {
public:
    NotFoundError(const std::string& message, const std::string& key)
        : BackupError(message), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// An alias resolves to more than one entity
class AliasConflictError : public BackupError {
public:
    AliasConflictError(const std::string& message, const std::string& alias)
        : BackupError(message), alias_(alias) {}

    const std::string& alias() const { return alias_; }

private:
    std::string alias_;
};

class PipelineError : public BackupError {
public:
    PipelineError(StageKind stage, const std::string& operation, const std::string& cause)
        : BackupError(stageKindToString(stage) + " failed for " + operation + ": " + cause)
        , stage_(stage)
        , operation_(operation)
        , cause_(cause) {}

    StageKind stage() const { return stage_; }
    const std::string& operation() const { return operation_; }
    const std::string& cause() const { return cause_; }

private:
    StageKind stage_;
    std::string operation_;
    std::string cause_;
};

// State file unreadable, corrupt or unwritable
class PersistenceError : public BackupError {
public:
    PersistenceError(const std::string& message, const std::string& path)
        : BackupError(message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
