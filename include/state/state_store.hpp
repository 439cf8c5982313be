#pragma once

#include "state/entities.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Outcome of looking up a path or alias
struct ResolveResult {
    enum class Kind {
        Found,
        NotFound,
        AmbiguousAlias
    };

    Kind kind = Kind::NotFound;
    EntityId id = 0;

    static ResolveResult found(EntityId id) { return {Kind::Found, id}; }
    static ResolveResult notFound() { return {Kind::NotFound, 0}; }
    static ResolveResult ambiguous() { return {Kind::AmbiguousAlias, 0}; }
};

struct SourceSpec {
    std::string path;
    std::optional<std::string> alias;
    std::string hashAlgorithm = "sha512";
    bool forceSingleHash = false;
    std::vector<std::string> allowlist;
    std::vector<std::string> blocklist;
};

struct TargetSpec {
    std::string path;
    std::optional<std::string> alias;
    bool verify = true;
};

// Consistent copy of every entity, taken under a single lock
struct StateSnapshot {
    std::vector<Source> sources;  // creation order
    std::vector<Target> targets;  // creation order
};

// Durable record of all sources and targets. Every mutation is linearized by
// an internal lock and written to disk before it returns; if the write fails
// the in-memory change is rolled back and PersistenceError is thrown.
class StateStore {
public:
    explicit StateStore(const std::string& path);
    ~StateStore() = default;

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Loads the state file if it exists and resets stages that were
    // interrupted mid-flight. Throws PersistenceError on unreadable or corrupt state.
    static std::unique_ptr<StateStore> open(const std::string& path);

    const std::string& path() const { return path_; }

    // Mutations
    EntityId addSource(const SourceSpec& spec);
    EntityId addTarget(EntityId sourceId, const TargetSpec& spec);
    void removeSource(EntityId sourceId);
    void removeTarget(EntityId targetId);
    void transition(EntityId sourceId, SourceStatus newStatus,
                    const TransitionEvidence& evidence = TransitionEvidence());
    void transition(EntityId targetId, TargetStatus newStatus,
                    const TransitionEvidence& evidence = TransitionEvidence());
    // Operator requested return of a failed stage to its queued status
    void reset(EntityId entityId);
    void setSourceField(EntityId sourceId, const std::string& field,
                        const std::vector<std::string>& values);
    void setTargetField(EntityId targetId, const std::string& field,
                        const std::vector<std::string>& values);

    // Lookup by normalized path or alias
    ResolveResult resolve(const std::string& key) const;
    ResolveResult resolveSource(const std::string& key) const;
    ResolveResult resolveTarget(EntityId sourceId, const std::string& key) const;
    // Same as above, throwing NotFoundError / AliasConflictError
    EntityId requireSource(const std::string& key) const;
    EntityId requireTarget(EntityId sourceId, const std::string& key) const;

    bool isSource(EntityId id) const;
    bool isTarget(EntityId id) const;
    Source getSource(EntityId id) const;
    Target getTarget(EntityId id) const;
    StateSnapshot snapshot() const;

    // Human readable JSON of one source with its targets, or of everything
    std::string describe(std::optional<EntityId> sourceId = std::nullopt) const;
    // Writes the current state to a different file, used for crash copies
    void saveCopy(const std::string& path) const;

    // Number of interrupted stages reset by the last open()
    size_t recoveredStages() const { return recoveredStages_; }

private:
    void load();
    size_t recoverInterruptedLocked();
    // Applies a mutation and persists it, restoring the previous state if either step throws
    void commitLocked(const std::function<void()>& mutate);
    void persistLocked() const;
    nlohmann::json toJsonLocked() const;
    void fromJson(const nlohmann::json& state);

    Source& sourceLocked(EntityId id);
    const Source& sourceLocked(EntityId id) const;
    Target& targetLocked(EntityId id);
    const Target& targetLocked(EntityId id) const;
    ResolveResult resolveSourceLocked(const std::string& key) const;
    ResolveResult resolveTargetLocked(const Source& source, const std::string& key) const;
    void checkSourceAliasLocked(const std::string& alias, EntityId self) const;
    void checkTargetAliasLocked(const Source& source, const std::string& alias, EntityId self) const;

    std::string path_;
    std::map<EntityId, Source> sources_;
    std::map<EntityId, Target> targets_;
    EntityId nextId_ = 1;
    size_t recoveredStages_ = 0;
    mutable std::mutex mutex_;
};
