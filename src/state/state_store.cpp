#include "state/state_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

const int kStateVersion = 1;

// Failure causes quote file names, which need not be valid UTF-8
std::optional<std::string> printableError(const std::optional<std::string>& error) {
    if (!error) {
        return std::nullopt;
    }
    const std::string quoted = json(*error).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(quoted).get<std::string>();
}

json optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optionalFromJson(const json& object, const char* key) {
    const auto& value = object.at(key);
    if (value.is_null()) {
        return std::nullopt;
    }
    return value.get<std::string>();
}

json sourceToJson(const Source& source) {
    json result;
    result["id"] = source.id;
    result["path"] = source.path;
    result["alias"] = optionalToJson(source.alias);
    result["status"] = toString(source.status);
    result["hash_algorithm"] = source.hashAlgorithm;
    result["force_single_hash"] = source.forceSingleHash;
    result["allowlist"] = source.allowlist;
    result["blocklist"] = source.blocklist;
    result["hash_file"] = optionalToJson(source.hashFile);
    result["hash_log_file"] = optionalToJson(source.hashLogFile);
    result["error"] = optionalToJson(source.error);
    result["targets"] = source.targets;
    return result;
}

json targetToJson(const Target& target) {
    json result;
    result["id"] = target.id;
    result["source_id"] = target.sourceId;
    result["path"] = target.path;
    result["alias"] = optionalToJson(target.alias);
    result["status"] = toString(target.status);
    result["verify"] = target.verify;
    result["error"] = optionalToJson(target.error);
    if (target.verified) {
        result["verified"] = {
            {"files", target.verified->files},
            {"errors", target.verified->errors},
            {"missing", target.verified->missing},
            {"crc_errors", target.verified->crcErrors},
            {"log_file", target.verified->logFile}
        };
    } else {
        result["verified"] = nullptr;
    }
    return result;
}

Source sourceFromJson(const json& object) {
    Source source;
    source.id = object.at("id").get<EntityId>();
    source.path = object.at("path").get<std::string>();
    source.alias = optionalFromJson(object, "alias");
    source.status = sourceStatusFromString(object.at("status").get<std::string>());
    source.hashAlgorithm = object.at("hash_algorithm").get<std::string>();
    source.forceSingleHash = object.at("force_single_hash").get<bool>();
    source.allowlist = object.at("allowlist").get<std::vector<std::string>>();
    source.blocklist = object.at("blocklist").get<std::vector<std::string>>();
    source.hashFile = optionalFromJson(object, "hash_file");
    source.hashLogFile = optionalFromJson(object, "hash_log_file");
    source.error = optionalFromJson(object, "error");
    source.targets = object.at("targets").get<std::vector<EntityId>>();
    return source;
}

Target targetFromJson(const json& object) {
    Target target;
    target.id = object.at("id").get<EntityId>();
    target.sourceId = object.at("source_id").get<EntityId>();
    target.path = object.at("path").get<std::string>();
    target.alias = optionalFromJson(object, "alias");
    target.status = targetStatusFromString(object.at("status").get<std::string>());
    target.verify = object.at("verify").get<bool>();
    target.error = optionalFromJson(object, "error");

    const auto& verified = object.at("verified");
    if (!verified.is_null()) {
        VerifiedInfo info;
        info.files = verified.at("files").get<uint64_t>();
        info.errors = verified.at("errors").get<uint64_t>();
        info.missing = verified.at("missing").get<uint64_t>();
        info.crcErrors = verified.at("crc_errors").get<uint64_t>();
        info.logFile = verified.at("log_file").get<std::string>();
        target.verified = info;
    }
    return target;
}

void writeJsonFile(const std::string& path, const json& state) {
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("Failed to open state file for writing: " + tmpPath, path);
        }
        try {
            file << state.dump(2);
        } catch (const json::exception& e) {
            throw PersistenceError("Failed to serialize state: " + std::string(e.what()), path);
        }
        file.flush();
        if (!file) {
            throw PersistenceError("Failed to write state file: " + tmpPath, path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        throw PersistenceError("Failed to replace state file " + path + ": " + ec.message(), path);
    }
}

bool isRunningStatus(SourceStatus status) {
    return status == SourceStatus::Hashing;
}

bool isRunningStatus(TargetStatus status) {
    return status == TargetStatus::Transferring || status == TargetStatus::Verifying;
}

bool sourceTransitionAllowed(SourceStatus from, SourceStatus to) {
    switch (from) {
        case SourceStatus::Unhashed:
            return to == SourceStatus::Hashing;
        case SourceStatus::Hashing:
            return to == SourceStatus::Hashed || to == SourceStatus::HashFailed;
        case SourceStatus::Hashed:
        case SourceStatus::HashFailed:
            return false;
    }
    return false;
}

bool targetTransitionAllowed(TargetStatus from, TargetStatus to) {
    switch (from) {
        case TargetStatus::Pending:
            return to == TargetStatus::Transferring;
        case TargetStatus::Transferring:
            return to == TargetStatus::Transferred || to == TargetStatus::TransferFailed;
        case TargetStatus::Transferred:
            return to == TargetStatus::Verifying;
        case TargetStatus::Verifying:
            return to == TargetStatus::Verified || to == TargetStatus::VerifyFailed;
        case TargetStatus::TransferFailed:
        case TargetStatus::Verified:
        case TargetStatus::VerifyFailed:
            return false;
    }
    return false;
}

} // namespace

StateStore::StateStore(const std::string& path)
    : path_(utils::normalizePath(path).string()) {
}

std::unique_ptr<StateStore> StateStore::open(const std::string& path) {
    auto store = std::make_unique<StateStore>(path);
    store->load();
    return store;
}

void StateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            throw PersistenceError("Cannot access state file " + path_ + ": " + ec.message(), path_);
        }
        Logger::info("No state file at " + path_ + ", starting with an empty state");
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw PersistenceError("Failed to open state file for reading: " + path_, path_);
    }

    try {
        json state;
        file >> state;
        fromJson(state);
    } catch (const json::exception& e) {
        throw PersistenceError("Corrupt state file " + path_ + ": " + e.what(), path_);
    } catch (const std::invalid_argument& e) {
        throw PersistenceError("Corrupt state file " + path_ + ": " + e.what(), path_);
    }

    recoveredStages_ = recoverInterruptedLocked();
    if (recoveredStages_ > 0) {
        persistLocked();
    }
    Logger::debug("Loaded " + std::to_string(sources_.size()) + " sources and " +
                  std::to_string(targets_.size()) + " targets from " + path_);
}

void StateStore::fromJson(const json& state) {
    if (state.at("type").get<std::string>() != "BackupState") {
        throw std::invalid_argument("not a backup state file");
    }
    if (state.at("version").get<int>() != kStateVersion) {
        throw std::invalid_argument("unsupported state version " +
                                    std::to_string(state.at("version").get<int>()));
    }

    std::map<EntityId, Source> sources;
    std::map<EntityId, Target> targets;
    EntityId nextId = state.at("next_id").get<EntityId>();

    for (const auto& object : state.at("sources")) {
        auto source = sourceFromJson(object);
        if (source.id >= nextId || !sources.emplace(source.id, source).second) {
            throw std::invalid_argument("invalid source id " + std::to_string(source.id));
        }
    }
    for (const auto& object : state.at("targets")) {
        auto target = targetFromJson(object);
        if (target.id >= nextId || sources.count(target.id) ||
            !targets.emplace(target.id, target).second) {
            throw std::invalid_argument("invalid target id " + std::to_string(target.id));
        }
    }

    // Cross references have to agree in both directions
    for (const auto& [id, source] : sources) {
        for (EntityId targetId : source.targets) {
            auto it = targets.find(targetId);
            if (it == targets.end() || it->second.sourceId != id) {
                throw std::invalid_argument("source " + source.path +
                                            " references unknown target " + std::to_string(targetId));
            }
        }
    }
    for (const auto& [id, target] : targets) {
        auto it = sources.find(target.sourceId);
        if (it == sources.end() ||
            std::find(it->second.targets.begin(), it->second.targets.end(), id) == it->second.targets.end()) {
            throw std::invalid_argument("target " + target.path + " has no owning source");
        }
    }

    sources_ = std::move(sources);
    targets_ = std::move(targets);
    nextId_ = nextId;
}

size_t StateStore::recoverInterruptedLocked() {
    size_t recovered = 0;
    for (auto& [id, source] : sources_) {
        if (source.status == SourceStatus::Hashing) {
            Logger::warning("Hashing of " + source.label() + " was interrupted, it will be hashed again");
            source.status = SourceStatus::Unhashed;
            ++recovered;
        }
    }
    for (auto& [id, target] : targets_) {
        if (target.status == TargetStatus::Transferring) {
            Logger::warning("Transfer to " + target.path + " was interrupted, it will be transferred again");
            target.status = TargetStatus::Pending;
            ++recovered;
        } else if (target.status == TargetStatus::Verifying) {
            Logger::warning("Verification of " + target.path + " was interrupted, it will be verified again");
            target.status = TargetStatus::Transferred;
            ++recovered;
        }
    }
    return recovered;
}

json StateStore::toJsonLocked() const {
    json state;
    state["version"] = kStateVersion;
    state["type"] = "BackupState";
    state["next_id"] = nextId_;
    state["sources"] = json::array();
    for (const auto& [id, source] : sources_) {
        state["sources"].push_back(sourceToJson(source));
    }
    state["targets"] = json::array();
    for (const auto& [id, target] : targets_) {
        state["targets"].push_back(targetToJson(target));
    }
    return state;
}

void StateStore::persistLocked() const {
    writeJsonFile(path_, toJsonLocked());
}

void StateStore::commitLocked(const std::function<void()>& mutate) {
    auto sources = sources_;
    auto targets = targets_;
    auto nextId = nextId_;

    try {
        mutate();
        persistLocked();
    } catch (...) {
        sources_ = std::move(sources);
        targets_ = std::move(targets);
        nextId_ = nextId;
        throw;
    }
}

void StateStore::saveCopy(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    writeJsonFile(path, toJsonLocked());
}

Source& StateStore::sourceLocked(EntityId id) {
    auto it = sources_.find(id);
    if (it == sources_.end()) {
        throw NotFoundError("Source #" + std::to_string(id) + " not found!", std::to_string(id));
    }
    return it->second;
}

const Source& StateStore::sourceLocked(EntityId id) const {
    auto it = sources_.find(id);
    if (it == sources_.end()) {
        throw NotFoundError("Source #" + std::to_string(id) + " not found!", std::to_string(id));
    }
    return it->second;
}

Target& StateStore::targetLocked(EntityId id) {
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        throw NotFoundError("Target #" + std::to_string(id) + " not found!", std::to_string(id));
    }
    return it->second;
}

const Target& StateStore::targetLocked(EntityId id) const {
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        throw NotFoundError("Target #" + std::to_string(id) + " not found!", std::to_string(id));
    }
    return it->second;
}

void StateStore::checkSourceAliasLocked(const std::string& alias, EntityId self) const {
    if (alias.empty()) {
        throw ConflictError("Source alias must not be empty!");
    }
    for (const auto& [id, source] : sources_) {
        if (id == self) {
            continue;
        }
        if ((source.alias && *source.alias == alias) || source.path == alias) {
            throw ConflictError("Alias '" + alias + "' already exists!");
        }
    }
}

void StateStore::checkTargetAliasLocked(const Source& source, const std::string& alias, EntityId self) const {
    if (alias.empty()) {
        throw ConflictError("Target alias must not be empty!");
    }
    for (EntityId id : source.targets) {
        if (id == self) {
            continue;
        }
        const auto& sibling = targetLocked(id);
        if ((sibling.alias && *sibling.alias == alias) || sibling.path == alias) {
            throw ConflictError("Alias '" + alias + "' already exists on source '" + source.path + "'!");
        }
    }
}

EntityId StateStore::addSource(const SourceSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);

    Source source;
    source.path = utils::normalizePath(spec.path).string();
    source.alias = spec.alias;
    source.hashAlgorithm = spec.hashAlgorithm;
    source.forceSingleHash = spec.forceSingleHash;
    source.allowlist = spec.allowlist;
    source.blocklist = spec.blocklist;

    for (const auto& [id, existing] : sources_) {
        if (existing.path == source.path) {
            throw ConflictError("Source '" + source.path + "' already exists!");
        }
        if (existing.alias && *existing.alias == source.path) {
            throw ConflictError("Source path '" + source.path + "' is already used as an alias!");
        }
    }
    if (source.alias) {
        checkSourceAliasLocked(*source.alias, 0);
    }

    commitLocked([&]() {
        source.id = nextId_++;
        sources_.emplace(source.id, source);
    });

    Logger::info("Staged source " + source.path + (source.alias ? " (alias " + *source.alias + ")" : ""));
    return source.id;
}

EntityId StateStore::addTarget(EntityId sourceId, const TargetSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto& source = sourceLocked(sourceId);

    Target target;
    target.sourceId = sourceId;
    target.path = utils::normalizePath(spec.path).string();
    target.alias = spec.alias;
    target.verify = spec.verify;

    if (target.path == source.path) {
        throw ConflictError("Target '" + target.path + "' is the source itself!");
    }
    for (EntityId id : source.targets) {
        const auto& sibling = targetLocked(id);
        if (sibling.path == target.path) {
            throw ConflictError("Target '" + target.path + "' already exists on source '" + source.path + "'!");
        }
        if (sibling.alias && *sibling.alias == target.path) {
            throw ConflictError("Target path '" + target.path + "' is already used as an alias on source '" +
                                source.path + "'!");
        }
    }
    if (target.alias) {
        checkTargetAliasLocked(source, *target.alias, 0);
    }

    commitLocked([&]() {
        target.id = nextId_++;
        targets_.emplace(target.id, target);
        sourceLocked(sourceId).targets.push_back(target.id);
    });

    Logger::info("Added target " + target.path + " to source " + source.label());
    return target.id;
}

void StateStore::removeSource(EntityId sourceId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto& source = sourceLocked(sourceId);
    if (isRunningStatus(source.status)) {
        throw ConflictError("Cannot remove source '" + source.path + "' while it is being hashed!");
    }
    for (EntityId id : source.targets) {
        if (isRunningStatus(targetLocked(id).status)) {
            throw ConflictError("Cannot remove source '" + source.path + "' while target '" +
                                targetLocked(id).path + "' is in use!");
        }
    }

    const std::string path = source.path;
    commitLocked([&]() {
        for (EntityId id : sourceLocked(sourceId).targets) {
            targets_.erase(id);
        }
        sources_.erase(sourceId);
    });
    Logger::info("Removed source " + path);
}

void StateStore::removeTarget(EntityId targetId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto& target = targetLocked(targetId);
    if (isRunningStatus(target.status)) {
        throw ConflictError("Cannot remove target '" + target.path + "' while it is in use!");
    }

    const std::string path = target.path;
    const EntityId sourceId = target.sourceId;
    commitLocked([&]() {
        auto& siblings = sourceLocked(sourceId).targets;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), targetId), siblings.end());
        targets_.erase(targetId);
    });
    Logger::info("Removed target " + path);
}

void StateStore::transition(EntityId sourceId, SourceStatus newStatus, const TransitionEvidence& evidence) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& source = sourceLocked(sourceId);
    if (!sourceTransitionAllowed(source.status, newStatus)) {
        throw ConflictError("Source '" + source.label() + "' cannot go from " + toString(source.status) +
                            " to " + toString(newStatus));
    }
    if (newStatus == SourceStatus::Hashed && !evidence.hashFile) {
        throw ConflictError("Source '" + source.label() + "' cannot be marked Hashed without a hash file");
    }

    commitLocked([&]() {
        source.status = newStatus;
        switch (newStatus) {
            case SourceStatus::Hashing:
                source.error.reset();
                break;
            case SourceStatus::Hashed:
                source.hashFile = evidence.hashFile;
                if (evidence.hashLogFile) {
                    source.hashLogFile = evidence.hashLogFile;
                }
                break;
            case SourceStatus::HashFailed:
                source.error = printableError(evidence.error);
                if (evidence.hashLogFile) {
                    source.hashLogFile = evidence.hashLogFile;
                }
                break;
            case SourceStatus::Unhashed:
                break;
        }
    });
}

void StateStore::transition(EntityId targetId, TargetStatus newStatus, const TransitionEvidence& evidence) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& target = targetLocked(targetId);
    const auto& source = sourceLocked(target.sourceId);

    if (!targetTransitionAllowed(target.status, newStatus)) {
        throw ConflictError("Target '" + target.label() + "' cannot go from " + toString(target.status) +
                            " to " + toString(newStatus));
    }
    // Nothing may be transferred or verified before its source is hashed
    if (newStatus != TargetStatus::Pending && source.status != SourceStatus::Hashed) {
        throw ConflictError("Target '" + target.label() + "' cannot go to " + toString(newStatus) +
                            " while source '" + source.label() + "' is " + toString(source.status));
    }

    commitLocked([&]() {
        target.status = newStatus;
        switch (newStatus) {
            case TargetStatus::Transferring:
                target.error.reset();
                target.verified.reset();
                break;
            case TargetStatus::Verifying:
                target.error.reset();
                break;
            case TargetStatus::TransferFailed:
                target.error = printableError(evidence.error);
                break;
            case TargetStatus::Verified:
            case TargetStatus::VerifyFailed:
                target.verified = evidence.verified;
                target.error = printableError(evidence.error);
                break;
            case TargetStatus::Pending:
            case TargetStatus::Transferred:
                break;
        }
    });
}

void StateStore::reset(EntityId entityId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (sources_.count(entityId)) {
        auto& source = sources_.at(entityId);
        if (source.status != SourceStatus::HashFailed) {
            throw ConflictError("Source '" + source.label() + "' is " + toString(source.status) +
                                ", only failed stages can be reset");
        }
        commitLocked([&]() {
            source.status = SourceStatus::Unhashed;
            source.error.reset();
        });
        Logger::info("Reset source " + source.label() + " to " + toString(source.status));
        return;
    }

    auto& target = targetLocked(entityId);
    if (target.status != TargetStatus::TransferFailed && target.status != TargetStatus::VerifyFailed) {
        throw ConflictError("Target '" + target.label() + "' is " + toString(target.status) +
                            ", only failed stages can be reset");
    }
    commitLocked([&]() {
        target.status = target.status == TargetStatus::TransferFailed ? TargetStatus::Pending
                                                                      : TargetStatus::Transferred;
        target.error.reset();
    });
    Logger::info("Reset target " + target.label() + " to " + toString(target.status));
}

void StateStore::setSourceField(EntityId sourceId, const std::string& field,
                                const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& source = sourceLocked(sourceId);
    const bool listField = field == "allowlist" || field == "blocklist";
    if (!listField && values.size() != 1) {
        throw std::invalid_argument("Field '" + field + "' takes exactly one value");
    }

    if (field == "alias") {
        if (!values[0].empty()) {
            checkSourceAliasLocked(values[0], sourceId);
        }
        commitLocked([&]() {
            source.alias = values[0].empty() ? std::nullopt : std::optional<std::string>(values[0]);
        });
    } else if (field == "hash_algorithm") {
        commitLocked([&]() { source.hashAlgorithm = values[0]; });
    } else if (field == "force_single_hash") {
        commitLocked([&]() { source.forceSingleHash = utils::boolFromString(values[0]); });
    } else if (field == "allowlist") {
        commitLocked([&]() { source.allowlist = values; });
    } else if (field == "blocklist") {
        commitLocked([&]() { source.blocklist = values; });
    } else {
        throw std::invalid_argument("Unknown or read-only source field '" + field + "'");
    }
}

void StateStore::setTargetField(EntityId targetId, const std::string& field,
                                const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& target = targetLocked(targetId);
    if (values.size() != 1) {
        throw std::invalid_argument("Field '" + field + "' takes exactly one value");
    }

    if (field == "alias") {
        if (!values[0].empty()) {
            checkTargetAliasLocked(sourceLocked(target.sourceId), values[0], targetId);
        }
        commitLocked([&]() {
            target.alias = values[0].empty() ? std::nullopt : std::optional<std::string>(values[0]);
        });
    } else if (field == "verify") {
        commitLocked([&]() { target.verify = utils::boolFromString(values[0]); });
    } else {
        throw std::invalid_argument("Unknown or read-only target field '" + field + "'");
    }
}

ResolveResult StateStore::resolveSourceLocked(const std::string& key) const {
    std::optional<EntityId> byAlias;
    std::optional<EntityId> byPath;
    const std::string normalized = key.empty() ? key : utils::normalizePath(key).string();

    for (const auto& [id, source] : sources_) {
        if (source.alias && *source.alias == key) {
            byAlias = id;
        }
        if (source.path == normalized) {
            byPath = id;
        }
    }

    if (byAlias && byPath && *byAlias != *byPath) {
        return ResolveResult::ambiguous();
    }
    if (byAlias) {
        return ResolveResult::found(*byAlias);
    }
    if (byPath) {
        return ResolveResult::found(*byPath);
    }
    return ResolveResult::notFound();
}

ResolveResult StateStore::resolveTargetLocked(const Source& source, const std::string& key) const {
    std::optional<EntityId> byAlias;
    std::optional<EntityId> byPath;
    const std::string normalized = key.empty() ? key : utils::normalizePath(key).string();

    for (EntityId id : source.targets) {
        const auto& target = targetLocked(id);
        if (target.alias && *target.alias == key) {
            byAlias = id;
        }
        if (target.path == normalized) {
            byPath = id;
        }
    }

    if (byAlias && byPath && *byAlias != *byPath) {
        return ResolveResult::ambiguous();
    }
    if (byAlias) {
        return ResolveResult::found(*byAlias);
    }
    if (byPath) {
        return ResolveResult::found(*byPath);
    }
    return ResolveResult::notFound();
}

ResolveResult StateStore::resolve(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<EntityId> matches;
    auto sourceMatch = resolveSourceLocked(key);
    if (sourceMatch.kind == ResolveResult::Kind::AmbiguousAlias) {
        return sourceMatch;
    }
    if (sourceMatch.kind == ResolveResult::Kind::Found) {
        matches.push_back(sourceMatch.id);
    }

    for (const auto& [id, source] : sources_) {
        auto targetMatch = resolveTargetLocked(source, key);
        if (targetMatch.kind == ResolveResult::Kind::AmbiguousAlias) {
            return targetMatch;
        }
        if (targetMatch.kind == ResolveResult::Kind::Found) {
            matches.push_back(targetMatch.id);
        }
    }

    if (matches.empty()) {
        return ResolveResult::notFound();
    }
    if (matches.size() > 1) {
        return ResolveResult::ambiguous();
    }
    return ResolveResult::found(matches.front());
}

ResolveResult StateStore::resolveSource(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolveSourceLocked(key);
}

ResolveResult StateStore::resolveTarget(EntityId sourceId, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolveTargetLocked(sourceLocked(sourceId), key);
}

EntityId StateStore::requireSource(const std::string& key) const {
    auto result = resolveSource(key);
    switch (result.kind) {
        case ResolveResult::Kind::Found:
            return result.id;
        case ResolveResult::Kind::AmbiguousAlias:
            throw AliasConflictError("'" + key + "' matches more than one source!", key);
        case ResolveResult::Kind::NotFound:
            break;
    }
    throw NotFoundError("Source '" + key + "' not found!", key);
}

EntityId StateStore::requireTarget(EntityId sourceId, const std::string& key) const {
    auto result = resolveTarget(sourceId, key);
    switch (result.kind) {
        case ResolveResult::Kind::Found:
            return result.id;
        case ResolveResult::Kind::AmbiguousAlias:
            throw AliasConflictError("'" + key + "' matches more than one target!", key);
        case ResolveResult::Kind::NotFound:
            break;
    }
    throw NotFoundError("Target '" + key + "' not found on source '" + getSource(sourceId).path + "'!", key);
}

bool StateStore::isSource(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.count(id) > 0;
}

bool StateStore::isTarget(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.count(id) > 0;
}

Source StateStore::getSource(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sourceLocked(id);
}

Target StateStore::getTarget(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targetLocked(id);
}

StateSnapshot StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StateSnapshot result;
    result.sources.reserve(sources_.size());
    for (const auto& [id, source] : sources_) {
        result.sources.push_back(source);
    }
    result.targets.reserve(targets_.size());
    for (const auto& [id, target] : targets_) {
        result.targets.push_back(target);
    }
    return result;
}

std::string StateStore::describe(std::optional<EntityId> sourceId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto describeSource = [this](const Source& source) {
        json result = sourceToJson(source);
        result["targets"] = json::array();
        for (EntityId id : source.targets) {
            result["targets"].push_back(targetToJson(targetLocked(id)));
        }
        return result;
    };

    if (sourceId) {
        return describeSource(sourceLocked(*sourceId)).dump(2, ' ', false, json::error_handler_t::replace);
    }

    json all = json::array();
    for (const auto& [id, source] : sources_) {
        all.push_back(describeSource(source));
    }
    return all.dump(2, ' ', false, json::error_handler_t::replace);
}
