#include <gtest/gtest.h>
#include "state/state_store.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        statePath_ = temp_.file("backup_status.json");
        store_ = StateStore::open(statePath_);
    }

    EntityId stage(const std::string& path, const std::string& alias = "") {
        SourceSpec spec;
        spec.path = path;
        if (!alias.empty()) {
            spec.alias = alias;
        }
        return store_->addSource(spec);
    }

    EntityId addTarget(EntityId sourceId, const std::string& path, const std::string& alias = "") {
        TargetSpec spec;
        spec.path = path;
        if (!alias.empty()) {
            spec.alias = alias;
        }
        return store_->addTarget(sourceId, spec);
    }

    void markHashed(EntityId sourceId) {
        store_->transition(sourceId, SourceStatus::Hashing);
        TransitionEvidence evidence;
        evidence.hashFile = "/data/docs/docs_bh.cshd";
        store_->transition(sourceId, SourceStatus::Hashed, evidence);
    }

    TempDir temp_;
    std::string statePath_;
    std::unique_ptr<StateStore> store_;
};

TEST_F(StateStoreTest, MissingFileStartsEmpty) {
    auto snapshot = store_->snapshot();
    EXPECT_TRUE(snapshot.sources.empty());
    EXPECT_TRUE(snapshot.targets.empty());
    EXPECT_EQ(store_->recoveredStages(), 0u);
}

TEST_F(StateStoreTest, SourcesAreKeyedByNormalizedPath) {
    const EntityId id = stage("/data/docs/", "docs");
    EXPECT_EQ(store_->getSource(id).path, "/data/docs");

    EXPECT_EQ(store_->requireSource("docs"), id);
    EXPECT_EQ(store_->requireSource("/data/docs"), id);
    EXPECT_EQ(store_->requireSource("/data/./docs/"), id);
    EXPECT_THROW(store_->requireSource("/data/other"), NotFoundError);
    EXPECT_THROW(stage("/data/docs"), ConflictError);
}

TEST_F(StateStoreTest, DuplicateSourceAliasKeepsTheFirst) {
    const EntityId first = stage("/data/a", "docs");
    EXPECT_THROW(stage("/data/b", "docs"), ConflictError);

    auto snapshot = store_->snapshot();
    ASSERT_EQ(snapshot.sources.size(), 1u);
    EXPECT_EQ(snapshot.sources[0].path, "/data/a");
    EXPECT_EQ(store_->requireSource("docs"), first);
}

TEST_F(StateStoreTest, TargetAliasesAreScopedPerSource) {
    const EntityId a = stage("/data/a", "a");
    const EntityId b = stage("/data/b", "b");
    const EntityId targetA = addTarget(a, "/disk1/out", "s1");
    const EntityId targetB = addTarget(b, "/disk1/out_b", "s1");

    EXPECT_THROW(addTarget(a, "/disk2/out", "s1"), ConflictError);
    EXPECT_THROW(addTarget(a, "/disk1/out"), ConflictError);
    EXPECT_THROW(addTarget(a, "/data/a"), ConflictError);

    EXPECT_EQ(store_->requireTarget(a, "s1"), targetA);
    EXPECT_EQ(store_->requireTarget(b, "s1"), targetB);
    EXPECT_EQ(store_->resolve("s1").kind, ResolveResult::Kind::AmbiguousAlias);
    EXPECT_EQ(store_->getSource(a).targets, std::vector<EntityId>{targetA});
}

TEST_F(StateStoreTest, AliasSharedAcrossKindsIsAmbiguous) {
    const EntityId source = stage("/data/a", "x");
    const EntityId target = addTarget(source, "/disk1/out", "x");

    EXPECT_EQ(store_->resolve("x").kind, ResolveResult::Kind::AmbiguousAlias);
    EXPECT_EQ(store_->requireSource("x"), source);
    EXPECT_EQ(store_->requireTarget(source, "x"), target);

    auto byPath = store_->resolve("/disk1/out");
    ASSERT_EQ(byPath.kind, ResolveResult::Kind::Found);
    EXPECT_EQ(byPath.id, target);
}

TEST_F(StateStoreTest, AliasMayNotShadowAnotherSourcePath) {
    const EntityId a = stage("/data/a");
    const EntityId b = stage("/data/b");
    EXPECT_THROW(store_->setSourceField(b, "alias", {"/data/a"}), ConflictError);
    EXPECT_FALSE(store_->getSource(b).alias.has_value());
    EXPECT_EQ(store_->requireSource("/data/a"), a);
}

TEST_F(StateStoreTest, TransferBeforeHashIsAConflict) {
    const EntityId source = stage("/data/docs");
    const EntityId target = addTarget(source, "/disk1/out");

    EXPECT_THROW(store_->transition(target, TargetStatus::Transferring), ConflictError);
    EXPECT_EQ(store_->getTarget(target).status, TargetStatus::Pending);

    store_->transition(source, SourceStatus::Hashing);
    EXPECT_THROW(store_->transition(target, TargetStatus::Transferring), ConflictError);
    EXPECT_THROW(store_->transition(source, SourceStatus::Hashed), ConflictError);
}

TEST_F(StateStoreTest, OutOfOrderTransitionsAreRejected) {
    const EntityId source = stage("/data/docs");
    const EntityId target = addTarget(source, "/disk1/out");
    markHashed(source);

    EXPECT_THROW(store_->transition(target, TargetStatus::Transferred), ConflictError);
    EXPECT_THROW(store_->transition(target, TargetStatus::Verifying), ConflictError);
    EXPECT_THROW(store_->transition(source, SourceStatus::Hashing), ConflictError);

    store_->transition(target, TargetStatus::Transferring);
    store_->transition(target, TargetStatus::Transferred);
    store_->transition(target, TargetStatus::Verifying);
    store_->transition(target, TargetStatus::Verified);
    EXPECT_EQ(store_->getTarget(target).status, TargetStatus::Verified);
}

TEST_F(StateStoreTest, EveryMutationIsPersisted) {
    const EntityId source = stage("/data/docs", "docs");
    const EntityId target = addTarget(source, "/disk1/out", "s1");
    markHashed(source);
    store_->transition(target, TargetStatus::Transferring);
    store_->transition(target, TargetStatus::Transferred);
    store_->transition(target, TargetStatus::Verifying);

    TransitionEvidence evidence;
    VerifiedInfo info;
    info.files = 3;
    info.crcErrors = 1;
    info.logFile = "/disk1/out_verify.log";
    evidence.verified = info;
    evidence.error = "1 checksum mismatch";
    store_->transition(target, TargetStatus::VerifyFailed, evidence);

    auto reopened = StateStore::open(statePath_);
    const Source loadedSource = reopened->getSource(source);
    EXPECT_EQ(loadedSource.alias, std::optional<std::string>("docs"));
    EXPECT_EQ(loadedSource.status, SourceStatus::Hashed);
    EXPECT_EQ(loadedSource.hashFile, std::optional<std::string>("/data/docs/docs_bh.cshd"));

    const Target loadedTarget = reopened->getTarget(target);
    EXPECT_EQ(loadedTarget.status, TargetStatus::VerifyFailed);
    ASSERT_TRUE(loadedTarget.verified.has_value());
    EXPECT_EQ(loadedTarget.verified->files, 3u);
    EXPECT_EQ(loadedTarget.verified->crcErrors, 1u);
    EXPECT_EQ(loadedTarget.error, std::optional<std::string>("1 checksum mismatch"));

    // Ids keep increasing across restarts
    SourceSpec spec;
    spec.path = "/data/more";
    EXPECT_GT(reopened->addSource(spec), target);
}

TEST_F(StateStoreTest, InterruptedStagesAreRecoveredOnOpen) {
    const EntityId hashed = stage("/data/a");
    const EntityId copying = addTarget(hashed, "/disk1/a");
    const EntityId checking = addTarget(hashed, "/disk2/a");
    const EntityId hashing = stage("/data/b");

    markHashed(hashed);
    store_->transition(copying, TargetStatus::Transferring);
    store_->transition(checking, TargetStatus::Transferring);
    store_->transition(checking, TargetStatus::Transferred);
    store_->transition(checking, TargetStatus::Verifying);
    store_->transition(hashing, SourceStatus::Hashing);
    store_.reset();

    auto recovered = StateStore::open(statePath_);
    EXPECT_EQ(recovered->recoveredStages(), 3u);
    EXPECT_EQ(recovered->getSource(hashing).status, SourceStatus::Unhashed);
    EXPECT_EQ(recovered->getSource(hashed).status, SourceStatus::Hashed);
    EXPECT_EQ(recovered->getTarget(copying).status, TargetStatus::Pending);
    EXPECT_EQ(recovered->getTarget(checking).status, TargetStatus::Transferred);

    // The recovery itself was persisted
    EXPECT_EQ(StateStore::open(statePath_)->recoveredStages(), 0u);
}

TEST_F(StateStoreTest, CorruptStateIsFatal) {
    writeFile(statePath_, "{ this is not json");
    EXPECT_THROW(StateStore::open(statePath_), PersistenceError);

    writeFile(statePath_, R"({"version": 1, "type": "BackupState", "next_id": 3,
        "sources": [],
        "targets": [{"id": 2, "source_id": 1, "path": "/x", "alias": null, "verify": true,
                     "status": "Pending", "error": null, "verified": null}]})");
    EXPECT_THROW(StateStore::open(statePath_), PersistenceError);

    writeFile(statePath_, R"({"version": 1, "type": "BackupState", "next_id": 2,
        "sources": [{"id": 1, "path": "/x", "alias": null, "status": "Sleeping",
                     "hash_algorithm": "sha512", "force_single_hash": false, "allowlist": [],
                     "blocklist": [], "hash_file": null, "hash_log_file": null, "error": null,
                     "targets": []}],
        "targets": []})");
    EXPECT_THROW(StateStore::open(statePath_), PersistenceError);
}

TEST_F(StateStoreTest, FailedWriteLeavesStateUnchanged) {
    StateStore store(temp_.file("missing_dir/state.json"));
    SourceSpec spec;
    spec.path = "/data/docs";
    EXPECT_THROW(store.addSource(spec), PersistenceError);
    EXPECT_TRUE(store.snapshot().sources.empty());
    EXPECT_FALSE(store.isSource(1));
}

TEST_F(StateStoreTest, ResetReturnsFailedStagesToQueued) {
    const EntityId source = stage("/data/docs");
    const EntityId target = addTarget(source, "/disk1/out");
    EXPECT_THROW(store_->reset(source), ConflictError);

    store_->transition(source, SourceStatus::Hashing);
    store_->transition(source, SourceStatus::HashFailed, TransitionEvidence::failure("disk gone"));
    EXPECT_EQ(store_->getSource(source).error, std::optional<std::string>("disk gone"));
    store_->reset(source);
    EXPECT_EQ(store_->getSource(source).status, SourceStatus::Unhashed);
    EXPECT_FALSE(store_->getSource(source).error.has_value());

    markHashed(source);
    store_->transition(target, TargetStatus::Transferring);
    store_->transition(target, TargetStatus::TransferFailed, TransitionEvidence::failure("read only"));
    store_->reset(target);
    EXPECT_EQ(store_->getTarget(target).status, TargetStatus::Pending);
}

TEST_F(StateStoreTest, RemoveIsRejectedWhileInUse) {
    const EntityId source = stage("/data/docs");
    const EntityId target = addTarget(source, "/disk1/out");
    markHashed(source);
    store_->transition(target, TargetStatus::Transferring);

    EXPECT_THROW(store_->removeTarget(target), ConflictError);
    EXPECT_THROW(store_->removeSource(source), ConflictError);

    store_->transition(target, TargetStatus::Transferred);
    store_->removeSource(source);
    EXPECT_FALSE(store_->isSource(source));
    EXPECT_FALSE(store_->isTarget(target));
}

TEST_F(StateStoreTest, ModifyChangesOptionsButNotStatus) {
    const EntityId source = stage("/data/docs", "docs");
    const EntityId other = stage("/data/other", "other");
    const EntityId target = addTarget(source, "/disk1/out");

    store_->setSourceField(source, "hash_algorithm", {"sha256"});
    store_->setSourceField(source, "blocklist", {"*.tmp", "cache/*"});
    store_->setTargetField(target, "verify", {"false"});
    EXPECT_EQ(store_->getSource(source).hashAlgorithm, "sha256");
    EXPECT_EQ(store_->getSource(source).blocklist.size(), 2u);
    EXPECT_FALSE(store_->getTarget(target).verify);

    EXPECT_THROW(store_->setSourceField(other, "alias", {"docs"}), ConflictError);
    EXPECT_THROW(store_->setSourceField(source, "status", {"Hashed"}), std::invalid_argument);
    EXPECT_THROW(store_->setTargetField(target, "path", {"/x"}), std::invalid_argument);
    EXPECT_EQ(store_->getSource(other).alias, std::optional<std::string>("other"));
}

TEST_F(StateStoreTest, DescribeRendersSourcesWithTargets) {
    const EntityId source = stage("/data/docs", "docs");
    addTarget(source, "/disk1/out", "s1");

    auto one = nlohmann::json::parse(store_->describe(source));
    EXPECT_EQ(one["alias"], "docs");
    ASSERT_EQ(one["targets"].size(), 1u);
    EXPECT_EQ(one["targets"][0]["alias"], "s1");
    EXPECT_EQ(one["targets"][0]["status"], "Pending");

    auto all = nlohmann::json::parse(store_->describe());
    EXPECT_TRUE(all.is_array());
    EXPECT_EQ(all.size(), 1u);
}

TEST_F(StateStoreTest, UnencodablePathIsRejectedAndRolledBack) {
    EXPECT_THROW(stage("/data/caf\xe9"), PersistenceError);
    EXPECT_TRUE(store_->snapshot().sources.empty());

    auto reopened = StateStore::open(statePath_);
    EXPECT_TRUE(reopened->snapshot().sources.empty());
}

TEST_F(StateStoreTest, FailureCauseIsStoredAsValidText) {
    const EntityId docs = stage("/data/docs", "docs");
    store_->transition(docs, SourceStatus::Hashing);
    store_->transition(docs, SourceStatus::HashFailed, TransitionEvidence::failure("cannot read caf\xe9.txt"));

    auto reopened = StateStore::open(statePath_);
    const Source source = reopened->getSource(docs);
    EXPECT_EQ(source.status, SourceStatus::HashFailed);
    ASSERT_TRUE(source.error.has_value());
    EXPECT_EQ(source.error->rfind("cannot read caf", 0), 0u);
    EXPECT_NE(*source.error, "cannot read caf\xe9.txt");
}
