#include <gtest/gtest.h>
#include "scheduler/operation_scheduler.hpp"
#include "test_helpers.hpp"
#include <filesystem>

namespace fs = std::filesystem;

// Runs the real checksum and copy stages against temporary directories
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        docs_ = temp_.path() / "docs";
        writeFile(docs_ / "report.txt", "quarterly numbers");
        writeFile(docs_ / "photos" / "a.jpg", std::string(4096, 'x'));
        writeFile(docs_ / "photos" / "b.jpg", std::string(100, 'y'));

        store_ = StateStore::open(temp_.file("backup_status.json"));
        options_.workers = 2;
        options_.logDirectory = temp_.path().string();
    }

    EntityId stageDocs() {
        SourceSpec spec;
        spec.path = docs_.string();
        spec.alias = "docs";
        spec.hashAlgorithm = "sha256";
        return store_->addSource(spec);
    }

    EntityId addTarget(EntityId sourceId, const fs::path& path, const std::string& alias) {
        TargetSpec spec;
        spec.path = path.string();
        spec.alias = alias;
        return store_->addTarget(sourceId, spec);
    }

    RunReport runAll() {
        OperationScheduler scheduler(*store_, disks_, StageExecutors::standard(), options_);
        return scheduler.run();
    }

    TempDir temp_;
    fs::path docs_;
    std::unique_ptr<StateStore> store_;
    DiskResourceManager disks_;
    SchedulerOptions options_;
};

TEST_F(EndToEndTest, BacksUpToTwoTargets) {
    const EntityId docs = stageDocs();
    const EntityId s1 = addTarget(docs, temp_.path() / "disk1" / "out", "s1");
    const EntityId s2 = addTarget(docs, temp_.path() / "disk2" / "out", "s2");

    RunReport report = runAll();

    EXPECT_FALSE(report.anyFailed()) << report.toString();
    EXPECT_EQ(report.executed, 5u);
    EXPECT_EQ(report.summary.files, 6u);
    EXPECT_EQ(report.summary.crcErrors, 0u);

    const Source source = store_->getSource(docs);
    ASSERT_TRUE(source.hashFile.has_value());
    EXPECT_TRUE(fs::exists(*source.hashFile));
    ASSERT_TRUE(source.hashLogFile.has_value());
    EXPECT_TRUE(fs::exists(*source.hashLogFile));

    for (EntityId id : {s1, s2}) {
        const Target target = store_->getTarget(id);
        EXPECT_EQ(target.status, TargetStatus::Verified);
        ASSERT_TRUE(target.verified.has_value());
        EXPECT_EQ(target.verified->files, 3u);
        EXPECT_TRUE(fs::exists(target.verified->logFile));
        EXPECT_EQ(readFile(fs::path(target.path) / "photos" / "a.jpg"), std::string(4096, 'x'));
        EXPECT_TRUE(fs::exists(fs::path(target.path) / fs::path(*source.hashFile).filename()));
    }
}

TEST_F(EndToEndTest, BrokenTargetDoesNotStopTheOther) {
    writeFile(temp_.path() / "disk2", "a regular file where a directory should be");

    const EntityId docs = stageDocs();
    const EntityId s1 = addTarget(docs, temp_.path() / "disk1" / "out", "s1");
    const EntityId s2 = addTarget(docs, temp_.path() / "disk2" / "out", "s2");

    RunReport report = runAll();

    EXPECT_TRUE(report.anyFailed());
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].label, "Transfer(docs,s2)");
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].label, "Verify(docs,s2)");

    EXPECT_EQ(store_->getTarget(s1).status, TargetStatus::Verified);
    EXPECT_EQ(store_->getTarget(s2).status, TargetStatus::TransferFailed);
    EXPECT_TRUE(store_->getTarget(s2).error.has_value());
}

TEST_F(EndToEndTest, CorruptedCopyFailsVerification) {
    const EntityId docs = stageDocs();
    const fs::path out = temp_.path() / "disk1" / "out";
    const EntityId s1 = addTarget(docs, out, "s1");

    RunScope transferOnly;
    transferOnly.upTo = StageKind::Transfer;
    OperationScheduler(*store_, disks_, StageExecutors::standard(), options_).run(transferOnly);
    ASSERT_EQ(store_->getTarget(s1).status, TargetStatus::Transferred);

    writeFile(out / "report.txt", "tampered numbers");
    RunReport report = runAll();

    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].label, "Verify(docs,s1)");
    EXPECT_EQ(report.summary.crcErrors, 1u);

    const Target target = store_->getTarget(s1);
    EXPECT_EQ(target.status, TargetStatus::VerifyFailed);
    ASSERT_TRUE(target.verified.has_value());
    EXPECT_NE(readFile(target.verified->logFile).find("checksum mismatch: report.txt"), std::string::npos);
}
