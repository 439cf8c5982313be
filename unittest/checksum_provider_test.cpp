#include <gtest/gtest.h>
#include "backup/checksum_provider.hpp"
#include "backup/copy_provider.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

class ChecksumProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = temp_.path() / "docs";
        writeFile(source_ / "a.txt", "alpha");
        writeFile(source_ / "sub" / "b.txt", "bravo");
        writeFile(source_ / "scratch.tmp", "temporary");
    }

    static std::vector<std::string> entries(const std::string& hashFile) {
        std::vector<std::string> lines;
        std::istringstream in(readFile(hashFile));
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line[0] != '#') {
                lines.push_back(line.substr(line.find("  ") + 2));
            }
        }
        return lines;
    }

    TempDir temp_;
    fs::path source_;
    OpenSslChecksumProvider provider_;
};

TEST_F(ChecksumProviderTest, DigestMatchesKnownVector) {
    writeFile(temp_.path() / "abc", "abc");
    EXPECT_EQ(OpenSslChecksumProvider::fileDigest(temp_.file("abc"), "sha256"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_THROW(OpenSslChecksumProvider::fileDigest(temp_.file("abc"), "no-such-digest"), std::runtime_error);
    EXPECT_THROW(OpenSslChecksumProvider::fileDigest(temp_.file("missing"), "sha256"), std::runtime_error);
}

TEST_F(ChecksumProviderTest, ChecksumFileIsWrittenInsideTheSource) {
    ChecksumOptions options;
    options.blocklist = {"*.tmp"};
    const std::string logFile = temp_.file("hash.log");

    ChecksumFileInfo info = provider_.createChecksums(source_.string(), options, logFile);

    EXPECT_EQ(info.files, 2u);
    const fs::path hashFile(info.hashFile);
    EXPECT_EQ(hashFile.parent_path(), source_);
    EXPECT_EQ(hashFile.extension(), ".cshd");
    EXPECT_EQ(hashFile.filename().string().rfind("docs_bh_", 0), 0u);
    EXPECT_EQ(entries(info.hashFile), (std::vector<std::string>{"a.txt", "sub/b.txt"}));
    EXPECT_NE(readFile(logFile).find("sub/b.txt"), std::string::npos);
}

TEST_F(ChecksumProviderTest, SingleHashUsesTheAlgorithmAsExtension) {
    ChecksumOptions options;
    options.algorithm = "sha256";
    options.forceSingleHash = true;

    ChecksumFileInfo info = provider_.createChecksums(source_.string(), options, "");
    EXPECT_EQ(fs::path(info.hashFile).extension(), ".sha256");
    EXPECT_EQ(info.files, 3u);
}

TEST_F(ChecksumProviderTest, AllowlistTakesPrecedence) {
    ChecksumOptions options;
    options.allowlist = {"sub/*"};
    options.blocklist = {"*.txt"};
    EXPECT_TRUE(OpenSslChecksumProvider::isSelected("sub/b.txt", options));
    EXPECT_FALSE(OpenSslChecksumProvider::isSelected("a.txt", options));

    options.allowlist.clear();
    EXPECT_FALSE(OpenSslChecksumProvider::isSelected("sub/b.txt", options));
    EXPECT_TRUE(OpenSslChecksumProvider::isSelected("scratch.tmp", options));
}

TEST_F(ChecksumProviderTest, UnknownAlgorithmFailsBeforeWriting) {
    ChecksumOptions options;
    options.algorithm = "no-such-digest";
    EXPECT_THROW(provider_.createChecksums(source_.string(), options, ""), std::runtime_error);

    size_t checksumFiles = 0;
    for (const auto& entry : fs::directory_iterator(source_)) {
        if (entry.path().filename().string().find("_bh_") != std::string::npos) {
            checksumFiles++;
        }
    }
    EXPECT_EQ(checksumFiles, 0u);
}

TEST_F(ChecksumProviderTest, IntactCopyVerifiesClean) {
    ChecksumFileInfo info = provider_.createChecksums(source_.string(), ChecksumOptions(), "");

    FilesystemCopyProvider copier;
    const fs::path target = temp_.path() / "disk1" / "out";
    EXPECT_EQ(copier.copyTree(source_.string(), target.string()), 4u);

    const fs::path copiedHashFile = target / fs::path(info.hashFile).filename();
    VerifiedInfo result = provider_.verifyChecksums(copiedHashFile.string(), target.string(), temp_.file("v.log"));
    EXPECT_EQ(result.files, 3u);
    EXPECT_TRUE(result.passed());
    EXPECT_EQ(result.logFile, temp_.file("v.log"));
}

TEST_F(ChecksumProviderTest, DamagedCopyReportsMismatchesAndMissingFiles) {
    ChecksumFileInfo info = provider_.createChecksums(source_.string(), ChecksumOptions(), "");

    FilesystemCopyProvider copier;
    const fs::path target = temp_.path() / "out";
    copier.copyTree(source_.string(), target.string());
    writeFile(target / "a.txt", "tampered");
    fs::remove(target / "sub" / "b.txt");

    const std::string logFile = temp_.file("verify.log");
    const fs::path copiedHashFile = target / fs::path(info.hashFile).filename();
    VerifiedInfo result = provider_.verifyChecksums(copiedHashFile.string(), target.string(), logFile);

    EXPECT_EQ(result.files, 3u);
    EXPECT_EQ(result.crcErrors, 1u);
    EXPECT_EQ(result.missing, 1u);
    EXPECT_FALSE(result.passed());
    EXPECT_NE(readFile(logFile).find("missing: sub/b.txt"), std::string::npos);
    EXPECT_NE(readFile(logFile).find("checksum mismatch: a.txt"), std::string::npos);
}

TEST_F(ChecksumProviderTest, MissingChecksumFileThrows) {
    EXPECT_THROW(provider_.verifyChecksums(temp_.file("none.cshd"), source_.string(), ""), std::runtime_error);
}

TEST_F(ChecksumProviderTest, CopyFailsBelowARegularFile) {
    writeFile(temp_.path() / "blocker", "not a directory");
    FilesystemCopyProvider copier;
    EXPECT_THROW(copier.copyTree(source_.string(), (temp_.path() / "blocker" / "out").string()),
                 fs::filesystem_error);
}
