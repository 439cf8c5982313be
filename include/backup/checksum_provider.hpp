#pragma once

#include "state/entities.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct ChecksumOptions {
    std::string algorithm = "sha512";
    bool forceSingleHash = false;
    std::vector<std::string> allowlist;
    std::vector<std::string> blocklist;
};

struct ChecksumFileInfo {
    std::string hashFile;
    uint64_t files = 0;
};

// Creates and checks checksum files covering every file below a directory
class ChecksumProvider {
public:
    virtual ~ChecksumProvider() = default;

    // Writes the checksum file inside directory. Throws on I/O or digest errors.
    virtual ChecksumFileInfo createChecksums(const std::string& directory,
                                             const ChecksumOptions& options,
                                             const std::string& logFile) = 0;

    // Checks the files below directory against hashFile. Mismatches and missing
    // files are counted, not thrown; an unreadable hashFile throws.
    virtual VerifiedInfo verifyChecksums(const std::string& hashFile,
                                         const std::string& directory,
                                         const std::string& logFile) = 0;
};

// Checksum file layout:
//   # algorithm: <openssl digest name>
//   <hex digest>  <path relative to the directory>
class OpenSslChecksumProvider : public ChecksumProvider {
public:
    ChecksumFileInfo createChecksums(const std::string& directory,
                                     const ChecksumOptions& options,
                                     const std::string& logFile) override;
    VerifiedInfo verifyChecksums(const std::string& hashFile,
                                 const std::string& directory,
                                 const std::string& logFile) override;

    // Hex digest of a file, throws std::runtime_error
    static std::string fileDigest(const std::string& path, const std::string& algorithm);
    static std::string checksumFileName(const std::string& directory, const ChecksumOptions& options);
    static bool isSelected(const std::string& relativePath, const ChecksumOptions& options);
};
