#pragma once

#include <cstdint>
#include <string>

// Copies the contents of a source directory into a destination directory
class CopyProvider {
public:
    virtual ~CopyProvider() = default;

    // Returns the number of files copied. Throws on any I/O error.
    virtual uint64_t copyTree(const std::string& source, const std::string& destination) = 0;
};

class FilesystemCopyProvider : public CopyProvider {
public:
    uint64_t copyTree(const std::string& source, const std::string& destination) override;
};
