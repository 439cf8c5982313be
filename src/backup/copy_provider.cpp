#include "backup/copy_provider.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

uint64_t FilesystemCopyProvider::copyTree(const std::string& source, const std::string& destination) {
    const fs::path from = utils::normalizePath(source);
    const fs::path to = utils::normalizePath(destination);

    if (!fs::is_directory(from)) {
        throw std::runtime_error("Source is not a directory: " + from.string());
    }
    // Throws fs::filesystem_error if a parent is not a directory or not writable
    fs::create_directories(to);

    uint64_t copied = 0;
    for (const auto& entry : fs::recursive_directory_iterator(from)) {
        const fs::path relative = entry.path().lexically_relative(from);
        const fs::path destinationPath = to / relative;
        if (entry.is_directory()) {
            fs::create_directories(destinationPath);
        } else if (entry.is_regular_file()) {
            fs::create_directories(destinationPath.parent_path());
            fs::copy_file(entry.path(), destinationPath, fs::copy_options::overwrite_existing);
            copied++;
        } else {
            Logger::warning("Skipping special file " + entry.path().string());
        }
    }

    Logger::debug("Copied " + std::to_string(copied) + " files from " + from.string() + " to " + to.string());
    return copied;
}
