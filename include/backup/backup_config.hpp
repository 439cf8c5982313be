#pragma once

#include "common/logger.hpp"
#include <string>
#include <cstddef>

struct BackupConfig {
    std::string stateFile = "backup_status.json";
    LogLevel logLevel = LogLevel::INFO;
    size_t workers = 0;  // 0 means hardware concurrency
    std::string hashAlgorithm = "sha512";  // default for newly staged sources

    // Merges the keys present in a JSON config file into this config.
    // Throws std::runtime_error if the file cannot be read or a value has the wrong type.
    void loadFile(const std::string& path);

    // Directory the state file lives in, log artifacts are written there
    std::string workingDirectory() const;
};
