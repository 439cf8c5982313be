#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void BackupConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json config;
    try {
        file >> config;

        if (!config.is_object()) {
            throw std::runtime_error("top level value must be an object");
        }
        if (config.contains("state_file")) {
            stateFile = config.at("state_file").get<std::string>();
        }
        if (config.contains("log_level")) {
            auto name = config.at("log_level").get<std::string>();
            if (!Logger::parseLevel(name, logLevel)) {
                throw std::runtime_error("unknown log level '" + name + "'");
            }
        }
        if (config.contains("workers")) {
            workers = config.at("workers").get<size_t>();
        }
        if (config.contains("hash_algorithm")) {
            hashAlgorithm = config.at("hash_algorithm").get<std::string>();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

std::string BackupConfig::workingDirectory() const {
    auto dir = std::filesystem::absolute(stateFile).parent_path();
    return dir.string();
}
