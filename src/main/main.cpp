#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // Check for help flag first, before any initialization
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        BackupCLI::printUsage(std::cout);
        return args.empty() ? 1 : 0;
    }

    BackupConfig config;
    try {
        config = BackupCLI::parseGlobalOptions(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const std::string logPath = (std::filesystem::path(config.workingDirectory()) / "coldstage.log").string();
    if (!Logger::initialize(logPath, config.logLevel)) {
        std::cerr << "Failed to initialize logger at " << logPath << std::endl;
        return 1;
    }

    BackupCLI cli(config);
    const int status = cli.run(args);
    Logger::shutdown();
    return status;
}
