#pragma once

#include "backup/backup_config.hpp"
#include "scheduler/disk_resource_manager.hpp"
#include "scheduler/operation_scheduler.hpp"
#include "state/state_store.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class InteractiveSession;

class BackupCLI {
public:
    explicit BackupCLI(BackupConfig config, std::istream& in = std::cin, std::ostream& out = std::cout);
    ~BackupCLI();

    // Runs one command and returns the process exit status
    int run(const std::vector<std::string>& args);
    static void printUsage(std::ostream& out);

    // Consumes the leading global options of args. The config file is applied
    // first, the other options override it. Throws std::invalid_argument.
    static BackupConfig parseGlobalOptions(std::vector<std::string>& args);

private:
    int dispatch(const std::string& command, const std::vector<std::string>& args);
    int handleStageCommand(const std::vector<std::string>& args);
    int handleAddTargetCommand(const std::vector<std::string>& args);
    int handleModifyCommand(const std::vector<std::string>& args);
    int handleResetCommand(const std::vector<std::string>& args);
    int handleRemoveCommand(const std::vector<std::string>& args);
    int handleRunCommand(StageKind upTo, const std::vector<std::string>& args);
    int handleStatusCommand(const std::vector<std::string>& args);
    int handleInteractiveCommand();
    void printInteractiveHelp() const;
    void printSessionStatus(const InteractiveSession& session) const;

    // Splits "<source> [--target T] rest..." into ids and the remaining words
    EntityId parseEntity(const std::vector<std::string>& args, std::optional<EntityId>& targetId,
                         std::vector<std::string>& rest);
    SchedulerOptions schedulerOptions() const;
    void saveCrashCopy();

    StateStore& store();

    BackupConfig config_;
    std::istream& in_;
    std::ostream& out_;
    std::unique_ptr<StateStore> store_;
    DiskResourceManager disks_;
    InteractiveSession* session_ = nullptr;
};
