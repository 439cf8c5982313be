#include "backup/backup_cli.hpp"
#include "backup/stage_executor.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "session/interactive_session.hpp"
#include <filesystem>
#include <stdexcept>

namespace {

const std::string& valueOf(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

} // namespace

BackupCLI::BackupCLI(BackupConfig config, std::istream& in, std::ostream& out)
    : config_(std::move(config))
    , in_(in)
    , out_(out) {
}

BackupCLI::~BackupCLI() {
}

BackupConfig BackupCLI::parseGlobalOptions(std::vector<std::string>& args) {
    std::optional<std::string> configFile, stateFile, logLevel, workers;

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            configFile = valueOf(args, i);
        } else if (arg == "--status-file") {
            stateFile = valueOf(args, i);
        } else if (arg == "--log-level") {
            logLevel = valueOf(args, i);
        } else if (arg == "--workers") {
            workers = valueOf(args, i);
        } else {
            break;
        }
    }
    args.erase(args.begin(), args.begin() + i);

    BackupConfig config;
    if (configFile) {
        config.loadFile(*configFile);
    }
    if (stateFile) {
        config.stateFile = *stateFile;
    }
    if (logLevel && !Logger::parseLevel(*logLevel, config.logLevel)) {
        throw std::invalid_argument("Unknown log level: " + *logLevel);
    }
    if (workers) {
        config.workers = std::stoul(*workers);
    }
    return config;
}

void BackupCLI::printUsage(std::ostream& out) {
    out << "Usage: coldstage [global options] <command> [options]\n"
        << "\n"
        << "Global options:\n"
        << "  --status-file FILE     State file (default: backup_status.json)\n"
        << "  --config FILE          JSON config file\n"
        << "  --log-level LEVEL      debug, info, warning, error or fatal\n"
        << "  --workers N            Worker threads (default: one per core)\n"
        << "\n"
        << "Commands:\n"
        << "  stage <path> [--alias A] [--hash-algorithm H] [--single-hash]\n"
        << "               [--allow GLOB]... [--block GLOB]...\n"
        << "  add-target <source> <path> [--alias A] [--no-verify]\n"
        << "  modify <source> [--target T] [key [value...]]\n"
        << "  reset <source> [--target T]\n"
        << "  remove <source> [--target T]\n"
        << "  hash|transfer|verify|all [--source S] [--target T]\n"
        << "  status [--source S]\n"
        << "  interactive\n";
}

StateStore& BackupCLI::store() {
    if (!store_) {
        store_ = StateStore::open(config_.stateFile);
        if (store_->recoveredStages() > 0) {
            Logger::warning("Reset " + std::to_string(store_->recoveredStages()) +
                            " stages interrupted by a previous run");
        }
    }
    return *store_;
}

SchedulerOptions BackupCLI::schedulerOptions() const {
    SchedulerOptions options;
    options.workers = config_.workers;
    options.logDirectory = config_.workingDirectory();
    return options;
}

void BackupCLI::saveCrashCopy() {
    if (!store_) {
        return;
    }
    const std::filesystem::path statePath(config_.stateFile);
    const std::filesystem::path crashPath = utils::uniqueFilename(
        statePath.parent_path() / (statePath.stem().string() + "_crash" + statePath.extension().string()));
    try {
        store_->saveCopy(crashPath.string());
        Logger::error("State saved to " + crashPath.string());
    } catch (const PersistenceError& e) {
        Logger::error(std::string("Could not save crash copy: ") + e.what());
    }
}

int BackupCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage(out_);
        return 1;
    }

    const std::string command = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        return dispatch(command, rest);
    } catch (const BackupError& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Unexpected error: ") + e.what());
        saveCrashCopy();
        return 1;
    }
}

int BackupCLI::dispatch(const std::string& command, const std::vector<std::string>& args) {
    if (command == "-h" || command == "--help" || command == "help") {
        printUsage(out_);
        return 0;
    } else if (command == "stage") {
        return handleStageCommand(args);
    } else if (command == "add-target") {
        return handleAddTargetCommand(args);
    } else if (command == "modify") {
        return handleModifyCommand(args);
    } else if (command == "reset") {
        return handleResetCommand(args);
    } else if (command == "remove") {
        return handleRemoveCommand(args);
    } else if (command == "hash") {
        return handleRunCommand(StageKind::Hash, args);
    } else if (command == "transfer") {
        return handleRunCommand(StageKind::Transfer, args);
    } else if (command == "verify" || command == "all") {
        return handleRunCommand(StageKind::Verify, args);
    } else if (command == "status") {
        return handleStatusCommand(args);
    } else if (command == "interactive") {
        return handleInteractiveCommand();
    }

    Logger::error("Unknown command: " + command);
    printUsage(out_);
    return 1;
}

int BackupCLI::handleStageCommand(const std::vector<std::string>& args) {
    SourceSpec spec;
    spec.hashAlgorithm = config_.hashAlgorithm;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--alias") {
            spec.alias = valueOf(args, i);
        } else if (arg == "--hash-algorithm") {
            spec.hashAlgorithm = valueOf(args, i);
        } else if (arg == "--single-hash") {
            spec.forceSingleHash = true;
        } else if (arg == "--allow") {
            spec.allowlist.push_back(valueOf(args, i));
        } else if (arg == "--block") {
            spec.blocklist.push_back(valueOf(args, i));
        } else if (spec.path.empty()) {
            spec.path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    if (spec.path.empty()) {
        throw std::invalid_argument("stage needs a source path");
    }
    if (!std::filesystem::is_directory(spec.path)) {
        throw std::invalid_argument("Source is not a directory: " + spec.path);
    }

    const EntityId id = session_ ? session_->addSource(spec) : store().addSource(spec);
    out_ << "Staged " << store().getSource(id).label() << "\n";
    return 0;
}

int BackupCLI::handleAddTargetCommand(const std::vector<std::string>& args) {
    TargetSpec spec;
    std::string sourceKey;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--alias") {
            spec.alias = valueOf(args, i);
        } else if (arg == "--no-verify") {
            spec.verify = false;
        } else if (sourceKey.empty()) {
            sourceKey = arg;
        } else if (spec.path.empty()) {
            spec.path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    if (sourceKey.empty() || spec.path.empty()) {
        throw std::invalid_argument("add-target needs a source and a target path");
    }

    const EntityId sourceId = store().requireSource(sourceKey);
    const EntityId id = session_ ? session_->addTarget(sourceId, spec) : store().addTarget(sourceId, spec);
    out_ << "Added target " << store().getTarget(id).label() << " to " << store().getSource(sourceId).label() << "\n";
    return 0;
}

EntityId BackupCLI::parseEntity(const std::vector<std::string>& args, std::optional<EntityId>& targetId,
                                std::vector<std::string>& rest) {
    std::optional<std::string> sourceKey, targetKey;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--target") {
            targetKey = valueOf(args, i);
        } else if (!sourceKey) {
            sourceKey = args[i];
        } else {
            rest.push_back(args[i]);
        }
    }
    if (!sourceKey) {
        throw std::invalid_argument("Missing source");
    }

    const EntityId sourceId = store().requireSource(*sourceKey);
    if (targetKey) {
        targetId = store().requireTarget(sourceId, *targetKey);
    }
    return sourceId;
}

int BackupCLI::handleModifyCommand(const std::vector<std::string>& args) {
    std::optional<EntityId> targetId;
    std::vector<std::string> rest;
    const EntityId sourceId = parseEntity(args, targetId, rest);

    if (!rest.empty()) {
        const std::string field = rest[0];
        const std::vector<std::string> values(rest.begin() + 1, rest.end());
        if (targetId) {
            store().setTargetField(*targetId, field, values);
        } else {
            store().setSourceField(sourceId, field, values);
        }
        Logger::info("Set " + field + " to '" + utils::join(values, " ") + "'");
    }
    out_ << store().describe(sourceId) << "\n";
    return 0;
}

int BackupCLI::handleResetCommand(const std::vector<std::string>& args) {
    std::optional<EntityId> targetId;
    std::vector<std::string> rest;
    const EntityId sourceId = parseEntity(args, targetId, rest);
    if (!rest.empty()) {
        throw std::invalid_argument("Unexpected argument: " + rest[0]);
    }

    store().reset(targetId ? *targetId : sourceId);
    return 0;
}

int BackupCLI::handleRemoveCommand(const std::vector<std::string>& args) {
    std::optional<EntityId> targetId;
    std::vector<std::string> rest;
    const EntityId sourceId = parseEntity(args, targetId, rest);
    if (!rest.empty()) {
        throw std::invalid_argument("Unexpected argument: " + rest[0]);
    }

    if (targetId) {
        store().removeTarget(*targetId);
    } else {
        store().removeSource(sourceId);
    }
    return 0;
}

int BackupCLI::handleRunCommand(StageKind upTo, const std::vector<std::string>& args) {
    std::optional<std::string> sourceKey, targetKey;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--source") {
            sourceKey = valueOf(args, i);
        } else if (args[i] == "--target") {
            targetKey = valueOf(args, i);
        } else {
            throw std::invalid_argument("Unexpected argument: " + args[i]);
        }
    }
    if (targetKey && !sourceKey) {
        throw std::invalid_argument("--target needs --source");
    }

    RunScope scope;
    scope.upTo = upTo;
    if (sourceKey) {
        scope.sourceId = store().requireSource(*sourceKey);
    }
    if (targetKey) {
        scope.targetId = store().requireTarget(*scope.sourceId, *targetKey);
    }

    OperationScheduler scheduler(store(), disks_, StageExecutors::standard(), schedulerOptions());
    const RunReport report = scheduler.run(scope);
    out_ << report.toString() << "\n";
    return report.anyFailed() ? 1 : 0;
}

int BackupCLI::handleStatusCommand(const std::vector<std::string>& args) {
    std::optional<EntityId> sourceId;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--source") {
            sourceId = store().requireSource(valueOf(args, i));
        } else {
            throw std::invalid_argument("Unexpected argument: " + args[i]);
        }
    }
    out_ << store().describe(sourceId) << "\n";
    return 0;
}

// Interactive mode

void BackupCLI::printInteractiveHelp() const {
    out_ << "Commands:\n"
         << "  stage <path> [--alias A] [--hash-algorithm H] [--single-hash] [--allow G] [--block G]\n"
         << "  add-target <source> <path> [--alias A] [--no-verify]\n"
         << "  modify <source> [--target T] [key [value...]]\n"
         << "  start       run all staged work in the background\n"
         << "  status      show operations and their status\n"
         << "  stop        stop dispatching, running operations finish\n"
         << "  help\n"
         << "  exit        stop and wait for running operations\n";
}

void BackupCLI::printSessionStatus(const InteractiveSession& session) const {
    const SessionStatus status = session.statusSnapshot();
    out_ << (status.running ? "Running" : "Idle") << ", "
         << status.state.sources.size() << " sources, " << status.state.targets.size() << " targets\n";
    for (const auto& op : status.operations) {
        out_ << "  " << op.label << ": " << toString(op.status);
        if (op.error) {
            out_ << " (" << *op.error << ")";
        }
        out_ << "\n";
    }
}

int BackupCLI::handleInteractiveCommand() {
    InteractiveSession session(store(), disks_, StageExecutors::standard(), schedulerOptions());
    session_ = &session;
    bool failed = false;

    out_ << "Interactive mode, type 'help' for commands\n";
    std::string line;
    while (true) {
        out_ << "bh > " << std::flush;
        if (!std::getline(in_, line)) {
            break;
        }

        std::vector<std::string> words;
        try {
            words = utils::splitCommandLine(line);
        } catch (const std::invalid_argument& e) {
            out_ << "Error: " << e.what() << "\n";
            continue;
        }
        if (words.empty()) {
            continue;
        }
        const std::string command = words[0];
        const std::vector<std::string> args(words.begin() + 1, words.end());

        if (command == "exit" || command == "quit") {
            break;
        }
        try {
            if (command == "help") {
                printInteractiveHelp();
            } else if (command == "start") {
                session.start();
                out_ << "Started\n";
            } else if (command == "stop") {
                std::optional<RunReport> report = session.stop();
                if (report) {
                    failed = failed || report->anyFailed();
                    out_ << report->toString() << "\n";
                }
            } else if (command == "status") {
                printSessionStatus(session);
            } else if (command == "stage") {
                handleStageCommand(args);
            } else if (command == "add-target") {
                handleAddTargetCommand(args);
            } else if (command == "modify") {
                handleModifyCommand(args);
            } else {
                out_ << "Unknown command: " << command << "\n";
            }
        } catch (const BackupError& e) {
            out_ << "Error: " << e.what() << "\n";
        } catch (const std::invalid_argument& e) {
            out_ << "Error: " << e.what() << "\n";
        }
    }

    std::optional<RunReport> report = session.stop();
    session_ = nullptr;
    if (report) {
        failed = failed || report->anyFailed();
        out_ << report->toString() << "\n";
    }
    return failed ? 1 : 0;
}
