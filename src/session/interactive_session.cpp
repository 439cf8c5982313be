#include "session/interactive_session.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>

namespace {

SchedulerOptions keepAlive(SchedulerOptions options) {
    options.keepAlive = true;
    return options;
}

} // namespace

InteractiveSession::InteractiveSession(StateStore& store, DiskResourceManager& disks,
                                       StageExecutors executors, SchedulerOptions options)
    : store_(store)
    , scheduler_(store, disks, std::move(executors), keepAlive(std::move(options))) {
}

InteractiveSession::~InteractiveSession() {
    try {
        stop();
    } catch (const std::exception& e) {
        Logger::error(std::string("Background run ended with an error: ") + e.what());
    }
}

void InteractiveSession::start(const RunScope& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run_.valid() && run_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        throw ConflictError("A run is already in progress");
    }
    if (run_.valid()) {
        // Surface the outcome of a run that ended on its own
        RunReport previous = run_.get();
        Logger::info(previous.toString());
    }
    run_ = std::async(std::launch::async, [this, scope] { return scheduler_.run(scope); });
    Logger::info("Background run started");
}

bool InteractiveSession::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_.valid() && run_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

EntityId InteractiveSession::addSource(const SourceSpec& spec) {
    return scheduler_.addSource(spec);
}

EntityId InteractiveSession::addTarget(EntityId sourceId, const TargetSpec& spec) {
    return scheduler_.addTarget(sourceId, spec);
}

SessionStatus InteractiveSession::statusSnapshot() const {
    SessionStatus status;
    status.running = isRunning();
    status.operations = scheduler_.operations();
    status.state = store_.snapshot();
    return status;
}

std::optional<RunReport> InteractiveSession::stop() {
    if (isRunning()) {
        scheduler_.requestStop();
    }
    return collect();
}

std::optional<RunReport> InteractiveSession::finish() {
    if (isRunning()) {
        scheduler_.drain();
    }
    return collect();
}

std::optional<RunReport> InteractiveSession::collect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!run_.valid()) {
        return std::nullopt;
    }
    return run_.get();
}
