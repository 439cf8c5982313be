#include "test_helpers.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("coldstage_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void EventLog::add(const std::string& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<std::string> EventLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

int EventLog::indexOf(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(events_.begin(), events_.end(), event);
    return it == events_.end() ? -1 : static_cast<int>(it - events_.begin());
}

FakeExecutor::FakeExecutor(StageKind kind, std::shared_ptr<EventLog> log)
    : kind_(kind)
    , log_(std::move(log)) {
}

StageResult FakeExecutor::execute(const OperationContext& context) {
    const std::string label = context.label();
    const std::string subject = context.target ? context.target->label() : context.source.label();

    Hook hook;
    bool fail = false;
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(label);
        hook = hook_;
        fail = failing_.count(subject) > 0;
        delay = delay_;
    }

    log_->add("start:" + label);
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    StageResult result;
    if (hook) {
        result = hook(context);
    } else if (kind_ == StageKind::Hash) {
        result.hashFile = context.source.path + "/fake.cshd";
    } else if (kind_ == StageKind::Verify) {
        VerifiedInfo info;
        info.files = 1;
        result.verified = info;
    }
    log_->add("end:" + label);

    if (fail) {
        throw PipelineError(kind_, label, "simulated failure");
    }
    return result;
}

void FakeExecutor::failFor(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(label);
}

void FakeExecutor::setHook(Hook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

void FakeExecutor::setDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

std::vector<std::string> FakeExecutor::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

size_t FakeExecutor::callCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

FakeStages::FakeStages(std::shared_ptr<EventLog> eventLog)
    : log(std::move(eventLog))
    , hasher(std::make_shared<FakeExecutor>(StageKind::Hash, log))
    , transporter(std::make_shared<FakeExecutor>(StageKind::Transfer, log))
    , verifier(std::make_shared<FakeExecutor>(StageKind::Verify, log)) {
}

StageExecutors FakeStages::executors() const {
    StageExecutors executors;
    executors.hasher = hasher;
    executors.transporter = transporter;
    executors.verifier = verifier;
    return executors;
}

void FakeDisks::mount(const std::string& prefix, uint64_t device) {
    (*mounts_)[prefix] = device;
}

uint64_t FakeDisks::deviceOf(const std::string& path) const {
    const std::string* best = nullptr;
    uint64_t device = 0;
    for (const auto& [prefix, dev] : *mounts_) {
        const bool matches = path == prefix ||
                             (path.compare(0, prefix.size(), prefix) == 0 && path.size() > prefix.size() &&
                              path[prefix.size()] == '/');
        if (matches && (!best || prefix.size() > best->size())) {
            best = &prefix;
            device = dev;
        }
    }
    if (!best) {
        throw ResourceError("No fake disk mounted for " + path, path);
    }
    return device;
}

DeviceResolver FakeDisks::resolver() const {
    auto mounts = mounts_;
    FakeDisks copy;
    copy.mounts_ = mounts;
    return [copy](const std::string& path) { return copy.deviceOf(path); };
}
