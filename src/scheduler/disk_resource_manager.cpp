#include "scheduler/disk_resource_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

std::string DiskId::toString() const {
    // st_dev packs major and minor numbers
    return "dev:" + std::to_string(value_);
}

Lease::Lease(DiskResourceManager* manager, std::vector<DiskId> disks)
    : manager_(manager)
    , disks_(std::move(disks)) {
}

Lease::~Lease() {
    release();
}

Lease::Lease(Lease&& other) noexcept
    : manager_(other.manager_)
    , disks_(std::move(other.disks_)) {
    other.manager_ = nullptr;
    other.disks_.clear();
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        disks_ = std::move(other.disks_);
        other.manager_ = nullptr;
        other.disks_.clear();
    }
    return *this;
}

void Lease::release() {
    if (manager_) {
        manager_->release(*this);
    }
}

DiskResourceManager::DiskResourceManager(DeviceResolver resolver)
    : resolver_(std::move(resolver)) {
}

DeviceResolver DiskResourceManager::statDeviceResolver() {
    return [](const std::string& path) -> uint64_t {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            throw ResourceError("Could not determine device of path " + path + ": " + strerror(errno), path);
        }
        return static_cast<uint64_t>(st.st_dev);
    };
}

DiskId DiskResourceManager::resolve(const std::string& path) {
    if (path.empty()) {
        throw ResourceError("Cannot resolve the disk of an empty path", path);
    }
    const std::string normalized = utils::normalizePath(path).string();

    DiskId disk(resolver_(normalized));
    remember(normalized, disk);
    return disk;
}

DiskId DiskResourceManager::resolveDestination(const std::string& path) {
    if (path.empty()) {
        throw ResourceError("Cannot resolve the disk of an empty path", path);
    }
    std::filesystem::path current = utils::normalizePath(path);

    while (true) {
        {
            std::lock_guard<std::mutex> lock(cacheMutex_);
            auto it = cache_.find(current.string());
            if (it != cache_.end()) {
                return it->second;
            }
        }

        try {
            DiskId disk(resolver_(current.string()));
            remember(current.string(), disk);
            return disk;
        } catch (const ResourceError&) {
            // Only a path that is not there yet may borrow the disk of its parent
            std::error_code ec;
            const auto status = std::filesystem::symlink_status(current, ec);
            const bool missing = status.type() == std::filesystem::file_type::not_found;
            if (!missing || !current.has_parent_path() || current.parent_path() == current) {
                throw;
            }
        }
        current = current.parent_path();
    }
}

void DiskResourceManager::remember(const std::string& prefix, const DiskId& disk) {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto [it, inserted] = cache_.insert_or_assign(prefix, disk);
    (void)it;
    if (inserted) {
        Logger::debug("Resolved " + prefix + " to " + disk.toString());
    }
}

std::vector<DiskId> DiskResourceManager::normalizeDisks(std::vector<DiskId> disks) {
    std::sort(disks.begin(), disks.end());
    disks.erase(std::unique(disks.begin(), disks.end()), disks.end());
    return disks;
}

Lease DiskResourceManager::acquire(const DiskId& disk) {
    return acquire(std::vector<DiskId>{disk});
}

Lease DiskResourceManager::acquire(std::vector<DiskId> disks) {
    disks = normalizeDisks(std::move(disks));

    std::unique_lock<std::mutex> lock(mutex_);
    for (const auto& disk : disks) {
        auto& state = disks_[disk];
        const uint64_t ticket = nextTicket_++;
        state.waiters.push_back(ticket);
        released_.wait(lock, [&state, ticket] {
            return !state.held && state.waiters.front() == ticket;
        });
        state.waiters.pop_front();
        state.held = true;
        if (observer_) {
            observer_(disk, LeaseEvent::Acquired);
        }
    }
    return Lease(this, std::move(disks));
}

std::optional<Lease> DiskResourceManager::tryAcquire(std::vector<DiskId> disks) {
    disks = normalizeDisks(std::move(disks));

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& disk : disks) {
        auto it = disks_.find(disk);
        if (it != disks_.end() && (it->second.held || !it->second.waiters.empty())) {
            return std::nullopt;
        }
    }
    for (const auto& disk : disks) {
        disks_[disk].held = true;
        if (observer_) {
            observer_(disk, LeaseEvent::Acquired);
        }
    }
    return Lease(this, std::move(disks));
}

void DiskResourceManager::release(Lease& lease) {
    if (lease.manager_ != this) {
        return;
    }
    releaseDisks(lease.disks_);
    lease.manager_ = nullptr;
    lease.disks_.clear();
    notifyReleaseListeners();
}

void DiskResourceManager::releaseDisks(const std::vector<DiskId>& disks) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& disk : disks) {
            auto& state = disks_[disk];
            if (observer_) {
                observer_(disk, LeaseEvent::Released);
            }
            state.held = false;
        }
    }
    released_.notify_all();
}

bool DiskResourceManager::isAvailable(const DiskId& disk) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = disks_.find(disk);
    return it == disks_.end() || (!it->second.held && it->second.waiters.empty());
}

size_t DiskResourceManager::addReleaseListener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const size_t handle = nextListener_++;
    listeners_.emplace(handle, std::move(listener));
    return handle;
}

void DiskResourceManager::removeReleaseListener(size_t handle) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(handle);
}

void DiskResourceManager::setLeaseObserver(LeaseObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

void DiskResourceManager::notifyReleaseListeners() {
    // Invoked under listenerMutex_ so that removeReleaseListener() returning
    // guarantees the listener is not running anymore
    std::lock_guard<std::mutex> lock(listenerMutex_);
    for (const auto& [handle, listener] : listeners_) {
        listener();
    }
}
