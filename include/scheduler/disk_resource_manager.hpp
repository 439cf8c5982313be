#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Identity of the device backing a path
class DiskId {
public:
    DiskId() = default;
    explicit DiskId(uint64_t value) : value_(value) {}

    uint64_t value() const { return value_; }
    std::string toString() const;

    bool operator==(const DiskId& other) const { return value_ == other.value_; }
    bool operator!=(const DiskId& other) const { return value_ != other.value_; }
    bool operator<(const DiskId& other) const { return value_ < other.value_; }

private:
    uint64_t value_ = 0;
};

namespace std {
template <>
struct hash<DiskId> {
    size_t operator()(const DiskId& disk) const { return std::hash<uint64_t>()(disk.value()); }
};
} // namespace std

class DiskResourceManager;

// Exclusive hold on one or more disks, released on destruction
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    bool isHeld() const { return manager_ != nullptr; }
    const std::vector<DiskId>& disks() const { return disks_; }
    void release();

private:
    friend class DiskResourceManager;
    Lease(DiskResourceManager* manager, std::vector<DiskId> disks);

    DiskResourceManager* manager_ = nullptr;
    std::vector<DiskId> disks_;
};

enum class LeaseEvent {
    Acquired,
    Released
};

// Maps a normalized absolute path to a device number, throws ResourceError
using DeviceResolver = std::function<uint64_t(const std::string& path)>;
using LeaseObserver = std::function<void(const DiskId& disk, LeaseEvent event)>;

// Grants at most one lease per disk at a time. Waiters are served in the
// order they arrived. Leases are not reentrant: acquiring a disk that the
// calling thread already holds blocks forever.
class DiskResourceManager {
public:
    explicit DiskResourceManager(DeviceResolver resolver = statDeviceResolver());
    ~DiskResourceManager() = default;

    DiskResourceManager(const DiskResourceManager&) = delete;
    DiskResourceManager& operator=(const DiskResourceManager&) = delete;

    // The path must exist, it is looked up again on every call. Throws ResourceError.
    DiskId resolve(const std::string& path);
    // For paths that may not exist yet: walks up to the nearest existing
    // ancestor. Resolved prefixes are cached for the lifetime of the manager.
    DiskId resolveDestination(const std::string& path);

    // Block until every disk is free. Duplicates are collapsed and disks are
    // taken in ascending order, so multi-disk callers cannot deadlock each other.
    Lease acquire(const DiskId& disk);
    Lease acquire(std::vector<DiskId> disks);
    // All-or-nothing, never blocks. Fails if any disk is held or has waiters.
    std::optional<Lease> tryAcquire(std::vector<DiskId> disks);
    void release(Lease& lease);

    bool isAvailable(const DiskId& disk) const;

    // Listeners are called after a lease is released, outside the lease lock.
    // They must not add or remove listeners.
    size_t addReleaseListener(std::function<void()> listener);
    void removeReleaseListener(size_t handle);
    // Called under the internal lock on every acquire and release, for instrumentation
    void setLeaseObserver(LeaseObserver observer);

    // stat(2) st_dev of the path, ResourceError if it does not exist
    static DeviceResolver statDeviceResolver();

private:
    struct DiskState {
        bool held = false;
        std::deque<uint64_t> waiters;
    };

    static std::vector<DiskId> normalizeDisks(std::vector<DiskId> disks);
    void releaseDisks(const std::vector<DiskId>& disks);
    void notifyReleaseListeners();
    void remember(const std::string& prefix, const DiskId& disk);

    DeviceResolver resolver_;
    std::mutex cacheMutex_;
    std::unordered_map<std::string, DiskId> cache_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_map<DiskId, DiskState> disks_;
    uint64_t nextTicket_ = 0;
    LeaseObserver observer_;

    std::mutex listenerMutex_;
    std::map<size_t, std::function<void()>> listeners_;
    size_t nextListener_ = 0;
};
