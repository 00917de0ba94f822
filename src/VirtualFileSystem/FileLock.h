/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file FileLock.h
 * @brief Process-wide exclusive write locks keyed by file identity
 *
 * FileLockRegistry::global() maps a normalized identity to one FileLock for the lifetime of
 * the process. Acquisition returns a WriteLockToken: a move-only proof of ownership that
 * releases the lock exactly once, either explicitly or when destroyed. Ownership belongs to
 * the token, not to a thread, so a lock may be released from a different thread than the one
 * that acquired it.
 *
 * @code
 * auto token = FileLockRegistry::global().acquireWrite(key);  // blocks
 * // ... exclusive section ...
 * token.release();
 * @endcode
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace VaultEngine::Core::IO {

/**
 * @brief Exclusive, non-reentrant lock for one identity
 *
 * Each successful acquisition is issued a lease id; release() only succeeds for the lease
 * currently holding the lock. Re-acquiring a held lock blocks even on the holding thread.
 */
class FileLock {
public:
    using LeaseId = uint64_t;
    static constexpr LeaseId NoLease = 0;

    explicit FileLock(std::string key);

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    LeaseId acquire();
    LeaseId tryAcquire();
    LeaseId tryAcquireFor(std::chrono::milliseconds timeout);

    /**
     * @brief Releases the lock held by lease
     * @return false (and logs an error) if lease does not hold the lock
     */
    bool release(LeaseId lease);

    bool isHeld() const;
    size_t waiters() const;
    uint64_t acquisitions() const noexcept { return _acquisitions.load(std::memory_order_acquire); }
    uint64_t releases() const noexcept { return _releases.load(std::memory_order_acquire); }
    const std::string& key() const noexcept { return _key; }

private:
    LeaseId grantLocked();

    std::string _key;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    LeaseId _holder = NoLease;
    LeaseId _nextLease = 1;
    size_t _waiters = 0;
    std::atomic<uint64_t> _acquisitions{0};
    std::atomic<uint64_t> _releases{0};
};

/**
 * @brief Move-only ownership of one FileLock acquisition
 */
class WriteLockToken {
public:
    WriteLockToken() = default;
    WriteLockToken(std::shared_ptr<FileLock> lock, FileLock::LeaseId lease) noexcept;
    ~WriteLockToken();

    WriteLockToken(WriteLockToken&& other) noexcept;
    WriteLockToken& operator=(WriteLockToken&& other) noexcept;
    WriteLockToken(const WriteLockToken&) = delete;
    WriteLockToken& operator=(const WriteLockToken&) = delete;

    bool held() const noexcept { return _lock && _lease != FileLock::NoLease; }
    explicit operator bool() const noexcept { return held(); }

    /**
     * @brief Releases the lock if this token still holds it
     * @return true if this call released the lock
     */
    bool release();

    FileLock* lock() const noexcept { return _lock.get(); }

private:
    std::shared_ptr<FileLock> _lock;
    FileLock::LeaseId _lease = FileLock::NoLease;
};

/**
 * @brief Concurrent identity -> FileLock map
 *
 * Entries are created on first access and retained. When the map grows past maxCached,
 * least recently used entries that are idle (not held, nobody waiting, nobody else holding a
 * reference) are dropped; a dropped identity simply gets a fresh lock on its next access.
 * The map mutex is never held while waiting on a FileLock.
 */
class FileLockRegistry {
public:
    explicit FileLockRegistry(size_t maxCached = 1024);

    static FileLockRegistry& global();

    std::shared_ptr<FileLock> lockFor(const std::string& key);

    WriteLockToken acquireWrite(const std::string& key);
    // Empty token if the lock is still held when timeout expires
    WriteLockToken tryAcquireWrite(const std::string& key, std::chrono::milliseconds timeout);

    bool isLocked(const std::string& key) const;
    size_t size() const;
    size_t maxCached() const;
    void setMaxCached(size_t maxCached);

private:
    struct LockEntry {
        std::shared_ptr<FileLock> lock;
        std::chrono::steady_clock::time_point lastAccess;
        std::list<std::string>::iterator lruIt;
    };

    void evictIdleLocks();

    mutable std::mutex _mapMutex;
    std::unordered_map<std::string, LockEntry> _locks;
    std::list<std::string> _lruList;  // Most recently used at front
    size_t _maxCached;
};

} // namespace VaultEngine::Core::IO
