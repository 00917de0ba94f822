/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "FileLock.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <format>
#include <utility>

namespace VaultEngine::Core::IO {

FileLock::FileLock(std::string key)
    : _key(std::move(key)) {
}

FileLock::LeaseId FileLock::grantLocked() {
    _holder = _nextLease++;
    _acquisitions.fetch_add(1, std::memory_order_acq_rel);
    return _holder;
}

FileLock::LeaseId FileLock::acquire() {
    std::unique_lock lock(_mutex);
    ++_waiters;
    _cv.wait(lock, [this] { return _holder == NoLease; });
    --_waiters;
    return grantLocked();
}

FileLock::LeaseId FileLock::tryAcquire() {
    std::lock_guard lock(_mutex);
    if (_holder != NoLease) return NoLease;
    return grantLocked();
}

FileLock::LeaseId FileLock::tryAcquireFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(_mutex);
    ++_waiters;
    bool free = _cv.wait_for(lock, timeout, [this] { return _holder == NoLease; });
    --_waiters;
    if (!free) return NoLease;
    return grantLocked();
}

bool FileLock::release(LeaseId lease) {
    {
        std::lock_guard lock(_mutex);
        if (_holder == NoLease || _holder != lease) {
            VAULT_LOG_ERROR_CAT("FileLock",
                std::format("release of {} by lease {} which does not hold it (holder {})", _key, lease, _holder));
            VAULT_ASSERT(false, "FileLock released by a lease that does not hold it");
            return false;
        }
        _holder = NoLease;
        _releases.fetch_add(1, std::memory_order_acq_rel);
    }
    _cv.notify_one();
    return true;
}

bool FileLock::isHeld() const {
    std::lock_guard lock(_mutex);
    return _holder != NoLease;
}

size_t FileLock::waiters() const {
    std::lock_guard lock(_mutex);
    return _waiters;
}

// WriteLockToken

WriteLockToken::WriteLockToken(std::shared_ptr<FileLock> lock, FileLock::LeaseId lease) noexcept
    : _lock(std::move(lock))
    , _lease(lease) {
}

WriteLockToken::~WriteLockToken() {
    release();
}

WriteLockToken::WriteLockToken(WriteLockToken&& other) noexcept
    : _lock(std::move(other._lock))
    , _lease(std::exchange(other._lease, FileLock::NoLease)) {
}

WriteLockToken& WriteLockToken::operator=(WriteLockToken&& other) noexcept {
    if (this != &other) {
        release();
        _lock = std::move(other._lock);
        _lease = std::exchange(other._lease, FileLock::NoLease);
    }
    return *this;
}

bool WriteLockToken::release() {
    if (!held()) return false;
    auto lease = std::exchange(_lease, FileLock::NoLease);
    bool released = _lock->release(lease);
    _lock.reset();
    return released;
}

// FileLockRegistry

FileLockRegistry::FileLockRegistry(size_t maxCached)
    : _maxCached(maxCached) {
}

FileLockRegistry& FileLockRegistry::global() {
    // Leaked so that handles destroyed during static teardown can still release
    static FileLockRegistry* registry = new FileLockRegistry();
    return *registry;
}

std::shared_ptr<FileLock> FileLockRegistry::lockFor(const std::string& key) {
    std::lock_guard lk(_mapMutex);
    auto now = std::chrono::steady_clock::now();

    auto it = _locks.find(key);
    if (it != _locks.end()) {
        it->second.lastAccess = now;
        _lruList.erase(it->second.lruIt);
        _lruList.push_front(key);
        it->second.lruIt = _lruList.begin();
        return it->second.lock;
    }

    if (_locks.size() >= _maxCached) {
        evictIdleLocks();
    }

    auto lock = std::make_shared<FileLock>(key);
    _lruList.push_front(key);
    _locks.emplace(key, LockEntry{lock, now, _lruList.begin()});
    return lock;
}

// Caller holds _mapMutex. Drops least recently used entries nobody else references.
void FileLockRegistry::evictIdleLocks() {
    auto it = _lruList.end();
    while (it != _lruList.begin() && _locks.size() >= _maxCached) {
        --it;
        auto entry = _locks.find(*it);
        if (entry == _locks.end()) {
            it = _lruList.erase(it);
            continue;
        }
        // A held or awaited lock is always referenced by its token or waiter
        if (entry->second.lock.use_count() > 1) continue;
        _locks.erase(entry);
        it = _lruList.erase(it);
    }
    if (_locks.size() >= _maxCached) {
        VAULT_LOG_DEBUG_CAT("FileLockRegistry",
            std::format("{} locks in use, cache limit {} exceeded", _locks.size(), _maxCached));
    }
}

WriteLockToken FileLockRegistry::acquireWrite(const std::string& key) {
    auto lock = lockFor(key);
    auto lease = lock->acquire();
    return WriteLockToken(std::move(lock), lease);
}

WriteLockToken FileLockRegistry::tryAcquireWrite(const std::string& key, std::chrono::milliseconds timeout) {
    auto lock = lockFor(key);
    auto lease = lock->tryAcquireFor(timeout);
    if (lease == FileLock::NoLease) {
        return {};
    }
    return WriteLockToken(std::move(lock), lease);
}

bool FileLockRegistry::isLocked(const std::string& key) const {
    std::shared_ptr<FileLock> lock;
    {
        std::lock_guard lk(_mapMutex);
        auto it = _locks.find(key);
        if (it == _locks.end()) return false;
        lock = it->second.lock;
    }
    return lock->isHeld();
}

size_t FileLockRegistry::size() const {
    std::lock_guard lk(_mapMutex);
    return _locks.size();
}

size_t FileLockRegistry::maxCached() const {
    std::lock_guard lk(_mapMutex);
    return _maxCached;
}

void FileLockRegistry::setMaxCached(size_t maxCached) {
    std::lock_guard lk(_mapMutex);
    _maxCached = maxCached;
    if (_locks.size() >= _maxCached) {
        evictIdleLocks();
    }
}

} // namespace VaultEngine::Core::IO
