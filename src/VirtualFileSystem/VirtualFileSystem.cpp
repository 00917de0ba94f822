/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "VirtualFileSystem.h"
#include "LocalFileSystemBackend.h"
#include "../Logging/Logger.h"
#include <format>

namespace VaultEngine::Core::IO {

VirtualFileSystem::VirtualFileSystem(Config cfg)
    : _cfg(cfg)
    , _channels(std::make_shared<ChannelRegistry>(
          ChannelOptions{cfg.defaultCreateParentDirs, cfg.syncOnClose})) {
}

VirtualFileSystem::~VirtualFileSystem() {
    if (auto open = _channels->size(); open > 0) {
        VAULT_LOG_WARNING_CAT("VirtualFileSystem",
            std::format("Destroyed with {} file(s) still referenced by handles", open));
    }
}

FileLockRegistry& VirtualFileSystem::lockRegistry() const {
    return _cfg.lockRegistry ? *_cfg.lockRegistry : FileLockRegistry::global();
}

std::string VirtualFileSystem::normalizeKey(const std::string& path) const {
    return findBackend(path)->normalizeKey(path);
}

std::unique_ptr<WriteHandle> VirtualFileSystem::openWritable(const std::string& path) {
    if (_cfg.writeLockTimeout) {
        return tryOpenWritable(path, *_cfg.writeLockTimeout);
    }
    auto backend = findBackend(path);
    auto key = backend->normalizeKey(path);
    auto token = lockRegistry().acquireWrite(key);
    VAULT_LOG_DEBUG_CAT("VirtualFileSystem", "Acquired write lock for " + key);
    return makeWriteHandle(std::move(backend), path, std::move(key), std::move(token));
}

std::unique_ptr<WriteHandle> VirtualFileSystem::tryOpenWritable(const std::string& path,
                                                                std::chrono::milliseconds timeout) {
    auto backend = findBackend(path);
    auto key = backend->normalizeKey(path);
    auto token = lockRegistry().tryAcquireWrite(key, timeout);
    if (!token) {
        VAULT_LOG_WARNING_CAT("VirtualFileSystem",
            std::format("Timed out after {}ms waiting for write lock on {}", timeout.count(), key));
        return nullptr;
    }
    VAULT_LOG_DEBUG_CAT("VirtualFileSystem", "Acquired write lock for " + key);
    return makeWriteHandle(std::move(backend), path, std::move(key), std::move(token));
}

std::unique_ptr<WriteHandle> VirtualFileSystem::makeWriteHandle(std::shared_ptr<IFileSystemBackend> backend,
                                                                const std::string& path,
                                                                std::string key,
                                                                WriteLockToken token) {
    auto channel = _channels->acquire(key, backend, path);
    // Constructor is private; make_unique cannot reach it
    return std::unique_ptr<WriteHandle>(new WriteHandle(this, std::move(backend), path, std::move(key),
                                                        std::move(token), _channels, std::move(channel)));
}

FileOperationHandle VirtualFileSystem::getMetadata(const std::string& path) {
    return findBackend(path)->getMetadata(path);
}

bool VirtualFileSystem::exists(const std::string& path) {
    return findBackend(path)->exists(path);
}

FileOperationHandle VirtualFileSystem::createDirectory(const std::string& path) {
    return findBackend(path)->createDirectory(path);
}

std::shared_ptr<IFileSystemBackend> VirtualFileSystem::getDefaultBackend() const {
    {
        std::shared_lock rlock(_backendMutex);
        if (_defaultBackend) return _defaultBackend;
    }
    std::unique_lock wlock(_backendMutex);
    if (!_defaultBackend) {
        _defaultBackend = std::make_shared<LocalFileSystemBackend>();
    }
    return _defaultBackend;
}

// Backend management
void VirtualFileSystem::setDefaultBackend(std::shared_ptr<IFileSystemBackend> backend) {
    std::unique_lock lock(_backendMutex);
    _defaultBackend = backend;
}

void VirtualFileSystem::mountBackend(const std::string& prefix, std::shared_ptr<IFileSystemBackend> backend) {
    std::unique_lock lock(_backendMutex);
    _mountedBackends[prefix] = backend;
}

std::shared_ptr<IFileSystemBackend> VirtualFileSystem::findBackend(const std::string& path) const {
    {
        std::shared_lock lock(_backendMutex);

        // Check mounted backends for longest matching prefix
        std::shared_ptr<IFileSystemBackend> bestMatch;
        size_t longestPrefix = 0;

        for (const auto& [prefix, backend] : _mountedBackends) {
            if (backend && path.rfind(prefix, 0) == 0 && prefix.length() > longestPrefix) {
                bestMatch = backend;
                longestPrefix = prefix.length();
            }
        }

        if (bestMatch) return bestMatch;
    }
    return getDefaultBackend();
}

} // namespace VaultEngine::Core::IO
