/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file VirtualFileSystem.h
 * @brief Facade that routes paths to backends and hands out exclusive WriteHandles
 *
 * VirtualFileSystem (VFS) routes a path to a backend (longest mounted prefix, otherwise the
 * local filesystem) and creates WriteHandles for it. Opening a handle acquires the identity's
 * write lock from the configured FileLockRegistry, so a second openWritable() for the same
 * file blocks until the first handle is closed, removed or moved. All calls are synchronous.
 * See Examples/VFS_WriteHandle.cpp for end-to-end usage.
 */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "FileOperationHandle.h"
#include "FileLock.h"
#include "IFileSystemBackend.h"
#include "SharedChannel.h"
#include "WriteHandle.h"

namespace VaultEngine::Core::IO {

class VirtualFileSystem {
public:
    struct Config {
        FileLockRegistry* lockRegistry;                          // nullptr: FileLockRegistry::global()
        std::optional<std::chrono::milliseconds> writeLockTimeout;  // bound for openWritable; nullopt waits forever
        bool defaultCreateParentDirs;                            // create missing parents on first write
        bool syncOnClose;                                        // fsync before the last channel close

        Config()
            : lockRegistry(nullptr)
            , writeLockTimeout(std::nullopt)
            , defaultCreateParentDirs(false)
            , syncOnClose(false) {}
    };

    explicit VirtualFileSystem(Config cfg = {});
    ~VirtualFileSystem();

    VirtualFileSystem(const VirtualFileSystem&) = delete;
    VirtualFileSystem& operator=(const VirtualFileSystem&) = delete;

    /**
     * @brief Opens an exclusive write session for path
     *
     * Blocks until the identity lock is free, or for at most Config::writeLockTimeout when set.
     * The file itself is created lazily by the first operation that needs the channel.
     * @param path Target file path
     * @return Open handle, or nullptr if the bounded wait expired
     */
    std::unique_ptr<WriteHandle> openWritable(const std::string& path);

    /**
     * @brief Opens an exclusive write session, waiting at most timeout for the lock
     * @return Open handle, or nullptr if the lock is still held
     */
    std::unique_ptr<WriteHandle> tryOpenWritable(const std::string& path, std::chrono::milliseconds timeout);

    FileOperationHandle getMetadata(const std::string& path);
    bool exists(const std::string& path);
    FileOperationHandle createDirectory(const std::string& path);

    // Backend management
    /**
     * @brief Sets the default backend used when no mount matches
     * @param backend Backend implementation (shared ownership)
     */
    void setDefaultBackend(std::shared_ptr<IFileSystemBackend> backend);
    /**
     * @brief Mounts a backend at a path prefix (longest-prefix match)
     * @param prefix Path prefix (e.g., "mem://")
     * @param backend Backend to route to when prefix matches
     */
    void mountBackend(const std::string& prefix, std::shared_ptr<IFileSystemBackend> backend);
    /**
     * @brief Finds the backend that would handle a given path
     * @return Mounted backend or the default backend (created on first use)
     */
    std::shared_ptr<IFileSystemBackend> findBackend(const std::string& path) const;
    std::shared_ptr<IFileSystemBackend> getDefaultBackend() const;

    // Identity used for locking and channel sharing
    std::string normalizeKey(const std::string& path) const;

    FileLockRegistry& lockRegistry() const;
    ChannelRegistry& channelRegistry() noexcept { return *_channels; }
    const Config& config() const noexcept { return _cfg; }

private:
    std::unique_ptr<WriteHandle> makeWriteHandle(std::shared_ptr<IFileSystemBackend> backend,
                                                 const std::string& path,
                                                 std::string key,
                                                 WriteLockToken token);

    Config _cfg{};

    // Shared with handles, which return their channel reference on destruction
    std::shared_ptr<ChannelRegistry> _channels;

    // Backend storage (reference-counted for thread-safe lifetime management)
    mutable std::shared_ptr<IFileSystemBackend> _defaultBackend;
    std::unordered_map<std::string, std::shared_ptr<IFileSystemBackend>> _mountedBackends;
    mutable std::shared_mutex _backendMutex;
};

} // namespace VaultEngine::Core::IO
