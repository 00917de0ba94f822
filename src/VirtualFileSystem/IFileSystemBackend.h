/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file IFileSystemBackend.h
 * @brief Backend interface for VirtualFileSystem
 *
 * Implementations provide the host-facing primitives the write-handle layer is built on:
 * opening a byte transport, deleting, the atomic rename used by WriteHandle::moveTo, and
 * timestamp/metadata access. VFS routes a path to a backend selected by mounted prefix.
 * Backends may override normalizeKey() to define identity/locking keys.
 */
#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <system_error>
#include "FileOperationHandle.h"
#include "FileTransport.h"

namespace VaultEngine::Core::IO {

class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    /**
     * @brief Opens a byte transport for the path
     *
     * Write mode creates the file when missing (and its parents when createParents is set)
     * and never truncates. Read mode requires the file to exist.
     * @param path Target path
     * @param mode Read or Write
     * @param createParents Create missing parent directories (Write only)
     * @param ec Set on failure
     * @return Open transport, or null with ec set
     */
    virtual std::unique_ptr<FileTransport> openTransport(const std::string& path, OpenMode mode,
                                                         bool createParents, std::error_code& ec) = 0;

    /**
     * @brief Deletes a file; a missing file is reported as FileNotFound
     */
    virtual FileOperationHandle deleteFile(const std::string& path) = 0;

    /**
     * @brief Atomically renames src over dst, replacing dst if it exists
     *
     * Must not fall back to copy+delete: callers rely on the rename being indivisible, so a
     * cross-device move fails instead. Failures carry the host error in systemError.
     */
    virtual FileOperationHandle moveFile(const std::string& src, const std::string& dst) = 0;

    virtual FileOperationHandle setLastModified(const std::string& path,
                                                std::chrono::system_clock::time_point when) = 0;

    /**
     * @brief Retrieves metadata for a path; a missing path completes with exists=false
     */
    virtual FileOperationHandle getMetadata(const std::string& path) = 0;

    virtual bool exists(const std::string& path) = 0;
    virtual bool isDirectory(const std::string& path) = 0;

    // Directory creation (optional)
    virtual FileOperationHandle createDirectory(const std::string& path) {
        return FileOperationHandle::failure(FileError::Unknown, "Directories not supported by backend", path);
    }

    // Backend-aware path normalization for identity/locking keys
    // Default: pass-through (no normalization).
    virtual std::string normalizeKey(const std::string& path) const { return path; }
};

} // namespace VaultEngine::Core::IO
