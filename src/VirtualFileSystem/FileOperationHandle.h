/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include <memory>
#include <string>
#include <cstdint>
#include <optional>
#include <system_error>
#include <chrono>

namespace VaultEngine::Core::IO {

enum class FileOpStatus { Pending, Complete, Failed };

/**
 * Public error taxonomy surfaced by VFS operations.
 * Mapping guidelines:
 * - HandleClosed: operation on a WriteHandle after close/remove/moveTo
 * - InvalidArgument: move target from a different filesystem instance
 * - IsADirectory: move source or destination currently is a directory
 * - MoveFailed: rename failed after both channels were torn down
 * - FileNotFound / AccessDenied / DiskFull / InvalidPath: errno-classified host failures
 * - IOError: other transport or host failures
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    IOError,
    HandleClosed,
    InvalidArgument,
    IsADirectory,
    MoveFailed,
    Unknown
};

const char* toString(FileError error) noexcept;

// Classifies a host error (errno in generic/system category)
FileError fileErrorFromErrorCode(const std::error_code& ec) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
};

struct FileMetadata {
    std::string path;
    bool exists = false;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    uintmax_t size = 0;
    std::optional<std::chrono::system_clock::time_point> lastModified;
};

/**
 * @brief Shared result of a completed file operation
 *
 * Every mutating call in the I/O layer runs synchronously and hands back one of these
 * already completed. Copies share the same result state.
 *
 * @code
 * auto w = handle->write(bytes);
 * if (w.status() != FileOpStatus::Complete) {
 *     VAULT_LOG_ERROR(w.errorInfo().message);
 * }
 * @endcode
 */
class FileOperationHandle {
public:
    FileOperationHandle() = default;

    FileOpStatus status() const noexcept;
    bool succeeded() const noexcept { return status() == FileOpStatus::Complete; }

    uint64_t bytesWritten() const;
    uint64_t bytesRead() const;

    const std::optional<FileMetadata>& metadata() const;

    // Error information - valid when status is Failed
    const FileErrorInfo& errorInfo() const;

    static FileOperationHandle completed(uint64_t wrote = 0);
    static FileOperationHandle failure(FileError code, std::string message,
                                       std::string path = {},
                                       std::optional<std::error_code> ec = std::nullopt);

private:
    struct OpState {
        FileOpStatus st = FileOpStatus::Pending;
        uint64_t wrote = 0;
        uint64_t read = 0;
        FileErrorInfo error;
        std::optional<FileMetadata> metadata;

        void complete(FileOpStatus final) noexcept { st = final; }

        void setError(FileError code, std::string msg,
                      std::string path = {},
                      std::optional<std::error_code> ec = std::nullopt) {
            error.code = code;
            error.message = std::move(msg);
            error.path = std::move(path);
            error.systemError = ec;
        }
    };

    std::shared_ptr<OpState> _s;
    explicit FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

    friend class LocalFileSystemBackend;
    friend class SharedChannel;
};

} // namespace VaultEngine::Core::IO
