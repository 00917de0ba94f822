/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "FileOperationHandle.h"
#include <cerrno>

namespace VaultEngine::Core::IO {

const char* toString(FileError error) noexcept {
    switch (error) {
        case FileError::None: return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull: return "DiskFull";
        case FileError::InvalidPath: return "InvalidPath";
        case FileError::IOError: return "IOError";
        case FileError::HandleClosed: return "HandleClosed";
        case FileError::InvalidArgument: return "InvalidArgument";
        case FileError::IsADirectory: return "IsADirectory";
        case FileError::MoveFailed: return "MoveFailed";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

FileError fileErrorFromErrorCode(const std::error_code& ec) noexcept {
    if (!ec) return FileError::None;
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return FileError::IOError;
    }
    switch (ec.value()) {
        case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
        case EDQUOT:  // Disk quota exceeded (POSIX)
#endif
            return FileError::DiskFull;
        case EACCES:
        case EPERM:
        case EROFS:
            return FileError::AccessDenied;
        case ENOENT:
            return FileError::FileNotFound;
        case EINVAL:
        case EISDIR:
        case ENAMETOOLONG:
        case ENOTDIR:
            return FileError::InvalidPath;
        default:
            return FileError::IOError;
    }
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st : FileOpStatus::Pending;
}

uint64_t FileOperationHandle::bytesWritten() const {
    return _s ? _s->wrote : 0ULL;
}

uint64_t FileOperationHandle::bytesRead() const {
    return _s ? _s->read : 0ULL;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    static const std::optional<FileMetadata> emptyMetadata;
    if (!_s) return emptyMetadata;
    return _s->metadata;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static const FileErrorInfo emptyError;
    if (!_s) return emptyError;
    return _s->error;
}

FileOperationHandle FileOperationHandle::completed(uint64_t wrote) {
    auto s = std::make_shared<OpState>();
    s->wrote = wrote;
    s->complete(FileOpStatus::Complete);
    return FileOperationHandle(std::move(s));
}

FileOperationHandle FileOperationHandle::failure(FileError code, std::string message,
                                                 std::string path,
                                                 std::optional<std::error_code> ec) {
    auto s = std::make_shared<OpState>();
    s->setError(code, std::move(message), std::move(path), ec);
    s->complete(FileOpStatus::Failed);
    return FileOperationHandle(std::move(s));
}

} // namespace VaultEngine::Core::IO
