/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "LocalFileSystemBackend.h"
#include "../Logging/Logger.h"
#include <filesystem>
#include <cerrno>
#include <cstdio>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>     // open(), O_* flags, AT_FDCWD
#include <unistd.h>    // pwrite(), pread(), ftruncate(), fsync(), close(), unlink()
#include <sys/stat.h>  // fstat(), stat(), lstat(), utimensat()
#else
#error "LocalFileSystemBackend requires a POSIX host"
#endif

namespace VaultEngine::Core::IO {

namespace {
    std::error_code lastError() {
        return std::error_code(errno, std::generic_category());
    }

    // FIFOs, devices and sockets are refused; opening a FIFO read-only would block
    bool isSpecialFile(const std::filesystem::path& p) {
        std::error_code ec;
        auto status = std::filesystem::status(p, ec);
        if (ec) return false;

        return std::filesystem::is_block_file(status) ||
               std::filesystem::is_character_file(status) ||
               std::filesystem::is_fifo(status) ||
               std::filesystem::is_socket(status);
    }

    std::chrono::system_clock::time_point modificationTime(const struct stat& st) {
#if defined(__APPLE__)
        const auto& ts = st.st_mtimespec;
#else
        const auto& ts = st.st_mtim;
#endif
        auto since = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since));
    }

    class LocalFileTransport : public FileTransport {
    public:
        LocalFileTransport(int fd, std::string path, OpenMode mode)
            : _fd(fd), _path(std::move(path)), _mode(mode) {}

        ~LocalFileTransport() override {
            if (_fd >= 0) {
                std::error_code ec;
                close(ec);
                if (ec) {
                    VAULT_LOG_WARNING_CAT("LocalFileTransport", "close on destruction failed for " + _path + ": " + ec.message());
                }
            }
        }

        size_t writeAt(uint64_t offset, std::span<const std::byte> data, std::error_code& ec) override {
            ec.clear();
            if (_fd < 0) { ec = std::make_error_code(std::errc::bad_file_descriptor); return 0; }
            for (;;) {
                ssize_t n = ::pwrite(_fd, data.data(), data.size(), static_cast<off_t>(offset));
                if (n >= 0) return static_cast<size_t>(n);
                if (errno == EINTR) continue;
                ec = lastError();
                return 0;
            }
        }

        size_t readAt(uint64_t offset, std::span<std::byte> buffer, std::error_code& ec) override {
            ec.clear();
            if (_fd < 0) { ec = std::make_error_code(std::errc::bad_file_descriptor); return 0; }
            for (;;) {
                ssize_t n = ::pread(_fd, buffer.data(), buffer.size(), static_cast<off_t>(offset));
                if (n >= 0) return static_cast<size_t>(n);
                if (errno == EINTR) continue;
                ec = lastError();
                return 0;
            }
        }

        void truncate(uint64_t length, std::error_code& ec) override {
            ec.clear();
            if (_fd < 0) { ec = std::make_error_code(std::errc::bad_file_descriptor); return; }
            if (::ftruncate(_fd, static_cast<off_t>(length)) != 0) {
                ec = lastError();
            }
        }

        uint64_t size(std::error_code& ec) const override {
            ec.clear();
            if (_fd < 0) { ec = std::make_error_code(std::errc::bad_file_descriptor); return 0; }
            struct stat st{};
            if (::fstat(_fd, &st) != 0) {
                ec = lastError();
                return 0;
            }
            return static_cast<uint64_t>(st.st_size);
        }

        void sync(std::error_code& ec) override {
            ec.clear();
            if (_fd < 0) { ec = std::make_error_code(std::errc::bad_file_descriptor); return; }
            if (::fsync(_fd) != 0) {
                ec = lastError();
            }
        }

        void close(std::error_code& ec) override {
            ec.clear();
            if (_fd < 0) return;
            int fd = _fd;
            _fd = -1;  // the descriptor is gone even when close(2) reports an error
            if (::close(fd) != 0) {
                ec = lastError();
            }
        }

        bool isOpen() const noexcept override { return _fd >= 0; }
        OpenMode mode() const noexcept override { return _mode; }

    private:
        int _fd = -1;
        std::string _path;
        OpenMode _mode;
    };
}

LocalFileSystemBackend::LocalFileSystemBackend() {
}

std::unique_ptr<FileTransport> LocalFileSystemBackend::openTransport(const std::string& path, OpenMode mode,
                                                                     bool createParents, std::error_code& ec) {
    ec.clear();
    if (isSpecialFile(path)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return nullptr;
    }

    if (mode == OpenMode::Write && createParents) {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) return nullptr;
        }
    }

    int flags = O_CLOEXEC;
    flags |= (mode == OpenMode::Write) ? (O_RDWR | O_CREAT) : O_RDONLY;
    int fd = ::open(path.c_str(), flags, 0666);
    if (fd < 0) {
        ec = lastError();
        return nullptr;
    }

    // Read-only open of a directory succeeds on POSIX; refuse it here
    struct stat st{};
    if (::fstat(fd, &st) != 0 || S_ISDIR(st.st_mode)) {
        ec = S_ISDIR(st.st_mode) ? std::make_error_code(std::errc::is_a_directory) : lastError();
        ::close(fd);
        return nullptr;
    }

    VAULT_LOG_DEBUG_CAT("LocalFileSystem", std::string("Opened transport ") + (mode == OpenMode::Write ? "rw " : "ro ") + path);
    return std::make_unique<LocalFileTransport>(fd, path, mode);
}

FileOperationHandle LocalFileSystemBackend::deleteFile(const std::string& path) {
    // unlink(2) refuses directories, matching file-only delete semantics
    if (::unlink(path.c_str()) != 0) {
        auto ec = lastError();
        return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Failed to delete file", path, ec);
    }
    VAULT_LOG_DEBUG_CAT("LocalFileSystem", "Deleted " + path);
    return FileOperationHandle::completed();
}

FileOperationHandle LocalFileSystemBackend::moveFile(const std::string& src, const std::string& dst) {
    if (std::rename(src.c_str(), dst.c_str()) != 0) {
        auto ec = lastError();
        return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Rename failed: " + ec.message(), src, ec);
    }
    VAULT_LOG_DEBUG_CAT("LocalFileSystem", "Renamed " + src + " -> " + dst);
    return FileOperationHandle::completed();
}

FileOperationHandle LocalFileSystemBackend::setLastModified(const std::string& path,
                                                            std::chrono::system_clock::time_point when) {
    auto since = when.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since - secs);

    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;  // leave atime alone
    times[1].tv_sec = static_cast<time_t>(secs.count());
    times[1].tv_nsec = static_cast<long>(nanos.count());

    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        auto ec = lastError();
        return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Failed to set modification time", path, ec);
    }
    return FileOperationHandle::completed();
}

FileOperationHandle LocalFileSystemBackend::getMetadata(const std::string& path) {
    auto state = std::make_shared<FileOperationHandle::OpState>();
    FileMetadata meta;
    meta.path = path;

    struct stat lst{};
    if (::lstat(path.c_str(), &lst) != 0) {
        auto ec = lastError();
        if (ec.value() != ENOENT && ec.value() != ENOTDIR) {
            state->setError(fileErrorFromErrorCode(ec), "Failed to stat path", path, ec);
            state->complete(FileOpStatus::Failed);
            return FileOperationHandle(std::move(state));
        }
        // Missing path is not an error for metadata queries
        state->metadata = meta;
        state->complete(FileOpStatus::Complete);
        return FileOperationHandle(std::move(state));
    }
    meta.isSymlink = S_ISLNK(lst.st_mode);

    // Follow symlinks for the remaining fields; a dangling link reports exists=false
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0) {
        meta.exists = true;
        meta.isDirectory = S_ISDIR(st.st_mode);
        meta.isRegularFile = S_ISREG(st.st_mode);
        meta.size = meta.isRegularFile ? static_cast<uintmax_t>(st.st_size) : 0;
        meta.lastModified = modificationTime(st);
    }

    state->metadata = meta;
    state->complete(FileOpStatus::Complete);
    return FileOperationHandle(std::move(state));
}

bool LocalFileSystemBackend::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool LocalFileSystemBackend::isDirectory(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

FileOperationHandle LocalFileSystemBackend::createDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Failed to create directory", path, ec);
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return FileOperationHandle::failure(FileError::InvalidPath, "Path exists and is not a directory", path);
    }
    return FileOperationHandle::completed();
}

std::string LocalFileSystemBackend::normalizeKey(const std::string& path) const {
    std::error_code ec;
    auto p = std::filesystem::path(path);
    auto canon = std::filesystem::weakly_canonical(p, ec);
    if (ec) {
        return std::filesystem::absolute(p, ec).lexically_normal().string();
    }
    return canon.string();
}

} // namespace VaultEngine::Core::IO
