/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file WriteHandle.h
 * @brief Exclusive write session against one file identity
 *
 * A WriteHandle is created by VirtualFileSystem::openWritable() together with the identity's
 * write lock and keeps it until its first terminal operation (close, remove or moveTo). The
 * shared channel for the identity is opened lazily on the first operation that needs it.
 * After the terminal operation the handle stays Closed and every mutating call fails with
 * FileError::HandleClosed; reopen through the VirtualFileSystem instead of retrying.
 *
 * A handle is not synchronized internally. Use it from one thread at a time; exclusivity
 * against other writers comes from the identity lock.
 *
 * @code
 * auto h = vfs.openWritable("data/out.bin");
 * h->write(std::string_view("header"));
 * h->position(128);
 * h->write(payload);
 * h->close();
 * @endcode
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include "FileOperationHandle.h"
#include "FileLock.h"

namespace VaultEngine::Core::IO {

class VirtualFileSystem;
class IFileSystemBackend;
class SharedChannel;
class ChannelRegistry;
class MoveCoordinator;

class WriteHandle {
public:
    enum class State { Open, Closed };

    /**
     * Closes the handle if it is still open, logging a warning, and returns its channel
     * reference to the owning registry.
     */
    ~WriteHandle();

    WriteHandle(const WriteHandle&) = delete;
    WriteHandle& operator=(const WriteHandle&) = delete;
    WriteHandle(WriteHandle&&) = delete;
    WriteHandle& operator=(WriteHandle&&) = delete;

    /**
     * @brief Writes the whole buffer at the cursor
     *
     * The cursor advances by bytesWritten() only when the write succeeds.
     * @return Complete with bytesWritten() == data.size(), or Failed
     */
    FileOperationHandle write(std::span<const std::byte> data);
    FileOperationHandle write(std::string_view text);

    /**
     * @brief Moves the cursor
     *
     * No bounds check: writing after seeking past the end extends the file and leaves a hole.
     */
    FileOperationHandle position(uint64_t newPosition);
    uint64_t position() const noexcept { return _cursor; }

    // Truncates the file to zero length; the cursor is left where it was
    FileOperationHandle truncate();

    FileOperationHandle setLastModified(std::chrono::system_clock::time_point when);

    /**
     * @brief Deletes the file and closes the handle
     *
     * The handle is Closed and the lock released whether or not the deletion succeeds.
     */
    FileOperationHandle remove();

    /**
     * @brief Closes the channel and releases the lock
     *
     * Idempotent. The lock is released even when closing the channel fails; that failure is
     * still reported.
     */
    FileOperationHandle close();

    /**
     * @brief Atomically renames this file over other's file
     *
     * Validation failures (this or other closed, different filesystem, either path a
     * directory) change nothing. Once validation passes both handles end Closed with their
     * locks released, including when the rename fails (FileError::MoveFailed).
     * moveTo(*this) is a no-op that succeeds.
     */
    FileOperationHandle moveTo(WriteHandle& other);

    bool isOpen() const noexcept { return _state == State::Open; }
    State state() const noexcept { return _state; }
    bool channelBound() const noexcept { return _channelBound; }

    const std::string& path() const noexcept { return _path; }
    const std::string& normalizedKey() const noexcept { return _normKey; }
    VirtualFileSystem* fileSystem() const noexcept { return _vfs; }
    const std::shared_ptr<IFileSystemBackend>& backend() const noexcept { return _backend; }

    std::string describe() const;

private:
    WriteHandle(VirtualFileSystem* vfs,
                std::shared_ptr<IFileSystemBackend> backend,
                std::string path,
                std::string normKey,
                WriteLockToken token,
                std::shared_ptr<ChannelRegistry> channels,
                std::shared_ptr<SharedChannel> channel);

    // Complete if open, HandleClosed failure otherwise
    FileOperationHandle assertOpen() const;
    FileOperationHandle ensureChannelIsOpened();
    FileOperationHandle closeChannelIfOpened();

    // The only transition to Closed; releases the lock once
    void finalize() noexcept;

    bool belongsToSameFilesystem(const WriteHandle& other) const noexcept;

    VirtualFileSystem* _vfs;
    std::shared_ptr<IFileSystemBackend> _backend;
    std::string _path;
    std::string _normKey;

    uint64_t _cursor = 0;
    State _state = State::Open;
    bool _channelBound = false;

    WriteLockToken _token;
    std::shared_ptr<ChannelRegistry> _channels;
    std::shared_ptr<SharedChannel> _channel;

    friend class VirtualFileSystem;
    friend class MoveCoordinator;
};

} // namespace VaultEngine::Core::IO
