/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file SharedChannel.h
 * @brief Lazily opened, open-counted transport shared by all handles of one file
 *
 * A SharedChannel exists once per file identity inside a VirtualFileSystem (see
 * ChannelRegistry). Handles call open() when they first need I/O and close() once when they
 * are done; the backend transport is opened on the first open() and released when the open
 * count returns to zero. Exclusive write access is not enforced here: WriteHandle holds the
 * identity's FileLock for that.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include "FileOperationHandle.h"
#include "FileTransport.h"

namespace VaultEngine::Core::IO {

class IFileSystemBackend;

struct ChannelOptions {
    bool createParentDirs = false;  // create missing parents on first Write open
    bool syncOnClose = false;       // fsync before the last close releases the transport
};

class SharedChannel {
public:
    SharedChannel(std::shared_ptr<IFileSystemBackend> backend, std::string path, ChannelOptions options = {});
    ~SharedChannel();

    SharedChannel(const SharedChannel&) = delete;
    SharedChannel& operator=(const SharedChannel&) = delete;

    /**
     * @brief Opens the transport on first use and counts this opener
     *
     * A Write request against a channel that is only open for Read reopens the transport
     * read-write; a Read request is satisfied by any open transport.
     * @return Complete on success; on failure the open count is unchanged
     */
    FileOperationHandle open(OpenMode mode);

    /**
     * @brief Writes the whole buffer at position
     * @return bytesWritten() == data.size() on success; Failed otherwise
     */
    FileOperationHandle writeFully(uint64_t position, std::span<const std::byte> data);

    /**
     * @brief Reads until the buffer is full or end of file
     * @return bytesRead() holds the number of bytes placed in buffer
     */
    FileOperationHandle readFully(uint64_t position, std::span<std::byte> buffer);

    FileOperationHandle truncate(uint64_t length);
    uint64_t size(std::error_code& ec) const;

    /**
     * @brief Balances one successful open()
     *
     * Releases the transport when the count reaches zero. Closing a channel that is not
     * open is a caller bug and fails with IOError without touching the count.
     */
    FileOperationHandle close();

    bool isOpen() const;
    uint32_t openCount() const;
    const std::string& path() const noexcept { return _path; }

private:
    FileOperationHandle releaseTransport();

    mutable std::mutex _mutex;
    std::shared_ptr<IFileSystemBackend> _backend;
    std::string _path;
    ChannelOptions _options;
    std::unique_ptr<FileTransport> _transport;
    uint32_t _openCount = 0;
};

/**
 * @brief Owning map from identity to SharedChannel with explicit reference counts
 *
 * acquire() hands out the identity's channel (creating it on first use) and counts the
 * reference; release() decrements and drops the entry at zero. The map has its own mutex
 * and never calls into a channel while holding it.
 */
class ChannelRegistry {
public:
    explicit ChannelRegistry(ChannelOptions defaults = {});

    std::shared_ptr<SharedChannel> acquire(const std::string& key,
                                           std::shared_ptr<IFileSystemBackend> backend,
                                           const std::string& path);
    void release(const std::string& key);

    size_t referenceCount(const std::string& key) const;
    size_t size() const;

private:
    struct Entry {
        size_t references = 0;
        std::shared_ptr<SharedChannel> channel;
    };

    ChannelOptions _defaults;
    mutable std::mutex _mutex;
    std::unordered_map<std::string, Entry> _entries;
};

} // namespace VaultEngine::Core::IO
