/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "SharedChannel.h"
#include "IFileSystemBackend.h"
#include "../Logging/Logger.h"
#include <format>

namespace VaultEngine::Core::IO {

SharedChannel::SharedChannel(std::shared_ptr<IFileSystemBackend> backend, std::string path, ChannelOptions options)
    : _backend(std::move(backend))
    , _path(std::move(path))
    , _options(options) {
}

SharedChannel::~SharedChannel() {
    if (_transport) {
        VAULT_LOG_WARNING_CAT("SharedChannel",
            std::format("Channel for {} destroyed with {} open reference(s)", _path, _openCount));
        std::error_code ec;
        _transport->close(ec);
        if (ec) {
            VAULT_LOG_WARNING_CAT("SharedChannel", "Closing abandoned transport failed: " + ec.message());
        }
    }
}

FileOperationHandle SharedChannel::open(OpenMode mode) {
    std::lock_guard lock(_mutex);
    if (!_backend) {
        return FileOperationHandle::failure(FileError::Unknown, "No backend available for channel", _path);
    }

    if (_transport && _transport->isOpen()) {
        if (mode == OpenMode::Write && _transport->mode() == OpenMode::Read) {
            std::error_code ec;
            auto upgraded = _backend->openTransport(_path, OpenMode::Write, _options.createParentDirs, ec);
            if (!upgraded) {
                return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Failed to reopen channel for write", _path, ec);
            }
            std::error_code closeEc;
            _transport->close(closeEc);
            if (closeEc) {
                VAULT_LOG_WARNING_CAT("SharedChannel", "Closing read transport during upgrade failed: " + closeEc.message());
            }
            _transport = std::move(upgraded);
        }
        ++_openCount;
        VAULT_LOG_TRACE_CAT("SharedChannel", std::format("open {} -> count {}", _path, _openCount));
        return FileOperationHandle::completed();
    }

    std::error_code ec;
    auto transport = _backend->openTransport(_path, mode, mode == OpenMode::Write && _options.createParentDirs, ec);
    if (!transport) {
        return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Failed to open channel", _path, ec);
    }
    _transport = std::move(transport);
    _openCount = 1;
    VAULT_LOG_DEBUG_CAT("SharedChannel", "Opened channel for " + _path);
    return FileOperationHandle::completed();
}

FileOperationHandle SharedChannel::writeFully(uint64_t position, std::span<const std::byte> data) {
    std::lock_guard lock(_mutex);
    if (!_transport || !_transport->isOpen()) {
        return FileOperationHandle::failure(FileError::IOError, "Channel is not open", _path);
    }
    if (_transport->mode() != OpenMode::Write) {
        return FileOperationHandle::failure(FileError::AccessDenied, "Channel is open read-only", _path);
    }

    auto state = std::make_shared<FileOperationHandle::OpState>();
    size_t total = 0;
    while (total < data.size()) {
        std::error_code ec;
        size_t n = _transport->writeAt(position + total, data.subspan(total), ec);
        if (ec) {
            state->wrote = total;
            state->setError(fileErrorFromErrorCode(ec),
                            std::format("Write failed after {} of {} bytes", total, data.size()), _path, ec);
            state->complete(FileOpStatus::Failed);
            return FileOperationHandle(std::move(state));
        }
        if (n == 0) {
            state->wrote = total;
            state->setError(FileError::IOError,
                            std::format("Transport made no progress after {} of {} bytes", total, data.size()), _path);
            state->complete(FileOpStatus::Failed);
            return FileOperationHandle(std::move(state));
        }
        total += n;
    }
    state->wrote = total;
    state->complete(FileOpStatus::Complete);
    return FileOperationHandle(std::move(state));
}

FileOperationHandle SharedChannel::readFully(uint64_t position, std::span<std::byte> buffer) {
    std::lock_guard lock(_mutex);
    if (!_transport || !_transport->isOpen()) {
        return FileOperationHandle::failure(FileError::IOError, "Channel is not open", _path);
    }

    auto state = std::make_shared<FileOperationHandle::OpState>();
    size_t total = 0;
    while (total < buffer.size()) {
        std::error_code ec;
        size_t n = _transport->readAt(position + total, buffer.subspan(total), ec);
        if (ec) {
            state->read = total;
            state->setError(fileErrorFromErrorCode(ec), "Read failed", _path, ec);
            state->complete(FileOpStatus::Failed);
            return FileOperationHandle(std::move(state));
        }
        if (n == 0) break;  // end of file
        total += n;
    }
    state->read = total;
    state->complete(FileOpStatus::Complete);
    return FileOperationHandle(std::move(state));
}

FileOperationHandle SharedChannel::truncate(uint64_t length) {
    std::lock_guard lock(_mutex);
    if (!_transport || !_transport->isOpen()) {
        return FileOperationHandle::failure(FileError::IOError, "Channel is not open", _path);
    }
    std::error_code ec;
    _transport->truncate(length, ec);
    if (ec) {
        return FileOperationHandle::failure(fileErrorFromErrorCode(ec), "Truncate failed", _path, ec);
    }
    return FileOperationHandle::completed();
}

uint64_t SharedChannel::size(std::error_code& ec) const {
    std::lock_guard lock(_mutex);
    if (!_transport || !_transport->isOpen()) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    return _transport->size(ec);
}

FileOperationHandle SharedChannel::close() {
    std::lock_guard lock(_mutex);
    if (_openCount == 0) {
        VAULT_LOG_ERROR_CAT("SharedChannel", "close() on channel that is not open: " + _path);
        return FileOperationHandle::failure(FileError::IOError, "Channel is not open", _path);
    }
    if (--_openCount > 0) {
        VAULT_LOG_TRACE_CAT("SharedChannel", std::format("close {} -> count {}", _path, _openCount));
        return FileOperationHandle::completed();
    }
    return releaseTransport();
}

// Caller holds _mutex and has brought the open count to zero
FileOperationHandle SharedChannel::releaseTransport() {
    auto transport = std::move(_transport);
    if (!transport) {
        return FileOperationHandle::completed();
    }

    std::error_code syncEc;
    if (_options.syncOnClose && transport->mode() == OpenMode::Write) {
        transport->sync(syncEc);
    }
    std::error_code closeEc;
    transport->close(closeEc);
    VAULT_LOG_DEBUG_CAT("SharedChannel", "Closed channel for " + _path);

    if (syncEc) {
        return FileOperationHandle::failure(fileErrorFromErrorCode(syncEc), "fsync failed", _path, syncEc);
    }
    if (closeEc) {
        return FileOperationHandle::failure(fileErrorFromErrorCode(closeEc), "Close failed", _path, closeEc);
    }
    return FileOperationHandle::completed();
}

bool SharedChannel::isOpen() const {
    std::lock_guard lock(_mutex);
    return _transport && _transport->isOpen();
}

uint32_t SharedChannel::openCount() const {
    std::lock_guard lock(_mutex);
    return _openCount;
}

// ChannelRegistry

ChannelRegistry::ChannelRegistry(ChannelOptions defaults)
    : _defaults(defaults) {
}

std::shared_ptr<SharedChannel> ChannelRegistry::acquire(const std::string& key,
                                                        std::shared_ptr<IFileSystemBackend> backend,
                                                        const std::string& path) {
    std::lock_guard lock(_mutex);
    auto& entry = _entries[key];
    if (!entry.channel) {
        entry.channel = std::make_shared<SharedChannel>(std::move(backend), path, _defaults);
    }
    ++entry.references;
    return entry.channel;
}

void ChannelRegistry::release(const std::string& key) {
    std::shared_ptr<SharedChannel> dropped;
    {
        std::lock_guard lock(_mutex);
        auto it = _entries.find(key);
        if (it == _entries.end() || it->second.references == 0) {
            VAULT_LOG_ERROR_CAT("ChannelRegistry", "release() without matching acquire for " + key);
            return;
        }
        if (--it->second.references > 0) return;
        dropped = std::move(it->second.channel);
        _entries.erase(it);
    }
    // Destroyed outside the map lock; closes the transport if opens are still outstanding
    dropped.reset();
}

size_t ChannelRegistry::referenceCount(const std::string& key) const {
    std::lock_guard lock(_mutex);
    auto it = _entries.find(key);
    return it == _entries.end() ? 0 : it->second.references;
}

size_t ChannelRegistry::size() const {
    std::lock_guard lock(_mutex);
    return _entries.size();
}

} // namespace VaultEngine::Core::IO
