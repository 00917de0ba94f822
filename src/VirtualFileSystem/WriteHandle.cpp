/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "WriteHandle.h"
#include "IFileSystemBackend.h"
#include "MoveCoordinator.h"
#include "SharedChannel.h"
#include "../Logging/Logger.h"
#include <format>

namespace VaultEngine::Core::IO {

WriteHandle::WriteHandle(VirtualFileSystem* vfs,
                         std::shared_ptr<IFileSystemBackend> backend,
                         std::string path,
                         std::string normKey,
                         WriteLockToken token,
                         std::shared_ptr<ChannelRegistry> channels,
                         std::shared_ptr<SharedChannel> channel)
    : _vfs(vfs)
    , _backend(std::move(backend))
    , _path(std::move(path))
    , _normKey(std::move(normKey))
    , _token(std::move(token))
    , _channels(std::move(channels))
    , _channel(std::move(channel)) {
}

WriteHandle::~WriteHandle() {
    if (isOpen()) {
        VAULT_LOG_WARNING_CAT("WriteHandle", describe() + " destroyed while open; closing");
        auto result = close();
        if (!result.succeeded()) {
            VAULT_LOG_WARNING_CAT("WriteHandle", "Close on destruction failed: " + result.errorInfo().message);
        }
    }
    _channel.reset();
    if (_channels) {
        _channels->release(_normKey);
    }
}

std::string WriteHandle::describe() const {
    return "WriteHandle(" + _path + ")";
}

FileOperationHandle WriteHandle::assertOpen() const {
    if (_state != State::Open) {
        return FileOperationHandle::failure(FileError::HandleClosed, describe() + " already closed.", _path);
    }
    return FileOperationHandle::completed();
}

FileOperationHandle WriteHandle::ensureChannelIsOpened() {
    if (_channelBound) {
        return FileOperationHandle::completed();
    }
    auto opened = _channel->open(OpenMode::Write);
    if (opened.succeeded()) {
        _channelBound = true;
    }
    return opened;
}

FileOperationHandle WriteHandle::closeChannelIfOpened() {
    if (!_channelBound) {
        return FileOperationHandle::completed();
    }
    // Unbound even on failure; the channel has already dropped this opener
    _channelBound = false;
    return _channel->close();
}

void WriteHandle::finalize() noexcept {
    if (_state == State::Closed) return;
    _state = State::Closed;
    if (_token.release()) {
        VAULT_LOG_DEBUG_CAT("WriteHandle", "Released write lock for " + _normKey);
    }
}

bool WriteHandle::belongsToSameFilesystem(const WriteHandle& other) const noexcept {
    return _vfs == other._vfs && _backend == other._backend;
}

FileOperationHandle WriteHandle::write(std::span<const std::byte> data) {
    if (auto check = assertOpen(); !check.succeeded()) return check;
    if (auto bound = ensureChannelIsOpened(); !bound.succeeded()) return bound;

    auto result = _channel->writeFully(_cursor, data);
    if (result.succeeded()) {
        _cursor += result.bytesWritten();
    }
    return result;
}

FileOperationHandle WriteHandle::write(std::string_view text) {
    return write(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

FileOperationHandle WriteHandle::position(uint64_t newPosition) {
    if (auto check = assertOpen(); !check.succeeded()) return check;
    _cursor = newPosition;
    return FileOperationHandle::completed();
}

FileOperationHandle WriteHandle::truncate() {
    if (auto check = assertOpen(); !check.succeeded()) return check;
    if (auto bound = ensureChannelIsOpened(); !bound.succeeded()) return bound;
    return _channel->truncate(0);
}

FileOperationHandle WriteHandle::setLastModified(std::chrono::system_clock::time_point when) {
    if (auto check = assertOpen(); !check.succeeded()) return check;
    if (auto bound = ensureChannelIsOpened(); !bound.succeeded()) return bound;
    return _backend->setLastModified(_path, when);
}

FileOperationHandle WriteHandle::remove() {
    if (auto check = assertOpen(); !check.succeeded()) return check;

    struct FinalizeGuard {
        WriteHandle* handle;
        ~FinalizeGuard() { handle->finalize(); }
    };
    FinalizeGuard guard{this};

    if (auto closed = closeChannelIfOpened(); !closed.succeeded()) {
        return closed;
    }
    auto deleted = _backend->deleteFile(_path);
    if (deleted.succeeded()) {
        VAULT_LOG_DEBUG_CAT("WriteHandle", "Deleted " + _path);
    }
    return deleted;
}

FileOperationHandle WriteHandle::close() {
    if (_state == State::Closed) {
        return FileOperationHandle::completed();
    }

    struct FinalizeGuard {
        WriteHandle* handle;
        ~FinalizeGuard() { handle->finalize(); }
    };
    FinalizeGuard guard{this};

    auto closed = closeChannelIfOpened();
    if (!closed.succeeded()) {
        VAULT_LOG_WARNING_CAT("WriteHandle",
            std::format("Channel close failed for {}: {}", _path, closed.errorInfo().message));
    }
    return closed;
}

FileOperationHandle WriteHandle::moveTo(WriteHandle& other) {
    return MoveCoordinator::execute(*this, other);
}

} // namespace VaultEngine::Core::IO
