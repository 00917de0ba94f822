/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include <span>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace VaultEngine::Core::IO {

enum class OpenMode { Read, Write };

/**
 * @brief Byte-level access to one open host file
 *
 * Backends hand these out from openTransport(); SharedChannel owns exactly one per identity
 * while it is open. Calls follow the std::filesystem convention: failures are reported
 * through the error_code out-parameter, which is cleared on success. Positioned calls do not
 * move any shared file offset, and a single writeAt/readAt may transfer fewer bytes than
 * requested.
 */
class FileTransport {
public:
    virtual ~FileTransport() = default;

    virtual size_t writeAt(uint64_t offset, std::span<const std::byte> data, std::error_code& ec) = 0;
    virtual size_t readAt(uint64_t offset, std::span<std::byte> buffer, std::error_code& ec) = 0;

    virtual void truncate(uint64_t length, std::error_code& ec) = 0;
    virtual uint64_t size(std::error_code& ec) const = 0;

    // Flush to stable storage
    virtual void sync(std::error_code& ec) = 0;

    // Idempotent; after close every other call fails with EBADF
    virtual void close(std::error_code& ec) = 0;
    virtual bool isOpen() const noexcept = 0;

    virtual OpenMode mode() const noexcept = 0;
};

} // namespace VaultEngine::Core::IO
