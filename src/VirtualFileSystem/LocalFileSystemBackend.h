/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include "IFileSystemBackend.h"

namespace VaultEngine::Core::IO {

/**
 * @brief Backend over the host filesystem
 *
 * Transports are POSIX file descriptors using pwrite/pread, so positioned writes past EOF
 * leave a hole that reads back as zeros. moveFile() is a plain rename(2) and therefore fails
 * with EXDEV across mount points rather than copying.
 */
class LocalFileSystemBackend : public IFileSystemBackend {
public:
    LocalFileSystemBackend();
    ~LocalFileSystemBackend() override = default;

    std::unique_ptr<FileTransport> openTransport(const std::string& path, OpenMode mode,
                                                 bool createParents, std::error_code& ec) override;

    FileOperationHandle deleteFile(const std::string& path) override;
    FileOperationHandle moveFile(const std::string& src, const std::string& dst) override;
    FileOperationHandle setLastModified(const std::string& path,
                                        std::chrono::system_clock::time_point when) override;

    FileOperationHandle getMetadata(const std::string& path) override;
    bool exists(const std::string& path) override;
    bool isDirectory(const std::string& path) override;
    FileOperationHandle createDirectory(const std::string& path) override;

    // Canonical absolute path (weakly_canonical, lexical fallback)
    std::string normalizeKey(const std::string& path) const override;
};

} // namespace VaultEngine::Core::IO
