/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "MoveCoordinator.h"
#include "WriteHandle.h"
#include "IFileSystemBackend.h"
#include "../Logging/Logger.h"
#include <format>

namespace VaultEngine::Core::IO {

FileOperationHandle MoveCoordinator::validate(WriteHandle& source, WriteHandle& target) {
    if (!source.belongsToSameFilesystem(target)) {
        return FileOperationHandle::failure(FileError::InvalidArgument,
            std::format("{} belongs to a different filesystem than {}", target.describe(), source.describe()),
            target.path());
    }
    if (auto check = target.assertOpen(); !check.succeeded()) {
        return check;
    }
    if (source._backend->isDirectory(source.path())) {
        return FileOperationHandle::failure(FileError::IsADirectory,
            "Move source is a directory", source.path());
    }
    if (target._backend->isDirectory(target.path())) {
        return FileOperationHandle::failure(FileError::IsADirectory,
            "Move destination is a directory", target.path());
    }
    return FileOperationHandle::completed();
}

FileOperationHandle MoveCoordinator::execute(WriteHandle& source, WriteHandle& target) {
    if (auto check = source.assertOpen(); !check.succeeded()) {
        return check;
    }
    if (&source == &target) {
        return FileOperationHandle::completed();
    }
    if (auto check = validate(source, target); !check.succeeded()) {
        return check;
    }

    // From here on both handles end Closed, target lock released before source lock
    struct FinalizeGuard {
        WriteHandle& source;
        WriteHandle& target;
        ~FinalizeGuard() {
            target.finalize();
            source.finalize();
        }
    };
    FinalizeGuard guard{source, target};

    auto moveFailed = [&](const FileOperationHandle& cause, const char* step) {
        const auto& info = cause.errorInfo();
        VAULT_LOG_WARNING_CAT("MoveCoordinator",
            std::format("Move {} -> {} failed while {}: {}", source.path(), target.path(), step, info.message));
        return FileOperationHandle::failure(FileError::MoveFailed,
            std::format("Move failed while {}: {}", step, info.message),
            source.path(), info.systemError);
    };

    // Both channels are released before any failure is reported
    auto sourceClosed = source.closeChannelIfOpened();
    auto targetClosed = target.closeChannelIfOpened();
    if (!sourceClosed.succeeded()) {
        return moveFailed(sourceClosed, "closing the source channel");
    }
    if (!targetClosed.succeeded()) {
        return moveFailed(targetClosed, "closing the destination channel");
    }

    auto renamed = source._backend->moveFile(source.path(), target.path());
    if (!renamed.succeeded()) {
        return moveFailed(renamed, "renaming");
    }

    VAULT_LOG_DEBUG_CAT("MoveCoordinator", "Moved " + source.path() + " -> " + target.path());
    return renamed;
}

} // namespace VaultEngine::Core::IO
