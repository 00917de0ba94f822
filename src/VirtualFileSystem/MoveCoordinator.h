/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file MoveCoordinator.h
 * @brief Rename protocol between two open WriteHandles
 *
 * Both handles already hold their identity locks, so the move takes no further locks.
 * The protocol has two phases:
 *
 * 1. Validation, which never mutates either handle: source open, same handle (no-op),
 *    same filesystem instance, target open, neither path a directory.
 * 2. Teardown: close the source channel, close the target channel, rename source over
 *    target. A guard then marks both handles Closed and releases the target lock followed by
 *    the source lock on every exit path.
 *
 * A failed rename therefore still closes both handles; callers reopen through the
 * VirtualFileSystem.
 */
#pragma once
#include "FileOperationHandle.h"

namespace VaultEngine::Core::IO {

class WriteHandle;

class MoveCoordinator {
public:
    static FileOperationHandle execute(WriteHandle& source, WriteHandle& target);

private:
    static FileOperationHandle validate(WriteHandle& source, WriteHandle& target);
};

} // namespace VaultEngine::Core::IO
