/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once

/**
 * @file VaultCore.h
 * @brief Single header that includes all VaultCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Virtual file system
#include "VirtualFileSystem/FileOperationHandle.h"
#include "VirtualFileSystem/FileTransport.h"
#include "VirtualFileSystem/IFileSystemBackend.h"
#include "VirtualFileSystem/LocalFileSystemBackend.h"
#include "VirtualFileSystem/SharedChannel.h"
#include "VirtualFileSystem/FileLock.h"
#include "VirtualFileSystem/WriteHandle.h"
#include "VirtualFileSystem/MoveCoordinator.h"
#include "VirtualFileSystem/VirtualFileSystem.h"
