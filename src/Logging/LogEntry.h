/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include <chrono>
#include <string>
#include <thread>
#include "LogLevel.h"

namespace VaultEngine::Core::Logging {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
    std::thread::id threadId;
};

} // namespace VaultEngine::Core::Logging
