/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include "LogEntry.h"

namespace VaultEngine::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks are invoked by Logger under its sink mutex, one entry at a time, so
 * implementations do not need their own locking for write().
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

} // namespace VaultEngine::Core::Logging
