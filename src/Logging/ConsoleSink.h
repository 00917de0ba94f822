/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include <string>
#include "ILogSink.h"

namespace VaultEngine::Core::Logging {

// Writes one line per entry; Warning and above go to stderr.
class ConsoleSink : public ILogSink {
public:
    ConsoleSink() = default;

    void write(const LogEntry& entry) override;
    void flush() override;

    static std::string formatEntry(const LogEntry& entry);
};

} // namespace VaultEngine::Core::Logging
