/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#include "ConsoleSink.h"
#include <cstdio>
#include <ctime>
#include <format>
#include <functional>

namespace VaultEngine::Core::Logging {

std::string ConsoleSink::formatEntry(const LogEntry& entry) {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(entry.timestamp);
    auto ms = duration_cast<milliseconds>(entry.timestamp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    auto tid = std::hash<std::thread::id>{}(entry.threadId) & 0xFFFF;
    return std::format("[{:02}:{:02}:{:02}.{:03}] [{}] [{:04x}] [{}] {}",
                       tm.tm_hour, tm.tm_min, tm.tm_sec, ms,
                       toString(entry.level), tid, entry.category, entry.message);
}

void ConsoleSink::write(const LogEntry& entry) {
    auto line = formatEntry(entry);
    std::FILE* out = entry.level >= LogLevel::Warning ? stderr : stdout;
    std::fprintf(out, "%s\n", line.c_str());
}

void ConsoleSink::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

} // namespace VaultEngine::Core::Logging
