/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once
#include <optional>
#include <string_view>

namespace VaultEngine::Core::Logging {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5
};

inline constexpr std::string_view toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "INFO";
}

/**
 * @brief Parses a level name (case-insensitive; "warn" and "warning" both accepted)
 * @return Parsed level, or std::nullopt for unknown names
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace VaultEngine::Core::Logging
