/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities and debugging macros for VaultCore
 *
 * Debug assertions, build configuration flags and the environment helper used by
 * the logging and configuration layers.
 */

#include <cassert>
#include <optional>
#include <string>
#include <cstdlib>

#ifdef VaultDebug
#undef NDEBUG
#define VAULT_ASSERT(condition, message) assert((condition) && (message))
#else
#define VAULT_ASSERT(condition, message) ((void)0)
#endif

namespace VaultEngine {
namespace Core {
    // Copies the variable into a std::string; std::nullopt if it is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    }
} // namespace Core
}
