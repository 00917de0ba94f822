/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Vault Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger::global() is created on first use with a ConsoleSink attached and its minimum
 * level taken from the VAULT_LOG_LEVEL environment variable (trace, debug, info, warning,
 * error, fatal; default info). Use the VAULT_LOG_* macros rather than calling log() directly.
 *
 * @code
 * VAULT_LOG_INFO("Opened " + path);
 * VAULT_LOG_DEBUG_CAT("SharedChannel", std::format("open count {}", n));
 * @endcode
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "ILogSink.h"
#include "LogLevel.h"

namespace VaultEngine::Core::Logging {

class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& global();

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept { return level >= minLevel(); }

    void log(LogLevel level, std::string_view category, std::string_view message);
    void flush();

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace VaultEngine::Core::Logging

#ifndef VAULT_LOG_CATEGORY_DEFAULT
#define VAULT_LOG_CATEGORY_DEFAULT __func__
#endif

#define VAULT_LOG_AT(level, cat, msg)                                                          \
    do {                                                                                       \
        auto& vault_logger_ = ::VaultEngine::Core::Logging::Logger::global();                  \
        if (vault_logger_.isEnabled(level)) vault_logger_.log((level), (cat), (msg));          \
    } while (0)

#define VAULT_LOG_TRACE(msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Trace, VAULT_LOG_CATEGORY_DEFAULT, msg)
#define VAULT_LOG_DEBUG(msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Debug, VAULT_LOG_CATEGORY_DEFAULT, msg)
#define VAULT_LOG_INFO(msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Info, VAULT_LOG_CATEGORY_DEFAULT, msg)
#define VAULT_LOG_WARNING(msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Warning, VAULT_LOG_CATEGORY_DEFAULT, msg)
#define VAULT_LOG_ERROR(msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Error, VAULT_LOG_CATEGORY_DEFAULT, msg)
#define VAULT_LOG_FATAL(msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Fatal, VAULT_LOG_CATEGORY_DEFAULT, msg)

#define VAULT_LOG_TRACE_CAT(cat, msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Trace, cat, msg)
#define VAULT_LOG_DEBUG_CAT(cat, msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Debug, cat, msg)
#define VAULT_LOG_INFO_CAT(cat, msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Info, cat, msg)
#define VAULT_LOG_WARNING_CAT(cat, msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Warning, cat, msg)
#define VAULT_LOG_ERROR_CAT(cat, msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Error, cat, msg)
#define VAULT_LOG_FATAL_CAT(cat, msg) VAULT_LOG_AT(::VaultEngine::Core::Logging::LogLevel::Fatal, cat, msg)
