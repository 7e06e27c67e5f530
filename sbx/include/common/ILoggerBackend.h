// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SBX-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SBX (ScriptBox Sandbox Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/reactive-state-machine/blob/main/LICENSE

#pragma once

#include <optional>
#include <source_location>
#include <string>

namespace SBX {

/**
 * @brief Log level enumeration
 *
 * Ordered from most to least verbose so backends can filter with a plain comparison.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Parse a level name as accepted by SPDLOG_LEVEL ("trace", "warning", "err", ...)
 * @return Parsed level or nullopt for unknown names
 */
std::optional<LogLevel> parseLogLevel(const std::string &name);

/**
 * @brief Level requested through the SPDLOG_LEVEL environment variable, if any
 */
std::optional<LogLevel> logLevelFromEnvironment();

/**
 * @brief Logger backend interface for dependency injection
 *
 * Embedders route sandbox diagnostics into their own logging stack by implementing
 * this interface and handing it to SBX::Logger::setBackend().
 *
 * @code
 * class ServiceLogger : public SBX::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         service_->write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { service_->setMinLevel(static_cast<int>(level)); }
 *     void flush() override { service_->flush(); }
 * };
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level; messages below it are dropped
     */
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace SBX
