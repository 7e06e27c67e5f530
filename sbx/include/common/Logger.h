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

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace SBX {

/**
 * @brief Process-wide logging facade for the sandbox engine
 *
 * Messages go to an injectable ILoggerBackend. Without injection the facade lazily
 * creates the spdlog backend (SBX_USE_SPDLOG builds) or the dependency-free
 * DefaultBackend.
 *
 * Script console output never passes through here: it is captured per invocation
 * and returned to the caller inside ScriptResult.
 *
 * @code
 * SBX::Logger::initialize();
 * LOG_INFO("SandboxRuntimeManager: ready, memory limit {} bytes", limit);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the default console backend unless one was injected
     */
    static void initialize();

    /**
     * @brief Create the default backend with an additional file sink
     *
     * @param logDir Directory receiving sbx.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace SBX

// std::format based macros; source_location is captured at the call site
#define LOG_TRACE(...) SBX::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) SBX::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) SBX::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) SBX::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) SBX::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
