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

#include "SBXTypes.h"
#include "scripting/ScriptResult.h"
#include <string>

namespace SBX {

/**
 * @brief Abstract interface for sandboxed script execution
 *
 * Lets the worker pool and embedding services be tested against mocks.
 * Implementations must be safe to call from several threads at once and must never
 * let an exception escape execute(): every failure is reported inside ScriptResult.
 */
class IScriptSandbox {
public:
    virtual ~IScriptSandbox() = default;

    /**
     * @brief Run one script invocation to completion
     * @param request Script, input, context and per-call options
     * @return Output or classified error, plus captured console entries
     */
    virtual ScriptResult execute(const ScriptInvocationRequest &request) = 0;

    /**
     * @brief Engine name and version
     */
    virtual std::string getEngineInfo() const = 0;
};

}  // namespace SBX
