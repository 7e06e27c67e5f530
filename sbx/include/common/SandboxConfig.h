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

#include "common/JsonUtils.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace SBX {

/**
 * @brief Engine-wide limits for sandboxed invocations
 *
 * Defaults are safe for untrusted tenant scripts. Values can be overridden from
 * SBX_SANDBOX_* environment variables or a JSON document whose keys match the field
 * names. An override that is not a valid positive number is logged and ignored, so
 * the previous value stays in effect.
 *
 * @code
 * auto config = SBX::SandboxConfig::fromEnvironment();
 * SBX::SandboxRuntimeManager manager(config);
 * @endcode
 */
struct SandboxConfig {
    size_t memoryLimitBytes = 128 * 1024 * 1024;
    size_t maxStackSizeBytes = 512 * 1024;
    int64_t minTimeoutMs = 1;
    int64_t maxTimeoutMs = 3000;
    int64_t terminationGraceMs = 25;
    size_t maxCodeSize = 32768;
    size_t maxInputSize = 65536;
    size_t maxOutputSize = 65536;
    size_t maxConsoleEntries = 1000;
    size_t maxConsoleBytes = 65536;
    size_t maxMarshalDepth = 128;
    size_t maxErrorMessageLength = 500;
    // 0 selects std::thread::hardware_concurrency()
    size_t workerThreads = 0;

    /**
     * @brief Defaults overridden by the SBX_SANDBOX_* environment variables
     */
    static SandboxConfig fromEnvironment();

    /**
     * @brief Defaults overridden by the keys present in a JSON object
     */
    static SandboxConfig fromJson(const json &value);

    /**
     * @brief Apply SBX_SANDBOX_* variables on top of the current values
     */
    void applyEnvironment();

    /**
     * @brief Apply the keys present in a JSON object on top of the current values
     */
    void applyJson(const json &value);

    json toJson() const;

    /**
     * @brief Check cross-field consistency
     * @param errorOut Receives the first problem found
     */
    bool validate(std::string *errorOut = nullptr) const;

    /**
     * @brief Requested timeout clamped into [minTimeoutMs, maxTimeoutMs]
     */
    int64_t clampTimeout(int64_t requestedMs) const;

    size_t resolvedWorkerThreads() const;
};

}  // namespace SBX
