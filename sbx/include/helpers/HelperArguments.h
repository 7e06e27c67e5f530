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

#include "helpers/HelperLibrary.h"
#include <string>

namespace SBX {
namespace HelperArguments {

// Argument accessors shared by the helper implementations. Each throws HelperError
// naming the helper and the offending position.

const HostValue &at(const HelperArgs &args, size_t index);

bool isMissing(const HelperArgs &args, size_t index);

const std::string &requireString(const HelperArgs &args, size_t index, const char *helper);

double requireNumber(const HelperArgs &args, size_t index, const char *helper);

double optionalNumber(const HelperArgs &args, size_t index, double defaultValue, const char *helper);

constexpr double MAX_SAFE_INTEGER = 9007199254740991.0;

/**
 * @brief Finite number truncated toward zero and clamped to +/-MAX_SAFE_INTEGER
 */
int64_t requireInteger(const HelperArgs &args, size_t index, const char *helper);

const HostValue &requireArray(const HelperArgs &args, size_t index, const char *helper);

const HostValue &requireObject(const HelperArgs &args, size_t index, const char *helper);

/**
 * @brief String conversion following ECMAScript String(value) for JSON values
 *
 * null becomes "null", arrays join their elements with "," and objects print as
 * "[object Object]".
 */
std::string toDisplayString(const HostValue &value);

/**
 * @brief Number as a host value: integral results become integers
 */
HostValue numberValue(double number);

}  // namespace HelperArguments
}  // namespace SBX
