#pragma once

#include <stdexcept>
#include <string>

namespace SBX {

/**
 * @brief A value cannot cross the sandbox boundary (unsupported type, cycle, depth, size)
 */
class MarshallingException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A QuickJS call returned JS_EXCEPTION; the exception is still pending on the context
 *
 * Carries no message: the ErrorTranslator reads and classifies the pending exception.
 */
class PendingScriptException : public std::runtime_error {
public:
    PendingScriptException() : std::runtime_error("pending JavaScript exception") {}
};

/**
 * @brief Engine-level failure unrelated to the script (runtime or thread could not be created)
 */
class SandboxUnavailableException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace SBX
