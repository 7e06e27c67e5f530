#pragma once

#include "quickjs.h"
#include "scripting/SandboxContext.h"
#include "scripting/ScriptResult.h"
#include <cstddef>
#include <exception>
#include <string>

namespace SBX {

/**
 * @brief Invocation phase a pending JavaScript exception was raised in
 */
enum class FailureStage { Compiling, Running };

/**
 * @brief Maps engine and host failures onto the closed ErrorTag taxonomy
 *
 * Classification order for a pending JavaScript exception:
 * memory ceiling hit, then deadline or cancellation, then an "out of memory" error
 * raised by the allocator, then a SyntaxError while compiling, and finally
 * RuntimeError for anything the script threw.
 *
 * Every message is sanitized: stack frames and absolute host paths are removed and
 * the text is cut to maxMessageLength bytes on a UTF-8 boundary.
 */
class ErrorTranslator {
public:
    static constexpr size_t DEFAULT_MAX_MESSAGE_LENGTH = 500;

    explicit ErrorTranslator(size_t maxMessageLength = DEFAULT_MAX_MESSAGE_LENGTH);

    ScriptError translate(ErrorTag tag, const std::string &rawMessage) const;

    /**
     * @brief Consume and classify the exception pending on ctx
     *
     * Never runs script code when the interrupt state already decided the outcome.
     */
    ScriptError fromPendingException(JSContext *ctx, FailureStage stage, const InterruptState &interrupt) const;

    /**
     * @brief Classify a C++ exception caught at the engine boundary
     */
    ScriptError fromHostException(const std::exception &e) const;

    ScriptError timeoutError(int64_t timeoutMs) const;
    ScriptError memoryLimitError(size_t memoryLimitBytes) const;

    std::string sanitize(const std::string &rawMessage) const;

    size_t getMaxMessageLength() const {
        return maxMessageLength_;
    }

private:
    size_t maxMessageLength_;

    static std::string describeException(JSContext *ctx, JSValueConst exception);
    static std::string readStringProperty(JSContext *ctx, JSValueConst object, const char *name);
};

}  // namespace SBX
