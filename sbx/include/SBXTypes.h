#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Export macro for shared library builds
#if defined(_WIN32) && defined(SBX_SHARED)
#ifdef SBX_BUILDING
#define SBX_API __declspec(dllexport)
#else
#define SBX_API __declspec(dllimport)
#endif
#else
#define SBX_API
#endif

namespace SBX {

/**
 * @brief Host-side value crossing the sandbox boundary
 *
 * Restricted to JSON shapes. Object key order is normalized (sorted) on the host.
 */
using HostValue = json;

class HelperLibrary;

/**
 * @brief Read-only view of the workflow run a script block executes in
 */
struct BlockContextView {
    std::string workflowId;
    std::string runId;
    std::string phase;
    std::string sectionId;
    std::string userId;
    HostValue answers = HostValue::object();
    HostValue metadata = HostValue::object();

    HostValue toJson() const;
    static BlockContextView fromJson(const HostValue &value);
};

/**
 * @brief One sandboxed script invocation
 *
 * When helpers is empty the executing manager's own library is used.
 */
struct ScriptInvocationRequest {
    std::string code;
    HostValue input;
    BlockContextView context;
    int64_t timeoutMs = 1000;
    bool consoleEnabled = false;
    std::shared_ptr<const HelperLibrary> helpers;
};

enum class ConsoleLevel { Log, Info, Warn, Error };

const char *consoleLevelToString(ConsoleLevel level);

struct ConsoleEntry {
    ConsoleLevel level = ConsoleLevel::Log;
    std::string message;

    bool operator==(const ConsoleEntry &other) const {
        return level == other.level && message == other.message;
    }
};

/**
 * @brief Closed failure taxonomy reported to the workflow engine
 */
enum class ErrorTag { CompileError, RuntimeError, TimeoutError, MemoryLimitError, SandboxUnavailable, MarshallingError };

const char *errorTagToString(ErrorTag tag);

std::optional<ErrorTag> errorTagFromString(const std::string &name);

}  // namespace SBX
