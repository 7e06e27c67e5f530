#pragma once

#include "SBXTypes.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SBX {

/**
 * @brief Classified, sanitized failure of one invocation
 */
struct ScriptError {
    ErrorTag tag = ErrorTag::SandboxUnavailable;
    std::string message;

    /**
     * @brief Only infrastructure faults may be retried; every other tag needs a script fix
     */
    bool isRetryable() const {
        return tag == ErrorTag::SandboxUnavailable;
    }
};

/**
 * @brief Outcome of a sandboxed script invocation
 *
 * Constructed only through createSuccess/createError so that a result is either a value
 * or a classified error, never both. Console entries are attached in both cases.
 */
class ScriptResult {
private:
    bool success_internal = false;
    HostValue output_internal;
    std::optional<ScriptError> error_internal;
    std::optional<double> executionTimeMs_internal;
    std::vector<ConsoleEntry> consoleLogs_internal;

public:
    static ScriptResult createSuccess(HostValue output, double executionTimeMs,
                                      std::vector<ConsoleEntry> consoleLogs = {}) {
        ScriptResult result;
        result.success_internal = true;
        result.output_internal = std::move(output);
        result.executionTimeMs_internal = executionTimeMs;
        result.consoleLogs_internal = std::move(consoleLogs);
        return result;
    }

    static ScriptResult createError(ScriptError error, std::vector<ConsoleEntry> consoleLogs = {},
                                    std::optional<double> executionTimeMs = std::nullopt) {
        ScriptResult result;
        result.success_internal = false;
        result.error_internal = std::move(error);
        result.executionTimeMs_internal = executionTimeMs;
        result.consoleLogs_internal = std::move(consoleLogs);
        return result;
    }

    static ScriptResult createError(ErrorTag tag, const std::string &message) {
        return createError(ScriptError{tag, message});
    }

    bool isSuccess() const {
        return success_internal;
    }

    bool isError() const {
        return !success_internal;
    }

    /**
     * @brief Script return value; null for failed invocations
     */
    const HostValue &getOutput() const {
        return output_internal;
    }

    /**
     * @brief Error of a failed invocation; a successful one reports an empty SandboxUnavailable placeholder
     */
    ScriptError getError() const {
        return error_internal.value_or(ScriptError{});
    }

    ErrorTag getErrorTag() const {
        return getError().tag;
    }

    std::string getErrorMessage() const {
        return error_internal ? error_internal->message : std::string();
    }

    bool hasExecutionTime() const {
        return executionTimeMs_internal.has_value();
    }

    double getExecutionTimeMs() const {
        return executionTimeMs_internal.value_or(0.0);
    }

    const std::vector<ConsoleEntry> &getConsoleLogs() const {
        return consoleLogs_internal;
    }

    /**
     * @brief Wire representation used by the CLI runner and embedding services
     *
     * {"ok":true,"output":...,"executionTimeMs":...,"consoleLogs":[{"level":"log","message":"..."}]}
     * or {"ok":false,"error":{"tag":"RuntimeError","message":"...","retryable":false},...}
     */
    HostValue toJson() const {
        HostValue value = HostValue::object();
        value["ok"] = success_internal;
        if (success_internal) {
            value["output"] = output_internal;
        } else {
            ScriptError error = getError();
            value["error"] = {{"tag", errorTagToString(error.tag)},
                              {"message", error.message},
                              {"retryable", error.isRetryable()}};
        }
        if (executionTimeMs_internal) {
            value["executionTimeMs"] = *executionTimeMs_internal;
        }
        HostValue logs = HostValue::array();
        for (const auto &entry : consoleLogs_internal) {
            logs.push_back({{"level", consoleLevelToString(entry.level)}, {"message", entry.message}});
        }
        value["consoleLogs"] = std::move(logs);
        return value;
    }
};

}  // namespace SBX
