#pragma once

#include "common/SandboxConfig.h"
#include "helpers/HelperLibrary.h"
#include "scripting/ExecutionController.h"
#include "scripting/IScriptSandbox.h"
#include <memory>

namespace SBX {

/**
 * @brief Runs "JS Transform" block scripts, each in a fresh isolated QuickJS runtime
 *
 * The script is a function body compiled as function(input, context, helpers). For
 * every call the manager:
 * - rejects oversized code, input or context before a runtime exists
 * - creates a dedicated runtime on its own execution thread (ExecutionController)
 * - compiles the body; a syntax error is a CompileError and nothing runs
 * - passes deep, frozen copies of input and context plus the frozen helpers object
 * - marshals the return value back out and enforces the output size limit
 * - destroys the runtime on every exit path
 *
 * The manager itself holds only immutable state, so one instance serves any number of
 * concurrent callers. execute() never throws.
 *
 * @code
 * SBX::SandboxRuntimeManager manager(SBX::SandboxConfig::fromEnvironment());
 * auto result = manager.execute("return helpers.math.sum(input.nums);", {{"nums", {1, 2, 3}}}, {});
 * @endcode
 */
class SandboxRuntimeManager : public IScriptSandbox {
public:
    /**
     * @param config Engine limits
     * @param helpers Helper catalog; the default catalog when null
     */
    explicit SandboxRuntimeManager(SandboxConfig config = SandboxConfig(),
                                   std::shared_ptr<const HelperLibrary> helpers = nullptr);

    ScriptResult execute(const ScriptInvocationRequest &request) override;

    /**
     * @brief Convenience overload using the manager's helper library
     */
    ScriptResult execute(const std::string &code, const HostValue &input, const BlockContextView &context,
                         int64_t timeoutMs = 1000, bool consoleEnabled = false);

    std::string getEngineInfo() const override;

    const SandboxConfig &getConfig() const {
        return config_;
    }

    const std::shared_ptr<const HelperLibrary> &getHelpers() const {
        return helpers_;
    }

private:
    SandboxConfig config_;
    std::shared_ptr<const HelperLibrary> helpers_;

    ExecutionLimits makeLimits(const ScriptInvocationRequest &request) const;
    ScriptResult executeChecked(const ScriptInvocationRequest &request);
};

}  // namespace SBX
