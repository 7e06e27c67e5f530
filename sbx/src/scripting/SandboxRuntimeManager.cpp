#include "scripting/SandboxRuntimeManager.h"
#include "common/Logger.h"
#include "scripting/HelperLibraryBridge.h"
#include "scripting/SandboxExceptions.h"
#include "scripting/ScopedJSValue.h"
#include "scripting/ValueMarshaller.h"

namespace SBX {

namespace {

ScopedJSValue checkedValue(JSContext *ctx, JSValue value) {
    ScopedJSValue scoped(ctx, value);
    if (scoped.isException()) {
        throw PendingScriptException();
    }
    return scoped;
}

// new Function('input', 'context', 'helpers', code), using the realm's own Function constructor
ScopedJSValue compileFunctionBody(JSContext *ctx, const std::string &code) {
    ScopedJSValue global = checkedValue(ctx, JS_GetGlobalObject(ctx));
    ScopedJSValue functionConstructor = checkedValue(ctx, JS_GetPropertyStr(ctx, global.get(), "Function"));
    ScopedJSValue inputName = checkedValue(ctx, JS_NewString(ctx, "input"));
    ScopedJSValue contextName = checkedValue(ctx, JS_NewString(ctx, "context"));
    ScopedJSValue helpersName = checkedValue(ctx, JS_NewString(ctx, "helpers"));
    ScopedJSValue body = checkedValue(ctx, JS_NewStringLen(ctx, code.data(), code.size()));

    JSValue args[] = {inputName.get(), contextName.get(), helpersName.get(), body.get()};
    return checkedValue(ctx, JS_CallConstructor(ctx, functionConstructor.get(), 4, args));
}

}  // namespace

SandboxRuntimeManager::SandboxRuntimeManager(SandboxConfig config, std::shared_ptr<const HelperLibrary> helpers)
    : config_(std::move(config)), helpers_(std::move(helpers)) {
    std::string problem;
    if (!config_.validate(&problem)) {
        LOG_WARN("SandboxRuntimeManager: Invalid configuration ({}), using defaults", problem);
        config_ = SandboxConfig();
    }
    if (!helpers_) {
        helpers_ = HelperLibrary::createDefault();
    }
    LOG_INFO("SandboxRuntimeManager: Ready (memory limit {} bytes, timeout range {}-{} ms)", config_.memoryLimitBytes,
             config_.minTimeoutMs, config_.maxTimeoutMs);
}

ScriptResult SandboxRuntimeManager::execute(const std::string &code, const HostValue &input,
                                            const BlockContextView &context, int64_t timeoutMs, bool consoleEnabled) {
    ScriptInvocationRequest request;
    request.code = code;
    request.input = input;
    request.context = context;
    request.timeoutMs = timeoutMs;
    request.consoleEnabled = consoleEnabled;
    return execute(request);
}

ScriptResult SandboxRuntimeManager::execute(const ScriptInvocationRequest &request) {
    try {
        return executeChecked(request);
    } catch (const std::exception &e) {
        LOG_ERROR("SandboxRuntimeManager: Engine failure: {}", e.what());
        ErrorTranslator translator(config_.maxErrorMessageLength);
        return ScriptResult::createError(translator.fromHostException(e));
    }
}

std::string SandboxRuntimeManager::getEngineInfo() const {
    return "QuickJS (isolated runtime per invocation)";
}

ExecutionLimits SandboxRuntimeManager::makeLimits(const ScriptInvocationRequest &request) const {
    ExecutionLimits limits;
    limits.sandbox.memoryLimitBytes = config_.memoryLimitBytes;
    limits.sandbox.maxStackSizeBytes = config_.maxStackSizeBytes;
    limits.timeoutMs = config_.clampTimeout(request.timeoutMs);
    limits.terminationGraceMs = config_.terminationGraceMs;
    limits.consoleEnabled = request.consoleEnabled;
    limits.maxConsoleEntries = config_.maxConsoleEntries;
    limits.maxConsoleBytes = config_.maxConsoleBytes;
    return limits;
}

ScriptResult SandboxRuntimeManager::executeChecked(const ScriptInvocationRequest &request) {
    ErrorTranslator translator(config_.maxErrorMessageLength);

    if (request.code.size() > config_.maxCodeSize) {
        LOG_DEBUG("SandboxRuntimeManager: Rejected script of {} bytes", request.code.size());
        return ScriptResult::createError(translator.translate(
            ErrorTag::CompileError, "Script exceeds maximum code size of " + std::to_string(config_.maxCodeSize) +
                                        " bytes"));
    }

    HostValue contextJson = request.context.toJson();
    if (JsonUtils::serializedSize(request.input) > config_.maxInputSize) {
        return ScriptResult::createError(translator.translate(
            ErrorTag::MarshallingError, "Input exceeds maximum size of " + std::to_string(config_.maxInputSize) +
                                            " bytes"));
    }
    if (JsonUtils::serializedSize(contextJson) > config_.maxInputSize) {
        return ScriptResult::createError(translator.translate(
            ErrorTag::MarshallingError, "Context exceeds maximum size of " + std::to_string(config_.maxInputSize) +
                                            " bytes"));
    }

    ExecutionLimits limits = makeLimits(request);
    LOG_DEBUG("SandboxRuntimeManager: Executing script ({} bytes, timeout {} ms, console {})", request.code.size(),
              limits.timeoutMs, limits.consoleEnabled);

    std::shared_ptr<const HelperLibrary> helpers = request.helpers ? request.helpers : helpers_;
    size_t maxDepth = config_.maxMarshalDepth;
    size_t maxOutputSize = config_.maxOutputSize;

    // Owns copies of everything: the execution thread may outlive this call after a timeout
    InvocationBody body = [code = request.code, input = request.input, context = std::move(contextJson), helpers,
                           maxDepth, maxOutputSize](InvocationScope &scope) -> HostValue {
        JSContext *ctx = scope.context();
        ValueMarshaller marshaller(ctx, maxDepth);
        HelperLibraryBridge bridge(ctx, *helpers, marshaller, scope.console());

        scope.transition(ExecutionState::Compiling);
        ScopedJSValue function = compileFunctionBody(ctx, code);

        scope.transition(ExecutionState::Running);
        ScopedJSValue inputValue(ctx, marshaller.marshalIn(input, true));
        ScopedJSValue contextValue(ctx, marshaller.marshalIn(context, true));
        JSValue args[] = {inputValue.get(), contextValue.get(), bridge.helpers()};
        ScopedJSValue returned = checkedValue(ctx, JS_Call(ctx, function.get(), JS_UNDEFINED, 3, args));

        HostValue output = marshaller.marshalOut(returned.get());
        if (JsonUtils::serializedSize(output) > maxOutputSize) {
            throw MarshallingException("Output exceeds maximum size of " + std::to_string(maxOutputSize) + " bytes");
        }
        return output;
    };

    ExecutionController controller(limits, translator);
    return controller.run(std::move(body)).toResult();
}

}  // namespace SBX
