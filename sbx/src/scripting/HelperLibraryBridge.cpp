#include "scripting/HelperLibraryBridge.h"
#include "common/Logger.h"
#include "scripting/SandboxExceptions.h"
#include "scripting/ScopedJSValue.h"
#include <new>

namespace SBX {

namespace {

void checkStatus(int status) {
    if (status < 0) {
        throw PendingScriptException();
    }
}

}  // namespace

HelperLibraryBridge::HelperLibraryBridge(JSContext *ctx, const HelperLibrary &library, const ValueMarshaller &marshaller,
                                         ConsoleBuffer &console)
    : ctx_(ctx), bindings_{&library, &marshaller, &console}, helpers_(JS_UNDEFINED) {
    JS_SetContextOpaque(ctx_, &bindings_);

    ScopedJSValue helpers(ctx_, JS_NewObject(ctx_));
    if (helpers.isException()) {
        JS_SetContextOpaque(ctx_, nullptr);
        throw PendingScriptException();
    }

    try {
        for (HelperNamespace ns : ALL_HELPER_NAMESPACES) {
            if (library.memberNames(ns).empty()) {
                continue;
            }
            JSValue nsObject = buildNamespace(ns);
            // Read-only and non-configurable; enumerable so Object.keys(helpers) lists the namespaces
            checkStatus(JS_DefinePropertyValueStr(ctx_, helpers.get(), helperNamespaceName(ns), nsObject,
                                                  JS_PROP_ENUMERABLE));
        }
        checkStatus(JS_PreventExtensions(ctx_, helpers.get()));
        helpers_ = helpers.release();
        installGlobalConsole();
    } catch (...) {
        JS_FreeValue(ctx_, helpers_);
        helpers_ = JS_UNDEFINED;
        JS_SetContextOpaque(ctx_, nullptr);
        throw;
    }

    LOG_TRACE("HelperLibraryBridge: installed {} helpers", library.getDescriptors().size());
}

HelperLibraryBridge::~HelperLibraryBridge() {
    JS_FreeValue(ctx_, helpers_);
    JS_SetContextOpaque(ctx_, nullptr);
}

JSValue HelperLibraryBridge::buildNamespace(HelperNamespace ns) {
    ScopedJSValue nsObject(ctx_, JS_NewObject(ctx_));
    if (nsObject.isException()) {
        throw PendingScriptException();
    }

    const auto &descriptors = bindings_.library->getDescriptors();
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto &descriptor = descriptors[i];
        if (descriptor.ns != ns) {
            continue;
        }
        ScopedJSValue function(ctx_, JS_NewCFunctionMagic(ctx_, &HelperLibraryBridge::dispatch,
                                                          descriptor.name.c_str(), descriptor.arity,
                                                          JS_CFUNC_generic_magic, static_cast<int>(i)));
        if (function.isException()) {
            throw PendingScriptException();
        }
        checkStatus(JS_PreventExtensions(ctx_, function.get()));
        checkStatus(JS_DefinePropertyValueStr(ctx_, nsObject.get(), descriptor.name.c_str(), function.release(),
                                              JS_PROP_ENUMERABLE));
    }

    checkStatus(JS_PreventExtensions(ctx_, nsObject.get()));
    return nsObject.release();
}

void HelperLibraryBridge::installGlobalConsole() {
    ScopedJSValue consoleNs(ctx_, JS_GetPropertyStr(ctx_, helpers_, "console"));
    if (consoleNs.isException()) {
        throw PendingScriptException();
    }
    if (JS_IsUndefined(consoleNs.get())) {
        return;
    }
    ScopedJSValue global(ctx_, JS_GetGlobalObject(ctx_));
    checkStatus(JS_DefinePropertyValueStr(ctx_, global.get(), "console", consoleNs.release(), 0));
}

std::string HelperLibraryBridge::formatConsoleArguments(JSContext *ctx, const ValueMarshaller &marshaller, int argc,
                                                        JSValueConst *argv) {
    std::string message;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) {
            message += ' ';
        }
        JSValueConst value = argv[i];
        if (JS_IsString(value)) {
            const char *text = JS_ToCString(ctx, value);
            if (!text) {
                throw PendingScriptException();
            }
            message += text;
            JS_FreeCString(ctx, text);
            continue;
        }
        if (JS_IsUndefined(value)) {
            message += "undefined";
            continue;
        }

        try {
            message += JsonUtils::toCompactString(marshaller.marshalOut(value));
        } catch (const MarshallingException &) {
            // Functions, symbols and cycles are printed with String(value)
            const char *text = JS_ToCString(ctx, value);
            if (!text) {
                throw PendingScriptException();
            }
            message += text;
            JS_FreeCString(ctx, text);
        }
    }
    return message;
}

JSValue HelperLibraryBridge::dispatch(JSContext *ctx, JSValueConst thisVal, int argc, JSValueConst *argv, int magic) {
    (void)thisVal;
    auto *bindings = static_cast<InvocationBindings *>(JS_GetContextOpaque(ctx));
    if (!bindings) {
        return JS_ThrowInternalError(ctx, "helper bridge is not attached");
    }
    const auto &descriptors = bindings->library->getDescriptors();
    if (magic < 0 || static_cast<size_t>(magic) >= descriptors.size()) {
        return JS_ThrowInternalError(ctx, "unknown helper");
    }
    const HelperDescriptor &descriptor = descriptors[static_cast<size_t>(magic)];

    try {
        if (descriptor.ns == HelperNamespace::Console) {
            if (bindings->console->isEnabled()) {
                bindings->console->append(descriptor.consoleLevel,
                                          formatConsoleArguments(ctx, *bindings->marshaller, argc, argv));
            }
            return JS_UNDEFINED;
        }

        HelperArgs args;
        args.reserve(static_cast<size_t>(argc));
        for (int i = 0; i < argc; ++i) {
            args.push_back(bindings->marshaller->marshalOut(argv[i]));
        }
        HostValue result = bindings->library->invoke(static_cast<size_t>(magic), args);
        return bindings->marshaller->marshalIn(result);
    } catch (const PendingScriptException &) {
        return JS_EXCEPTION;
    } catch (const HelperError &e) {
        return JS_ThrowTypeError(ctx, "%s", e.what());
    } catch (const MarshallingException &e) {
        return JS_ThrowTypeError(ctx, "%s: %s", descriptor.qualifiedName().c_str(), e.what());
    } catch (const std::bad_alloc &) {
        return JS_ThrowOutOfMemory(ctx);
    } catch (const std::exception &e) {
        LOG_ERROR("HelperLibraryBridge: {} failed: {}", descriptor.qualifiedName(), e.what());
        return JS_ThrowInternalError(ctx, "%s failed", descriptor.qualifiedName().c_str());
    }
}

}  // namespace SBX
