#pragma once

#include "helpers/HelperLibrary.h"
#include "quickjs.h"
#include "scripting/ConsoleBuffer.h"
#include "scripting/ValueMarshaller.h"

namespace SBX {

/**
 * @brief Exposes a HelperLibrary to one sandbox context as the frozen `helpers` object
 *
 * Every helper becomes a native function whose magic value is its descriptor index,
 * so dispatch is a table lookup with no name resolution at call time. Arguments are
 * marshalled out, the helper runs on the host, and its result is marshalled back in.
 * HelperError surfaces as a TypeError the script may catch.
 *
 * The console namespace writes to the invocation's ConsoleBuffer and is also bound as
 * the global `console`.
 *
 * The bridge stores its bindings in the context opaque pointer and must be destroyed
 * before the context.
 */
class HelperLibraryBridge {
public:
    HelperLibraryBridge(JSContext *ctx, const HelperLibrary &library, const ValueMarshaller &marshaller,
                        ConsoleBuffer &console);
    ~HelperLibraryBridge();

    HelperLibraryBridge(const HelperLibraryBridge &) = delete;
    HelperLibraryBridge &operator=(const HelperLibraryBridge &) = delete;

    /**
     * @brief The helpers object passed to the script (owned by the bridge)
     */
    JSValueConst helpers() const {
        return helpers_;
    }

    /**
     * @brief Text recorded for one console call: strings raw, other values as compact JSON, space separated
     */
    static std::string formatConsoleArguments(JSContext *ctx, const ValueMarshaller &marshaller, int argc,
                                              JSValueConst *argv);

private:
    struct InvocationBindings {
        const HelperLibrary *library;
        const ValueMarshaller *marshaller;
        ConsoleBuffer *console;
    };

    JSContext *ctx_;
    InvocationBindings bindings_;
    JSValue helpers_;

    JSValue buildNamespace(HelperNamespace ns);
    void installGlobalConsole();

    static JSValue dispatch(JSContext *ctx, JSValueConst thisVal, int argc, JSValueConst *argv, int magic);
};

}  // namespace SBX
