#pragma once

#include "SBXTypes.h"
#include "quickjs.h"
#include <cstddef>
#include <vector>

namespace SBX {

/**
 * @brief Converts values between the host (JSON) and one sandbox context
 *
 * marshalIn always deep-copies, so the script never aliases host memory. Frozen copies
 * have non-writable, non-configurable properties and are not extensible at any depth.
 *
 * marshalOut accepts JSON shapes plus Date (converted to its ISO-8601 string). It
 * rejects functions, symbols, BigInt, promises, invalid dates, circular references and
 * nesting deeper than the configured limit with MarshallingException. Whole numbers in
 * the int64 range come back as integers, non-finite numbers as null, and undefined as
 * null (object keys holding undefined are kept).
 *
 * A QuickJS call that raises (a throwing getter, out of memory, an interrupt) surfaces
 * as PendingScriptException with the exception left on the context.
 *
 * Must be used on the thread that owns the context.
 */
class ValueMarshaller {
public:
    /**
     * @param ctx Context the values live in
     * @param maxDepth Deepest nesting accepted in either direction
     * @param maxNodes Upper bound on values produced by one marshalOut call (guards sparse arrays)
     */
    explicit ValueMarshaller(JSContext *ctx, size_t maxDepth = 128, size_t maxNodes = 1000000);
    ~ValueMarshaller();

    ValueMarshaller(const ValueMarshaller &) = delete;
    ValueMarshaller &operator=(const ValueMarshaller &) = delete;

    /**
     * @brief Build a sandbox copy of a host value
     * @param value Host value
     * @param freeze Make the copy deeply read-only
     * @return Owned JSValue (caller frees)
     */
    JSValue marshalIn(const HostValue &value, bool freeze = false) const;

    /**
     * @brief Copy a sandbox value out to the host
     */
    HostValue marshalOut(JSValueConst value) const;

private:
    struct OutState {
        std::vector<void *> ancestors;
        size_t remainingNodes = 0;
    };

    JSContext *ctx_;
    size_t maxDepth_;
    size_t maxNodes_;
    // Captured before any script runs so later prototype patches are not observed
    JSValue dateConstructor_;
    JSValue dateGetTime_;
    JSValue dateToISOString_;

    JSValue marshalInRecursive(const HostValue &value, bool freeze, size_t depth) const;
    HostValue marshalOutRecursive(JSValueConst value, size_t depth, OutState &state) const;
    HostValue marshalObject(JSValueConst value, size_t depth, OutState &state) const;
    HostValue marshalArray(JSValueConst value, size_t depth, OutState &state) const;
    HostValue marshalDate(JSValueConst value) const;
    void defineProperty(JSValueConst object, const std::string &key, JSValue value, bool freeze) const;
    void defineElement(JSValueConst array, uint32_t index, JSValue value, bool freeze) const;
    void finishObject(JSValueConst object, bool freeze, bool isArray = false) const;
};

}  // namespace SBX
