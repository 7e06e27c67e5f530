#include "scripting/ValueMarshaller.h"
#include "common/Logger.h"
#include "scripting/SandboxExceptions.h"
#include "scripting/ScopedJSValue.h"
#include <cmath>
#include <limits>
#include <string>

namespace SBX {

namespace {

constexpr int FROZEN_PROPERTY_FLAGS = JS_PROP_ENUMERABLE;
constexpr int MUTABLE_PROPERTY_FLAGS = JS_PROP_C_W_E;

// 2^63 is the first double past int64 range
constexpr double INT64_UPPER_BOUND = 9223372036854775808.0;

JSValue checked(JSValue value) {
    if (JS_IsException(value)) {
        throw PendingScriptException();
    }
    return value;
}

}  // namespace

ValueMarshaller::ValueMarshaller(JSContext *ctx, size_t maxDepth, size_t maxNodes)
    : ctx_(ctx), maxDepth_(maxDepth), maxNodes_(maxNodes), dateConstructor_(JS_UNDEFINED), dateGetTime_(JS_UNDEFINED),
      dateToISOString_(JS_UNDEFINED) {
    ScopedJSValue global(ctx_, JS_GetGlobalObject(ctx_));
    ScopedJSValue constructor(ctx_, JS_GetPropertyStr(ctx_, global.get(), "Date"));
    ScopedJSValue prototype(ctx_, JS_GetPropertyStr(ctx_, constructor.get(), "prototype"));
    ScopedJSValue getTime(ctx_, JS_GetPropertyStr(ctx_, prototype.get(), "getTime"));
    ScopedJSValue toISOString(ctx_, JS_GetPropertyStr(ctx_, prototype.get(), "toISOString"));

    if (constructor.isException() || prototype.isException() || getTime.isException() ||
        toISOString.isException()) {
        throw PendingScriptException();
    }

    dateConstructor_ = constructor.release();
    dateGetTime_ = getTime.release();
    dateToISOString_ = toISOString.release();
}

ValueMarshaller::~ValueMarshaller() {
    JS_FreeValue(ctx_, dateToISOString_);
    JS_FreeValue(ctx_, dateGetTime_);
    JS_FreeValue(ctx_, dateConstructor_);
}

// === Host -> Sandbox ===

JSValue ValueMarshaller::marshalIn(const HostValue &value, bool freeze) const {
    return marshalInRecursive(value, freeze, 0);
}

JSValue ValueMarshaller::marshalInRecursive(const HostValue &value, bool freeze, size_t depth) const {
    if (depth > maxDepth_) {
        throw MarshallingException("Value nesting exceeds the maximum depth of " + std::to_string(maxDepth_));
    }

    switch (value.type()) {
    case HostValue::value_t::null:
        return JS_NULL;
    case HostValue::value_t::boolean:
        return JS_NewBool(ctx_, value.get<bool>());
    case HostValue::value_t::number_integer:
        return JS_NewInt64(ctx_, value.get<int64_t>());
    case HostValue::value_t::number_unsigned: {
        uint64_t number = value.get<uint64_t>();
        if (number <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return JS_NewInt64(ctx_, static_cast<int64_t>(number));
        }
        return JS_NewFloat64(ctx_, static_cast<double>(number));
    }
    case HostValue::value_t::number_float: {
        double number = value.get<double>();
        if (!std::isfinite(number)) {
            throw MarshallingException("Non-finite numbers cannot be passed into the sandbox");
        }
        return JS_NewFloat64(ctx_, number);
    }
    case HostValue::value_t::string: {
        const auto &text = value.get_ref<const std::string &>();
        return checked(JS_NewStringLen(ctx_, text.data(), text.size()));
    }
    case HostValue::value_t::array: {
        ScopedJSValue array(ctx_, checked(JS_NewArray(ctx_)));
        uint32_t index = 0;
        for (const auto &element : value) {
            defineElement(array.get(), index++, marshalInRecursive(element, freeze, depth + 1), freeze);
        }
        finishObject(array.get(), freeze, true);
        return array.release();
    }
    case HostValue::value_t::object: {
        ScopedJSValue object(ctx_, checked(JS_NewObject(ctx_)));
        for (auto it = value.begin(); it != value.end(); ++it) {
            defineProperty(object.get(), it.key(), marshalInRecursive(it.value(), freeze, depth + 1), freeze);
        }
        finishObject(object.get(), freeze);
        return object.release();
    }
    case HostValue::value_t::binary:
        throw MarshallingException("Binary values cannot be passed into the sandbox");
    case HostValue::value_t::discarded:
    default:
        throw MarshallingException("Discarded JSON values cannot be passed into the sandbox");
    }
}

void ValueMarshaller::defineProperty(JSValueConst object, const std::string &key, JSValue value, bool freeze) const {
    JSAtom atom = JS_NewAtomLen(ctx_, key.data(), key.size());
    if (atom == JS_ATOM_NULL) {
        JS_FreeValue(ctx_, value);
        throw PendingScriptException();
    }
    // JS_DefinePropertyValue takes ownership of value
    int rc = JS_DefinePropertyValue(ctx_, object, atom, value, freeze ? FROZEN_PROPERTY_FLAGS : MUTABLE_PROPERTY_FLAGS);
    JS_FreeAtom(ctx_, atom);
    if (rc < 0) {
        throw PendingScriptException();
    }
}

void ValueMarshaller::defineElement(JSValueConst array, uint32_t index, JSValue value, bool freeze) const {
    if (JS_DefinePropertyValueUint32(ctx_, array, index, value, freeze ? FROZEN_PROPERTY_FLAGS : MUTABLE_PROPERTY_FLAGS) <
        0) {
        throw PendingScriptException();
    }
}

void ValueMarshaller::finishObject(JSValueConst object, bool freeze, bool isArray) const {
    if (!freeze) {
        return;
    }
    if (isArray) {
        // Same descriptor change Object.freeze applies to length
        JSAtom lengthAtom = JS_NewAtom(ctx_, "length");
        if (lengthAtom == JS_ATOM_NULL) {
            throw PendingScriptException();
        }
        int status = JS_DefineProperty(ctx_, object, lengthAtom, JS_UNDEFINED, JS_UNDEFINED, JS_UNDEFINED,
                                       JS_PROP_HAS_WRITABLE | JS_PROP_HAS_CONFIGURABLE);
        JS_FreeAtom(ctx_, lengthAtom);
        if (status < 0) {
            throw PendingScriptException();
        }
    }
    if (JS_PreventExtensions(ctx_, object) < 0) {
        throw PendingScriptException();
    }
}

// === Sandbox -> Host ===

HostValue ValueMarshaller::marshalOut(JSValueConst value) const {
    OutState state;
    state.remainingNodes = maxNodes_;
    return marshalOutRecursive(value, 0, state);
}

HostValue ValueMarshaller::marshalOutRecursive(JSValueConst value, size_t depth, OutState &state) const {
    if (depth > maxDepth_) {
        throw MarshallingException("Value nesting exceeds the maximum depth of " + std::to_string(maxDepth_));
    }
    if (state.remainingNodes == 0) {
        throw MarshallingException("Value has too many elements to leave the sandbox");
    }
    state.remainingNodes--;

    if (JS_IsUndefined(value) || JS_IsNull(value)) {
        return nullptr;
    } else if (JS_IsBool(value)) {
        return JS_ToBool(ctx_, value) != 0;
    } else if (JS_IsNumber(value)) {
        double number = 0;
        if (JS_ToFloat64(ctx_, &number, value) < 0) {
            throw PendingScriptException();
        }
        if (!std::isfinite(number)) {
            // Same as JSON.stringify
            return nullptr;
        }
        if (number == std::floor(number) && number >= -INT64_UPPER_BOUND && number < INT64_UPPER_BOUND) {
            return static_cast<int64_t>(number);
        }
        return number;
    } else if (JS_IsString(value)) {
        size_t length = 0;
        const char *text = JS_ToCStringLen(ctx_, &length, value);
        if (!text) {
            throw PendingScriptException();
        }
        std::string result(text, length);
        JS_FreeCString(ctx_, text);
        return result;
    } else if (JS_IsSymbol(value)) {
        throw MarshallingException("Symbols cannot leave the sandbox");
    } else if (!JS_IsObject(value)) {
        throw MarshallingException("BigInt values cannot leave the sandbox");
    }

    if (JS_IsFunction(ctx_, value)) {
        throw MarshallingException("Functions cannot leave the sandbox");
    }
    if (static_cast<int>(JS_PromiseState(ctx_, value)) >= 0) {
        throw MarshallingException("Promises cannot leave the sandbox; return a settled value instead");
    }

    int isDate = JS_IsInstanceOf(ctx_, value, dateConstructor_);
    if (isDate < 0) {
        throw PendingScriptException();
    }
    if (isDate) {
        return marshalDate(value);
    }

    void *identity = JS_VALUE_GET_PTR(value);
    for (void *ancestor : state.ancestors) {
        if (ancestor == identity) {
            throw MarshallingException("Circular reference cannot leave the sandbox");
        }
    }

    int isArray = JS_IsArray(ctx_, value);
    if (isArray < 0) {
        throw PendingScriptException();
    }

    state.ancestors.push_back(identity);
    HostValue result = isArray ? marshalArray(value, depth, state) : marshalObject(value, depth, state);
    state.ancestors.pop_back();
    return result;
}

HostValue ValueMarshaller::marshalArray(JSValueConst value, size_t depth, OutState &state) const {
    ScopedJSValue lengthValue(ctx_, checked(JS_GetPropertyStr(ctx_, value, "length")));
    int64_t length = 0;
    if (JS_ToInt64(ctx_, &length, lengthValue.get()) < 0) {
        throw PendingScriptException();
    }
    if (length < 0 || static_cast<uint64_t>(length) > state.remainingNodes) {
        throw MarshallingException("Array is too large to leave the sandbox");
    }

    HostValue result = HostValue::array();
    for (int64_t i = 0; i < length; ++i) {
        // Holes read as undefined and become null
        ScopedJSValue element(ctx_, checked(JS_GetPropertyUint32(ctx_, value, static_cast<uint32_t>(i))));
        result.push_back(marshalOutRecursive(element.get(), depth + 1, state));
    }
    return result;
}

HostValue ValueMarshaller::marshalObject(JSValueConst value, size_t depth, OutState &state) const {
    JSPropertyEnum *props = nullptr;
    uint32_t propCount = 0;
    if (JS_GetOwnPropertyNames(ctx_, &props, &propCount, value, JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) < 0) {
        throw PendingScriptException();
    }

    // Atoms must be released even when a nested value fails
    struct PropertyListGuard {
        JSContext *ctx;
        JSPropertyEnum *props;
        uint32_t count;
        ~PropertyListGuard() {
            for (uint32_t i = 0; i < count; ++i) {
                JS_FreeAtom(ctx, props[i].atom);
            }
            js_free(ctx, props);
        }
    } guard{ctx_, props, propCount};

    HostValue result = HostValue::object();
    for (uint32_t i = 0; i < propCount; ++i) {
        const char *key = JS_AtomToCString(ctx_, props[i].atom);
        if (!key) {
            throw PendingScriptException();
        }
        std::string keyString(key);
        JS_FreeCString(ctx_, key);

        ScopedJSValue propValue(ctx_, checked(JS_GetProperty(ctx_, value, props[i].atom)));
        result[keyString] = marshalOutRecursive(propValue.get(), depth + 1, state);
    }
    return result;
}

HostValue ValueMarshaller::marshalDate(JSValueConst value) const {
    ScopedJSValue time(ctx_, checked(JS_Call(ctx_, dateGetTime_, value, 0, nullptr)));
    double millis = 0;
    if (JS_ToFloat64(ctx_, &millis, time.get()) < 0) {
        throw PendingScriptException();
    }
    if (!std::isfinite(millis)) {
        throw MarshallingException("Invalid Date cannot leave the sandbox");
    }

    ScopedJSValue iso(ctx_, checked(JS_Call(ctx_, dateToISOString_, value, 0, nullptr)));
    const char *text = JS_ToCString(ctx_, iso.get());
    if (!text) {
        throw PendingScriptException();
    }
    std::string result(text);
    JS_FreeCString(ctx_, text);
    return result;
}

}  // namespace SBX
