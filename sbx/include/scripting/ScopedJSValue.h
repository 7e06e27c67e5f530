#pragma once

#include "quickjs.h"
#include <utility>

namespace SBX {

/**
 * @brief Owning JSValue handle; frees the value with JS_FreeValue when it goes out of scope
 */
class ScopedJSValue {
public:
    ScopedJSValue(JSContext *ctx, JSValue value) : ctx_(ctx), value_(value) {}

    ~ScopedJSValue() {
        reset();
    }

    ScopedJSValue(const ScopedJSValue &) = delete;
    ScopedJSValue &operator=(const ScopedJSValue &) = delete;

    ScopedJSValue(ScopedJSValue &&other) noexcept : ctx_(other.ctx_), value_(other.value_) {
        other.value_ = JS_UNDEFINED;
    }

    JSValue get() const {
        return value_;
    }

    bool isException() const {
        return JS_IsException(value_);
    }

    /**
     * @brief Give up ownership; the caller becomes responsible for freeing
     */
    JSValue release() {
        JSValue value = value_;
        value_ = JS_UNDEFINED;
        return value;
    }

    void reset(JSValue value = JS_UNDEFINED) {
        if (ctx_) {
            JS_FreeValue(ctx_, value_);
        }
        value_ = value;
    }

private:
    JSContext *ctx_;
    JSValue value_;
};

}  // namespace SBX
