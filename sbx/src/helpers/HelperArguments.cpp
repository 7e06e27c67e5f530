#include "helpers/HelperArguments.h"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace SBX {
namespace HelperArguments {

namespace {

const HostValue &nullValue() {
    static const HostValue value;
    return value;
}

[[noreturn]] void fail(const char *helper, size_t index, const char *expected) {
    throw HelperError(std::string(helper) + ": argument " + std::to_string(index + 1) + " must be " + expected);
}

}  // namespace

const HostValue &at(const HelperArgs &args, size_t index) {
    return index < args.size() ? args[index] : nullValue();
}

bool isMissing(const HelperArgs &args, size_t index) {
    return index >= args.size() || args[index].is_null();
}

const std::string &requireString(const HelperArgs &args, size_t index, const char *helper) {
    const HostValue &value = at(args, index);
    if (!value.is_string()) {
        fail(helper, index, "a string");
    }
    return value.get_ref<const std::string &>();
}

double requireNumber(const HelperArgs &args, size_t index, const char *helper) {
    const HostValue &value = at(args, index);
    if (!value.is_number()) {
        fail(helper, index, "a number");
    }
    return value.get<double>();
}

double optionalNumber(const HelperArgs &args, size_t index, double defaultValue, const char *helper) {
    if (isMissing(args, index)) {
        return defaultValue;
    }
    return requireNumber(args, index, helper);
}

int64_t requireInteger(const HelperArgs &args, size_t index, const char *helper) {
    double number = requireNumber(args, index, helper);
    if (!std::isfinite(number)) {
        fail(helper, index, "a finite number");
    }
    // Counts and lengths beyond Number.MAX_SAFE_INTEGER behave like it
    return static_cast<int64_t>(std::clamp(std::trunc(number), -MAX_SAFE_INTEGER, MAX_SAFE_INTEGER));
}

const HostValue &requireArray(const HelperArgs &args, size_t index, const char *helper) {
    const HostValue &value = at(args, index);
    if (!value.is_array()) {
        fail(helper, index, "an array");
    }
    return value;
}

const HostValue &requireObject(const HelperArgs &args, size_t index, const char *helper) {
    const HostValue &value = at(args, index);
    if (!value.is_object()) {
        fail(helper, index, "an object");
    }
    return value;
}

std::string toDisplayString(const HostValue &value) {
    switch (value.type()) {
    case HostValue::value_t::null:
        return "null";
    case HostValue::value_t::boolean:
        return value.get<bool>() ? "true" : "false";
    case HostValue::value_t::string:
        return value.get<std::string>();
    case HostValue::value_t::number_integer:
        return std::to_string(value.get<int64_t>());
    case HostValue::value_t::number_unsigned:
        return std::to_string(value.get<uint64_t>());
    case HostValue::value_t::number_float: {
        double number = value.get<double>();
        if (std::isnan(number)) {
            return "NaN";
        }
        if (std::isinf(number)) {
            return number > 0 ? "Infinity" : "-Infinity";
        }
        char buffer[64];
        auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number);
        if (ec != std::errc()) {
            return std::to_string(number);
        }
        return std::string(buffer, end);
    }
    case HostValue::value_t::array: {
        std::string result;
        bool first = true;
        for (const auto &element : value) {
            if (!first) {
                result += ",";
            }
            first = false;
            if (!element.is_null()) {
                result += toDisplayString(element);
            }
        }
        return result;
    }
    case HostValue::value_t::object:
        return "[object Object]";
    default:
        return "";
    }
}

HostValue numberValue(double number) {
    if (!std::isfinite(number)) {
        return nullptr;
    }
    if (number == std::trunc(number) && std::fabs(number) < 9007199254740992.0) {
        return static_cast<int64_t>(number);
    }
    return number;
}

}  // namespace HelperArguments
}  // namespace SBX
