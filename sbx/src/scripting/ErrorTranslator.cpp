#include "scripting/ErrorTranslator.h"
#include "common/Logger.h"
#include "helpers/HelperLibrary.h"
#include "scripting/SandboxExceptions.h"
#include "scripting/ScopedJSValue.h"
#include <new>
#include <regex>
#include <sstream>

namespace SBX {

namespace {

constexpr const char *UNKNOWN_EXCEPTION = "Uncaught exception";
constexpr const char *ELLIPSIS = "...";

// Longest prefix of text that fits in maxBytes without splitting a UTF-8 sequence
std::string utf8Prefix(const std::string &text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut);
}

bool isStackFrameLine(const std::string &line) {
    size_t pos = line.find_first_not_of(" \t");
    return pos != std::string::npos && line.compare(pos, 3, "at ") == 0;
}

}  // namespace

ErrorTranslator::ErrorTranslator(size_t maxMessageLength) : maxMessageLength_(maxMessageLength) {}

ScriptError ErrorTranslator::translate(ErrorTag tag, const std::string &rawMessage) const {
    return ScriptError{tag, sanitize(rawMessage)};
}

ScriptError ErrorTranslator::timeoutError(int64_t timeoutMs) const {
    return translate(ErrorTag::TimeoutError, "Script execution timed out after " + std::to_string(timeoutMs) + " ms");
}

ScriptError ErrorTranslator::memoryLimitError(size_t memoryLimitBytes) const {
    return translate(ErrorTag::MemoryLimitError,
                     "Script exceeded memory limit of " + std::to_string(memoryLimitBytes) + " bytes");
}

ScriptError ErrorTranslator::fromPendingException(JSContext *ctx, FailureStage stage,
                                                  const InterruptState &interrupt) const {
    // Interrupt flags win over whatever exception object the engine produced
    if (interrupt.memoryExceeded.load()) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return memoryLimitError(interrupt.memoryLimitBytes);
    }
    if (interrupt.deadlineExceeded.load() || interrupt.cancelRequested.load()) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return timeoutError(interrupt.timeoutMs);
    }

    ScopedJSValue exception(ctx, JS_GetException(ctx));
    std::string name;
    std::string description;
    if (JS_IsError(ctx, exception.get())) {
        name = readStringProperty(ctx, exception.get(), "name");
    }
    description = describeException(ctx, exception.get());

    if (description.find("out of memory") != std::string::npos && (name.empty() || name == "InternalError")) {
        return memoryLimitError(interrupt.memoryLimitBytes);
    }
    if (stage == FailureStage::Compiling && name == "SyntaxError") {
        return translate(ErrorTag::CompileError, description);
    }
    return translate(ErrorTag::RuntimeError, description);
}

ScriptError ErrorTranslator::fromHostException(const std::exception &e) const {
    if (dynamic_cast<const MarshallingException *>(&e)) {
        return translate(ErrorTag::MarshallingError, e.what());
    }
    if (dynamic_cast<const HelperError *>(&e)) {
        return translate(ErrorTag::RuntimeError, e.what());
    }
    if (dynamic_cast<const SandboxUnavailableException *>(&e)) {
        return translate(ErrorTag::SandboxUnavailable, e.what());
    }
    if (dynamic_cast<const std::bad_alloc *>(&e)) {
        return translate(ErrorTag::SandboxUnavailable, "Host memory exhausted");
    }
    LOG_ERROR("ErrorTranslator: internal engine fault: {}", e.what());
    return translate(ErrorTag::SandboxUnavailable, std::string("Internal engine error: ") + e.what());
}

std::string ErrorTranslator::sanitize(const std::string &rawMessage) const {
    static const std::regex unixPath(R"((^|[\s(\[\"'=])(/[^\s/:"'()\[\]]+){2,}/?)");
    static const std::regex windowsPath(R"([A-Za-z]:\\[^\s"'()\[\]]+)");

    std::istringstream lines(rawMessage);
    std::string line;
    std::string kept;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isStackFrameLine(line)) {
            continue;
        }
        if (!kept.empty()) {
            kept += '\n';
        }
        kept += line;
    }

    kept = std::regex_replace(kept, unixPath, "$1<path>");
    kept = std::regex_replace(kept, windowsPath, "<path>");

    size_t end = kept.find_last_not_of(" \t\n");
    kept = end == std::string::npos ? std::string() : kept.substr(0, end + 1);
    if (kept.empty()) {
        kept = UNKNOWN_EXCEPTION;
    }

    if (kept.size() > maxMessageLength_) {
        size_t room = maxMessageLength_ > 3 ? maxMessageLength_ - 3 : 0;
        kept = utf8Prefix(kept, room) + (maxMessageLength_ > 3 ? ELLIPSIS : "");
    }
    return kept;
}

std::string ErrorTranslator::readStringProperty(JSContext *ctx, JSValueConst object, const char *name) {
    ScopedJSValue value(ctx, JS_GetPropertyStr(ctx, object, name));
    if (value.isException()) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return std::string();
    }
    if (!JS_IsString(value.get())) {
        return std::string();
    }
    const char *text = JS_ToCString(ctx, value.get());
    if (!text) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return std::string();
    }
    std::string result(text);
    JS_FreeCString(ctx, text);
    return result;
}

// "Name: message" for Error objects, String(value) for anything else thrown
std::string ErrorTranslator::describeException(JSContext *ctx, JSValueConst exception) {
    if (JS_IsError(ctx, exception)) {
        std::string name = readStringProperty(ctx, exception, "name");
        std::string message = readStringProperty(ctx, exception, "message");
        if (name.empty()) {
            name = "Error";
        }
        return message.empty() ? name : name + ": " + message;
    }

    if (JS_IsUndefined(exception)) {
        return "undefined";
    }
    const char *text = JS_ToCString(ctx, exception);
    if (!text) {
        // toString itself threw
        JS_FreeValue(ctx, JS_GetException(ctx));
        return UNKNOWN_EXCEPTION;
    }
    std::string result = std::string("Uncaught ") + text;
    JS_FreeCString(ctx, text);
    return result;
}

}  // namespace SBX
