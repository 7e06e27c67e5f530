#include "helpers/HelperLibrary.h"
#include "scripting/ErrorTranslator.h"
#include "scripting/SandboxExceptions.h"
#include <gtest/gtest.h>
#include <new>

namespace SBX {

class ErrorTranslatorTest : public ::testing::Test {
protected:
    ErrorTranslatorTest() : sandbox_(SandboxLimits{}, interrupt_) {}

    // Runs code expected to throw and classifies the pending exception
    ScriptError throwAndTranslate(const std::string &code, FailureStage stage = FailureStage::Running) {
        JSValue result = JS_Eval(sandbox_.context(), code.c_str(), code.size(), "<test>", JS_EVAL_TYPE_GLOBAL);
        EXPECT_TRUE(JS_IsException(result)) << code;
        JS_FreeValue(sandbox_.context(), result);
        return translator_.fromPendingException(sandbox_.context(), stage, flags_);
    }

    InterruptState interrupt_;
    SandboxContext sandbox_;
    InterruptState flags_;
    ErrorTranslator translator_;
};

TEST_F(ErrorTranslatorTest, Sanitize_DropsStackFrames) {
    std::string raw = "ReferenceError: total is not defined\n"
                      "    at <anonymous> (<input>:3)\n"
                      "    at run (/srv/app/engine.js:10)\n";
    EXPECT_EQ(translator_.sanitize(raw), "ReferenceError: total is not defined");
}

TEST_F(ErrorTranslatorTest, Sanitize_MasksHostPaths) {
    EXPECT_EQ(translator_.sanitize("Cannot read /home/deploy/secrets/config.json"), "Cannot read <path>");
    EXPECT_EQ(translator_.sanitize("failed (\"/var/lib/app/data\")"), "failed (\"<path>\")");
    EXPECT_EQ(translator_.sanitize("open C:\\Users\\ops\\file.txt failed"), "open <path> failed");
}

TEST_F(ErrorTranslatorTest, Sanitize_KeepsNonPaths) {
    EXPECT_EQ(translator_.sanitize("ratio 3/4 of /tmp"), "ratio 3/4 of /tmp");
    EXPECT_EQ(translator_.sanitize("Error: a/b/c"), "Error: a/b/c");
}

TEST_F(ErrorTranslatorTest, Sanitize_EmptyBecomesUncaughtException) {
    EXPECT_EQ(translator_.sanitize(""), "Uncaught exception");
    EXPECT_EQ(translator_.sanitize("  \n    at frame (x:1)\n"), "Uncaught exception");
}

TEST_F(ErrorTranslatorTest, Sanitize_TruncatesOnUtf8Boundary) {
    ErrorTranslator shortTranslator(10);
    EXPECT_EQ(shortTranslator.sanitize("abcdefghijklmnop"), "abcdefg...");

    ErrorTranslator tiny(8);
    // Five two-byte characters; the cut at byte 5 would split the third one
    EXPECT_EQ(tiny.sanitize("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"), "\xC3\xA9\xC3\xA9...");
}

TEST_F(ErrorTranslatorTest, Messages_ForLimits) {
    auto timeout = translator_.timeoutError(100);
    EXPECT_EQ(timeout.tag, ErrorTag::TimeoutError);
    EXPECT_EQ(timeout.message, "Script execution timed out after 100 ms");

    auto memory = translator_.memoryLimitError(1024);
    EXPECT_EQ(memory.tag, ErrorTag::MemoryLimitError);
    EXPECT_EQ(memory.message, "Script exceeded memory limit of 1024 bytes");
}

TEST_F(ErrorTranslatorTest, Pending_ErrorObjectIsRuntimeError) {
    auto error = throwAndTranslate("throw new TypeError('bad value')");
    EXPECT_EQ(error.tag, ErrorTag::RuntimeError);
    EXPECT_EQ(error.message, "TypeError: bad value");
}

TEST_F(ErrorTranslatorTest, Pending_NonErrorValues) {
    EXPECT_EQ(throwAndTranslate("throw 'plain'").message, "Uncaught plain");
    EXPECT_EQ(throwAndTranslate("throw 42").message, "Uncaught 42");
    EXPECT_EQ(throwAndTranslate("throw undefined").message, "undefined");
    EXPECT_EQ(throwAndTranslate("throw { toString() { throw 1; } }").message, "Uncaught exception");
}

TEST_F(ErrorTranslatorTest, Pending_SyntaxErrorDependsOnStage) {
    auto compiling = throwAndTranslate("var = ;", FailureStage::Compiling);
    EXPECT_EQ(compiling.tag, ErrorTag::CompileError);
    EXPECT_EQ(compiling.message.rfind("SyntaxError", 0), 0u) << compiling.message;

    auto running = throwAndTranslate("throw new SyntaxError('late')", FailureStage::Running);
    EXPECT_EQ(running.tag, ErrorTag::RuntimeError);
}

TEST_F(ErrorTranslatorTest, Pending_InterruptFlagsTakePrecedence) {
    flags_.memoryLimitBytes = 4096;
    flags_.memoryExceeded = true;
    auto memory = throwAndTranslate("throw new Error('ignored')");
    EXPECT_EQ(memory.tag, ErrorTag::MemoryLimitError);
    EXPECT_EQ(memory.message, "Script exceeded memory limit of 4096 bytes");

    flags_.memoryExceeded = false;
    flags_.timeoutMs = 250;
    flags_.deadlineExceeded = true;
    auto timeout = throwAndTranslate("throw new Error('ignored')");
    EXPECT_EQ(timeout.tag, ErrorTag::TimeoutError);
    EXPECT_EQ(timeout.message, "Script execution timed out after 250 ms");
}

TEST_F(ErrorTranslatorTest, Pending_ConsumesException) {
    throwAndTranslate("throw new Error('first')");
    JSValue value = JS_Eval(sandbox_.context(), "1 + 1", 5, "<test>", JS_EVAL_TYPE_GLOBAL);
    EXPECT_FALSE(JS_IsException(value));
    JS_FreeValue(sandbox_.context(), value);
}

TEST_F(ErrorTranslatorTest, HostExceptions_MapToTags) {
    EXPECT_EQ(translator_.fromHostException(MarshallingException("cycle")).tag, ErrorTag::MarshallingError);
    EXPECT_EQ(translator_.fromHostException(HelperError("bad")).tag, ErrorTag::RuntimeError);
    EXPECT_EQ(translator_.fromHostException(SandboxUnavailableException("no runtime")).tag,
              ErrorTag::SandboxUnavailable);

    auto oom = translator_.fromHostException(std::bad_alloc());
    EXPECT_EQ(oom.tag, ErrorTag::SandboxUnavailable);
    EXPECT_EQ(oom.message, "Host memory exhausted");

    auto other = translator_.fromHostException(std::runtime_error("boom"));
    EXPECT_EQ(other.tag, ErrorTag::SandboxUnavailable);
    EXPECT_EQ(other.message, "Internal engine error: boom");
}

}  // namespace SBX
