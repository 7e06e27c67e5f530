#include "common/TestUtils.h"
#include "scripting/SandboxRuntimeManager.h"
#include <gtest/gtest.h>

namespace SBX {

class SandboxRuntimeManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        EXPECT_EQ(SandboxContext::liveCount(), 0) << "every invocation must release its runtime";
    }

    ScriptResult run(const std::string &code, const HostValue &input = nullptr, int64_t timeoutMs = 1000,
                     bool console = false) {
        return manager_.execute(SBX::Test::Utils::makeRequest(code, input, timeoutMs, console));
    }

    void expectError(const ScriptResult &result, ErrorTag tag) {
        ASSERT_TRUE(result.isError()) << "expected " << errorTagToString(tag) << ", got output "
                                      << result.getOutput().dump();
        EXPECT_EQ(result.getErrorTag(), tag) << result.getErrorMessage();
    }

    SandboxRuntimeManager manager_{SBX::Test::Utils::smallLimitsConfig()};
};

// === Results ===

TEST_F(SandboxRuntimeManagerTest, Execute_ReturnsValue) {
    auto result = run("return 1 + 1;");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), 2);
    EXPECT_TRUE(result.hasExecutionTime());
    EXPECT_GE(result.getExecutionTimeMs(), 0.0);
}

TEST_F(SandboxRuntimeManagerTest, Execute_EmptyBodyReturnsNull) {
    auto result = run("");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_TRUE(result.getOutput().is_null());
}

TEST_F(SandboxRuntimeManagerTest, Execute_ReadsInputAndContext) {
    auto result = run("return { doubled: input.x * 2, who: context.answers.name, phase: context.phase };",
                      json{{"x", 21}});
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), (json{{"doubled", 42}, {"phase", "intake"}, {"who", "Ada"}}));
}

TEST_F(SandboxRuntimeManagerTest, Execute_InputIsReadOnly) {
    auto sloppy = run("input.x = 5; input.added = true; return [input.x, input.added];", json{{"x", 1}});
    ASSERT_TRUE(sloppy.isSuccess()) << sloppy.getErrorMessage();
    EXPECT_EQ(sloppy.getOutput(), json::array({1, nullptr}));

    auto strict = run("'use strict'; context.answers.name = 'Eve'; return 1;");
    expectError(strict, ErrorTag::RuntimeError);
    EXPECT_EQ(strict.getErrorMessage().rfind("TypeError", 0), 0u) << strict.getErrorMessage();
}

TEST_F(SandboxRuntimeManagerTest, Execute_DerivedValuesAreMutable) {
    auto result = run("var copy = Object.assign({}, input); copy.x += 1; return copy;", json{{"x", 1}});
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), (json{{"x", 2}}));
}

TEST_F(SandboxRuntimeManagerTest, Execute_OutputNormalization) {
    EXPECT_TRUE(run("return undefined;").getOutput().is_null());
    EXPECT_TRUE(run("return NaN;").getOutput().is_null());
    EXPECT_EQ(run("return new Date(Date.UTC(2024, 0, 1));").getOutput(), "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(run("return { b: 1, a: undefined };").getOutput(), (json{{"a", nullptr}, {"b", 1}}));
}

// === Helpers ===

TEST_F(SandboxRuntimeManagerTest, Helpers_MathSum) {
    auto result = run("return helpers.math.sum([1, 2, 3]);");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), 6);
}

TEST_F(SandboxRuntimeManagerTest, Helpers_CombineInOneScript) {
    auto result = run("return helpers.string.slug(input.title) + '-' + helpers.date.format(input.due, 'yyyyMMdd');",
                      json{{"title", "Quarterly Review"}, {"due", "2024-05-06T10:00:00Z"}});
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), "quarterly-review-20240506");
}

TEST_F(SandboxRuntimeManagerTest, Helpers_UnknownHelperIsRuntimeError) {
    expectError(run("return helpers.nonexistent();"), ErrorTag::RuntimeError);
    expectError(run("return helpers.string.reverse('abc');"), ErrorTag::RuntimeError);
}

TEST_F(SandboxRuntimeManagerTest, Helpers_BadArgumentsAreCatchable) {
    auto caught = run("try { return helpers.string.lower(5); } catch (e) { return e.name; }");
    ASSERT_TRUE(caught.isSuccess()) << caught.getErrorMessage();
    EXPECT_EQ(caught.getOutput(), "TypeError");

    auto uncaught = run("return helpers.number.round('x');");
    expectError(uncaught, ErrorTag::RuntimeError);
    EXPECT_NE(uncaught.getErrorMessage().find("number.round"), std::string::npos) << uncaught.getErrorMessage();
}

TEST_F(SandboxRuntimeManagerTest, Helpers_RequestLibraryOverridesDefault) {
    std::vector<HelperDescriptor> descriptors;
    descriptors.push_back({HelperNamespace::String, "shout", 1, [](const HelperArgs &args) -> HostValue {
                               return args.at(0).get<std::string>() + "!";
                           }});
    auto request = SBX::Test::Utils::makeRequest("return [helpers.string.shout('hi'), typeof helpers.math];");
    request.helpers = std::make_shared<HelperLibrary>(std::move(descriptors));

    auto result = manager_.execute(request);
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), json::array({"hi!", "undefined"}));
}

// === Failures ===

TEST_F(SandboxRuntimeManagerTest, Errors_ThrownErrorIsRuntimeError) {
    auto result = run("throw new Error('boom');");
    expectError(result, ErrorTag::RuntimeError);
    EXPECT_EQ(result.getErrorMessage(), "Error: boom");
    EXPECT_FALSE(result.getError().isRetryable());
}

TEST_F(SandboxRuntimeManagerTest, Errors_ThrownPrimitive) {
    auto result = run("throw 'plain failure';");
    expectError(result, ErrorTag::RuntimeError);
    EXPECT_EQ(result.getErrorMessage(), "Uncaught plain failure");
}

TEST_F(SandboxRuntimeManagerTest, Errors_SyntaxErrorIsCompileError) {
    auto result = run("return (;");
    expectError(result, ErrorTag::CompileError);
    EXPECT_EQ(result.getErrorMessage().rfind("SyntaxError", 0), 0u) << result.getErrorMessage();
    EXPECT_FALSE(result.hasExecutionTime());
}

TEST_F(SandboxRuntimeManagerTest, Errors_ReferenceErrorIsRuntimeError) {
    auto result = run("return missingVariable + 1;");
    expectError(result, ErrorTag::RuntimeError);
    EXPECT_EQ(result.getErrorMessage().rfind("ReferenceError", 0), 0u) << result.getErrorMessage();
}

TEST_F(SandboxRuntimeManagerTest, Errors_StackOverflowIsRuntimeError) {
    expectError(run("function recurse() { return recurse() + 1; } return recurse();"), ErrorTag::RuntimeError);
}

TEST_F(SandboxRuntimeManagerTest, Errors_MessagesHideHostPaths) {
    auto result = run("throw new Error('config at /etc/app/secret.json');");
    expectError(result, ErrorTag::RuntimeError);
    EXPECT_EQ(result.getErrorMessage(), "Error: config at <path>");
}

// === Limits ===

TEST_F(SandboxRuntimeManagerTest, Limits_InfiniteLoopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto result = run("while (true) {}", nullptr, 100);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    expectError(result, ErrorTag::TimeoutError);
    EXPECT_EQ(result.getErrorMessage(), "Script execution timed out after 100 ms");
    EXPECT_LT(elapsed.count(), 150 + SBX::Test::Utils::getBaseDelay(100));
}

TEST_F(SandboxRuntimeManagerTest, Limits_TimeoutIsClamped) {
    auto result = run("while (true) {}", nullptr, 0);
    expectError(result, ErrorTag::TimeoutError);
    EXPECT_EQ(result.getErrorMessage(), "Script execution timed out after 1 ms");
}

TEST_F(SandboxRuntimeManagerTest, Limits_MemoryCeiling) {
    auto result = run("var hoard = []; while (true) { hoard.push(new Array(100000).fill(0)); }", nullptr, 10000);
    expectError(result, ErrorTag::MemoryLimitError);
    EXPECT_EQ(result.getErrorMessage(), "Script exceeded memory limit of 16777216 bytes");
}

TEST_F(SandboxRuntimeManagerTest, Limits_CaughtAllocationFailureStillFails) {
    auto result = run("try { new ArrayBuffer(64 * 1024 * 1024); } catch (e) {} return 1;");
    expectError(result, ErrorTag::MemoryLimitError);
    EXPECT_EQ(result.getErrorMessage(), "Script exceeded memory limit of 16777216 bytes");
}

TEST_F(SandboxRuntimeManagerTest, Limits_CaughtAllocationFailureInLoop) {
    auto result = run("var seen = 0;"
                      "for (var i = 0; i < 5; i++) { try { new ArrayBuffer(32 * 1024 * 1024); } catch (e) { seen++; } }"
                      "return seen;");
    expectError(result, ErrorTag::MemoryLimitError);
}

TEST_F(SandboxRuntimeManagerTest, Limits_LargeButAllowedAllocation) {
    auto result = run("return new ArrayBuffer(1024 * 1024).byteLength;");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), 1024 * 1024);
}

TEST_F(SandboxRuntimeManagerTest, Limits_OversizedCode) {
    auto result = run("return 1;" + std::string(5000, ' '));
    expectError(result, ErrorTag::CompileError);
    EXPECT_EQ(result.getErrorMessage(), "Script exceeds maximum code size of 4096 bytes");
}

TEST_F(SandboxRuntimeManagerTest, Limits_OversizedInput) {
    auto result = run("return input;", std::string(5000, 'x'));
    expectError(result, ErrorTag::MarshallingError);
    EXPECT_EQ(result.getErrorMessage(), "Input exceeds maximum size of 4096 bytes");
}

TEST_F(SandboxRuntimeManagerTest, Limits_OversizedOutput) {
    auto result = run("return 'x'.repeat(10000);");
    expectError(result, ErrorTag::MarshallingError);
    EXPECT_EQ(result.getErrorMessage(), "Output exceeds maximum size of 4096 bytes");
}

TEST_F(SandboxRuntimeManagerTest, Limits_UnsupportedOutputTypes) {
    expectError(run("return function () {};"), ErrorTag::MarshallingError);
    expectError(run("return Symbol('x');"), ErrorTag::MarshallingError);
    expectError(run("var a = {}; a.self = a; return a;"), ErrorTag::MarshallingError);
    expectError(run("return Promise.resolve(1);"), ErrorTag::MarshallingError);
    expectError(run("var o = {}, c = o; for (var i = 0; i < 200; i++) { c.n = {}; c = c.n; } return o;"),
                ErrorTag::MarshallingError);
}

// === Console ===

TEST_F(SandboxRuntimeManagerTest, Console_DisabledCapturesNothing) {
    auto result = run("console.log('hidden'); return 1;");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_TRUE(result.getConsoleLogs().empty());
}

TEST_F(SandboxRuntimeManagerTest, Console_CapturesLevelsInOrder) {
    auto result = run("console.log('a', 1); console.warn({ k: [true] }); console.error('c'); return null;", nullptr,
                      1000, true);
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();

    std::vector<ConsoleEntry> expected = {
        {ConsoleLevel::Log, "a 1"}, {ConsoleLevel::Warn, "{\"k\":[true]}"}, {ConsoleLevel::Error, "c"}};
    EXPECT_EQ(result.getConsoleLogs(), expected);
}

TEST_F(SandboxRuntimeManagerTest, Console_TruncatesAtEntryCap) {
    auto result = run("for (var i = 0; i < 50; i++) { console.log('line ' + i); } return 'done';", nullptr, 1000,
                      true);
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();

    const auto &logs = result.getConsoleLogs();
    ASSERT_EQ(logs.size(), 11u);
    EXPECT_EQ(logs.front().message, "line 0");
    EXPECT_EQ(logs.back().level, ConsoleLevel::Warn);
    EXPECT_EQ(logs.back().message, "console output truncated");
}

TEST_F(SandboxRuntimeManagerTest, Console_KeptOnFailure) {
    auto result = run("console.log('before'); throw new Error('after');", nullptr, 1000, true);
    expectError(result, ErrorTag::RuntimeError);
    ASSERT_EQ(result.getConsoleLogs().size(), 1u);
    EXPECT_EQ(result.getConsoleLogs()[0].message, "before");
}

TEST_F(SandboxRuntimeManagerTest, Console_KeptOnTimeout) {
    auto result = run("console.log('started'); while (true) {}", nullptr, 50, true);
    expectError(result, ErrorTag::TimeoutError);
    ASSERT_EQ(result.getConsoleLogs().size(), 1u);
    EXPECT_EQ(result.getConsoleLogs()[0].message, "started");
}

// === Isolation ===

TEST_F(SandboxRuntimeManagerTest, Isolation_GlobalsDoNotLeak) {
    ASSERT_TRUE(run("globalThis.leak = 1; Array.prototype.evil = true; return 1;").isSuccess());

    auto result = run("return [typeof globalThis.leak, [].evil === undefined];");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), json::array({"undefined", true}));
}

TEST_F(SandboxRuntimeManagerTest, Isolation_NoHostCapabilities) {
    auto result = run("return [typeof require, typeof process, typeof std, typeof os, typeof setTimeout,"
                      " typeof fetch, typeof XMLHttpRequest, typeof importScripts];");
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), json::array({"undefined", "undefined", "undefined", "undefined", "undefined",
                                               "undefined", "undefined", "undefined"}));
}

TEST_F(SandboxRuntimeManagerTest, Isolation_PendingPromisesAreDropped) {
    auto result = run("var ran = false; Promise.resolve().then(function () { ran = true; }); return ran;", nullptr,
                      1000, true);
    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    EXPECT_EQ(result.getOutput(), false);
}

// === Configuration ===

TEST_F(SandboxRuntimeManagerTest, Config_InvalidFallsBackToDefaults) {
    SandboxConfig broken;
    broken.minTimeoutMs = 100;
    broken.maxTimeoutMs = 10;

    SandboxRuntimeManager fallback(broken);
    EXPECT_EQ(fallback.getConfig().maxTimeoutMs, SandboxConfig().maxTimeoutMs);
    EXPECT_TRUE(fallback.execute("return 3;", nullptr, SBX::Test::Utils::sampleContext()).isSuccess());
}

TEST_F(SandboxRuntimeManagerTest, EngineInfo_NamesQuickJS) {
    EXPECT_NE(manager_.getEngineInfo().find("QuickJS"), std::string::npos);
}

}  // namespace SBX
