#include "helpers/HelperLibrary.h"
#include "runtime/SandboxWorkerPool.h"
#include "scripting/SandboxRuntimeManager.h"
#include <benchmark/benchmark.h>
#include <memory>
#include <sstream>
#include <vector>

using namespace SBX;

static std::string generateArithmeticScript(int complexity) {
    std::stringstream ss;
    ss << "var result = 0;\n";
    for (int i = 0; i < complexity; ++i) {
        ss << "result += " << i << ";\n";
    }
    ss << "return result;";
    return ss.str();
}

static ScriptInvocationRequest makeRequest(const std::string &code, HostValue input = nullptr) {
    ScriptInvocationRequest request;
    request.code = code;
    request.input = std::move(input);
    request.context.workflowId = "bench";
    request.context.runId = "bench-run";
    return request;
}

// ============================================================================
// Benchmark Fixtures
// ============================================================================
class SandboxFixture : public benchmark::Fixture {
protected:
    std::unique_ptr<SandboxRuntimeManager> manager_;

    void SetUp(const ::benchmark::State & /*state*/) override {
        if (!manager_) {
            manager_ = std::make_unique<SandboxRuntimeManager>();
        }
    }
};

// ============================================================================
// Single invocation cost
// ============================================================================

// Runtime + context creation dominates trivial scripts
BENCHMARK_F(SandboxFixture, TrivialInvocation)(benchmark::State &state) {
    auto request = makeRequest("return 1;");
    for (auto _ : state) {
        auto result = manager_->execute(request);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel("Fresh runtime per invocation");
}

BENCHMARK_DEFINE_F(SandboxFixture, ScriptComplexity)(benchmark::State &state) {
    auto request = makeRequest(generateArithmeticScript(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto result = manager_->execute(request);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel("complexity=" + std::to_string(state.range(0)));
}
BENCHMARK_REGISTER_F(SandboxFixture, ScriptComplexity)->Arg(1)->Arg(10)->Arg(100)->Arg(500);

BENCHMARK_DEFINE_F(SandboxFixture, InputMarshalling)(benchmark::State &state) {
    HostValue rows = HostValue::array();
    for (int64_t i = 0; i < state.range(0); ++i) {
        rows.push_back({{"id", i}, {"name", "row " + std::to_string(i)}, {"score", i * 0.5}});
    }
    auto request = makeRequest("return input.length;", rows);
    for (auto _ : state) {
        auto result = manager_->execute(request);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel("rows=" + std::to_string(state.range(0)));
}
BENCHMARK_REGISTER_F(SandboxFixture, InputMarshalling)->Arg(10)->Arg(100)->Arg(500);

BENCHMARK_F(SandboxFixture, HelperCalls)(benchmark::State &state) {
    auto request = makeRequest("var total = 0; for (var i = 0; i < 100; i++) {"
                               " total += helpers.math.sum([i, i]); } return helpers.number.round(total, 2);");
    for (auto _ : state) {
        auto result = manager_->execute(request);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * 100);
    state.SetLabel("100 host helper calls per invocation");
}

// ============================================================================
// Helper library without the sandbox
// ============================================================================

static void BM_HelperLibraryDirect(benchmark::State &state) {
    auto library = HelperLibrary::createDefault();
    HelperArgs args = {HostValue("Quarterly Business Review 2024")};
    for (auto _ : state) {
        auto slug = library->call(HelperNamespace::String, "slug", args);
        benchmark::DoNotOptimize(slug);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HelperLibraryDirect);

// ============================================================================
// Throughput through the worker pool
// ============================================================================

static void BM_WorkerPoolThroughput(benchmark::State &state) {
    auto sandbox = std::make_shared<SandboxRuntimeManager>();
    SandboxWorkerPool pool(sandbox, static_cast<size_t>(state.range(0)));
    auto request = makeRequest("return helpers.string.upper('x');");

    for (auto _ : state) {
        std::vector<std::future<ScriptResult>> futures;
        futures.reserve(32);
        for (int i = 0; i < 32; ++i) {
            futures.push_back(pool.submit(request));
        }
        for (auto &future : futures) {
            auto result = future.get();
            benchmark::DoNotOptimize(result);
        }
    }
    state.SetItemsProcessed(state.iterations() * 32);
    state.SetLabel("workers=" + std::to_string(state.range(0)));
}
BENCHMARK(BM_WorkerPoolThroughput)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();
