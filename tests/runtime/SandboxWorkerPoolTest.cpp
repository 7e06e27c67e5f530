#include "common/TestUtils.h"
#include "mocks/MockScriptSandbox.h"
#include "runtime/SandboxWorkerPool.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace SBX {

class SandboxWorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        sandbox_ = std::make_shared<SBX::Test::MockScriptSandbox>();
    }

    std::shared_ptr<SBX::Test::MockScriptSandbox> sandbox_;
};

TEST_F(SandboxWorkerPoolTest, Construction_RequiresSandbox) {
    EXPECT_THROW(SandboxWorkerPool(nullptr, 2), std::invalid_argument);
}

TEST_F(SandboxWorkerPoolTest, Construction_AtLeastOneWorker) {
    SandboxWorkerPool pool(sandbox_, 0);
    EXPECT_EQ(pool.getThreadCount(), 1u);
    EXPECT_FALSE(pool.isShutdown());
}

TEST_F(SandboxWorkerPoolTest, Submit_ResolvesWithSandboxResult) {
    EXPECT_CALL(*sandbox_, execute(Field(&ScriptInvocationRequest::code, "return 42;")))
        .WillOnce(Return(ScriptResult::createSuccess(42, 1.0)));

    SandboxWorkerPool pool(sandbox_, 2);
    auto result = pool.submit(SBX::Test::Utils::makeRequest("return 42;")).get();

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.getOutput(), 42);
}

TEST_F(SandboxWorkerPoolTest, Submit_ScriptErrorsPassThrough) {
    EXPECT_CALL(*sandbox_, execute(_))
        .WillOnce(Return(ScriptResult::createError(ErrorTag::TimeoutError, "Script execution timed out after 5 ms")));

    SandboxWorkerPool pool(sandbox_, 1);
    auto result = pool.submit(SBX::Test::Utils::makeRequest("while (true) {}", nullptr, 5)).get();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getErrorTag(), ErrorTag::TimeoutError);
}

TEST_F(SandboxWorkerPoolTest, Submit_ExecutorExceptionBecomesSandboxUnavailable) {
    EXPECT_CALL(*sandbox_, execute(_)).WillOnce(Throw(std::runtime_error("runtime pool exhausted")));

    SandboxWorkerPool pool(sandbox_, 1);
    auto result = pool.submit(SBX::Test::Utils::makeRequest("return 1;")).get();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getErrorTag(), ErrorTag::SandboxUnavailable);
    EXPECT_TRUE(result.getError().isRetryable());
    EXPECT_EQ(result.getErrorMessage(), "Sandbox failure: runtime pool exhausted");
}

TEST_F(SandboxWorkerPoolTest, Shutdown_DrainsQueuedRequests) {
    EXPECT_CALL(*sandbox_, execute(_)).Times(5).WillRepeatedly(Invoke([](const ScriptInvocationRequest &request) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return ScriptResult::createSuccess(request.input, 10.0);
    }));

    SandboxWorkerPool pool(sandbox_, 1);
    std::vector<std::future<ScriptResult>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(pool.submit(SBX::Test::Utils::makeRequest("return input;", i)));
    }
    pool.shutdown();

    EXPECT_TRUE(pool.isShutdown());
    EXPECT_EQ(pool.getPendingCount(), 0u);
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(futures[i].wait_for(std::chrono::seconds(0)), std::future_status::ready);
        auto result = futures[i].get();
        ASSERT_TRUE(result.isSuccess());
        EXPECT_EQ(result.getOutput(), i);
    }
}

TEST_F(SandboxWorkerPoolTest, Submit_AfterShutdownIsRejected) {
    EXPECT_CALL(*sandbox_, execute(_)).Times(0);

    SandboxWorkerPool pool(sandbox_, 2);
    pool.shutdown();
    pool.shutdown();

    auto future = pool.submit(SBX::Test::Utils::makeRequest("return 1;"));
    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getErrorTag(), ErrorTag::SandboxUnavailable);
    EXPECT_EQ(result.getErrorMessage(), "Sandbox worker pool is shut down");
}

TEST_F(SandboxWorkerPoolTest, Workers_RunInParallel) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    EXPECT_CALL(*sandbox_, execute(_)).Times(8).WillRepeatedly(Invoke([&](const ScriptInvocationRequest &) {
        int now = ++running;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(SBX::Test::Utils::getBaseDelay(30)));
        --running;
        return ScriptResult::createSuccess(nullptr, 1.0);
    }));

    {
        SandboxWorkerPool pool(sandbox_, 4);
        std::vector<std::future<ScriptResult>> futures;
        for (int i = 0; i < 8; ++i) {
            futures.push_back(pool.submit(SBX::Test::Utils::makeRequest("return null;")));
        }
        for (auto &future : futures) {
            EXPECT_TRUE(future.get().isSuccess());
        }
    }

    EXPECT_GT(peak.load(), 1);
    EXPECT_LE(peak.load(), 4);
}

}  // namespace SBX
