#include "common/ILoggerBackend.h"
#include "common/Logger.h"
#include "common/TestUtils.h"
#include "scripting/SandboxRuntimeManager.h"
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <vector>

namespace SBX {

namespace {

class CapturingBackend : public ILoggerBackend {
public:
    struct Record {
        LogLevel level;
        std::string message;
    };

    explicit CapturingBackend(std::shared_ptr<std::vector<Record>> records, std::shared_ptr<std::mutex> mutex)
        : records_(std::move(records)), mutex_(std::move(mutex)) {}

    void log(LogLevel level, const std::string &message, const std::source_location &) override {
        if (level < level_) {
            return;
        }
        std::lock_guard<std::mutex> lock(*mutex_);
        records_->push_back({level, message});
    }

    void setLevel(LogLevel level) override {
        level_ = level;
    }

    void flush() override {}

private:
    std::shared_ptr<std::vector<CapturingBackend::Record>> records_;
    std::shared_ptr<std::mutex> mutex_;
    LogLevel level_ = LogLevel::Trace;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        records_ = std::make_shared<std::vector<CapturingBackend::Record>>();
        mutex_ = std::make_shared<std::mutex>();
        Logger::setBackend(std::make_unique<CapturingBackend>(records_, mutex_));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    std::vector<CapturingBackend::Record> records() {
        std::lock_guard<std::mutex> lock(*mutex_);
        return *records_;
    }

    std::shared_ptr<std::vector<CapturingBackend::Record>> records_;
    std::shared_ptr<std::mutex> mutex_;
};

TEST_F(LoggerTest, Macros_ReachInjectedBackendWithFunctionName) {
    LOG_INFO("LoggerTest: value {}", 42);

    auto captured = records();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].level, LogLevel::Info);
    EXPECT_NE(captured[0].message.find("LoggerTest: value 42"), std::string::npos);
    EXPECT_NE(captured[0].message.find("() - "), std::string::npos);
}

TEST_F(LoggerTest, SetLevel_FiltersLowerLevels) {
    Logger::setLevel(LogLevel::Warn);
    LOG_DEBUG("hidden");
    LOG_WARN("shown");

    auto captured = records();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].level, LogLevel::Warn);
}

TEST_F(LoggerTest, ParseLogLevel_AcceptsSpdlogNames) {
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("ERR"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST_F(LoggerTest, ScriptConsole_NeverReachesProcessLog) {
    SandboxRuntimeManager manager;
    auto result = manager.execute(
        SBX::Test::Utils::makeRequest("console.log('tenant-secret-value'); return 1;", nullptr, 1000, true));

    ASSERT_TRUE(result.isSuccess()) << result.getErrorMessage();
    ASSERT_EQ(result.getConsoleLogs().size(), 1u);
    for (const auto &record : records()) {
        EXPECT_EQ(record.message.find("tenant-secret-value"), std::string::npos) << record.message;
    }
}

}  // namespace SBX
