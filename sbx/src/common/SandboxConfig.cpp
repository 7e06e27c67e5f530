#include "common/SandboxConfig.h"
#include "common/Logger.h"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <thread>

namespace SBX {

namespace {

constexpr size_t KIB = 1024;
constexpr size_t MIB = 1024 * 1024;

std::optional<int64_t> parsePositive(const std::string &text) {
    int64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

template <typename T> void applyEnvVar(const char *name, T &field, size_t unit = 1) {
    const char *raw = std::getenv(name);
    if (!raw) {
        return;
    }
    auto parsed = parsePositive(raw);
    if (!parsed) {
        LOG_WARN("SandboxConfig: Ignoring {}='{}' (expected a positive integer)", name, raw);
        return;
    }
    field = static_cast<T>(*parsed) * static_cast<T>(unit);
    LOG_DEBUG("SandboxConfig: {} = {}", name, *parsed);
}

template <typename T> void applyJsonField(const json &object, const char *key, T &field) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
        LOG_WARN("SandboxConfig: Ignoring '{}' = {} (expected a positive integer)", key,
                 JsonUtils::toCompactString(*it));
        return;
    }
    field = static_cast<T>(it->get<int64_t>());
}

}  // namespace

SandboxConfig SandboxConfig::fromEnvironment() {
    SandboxConfig config;
    config.applyEnvironment();
    return config;
}

SandboxConfig SandboxConfig::fromJson(const json &value) {
    SandboxConfig config;
    config.applyJson(value);
    return config;
}

void SandboxConfig::applyEnvironment() {
    applyEnvVar("SBX_SANDBOX_MEMORY_LIMIT_MB", memoryLimitBytes, MIB);
    applyEnvVar("SBX_SANDBOX_MAX_STACK_KB", maxStackSizeBytes, KIB);
    applyEnvVar("SBX_SANDBOX_MIN_TIMEOUT_MS", minTimeoutMs);
    applyEnvVar("SBX_SANDBOX_MAX_TIMEOUT_MS", maxTimeoutMs);
    applyEnvVar("SBX_SANDBOX_TERMINATION_GRACE_MS", terminationGraceMs);
    applyEnvVar("SBX_SANDBOX_MAX_CODE_SIZE", maxCodeSize);
    applyEnvVar("SBX_SANDBOX_MAX_INPUT_SIZE", maxInputSize);
    applyEnvVar("SBX_SANDBOX_MAX_OUTPUT_SIZE", maxOutputSize);
    applyEnvVar("SBX_SANDBOX_MAX_CONSOLE_ENTRIES", maxConsoleEntries);
    applyEnvVar("SBX_SANDBOX_MAX_CONSOLE_BYTES", maxConsoleBytes);
    applyEnvVar("SBX_SANDBOX_MAX_MARSHAL_DEPTH", maxMarshalDepth);
    applyEnvVar("SBX_SANDBOX_WORKERS", workerThreads);
}

void SandboxConfig::applyJson(const json &value) {
    if (!value.is_object()) {
        LOG_WARN("SandboxConfig: Configuration document is not a JSON object, keeping current values");
        return;
    }
    applyJsonField(value, "memoryLimitBytes", memoryLimitBytes);
    applyJsonField(value, "maxStackSizeBytes", maxStackSizeBytes);
    applyJsonField(value, "minTimeoutMs", minTimeoutMs);
    applyJsonField(value, "maxTimeoutMs", maxTimeoutMs);
    applyJsonField(value, "terminationGraceMs", terminationGraceMs);
    applyJsonField(value, "maxCodeSize", maxCodeSize);
    applyJsonField(value, "maxInputSize", maxInputSize);
    applyJsonField(value, "maxOutputSize", maxOutputSize);
    applyJsonField(value, "maxConsoleEntries", maxConsoleEntries);
    applyJsonField(value, "maxConsoleBytes", maxConsoleBytes);
    applyJsonField(value, "maxMarshalDepth", maxMarshalDepth);
    applyJsonField(value, "maxErrorMessageLength", maxErrorMessageLength);
    applyJsonField(value, "workerThreads", workerThreads);
}

json SandboxConfig::toJson() const {
    return json{{"memoryLimitBytes", memoryLimitBytes},
                {"maxStackSizeBytes", maxStackSizeBytes},
                {"minTimeoutMs", minTimeoutMs},
                {"maxTimeoutMs", maxTimeoutMs},
                {"terminationGraceMs", terminationGraceMs},
                {"maxCodeSize", maxCodeSize},
                {"maxInputSize", maxInputSize},
                {"maxOutputSize", maxOutputSize},
                {"maxConsoleEntries", maxConsoleEntries},
                {"maxConsoleBytes", maxConsoleBytes},
                {"maxMarshalDepth", maxMarshalDepth},
                {"maxErrorMessageLength", maxErrorMessageLength},
                {"workerThreads", workerThreads}};
}

bool SandboxConfig::validate(std::string *errorOut) const {
    auto fail = [errorOut](const std::string &message) {
        if (errorOut) {
            *errorOut = message;
        }
        return false;
    };

    if (minTimeoutMs <= 0 || maxTimeoutMs <= 0) {
        return fail("timeouts must be positive");
    }
    if (minTimeoutMs > maxTimeoutMs) {
        return fail("minTimeoutMs exceeds maxTimeoutMs");
    }
    if (terminationGraceMs < 0) {
        return fail("terminationGraceMs must not be negative");
    }
    if (memoryLimitBytes == 0 || maxStackSizeBytes == 0) {
        return fail("memory and stack limits must be positive");
    }
    if (maxStackSizeBytes >= memoryLimitBytes) {
        return fail("maxStackSizeBytes must be smaller than memoryLimitBytes");
    }
    if (maxMarshalDepth == 0 || maxErrorMessageLength == 0) {
        return fail("maxMarshalDepth and maxErrorMessageLength must be positive");
    }
    return true;
}

int64_t SandboxConfig::clampTimeout(int64_t requestedMs) const {
    return std::clamp(requestedMs, minTimeoutMs, std::max(minTimeoutMs, maxTimeoutMs));
}

size_t SandboxConfig::resolvedWorkerThreads() const {
    if (workerThreads > 0) {
        return workerThreads;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

}  // namespace SBX
