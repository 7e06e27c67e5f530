#pragma once

#include "quickjs.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace SBX {

/**
 * @brief Flags shared between the interrupt handler, the allocator and the supervising caller
 *
 * deadline is written before the execution thread starts and memoryLimitBytes when the
 * SandboxContext is built; both are only read afterwards. The atomics may be touched from both threads. memoryExceeded is set by
 * the allocator as soon as one request would pass the limit, and stays set even if the
 * script catches the resulting "out of memory" error.
 */
struct InterruptState {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    int64_t timeoutMs = 0;
    size_t memoryLimitBytes = 0;

    std::atomic<bool> cancelRequested{false};
    std::atomic<bool> deadlineExceeded{false};
    std::atomic<bool> memoryExceeded{false};

    // Bytes held by the runtime's allocator, owned by the execution thread
    size_t heapBytes = 0;

    bool interrupted() const {
        return deadlineExceeded.load() || memoryExceeded.load();
    }
};

struct SandboxLimits {
    size_t memoryLimitBytes = 128 * 1024 * 1024;
    size_t maxStackSizeBytes = 512 * 1024;
};

/**
 * @brief One isolated QuickJS heap: a private JSRuntime with a single JSContext
 *
 * Must be created, used and destroyed on the same thread. The runtime allocates through
 * a counting allocator that refuses requests past InterruptState::memoryLimitBytes, and
 * carries the stack limit and an interrupt handler bound to the same InterruptState,
 * which has to outlive the SandboxContext.
 *
 * The context holds only the ECMAScript intrinsics: no std/os modules, no timers and
 * no host objects beyond what the caller installs.
 */
class SandboxContext {
public:
    /**
     * @throws SandboxUnavailableException if QuickJS cannot allocate the runtime or context
     */
    SandboxContext(const SandboxLimits &limits, InterruptState &interrupt);
    ~SandboxContext();

    SandboxContext(const SandboxContext &) = delete;
    SandboxContext &operator=(const SandboxContext &) = delete;

    JSRuntime *runtime() const {
        return runtime_;
    }

    JSContext *context() const {
        return context_;
    }

    /**
     * @brief Number of SandboxContext instances alive in the process
     */
    static int liveCount();

private:
    JSRuntime *runtime_ = nullptr;
    JSContext *context_ = nullptr;

    static std::atomic<int> liveCount_;

    static int interruptHandler(JSRuntime *rt, void *opaque);
    static JSRuntime *createRuntime(InterruptState &interrupt);
};

}  // namespace SBX
