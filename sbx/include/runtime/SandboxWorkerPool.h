#pragma once

#include "scripting/IScriptSandbox.h"
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace SBX {

/**
 * @brief Fixed set of host worker threads feeding invocations to an IScriptSandbox
 *
 * Architecture:
 * - Callers queue requests via submit() and receive a future
 * - Each worker takes the next request and runs it through the sandbox
 * - A mutex protects the queue, a condition variable signals new work
 *
 * Every invocation still gets its own runtime and execution thread inside the
 * sandbox; the pool only bounds how many run at once.
 */
class SandboxWorkerPool {
public:
    /**
     * @param sandbox Executor shared by all workers
     * @param threads Worker count, at least 1
     */
    SandboxWorkerPool(std::shared_ptr<IScriptSandbox> sandbox, size_t threads);
    ~SandboxWorkerPool();

    SandboxWorkerPool(const SandboxWorkerPool &) = delete;
    SandboxWorkerPool &operator=(const SandboxWorkerPool &) = delete;

    /**
     * @brief Queue an invocation
     *
     * After shutdown() the future is already resolved with SandboxUnavailable.
     */
    std::future<ScriptResult> submit(ScriptInvocationRequest request);

    /**
     * @brief Stop accepting work, finish queued requests and join the workers
     */
    void shutdown();

    bool isShutdown() const {
        return shouldStop_.load();
    }

    size_t getThreadCount() const {
        return workers_.size();
    }

    size_t getPendingCount() const;

private:
    struct QueuedInvocation {
        ScriptInvocationRequest request;
        std::promise<ScriptResult> promise;

        explicit QueuedInvocation(ScriptInvocationRequest req) : request(std::move(req)) {}
    };

    std::shared_ptr<IScriptSandbox> sandbox_;
    std::queue<std::unique_ptr<QueuedInvocation>> queue_;
    mutable std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::vector<std::thread> workers_;
    std::atomic<bool> shouldStop_{false};

    void workerLoop(size_t workerIndex);
};

}  // namespace SBX
