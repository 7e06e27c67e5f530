#include "runtime/SandboxWorkerPool.h"
#include "common/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace SBX {

SandboxWorkerPool::SandboxWorkerPool(std::shared_ptr<IScriptSandbox> sandbox, size_t threads)
    : sandbox_(std::move(sandbox)) {
    if (!sandbox_) {
        throw std::invalid_argument("SandboxWorkerPool requires a sandbox");
    }
    size_t count = std::max<size_t>(1, threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&SandboxWorkerPool::workerLoop, this, i);
    }
    LOG_DEBUG("SandboxWorkerPool: Started {} worker threads", count);
}

SandboxWorkerPool::~SandboxWorkerPool() {
    shutdown();
}

std::future<ScriptResult> SandboxWorkerPool::submit(ScriptInvocationRequest request) {
    auto queued = std::make_unique<QueuedInvocation>(std::move(request));
    auto future = queued->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shouldStop_.load()) {
            LOG_DEBUG("SandboxWorkerPool: Rejecting request submitted after shutdown");
            queued->promise.set_value(
                ScriptResult::createError(ErrorTag::SandboxUnavailable, "Sandbox worker pool is shut down"));
            return future;
        }
        queue_.push(std::move(queued));
    }
    queueCondition_.notify_one();
    return future;
}

size_t SandboxWorkerPool::getPendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

void SandboxWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shouldStop_.load()) {
            return;
        }
        shouldStop_ = true;
    }
    LOG_DEBUG("SandboxWorkerPool: Shutdown requested, draining {} queued requests", getPendingCount());
    queueCondition_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    LOG_DEBUG("SandboxWorkerPool: All worker threads joined");
}

void SandboxWorkerPool::workerLoop(size_t workerIndex) {
    LOG_TRACE("SandboxWorkerPool: Worker {} started", workerIndex);

    while (true) {
        std::unique_ptr<QueuedInvocation> invocation;

        // Wait for work or shutdown signal
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] { return !queue_.empty() || shouldStop_.load(); });

            if (queue_.empty()) {
                // Stopping and drained
                break;
            }
            invocation = std::move(queue_.front());
            queue_.pop();
        }

        // Execute outside of lock
        try {
            invocation->promise.set_value(sandbox_->execute(invocation->request));
        } catch (const std::exception &e) {
            LOG_ERROR("SandboxWorkerPool: Invocation failed in worker {}: {}", workerIndex, e.what());
            invocation->promise.set_value(
                ScriptResult::createError(ErrorTag::SandboxUnavailable, std::string("Sandbox failure: ") + e.what()));
        } catch (...) {
            LOG_ERROR("SandboxWorkerPool: Invocation failed in worker {} with unknown exception", workerIndex);
            invocation->promise.set_value(ScriptResult::createError(ErrorTag::SandboxUnavailable, "Sandbox failure"));
        }
    }

    LOG_TRACE("SandboxWorkerPool: Worker {} stopped", workerIndex);
}

}  // namespace SBX
