#include "scripting/SandboxContext.h"
#include "common/Logger.h"
#include "scripting/SandboxExceptions.h"
#include <algorithm>
#include <cstdlib>
#include <malloc.h>
#include <type_traits>

namespace SBX {

namespace {

// Per-block bookkeeping cost QuickJS's own allocator charges on top of the usable size
constexpr size_t MALLOC_OVERHEAD = 8;

/**
 * @brief Allocator hooks for JS_NewRuntime2 charging every block to an InterruptState
 *
 * QuickJS releases differ in the first hook parameter: older ones pass a JSMallocState
 * whose counters the hooks maintain, newer ones pass the runtime opaque and keep the
 * counters themselves. The hooks are templates so the assignment picks the right shape.
 */
struct CountingAllocator {
    template <typename State> static InterruptState *owner(State *state) {
        if constexpr (std::is_void_v<State>) {
            return static_cast<InterruptState *>(state);
        } else {
            return static_cast<InterruptState *>(state->opaque);
        }
    }

    template <typename State> static void charge(State *state, InterruptState *heap, size_t bytes, int blocks) {
        heap->heapBytes += bytes;
        if constexpr (!std::is_void_v<State>) {
            state->malloc_size += bytes;
            state->malloc_count += blocks;
        }
    }

    template <typename State> static void refund(State *state, InterruptState *heap, size_t bytes, int blocks) {
        heap->heapBytes -= std::min(heap->heapBytes, bytes);
        if constexpr (!std::is_void_v<State>) {
            state->malloc_size -= bytes;
            state->malloc_count -= blocks;
        }
    }

    static bool admit(InterruptState *heap, size_t released, size_t requested) {
        if (heap->memoryLimitBytes == 0) {
            return true;
        }
        size_t held = heap->heapBytes - std::min(heap->heapBytes, released);
        if (requested > heap->memoryLimitBytes || held + requested + MALLOC_OVERHEAD > heap->memoryLimitBytes) {
            heap->memoryExceeded = true;
            return false;
        }
        return true;
    }

    template <typename State> static void *allocate(State *state, size_t size) {
        InterruptState *heap = owner(state);
        if (!admit(heap, 0, size)) {
            return nullptr;
        }
        void *ptr = std::malloc(size);
        if (ptr) {
            charge(state, heap, malloc_usable_size(ptr) + MALLOC_OVERHEAD, 1);
        }
        return ptr;
    }

    static void *allocateZeroed(void *opaque, size_t count, size_t size) {
        auto *heap = static_cast<InterruptState *>(opaque);
        if (count != 0 && size > static_cast<size_t>(-1) / count) {
            heap->memoryExceeded = true;
            return nullptr;
        }
        if (!admit(heap, 0, count * size)) {
            return nullptr;
        }
        void *ptr = std::calloc(count, size);
        if (ptr) {
            heap->heapBytes += malloc_usable_size(ptr) + MALLOC_OVERHEAD;
        }
        return ptr;
    }

    template <typename State> static void release(State *state, void *ptr) {
        if (!ptr) {
            return;
        }
        refund(state, owner(state), malloc_usable_size(ptr) + MALLOC_OVERHEAD, 1);
        std::free(ptr);
    }

    template <typename State> static void *reallocate(State *state, void *ptr, size_t size) {
        if (!ptr) {
            return allocate(state, size);
        }
        if (size == 0) {
            release(state, ptr);
            return nullptr;
        }
        InterruptState *heap = owner(state);
        size_t oldBytes = malloc_usable_size(ptr) + MALLOC_OVERHEAD;
        if (!admit(heap, oldBytes, size)) {
            return nullptr;
        }
        void *resized = std::realloc(ptr, size);
        if (!resized) {
            return nullptr;
        }
        refund(state, heap, oldBytes, 0);
        charge(state, heap, malloc_usable_size(resized) + MALLOC_OVERHEAD, 0);
        return resized;
    }

    static size_t usableSize(const void *ptr) {
        return ptr ? malloc_usable_size(const_cast<void *>(ptr)) : 0;
    }

    template <typename Functions> static Functions hooks() {
        Functions functions{};
        if constexpr (requires { functions.js_calloc; }) {
            functions.js_calloc = &CountingAllocator::allocateZeroed;
        }
        functions.js_malloc = &CountingAllocator::allocate;
        functions.js_free = &CountingAllocator::release;
        functions.js_realloc = &CountingAllocator::reallocate;
        functions.js_malloc_usable_size = &CountingAllocator::usableSize;
        return functions;
    }
};

}  // namespace

std::atomic<int> SandboxContext::liveCount_{0};

SandboxContext::SandboxContext(const SandboxLimits &limits, InterruptState &interrupt) {
    interrupt.memoryLimitBytes = limits.memoryLimitBytes;
    runtime_ = createRuntime(interrupt);
    if (!runtime_) {
        throw SandboxUnavailableException("failed to create QuickJS runtime");
    }

    // Measured from the current stack position, so this must run on the execution thread
    JS_SetMaxStackSize(runtime_, limits.maxStackSizeBytes);
    JS_SetInterruptHandler(runtime_, &SandboxContext::interruptHandler, &interrupt);

    context_ = JS_NewContext(runtime_);
    if (!context_) {
        JS_FreeRuntime(runtime_);
        runtime_ = nullptr;
        throw SandboxUnavailableException("failed to create QuickJS context");
    }

    liveCount_++;
    LOG_TRACE("SandboxContext: created runtime (memory limit {} bytes, stack {} bytes)", limits.memoryLimitBytes,
              limits.maxStackSizeBytes);
}

SandboxContext::~SandboxContext() {
    if (context_) {
        JS_FreeContext(context_);
        context_ = nullptr;
    }
    if (runtime_) {
        // Drops any promise jobs the script queued without running them
        JS_FreeRuntime(runtime_);
        runtime_ = nullptr;
    }
    liveCount_--;
    LOG_TRACE("SandboxContext: runtime released");
}

JSRuntime *SandboxContext::createRuntime(InterruptState &interrupt) {
    static const JSMallocFunctions functions = CountingAllocator::hooks<JSMallocFunctions>();
    return JS_NewRuntime2(&functions, &interrupt);
}

int SandboxContext::liveCount() {
    return liveCount_.load();
}

int SandboxContext::interruptHandler(JSRuntime *, void *opaque) {
    auto *state = static_cast<InterruptState *>(opaque);

    if (state->memoryExceeded.load(std::memory_order_relaxed)) {
        return 1;
    }
    if (state->cancelRequested.load(std::memory_order_relaxed) || std::chrono::steady_clock::now() >= state->deadline) {
        state->deadlineExceeded = true;
        return 1;
    }
    return 0;
}

}  // namespace SBX
