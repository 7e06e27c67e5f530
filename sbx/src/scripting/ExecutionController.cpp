// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SBX-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SBX (ScriptBox Sandbox Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/reactive-state-machine/blob/main/LICENSE

#include "scripting/ExecutionController.h"
#include "common/Logger.h"
#include "scripting/SandboxExceptions.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace SBX {

namespace Detail {

/**
 * @brief State shared by the caller and the execution thread
 *
 * Held through shared_ptr by both sides so an abandoned thread keeps it alive.
 */
struct SharedInvocation {
    SharedInvocation(const ExecutionLimits &executionLimits, const ErrorTranslator &errorTranslator)
        : limits(executionLimits), translator(errorTranslator),
          console(executionLimits.consoleEnabled, executionLimits.maxConsoleEntries, executionLimits.maxConsoleBytes) {}

    const ExecutionLimits limits;
    const ErrorTranslator translator;
    InterruptState interrupt;
    ConsoleBuffer console;
    std::chrono::steady_clock::time_point startedAt;

    // Written by the execution thread only
    std::atomic<ExecutionState> state{ExecutionState::Created};
    std::atomic<bool> reachedRunning{false};

    std::mutex mutex;
    std::condition_variable finishedCondition;
    bool finished = false;
    bool abandoned = false;
    HostValue output;
    std::optional<ScriptError> error;
    std::optional<double> executionTimeMs;
};

}  // namespace Detail

namespace {

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

}  // namespace

std::atomic<int> ExecutionController::abandonedThreads_{0};

const char *executionStateToString(ExecutionState state) {
    switch (state) {
    case ExecutionState::Created:
        return "Created";
    case ExecutionState::Compiling:
        return "Compiling";
    case ExecutionState::Running:
        return "Running";
    case ExecutionState::Completed:
        return "Completed";
    case ExecutionState::Failed:
        return "Failed";
    case ExecutionState::TimedOut:
        return "TimedOut";
    case ExecutionState::MemoryExceeded:
        return "MemoryExceeded";
    }
    return "Unknown";
}

bool isTerminalState(ExecutionState state) {
    return state == ExecutionState::Completed || state == ExecutionState::Failed ||
           state == ExecutionState::TimedOut || state == ExecutionState::MemoryExceeded;
}

bool canTransition(ExecutionState from, ExecutionState to) {
    if (isTerminalState(from)) {
        return false;
    }
    switch (to) {
    case ExecutionState::Created:
        return false;
    case ExecutionState::Compiling:
        return from == ExecutionState::Created;
    case ExecutionState::Running:
        return from == ExecutionState::Compiling;
    case ExecutionState::Completed:
        return from == ExecutionState::Running;
    case ExecutionState::Failed:
    case ExecutionState::TimedOut:
    case ExecutionState::MemoryExceeded:
        return true;
    }
    return false;
}

ExecutionState terminalStateForError(ErrorTag tag) {
    switch (tag) {
    case ErrorTag::TimeoutError:
        return ExecutionState::TimedOut;
    case ErrorTag::MemoryLimitError:
        return ExecutionState::MemoryExceeded;
    default:
        return ExecutionState::Failed;
    }
}

// === InvocationScope ===

InvocationScope::InvocationScope(SandboxContext &sandbox, Detail::SharedInvocation &shared)
    : sandbox_(sandbox), shared_(shared) {}

ConsoleBuffer &InvocationScope::console() const {
    return shared_.console;
}

const InterruptState &InvocationScope::interrupt() const {
    return shared_.interrupt;
}

ExecutionState InvocationScope::state() const {
    return shared_.state.load();
}

void InvocationScope::transition(ExecutionState to) {
    ExecutionState from = shared_.state.load();
    if (!canTransition(from, to)) {
        throw std::logic_error(std::format("illegal execution state transition {} -> {}", executionStateToString(from),
                                           executionStateToString(to)));
    }
    shared_.state = to;
    if (to == ExecutionState::Running) {
        shared_.reachedRunning = true;
    }
    LOG_TRACE("ExecutionController: {} -> {}", executionStateToString(from), executionStateToString(to));
}

// === InvocationOutcome ===

ScriptResult InvocationOutcome::toResult() const {
    if (state == ExecutionState::Completed) {
        return ScriptResult::createSuccess(output, executionTimeMs.value_or(0.0), consoleLogs);
    }
    ScriptError failure = error.value_or(ScriptError{ErrorTag::SandboxUnavailable, "Invocation ended without a result"});
    return ScriptResult::createError(std::move(failure), consoleLogs, executionTimeMs);
}

// === ExecutionController ===

ExecutionController::ExecutionController(ExecutionLimits limits, ErrorTranslator translator)
    : limits_(std::move(limits)), translator_(std::move(translator)) {}

int ExecutionController::abandonedThreadCount() {
    return abandonedThreads_.load();
}

InvocationOutcome ExecutionController::run(InvocationBody body) const {
    auto shared = std::make_shared<Detail::SharedInvocation>(limits_, translator_);

    auto startedAt = std::chrono::steady_clock::now();
    shared->startedAt = startedAt;
    shared->interrupt.timeoutMs = limits_.timeoutMs;
    shared->interrupt.deadline = startedAt + std::chrono::milliseconds(limits_.timeoutMs);
    shared->interrupt.memoryLimitBytes = limits_.sandbox.memoryLimitBytes;

    std::thread worker;
    try {
        worker = std::thread([shared, body = std::move(body)]() { executeOnThread(shared, body); });
    } catch (const std::system_error &e) {
        LOG_ERROR("ExecutionController: Failed to start execution thread: {}", e.what());
        InvocationOutcome outcome;
        outcome.state = ExecutionState::Failed;
        outcome.error = translator_.translate(ErrorTag::SandboxUnavailable, "Could not start execution thread");
        return outcome;
    }

    auto waitLimit = shared->interrupt.deadline + std::chrono::milliseconds(limits_.terminationGraceMs);
    std::unique_lock<std::mutex> lock(shared->mutex);
    bool finished = shared->finishedCondition.wait_until(lock, waitLimit, [&shared] { return shared->finished; });

    if (!finished) {
        shared->abandoned = true;
        shared->interrupt.cancelRequested = true;
        abandonedThreads_++;
        lock.unlock();
        worker.detach();

        LOG_WARN("ExecutionController: Execution thread still busy {} ms past the {} ms deadline, abandoning it",
                 limits_.terminationGraceMs, limits_.timeoutMs);

        InvocationOutcome outcome;
        outcome.state = ExecutionState::TimedOut;
        outcome.error = translator_.timeoutError(limits_.timeoutMs);
        outcome.consoleLogs = shared->console.snapshot();
        outcome.executionTimeMs = elapsedMs(startedAt);
        return outcome;
    }

    InvocationOutcome outcome;
    outcome.output = std::move(shared->output);
    outcome.error = std::move(shared->error);
    outcome.executionTimeMs = shared->executionTimeMs;
    lock.unlock();
    worker.join();

    outcome.state = shared->state.load();
    outcome.consoleLogs = shared->console.takeEntries();

    if (outcome.error) {
        LOG_DEBUG("ExecutionController: Invocation ended in {} ({})", executionStateToString(outcome.state),
                  errorTagToString(outcome.error->tag));
    } else {
        LOG_DEBUG("ExecutionController: Invocation completed in {:.2f} ms", outcome.executionTimeMs.value_or(0.0));
    }
    return outcome;
}

void ExecutionController::executeOnThread(const std::shared_ptr<Detail::SharedInvocation> &shared,
                                          const InvocationBody &body) {
    Detail::SharedInvocation &invocation = *shared;
    HostValue output;
    std::optional<ScriptError> error;

    try {
        SandboxContext sandbox(invocation.limits.sandbox, invocation.interrupt);
        InvocationScope scope(sandbox, invocation);
        try {
            output = body(scope);
            // A refused allocation the script caught still ends the invocation
            if (invocation.interrupt.memoryExceeded.load()) {
                error = invocation.translator.memoryLimitError(invocation.interrupt.memoryLimitBytes);
            } else {
                scope.transition(ExecutionState::Completed);
            }
        } catch (const PendingScriptException &) {
            FailureStage stage =
                scope.state() == ExecutionState::Compiling ? FailureStage::Compiling : FailureStage::Running;
            error = invocation.translator.fromPendingException(sandbox.context(), stage, invocation.interrupt);
        } catch (const std::exception &e) {
            // An interrupt can surface as a host-side failure, e.g. inside a marshalling step
            if (invocation.interrupt.memoryExceeded.load()) {
                error = invocation.translator.memoryLimitError(invocation.interrupt.memoryLimitBytes);
            } else if (invocation.interrupt.deadlineExceeded.load()) {
                error = invocation.translator.timeoutError(invocation.interrupt.timeoutMs);
            } else {
                error = invocation.translator.fromHostException(e);
            }
        }
    } catch (const std::exception &e) {
        if (invocation.interrupt.memoryExceeded.load()) {
            error = invocation.translator.memoryLimitError(invocation.interrupt.memoryLimitBytes);
        } else {
            LOG_ERROR("ExecutionController: Sandbox setup failed: {}", e.what());
            error = invocation.translator.fromHostException(e);
        }
    }

    if (error) {
        invocation.state = terminalStateForError(error->tag);
    }

    bool abandoned = false;
    {
        std::lock_guard<std::mutex> lock(invocation.mutex);
        invocation.output = std::move(output);
        invocation.error = std::move(error);
        if (invocation.reachedRunning.load()) {
            invocation.executionTimeMs = elapsedMs(invocation.startedAt);
        }
        invocation.finished = true;
        abandoned = invocation.abandoned;
    }
    invocation.finishedCondition.notify_all();

    if (abandoned) {
        abandonedThreads_--;
        LOG_DEBUG("ExecutionController: Abandoned execution thread finished and released its sandbox");
    }
}

}  // namespace SBX
