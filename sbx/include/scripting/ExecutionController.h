#pragma once

#include "SBXTypes.h"
#include "scripting/ConsoleBuffer.h"
#include "scripting/ErrorTranslator.h"
#include "scripting/SandboxContext.h"
#include "scripting/ScriptResult.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace SBX {

/**
 * @brief Lifecycle of one invocation
 *
 * Created -> Compiling -> Running -> Completed | Failed | TimedOut | MemoryExceeded.
 * Failed, TimedOut and MemoryExceeded are also reachable from Created and Compiling.
 * Terminal states are final.
 */
enum class ExecutionState { Created, Compiling, Running, Completed, Failed, TimedOut, MemoryExceeded };

const char *executionStateToString(ExecutionState state);

bool isTerminalState(ExecutionState state);

bool canTransition(ExecutionState from, ExecutionState to);

/**
 * @brief Terminal state matching a failure tag
 */
ExecutionState terminalStateForError(ErrorTag tag);

struct ExecutionLimits {
    SandboxLimits sandbox;
    int64_t timeoutMs = 1000;
    int64_t terminationGraceMs = 25;
    bool consoleEnabled = false;
    size_t maxConsoleEntries = 1000;
    size_t maxConsoleBytes = 65536;
};

namespace Detail {
struct SharedInvocation;
}

/**
 * @brief What the invocation body sees on the execution thread
 */
class InvocationScope {
public:
    InvocationScope(SandboxContext &sandbox, Detail::SharedInvocation &shared);

    JSContext *context() const {
        return sandbox_.context();
    }

    ConsoleBuffer &console() const;

    const InterruptState &interrupt() const;

    ExecutionState state() const;

    /**
     * @throws std::logic_error for a transition the lifecycle does not allow
     */
    void transition(ExecutionState to);

private:
    SandboxContext &sandbox_;
    Detail::SharedInvocation &shared_;
};

/**
 * @brief Script work run inside a fresh sandbox
 *
 * Executes on the execution thread and may outlive the caller after a timeout, so it
 * must own everything it captures. Failures are reported by throwing:
 * PendingScriptException (JavaScript exception left on the context),
 * MarshallingException, SandboxUnavailableException or any other std::exception.
 */
using InvocationBody = std::function<HostValue(InvocationScope &)>;

struct InvocationOutcome {
    ExecutionState state = ExecutionState::Created;
    HostValue output;
    std::optional<ScriptError> error;
    std::vector<ConsoleEntry> consoleLogs;
    // Set once the invocation reached Running
    std::optional<double> executionTimeMs;

    ScriptResult toResult() const;
};

/**
 * @brief Supervises one invocation: dedicated thread, deadline, memory ceiling and console capture
 *
 * run() starts an execution thread that creates the SandboxContext, runs the body and
 * destroys the context before finishing. The caller waits until the deadline plus the
 * grace period. The QuickJS interrupt handler stops bytecode at the deadline; a thread
 * still busy after the grace period (a long native builtin) is abandoned with cancel
 * requested and the invocation reports TimeoutError. The abandoned thread releases its
 * context when it unwinds.
 *
 * @code
 * SBX::ExecutionController controller(limits, SBX::ErrorTranslator());
 * auto outcome = controller.run([code](SBX::InvocationScope &scope) { ... });
 * @endcode
 */
class ExecutionController {
public:
    ExecutionController(ExecutionLimits limits, ErrorTranslator translator);

    InvocationOutcome run(InvocationBody body) const;

    const ExecutionLimits &getLimits() const {
        return limits_;
    }

    /**
     * @brief Execution threads abandoned after a timeout that have not finished yet
     */
    static int abandonedThreadCount();

private:
    ExecutionLimits limits_;
    ErrorTranslator translator_;

    static std::atomic<int> abandonedThreads_;

    static void executeOnThread(const std::shared_ptr<Detail::SharedInvocation> &shared, const InvocationBody &body);
};

}  // namespace SBX
