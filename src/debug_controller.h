#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bridge_types.h"
#include "instance_registry.h"

struct ControllerOptions
{
    std::chrono::milliseconds callTimeout{30000};
    // How long start/step wait for a transient Running state to settle.
    std::chrono::milliseconds settleTimeout{250};
    std::chrono::milliseconds settlePoll{25};
};

// Debug session state machine over the active IDE instance.
//
// Design -> Running on start(), Running -> Break when the IDE reports a pause
// (observed through the debugger's mode notifications), any -> Design on stop()
// or when the active instance disappears or changes. Operations that need a
// paused debuggee check the cached state before touching the instance. Mode
// notifications from an instance the session has left are ignored.
//
// Not thread-safe apart from the state itself, which mode notifications
// update from the IDE's thread. The dispatcher calls in one request at a time.
class DebugController
{
public:
    DebugController(ActiveInstanceProvider& instances, ControllerOptions options = ControllerOptions());
    ~DebugController();

    DebugController(const DebugController&) = delete;
    DebugController& operator=(const DebugController&) = delete;

    DebugStateInfo start(const std::optional<std::string>& projectName);
    DebugStateInfo stop();
    DebugStateInfo stepInto();
    DebugStateInfo stepOver();
    DebugStateInfo stepOut();
    DebugStateInfo getDebugState();

    DebugState state() const { return state_->load(); }

    Breakpoint addBreakpoint(const std::string& file, int line, const std::string& condition = std::string());
    void removeBreakpoint(const std::string& id);
    std::vector<Breakpoint> listBreakpoints();

    std::vector<Variable> getLocalVariables();
    std::vector<CallStackFrame> getCallStack();
    std::vector<Variable> getVariablesFromFrame(int frameIndex);
    std::optional<CallStackFrame> getStackFrame(int frameIndex);

    Variable modifyVariable(const std::string& name, const std::string& value);
    ObjectInfo inspectObject(const std::string& name);
    [[noreturn]] void evaluateExpression(const std::string& expression);

private:
    using SharedState = std::shared_ptr<std::atomic<DebugState>>;
    using SharedToken = std::shared_ptr<std::atomic<uint64_t>>;

    enum class StepKind
    {
        Into,
        Over,
        Out
    };

    DebugStateInfo step(StepKind kind);

    std::optional<InstanceHandle> currentHandle();
    InstanceHandle requireHandle(const std::string& operation);
    InstanceHandle requirePausedHandle(const std::string& operation);
    void requireBreak(const std::string& operation) const;

    void resetSession(const char* reason);
    void subscribe(const InstanceHandle& handle);
    void unsubscribe();

    ForeignDebugMode readMode(const InstanceHandle& handle);
    DebugStateInfo settle(const InstanceHandle& handle);
    DebugStateInfo describe(const InstanceHandle& handle);
    std::vector<ForeignStackFrame> readFrames(const InstanceHandle& handle);

    ActiveInstanceProvider& instances_;
    ControllerOptions options_;
    SharedState state_;
    // Listeners only apply mode changes while their token is current.
    SharedToken sessionToken_;

    std::optional<uint64_t> subscription_;
    // Instance the session (and its subscription) belongs to.
    std::optional<InstanceHandle> session_;
};
