#include "debug_controller.h"

#include <algorithm>
#include <cctype>
#include <thread>

#include "bridge_error.h"
#include "logging.h"

namespace
{
    constexpr const char* kBreakpointPrefix = "bp_";

    DebugState toDebugState(ForeignDebugMode mode)
    {
        switch(mode)
        {
        case ForeignDebugMode::Design:
            return DebugState::Design;
        case ForeignDebugMode::Run:
            return DebugState::Running;
        case ForeignDebugMode::Break:
            return DebugState::Break;
        }
        return DebugState::Design;
    }

    bool equalsIgnoreCase(const std::string& left, const std::string& right)
    {
        return left.size() == right.size() &&
               std::equal(left.begin(), left.end(), right.begin(), [](unsigned char a, unsigned char b) {
                   return std::tolower(a) == std::tolower(b);
               });
    }

    bool isBlank(const std::string& text)
    {
        return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    }

    Breakpoint toBreakpoint(const ForeignBreakpoint& foreign)
    {
        Breakpoint breakpoint;
        breakpoint.id = kBreakpointPrefix + foreign.name;
        breakpoint.file = foreign.file;
        breakpoint.line = foreign.fileLine;
        breakpoint.condition = foreign.condition;
        breakpoint.enabled = foreign.enabled;
        return breakpoint;
    }

    Variable toVariable(const ForeignExpression& expression, VariableScope scope)
    {
        Variable variable;
        variable.name = expression.name;
        variable.value = expression.hasValue ? expression.value : std::string("<null>");
        variable.type = expression.type.empty() ? std::string("unknown") : expression.type;
        variable.scope = scope;
        return variable;
    }

    CallStackFrame toFrame(const ForeignStackFrame& foreign)
    {
        CallStackFrame frame;
        frame.method = foreign.functionName;
        frame.file = foreign.fileName;
        frame.line = foreign.lineNumber;
        frame.module = foreign.module;
        return frame;
    }

    std::vector<Variable> frameVariables(const ForeignStackFrame& frame)
    {
        std::vector<Variable> variables;
        variables.reserve(frame.locals.size() + frame.arguments.size());
        for(const auto& local : frame.locals)
            variables.push_back(toVariable(local, VariableScope::Local));
        for(const auto& argument : frame.arguments)
            variables.push_back(toVariable(argument, VariableScope::Parameter));
        return variables;
    }

    struct VariableMatch
    {
        const ForeignExpression* expression = nullptr;
        VariableScope scope = VariableScope::Local;
    };

    // Locals first, then parameters.
    VariableMatch findVariable(const ForeignStackFrame& frame, const std::string& name)
    {
        for(const auto& local : frame.locals)
        {
            if(equalsIgnoreCase(local.name, name))
                return VariableMatch{&local, VariableScope::Local};
        }
        for(const auto& argument : frame.arguments)
        {
            if(equalsIgnoreCase(argument.name, name))
                return VariableMatch{&argument, VariableScope::Parameter};
        }
        return VariableMatch{};
    }
}

DebugController::DebugController(ActiveInstanceProvider& instances, ControllerOptions options)
    : instances_(instances),
      options_(options),
      state_(std::make_shared<std::atomic<DebugState>>(DebugState::Design)),
      sessionToken_(std::make_shared<std::atomic<uint64_t>>(0))
{
}

DebugController::~DebugController()
{
    sessionToken_->fetch_add(1);
    unsubscribe();
}

DebugStateInfo DebugController::start(const std::optional<std::string>& projectName)
{
    const InstanceHandle handle = requireHandle("start_debugging");

    const ForeignDebugMode mode = readMode(handle);
    if(mode != ForeignDebugMode::Design)
    {
        state_->store(toDebugState(mode));
        subscribe(handle);
        LogInfoF("Debugging already active in instance %d (%s); not starting another session",
                 handle.processId,
                 DebugStateName(state_->load()));
        return describe(handle);
    }

    if(projectName && !isBlank(*projectName))
    {
        const std::string wanted = *projectName;
        const auto projects = handle.invoke("get_projects", options_.callTimeout, [](IAutomationRoot& root) {
            return root.solution().projects();
        });

        auto it = std::find_if(projects.begin(), projects.end(), [&](const ForeignProject& project) {
            return equalsIgnoreCase(project.name, wanted);
        });
        if(it == projects.end())
        {
            nlohmann::json available = nlohmann::json::array();
            for(const auto& project : projects)
                available.push_back(project.name);
            throw NotFoundError("Project '" + wanted + "' not found in solution",
                                nlohmann::json::object({{"project", wanted}, {"availableProjects", available}}));
        }

        const std::string uniqueName = it->uniqueName;
        handle.invoke("set_startup_project", options_.callTimeout, [uniqueName](IAutomationRoot& root) {
            root.solution().setStartupProject(uniqueName);
        });
        LogInfoF("Startup project set to %s", uniqueName.c_str());
    }

    subscribe(handle);

    handle.invoke("start_debugging", options_.callTimeout, [](IAutomationRoot& root) {
        root.debugger().go(false);
    });

    // a pause reported during go() already moved the state past Design
    DebugState expected = DebugState::Design;
    state_->compare_exchange_strong(expected, DebugState::Running);

    LogInfoF("Debugging started in instance %d", handle.processId);
    return settle(handle);
}

DebugStateInfo DebugController::stop()
{
    const auto handle = currentHandle();
    if(!handle || state_->load() == DebugState::Design)
    {
        LogDebug("stop_debugging: no active session");
        return DebugStateInfo{};
    }

    handle->invoke("stop_debugging", options_.callTimeout, [](IAutomationRoot& root) {
        root.debugger().stop(true);
    });

    resetSession("debugging stopped");
    return DebugStateInfo{};
}

DebugStateInfo DebugController::stepInto()
{
    return step(StepKind::Into);
}

DebugStateInfo DebugController::stepOver()
{
    return step(StepKind::Over);
}

DebugStateInfo DebugController::stepOut()
{
    return step(StepKind::Out);
}

DebugStateInfo DebugController::step(StepKind kind)
{
    const std::string operation = kind == StepKind::Into ? "step_into" : kind == StepKind::Over ? "step_over" : "step_out";
    const InstanceHandle handle = requirePausedHandle(operation);

    handle.invoke(operation, options_.callTimeout, [kind](IAutomationRoot& root) {
        switch(kind)
        {
        case StepKind::Into:
            root.debugger().stepInto();
            break;
        case StepKind::Over:
            root.debugger().stepOver();
            break;
        case StepKind::Out:
            root.debugger().stepOut();
            break;
        }
    });

    return settle(handle);
}

DebugStateInfo DebugController::getDebugState()
{
    const auto handle = currentHandle();
    if(!handle)
        return DebugStateInfo{};

    const ForeignDebugMode mode = readMode(*handle);
    state_->store(toDebugState(mode));

    if(mode == ForeignDebugMode::Design)
    {
        if(session_)
            resetSession("debuggee exited");
        return DebugStateInfo{};
    }

    // picks up sessions started from the IDE itself
    subscribe(*handle);
    return describe(*handle);
}

Breakpoint DebugController::addBreakpoint(const std::string& file, int line, const std::string& condition)
{
    if(isBlank(file))
        throw ValidationError("INVALID_PARAMETER", "Breakpoint file cannot be empty", "file is required");
    if(line <= 0)
        throw ValidationError("INVALID_PARAMETER", "Breakpoint line must be positive", "line must be greater than 0");

    const InstanceHandle handle = requireHandle("set_breakpoint");

    if(!condition.empty())
        LogWarningF("Breakpoint condition '%s' is accepted but not applied to the IDE breakpoint", condition.c_str());

    const ForeignBreakpoint foreign = handle.invoke("set_breakpoint", options_.callTimeout, [file, line](IAutomationRoot& root) {
        return root.debugger().addBreakpoint(file, line);
    });

    Breakpoint breakpoint = toBreakpoint(foreign);
    breakpoint.condition = condition;
    LogInfoF("Breakpoint %s set at %s:%d", breakpoint.id.c_str(), breakpoint.file.c_str(), breakpoint.line);
    return breakpoint;
}

void DebugController::removeBreakpoint(const std::string& id)
{
    const std::string prefix = kBreakpointPrefix;
    if(id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0)
        throw NotFoundError("Breakpoint '" + id + "' not found", nlohmann::json::object({{"id", id}}));

    const InstanceHandle handle = requireHandle("remove_breakpoint");
    const std::string name = id.substr(prefix.size());

    const bool removed = handle.invoke("remove_breakpoint", options_.callTimeout, [name](IAutomationRoot& root) {
        return root.debugger().removeBreakpoint(name);
    });
    if(!removed)
        throw NotFoundError("Breakpoint '" + id + "' not found", nlohmann::json::object({{"id", id}}));

    LogInfoF("Breakpoint %s removed", id.c_str());
}

std::vector<Breakpoint> DebugController::listBreakpoints()
{
    const auto handle = currentHandle();
    if(!handle)
        return {};

    const auto foreign = handle->invoke("get_breakpoints", options_.callTimeout, [](IAutomationRoot& root) {
        return root.debugger().breakpoints();
    });

    std::vector<Breakpoint> breakpoints;
    breakpoints.reserve(foreign.size());
    for(const auto& entry : foreign)
        breakpoints.push_back(toBreakpoint(entry));
    return breakpoints;
}

std::vector<Variable> DebugController::getLocalVariables()
{
    return getVariablesFromFrame(0);
}

std::vector<CallStackFrame> DebugController::getCallStack()
{
    // a changed or lost instance resets the state, so check it afterwards
    const auto handle = currentHandle();
    if(!handle || state_->load() != DebugState::Break)
        return {};

    std::vector<CallStackFrame> frames;
    for(const auto& frame : readFrames(*handle))
        frames.push_back(toFrame(frame));
    return frames;
}

std::vector<Variable> DebugController::getVariablesFromFrame(int frameIndex)
{
    // a changed or lost instance resets the state, so check it afterwards
    const auto handle = currentHandle();
    if(!handle || state_->load() != DebugState::Break)
        return {};

    const auto frames = readFrames(*handle);
    if(frameIndex < 0 || static_cast<size_t>(frameIndex) >= frames.size())
    {
        LogWarningF("Frame index %d is out of range (call stack has %zu frames)", frameIndex, frames.size());
        return {};
    }
    return frameVariables(frames[static_cast<size_t>(frameIndex)]);
}

std::optional<CallStackFrame> DebugController::getStackFrame(int frameIndex)
{
    // a changed or lost instance resets the state, so check it afterwards
    const auto handle = currentHandle();
    if(!handle || state_->load() != DebugState::Break)
        return std::nullopt;

    const auto frames = readFrames(*handle);
    if(frameIndex < 0 || static_cast<size_t>(frameIndex) >= frames.size())
    {
        LogWarningF("Frame index %d is out of range (call stack has %zu frames)", frameIndex, frames.size());
        return std::nullopt;
    }
    return toFrame(frames[static_cast<size_t>(frameIndex)]);
}

Variable DebugController::modifyVariable(const std::string& name, const std::string& value)
{
    const InstanceHandle handle = requirePausedHandle("modify_variable");

    Variable modified = handle.invoke("modify_variable", options_.callTimeout, [name, value](IAutomationRoot& root) {
        IDebugger& debugger = root.debugger();
        const auto frames = debugger.stackFrames();
        if(frames.empty())
            throw NotFoundError("No current stack frame is available");

        const VariableMatch match = findVariable(frames.front(), name);
        if(!match.expression)
            throw NotFoundError("Variable '" + name + "' not found in the current frame", nlohmann::json::object({{"name", name}}));

        const ForeignVariableScope scope = match.scope == VariableScope::Local ? ForeignVariableScope::Local : ForeignVariableScope::Argument;
        debugger.setVariableValue(0, scope, match.expression->name, value);

        Variable result = toVariable(*match.expression, match.scope);
        result.value = value;
        return result;
    });

    LogInfoF("Variable %s set to %s", modified.name.c_str(), value.c_str());
    return modified;
}

ObjectInfo DebugController::inspectObject(const std::string& name)
{
    const InstanceHandle handle = requirePausedHandle("inspect_object");

    return handle.invoke("inspect_object", options_.callTimeout, [name](IAutomationRoot& root) {
        const auto frames = root.debugger().stackFrames();
        if(frames.empty())
            throw NotFoundError("No current stack frame is available");

        const VariableMatch match = findVariable(frames.front(), name);
        if(!match.expression)
            throw NotFoundError("Object '" + name + "' not found in the current frame", nlohmann::json::object({{"name", name}}));

        const Variable variable = toVariable(*match.expression, match.scope);
        ObjectInfo info;
        info.name = variable.name;
        info.type = variable.type;
        info.value = variable.value;
        // the automation model exposes neither
        info.address = "Unknown";
        info.size = 0;

        for(const auto& member : match.expression->dataMembers)
        {
            ObjectProperty property;
            property.name = member.name;
            property.type = member.type.empty() ? std::string("unknown") : member.type;
            property.value = member.hasValue ? member.value : std::string("<null>");
            property.isReadOnly = false;
            info.properties.push_back(property);
        }
        return info;
    });
}

void DebugController::evaluateExpression(const std::string& expression)
{
    LogWarningF("Expression evaluation requested for '%s' but is not supported", expression.c_str());
    throw UnimplementedError("Expression evaluation is not supported by the IDE automation interface");
}

std::optional<InstanceHandle> DebugController::currentHandle()
{
    auto handle = instances_.activeInstance();
    if(!handle)
    {
        if(state_->load() != DebugState::Design || session_)
            resetSession("active IDE instance is gone");
        return std::nullopt;
    }

    if(session_ && (handle->processId != session_->processId || handle->generation != session_->generation))
        resetSession("active IDE instance changed");

    return handle;
}

InstanceHandle DebugController::requireHandle(const std::string& operation)
{
    auto handle = currentHandle();
    if(!handle)
        throw BridgeError(operation, "No IDE instance connected. Call vs_connect_instance first.", true);
    return *handle;
}

// Resolves before checking: a changed or lost instance resets the state first.
InstanceHandle DebugController::requirePausedHandle(const std::string& operation)
{
    const auto handle = currentHandle();
    requireBreak(operation);
    if(!handle)
        throw BridgeError(operation, "No IDE instance connected. Call vs_connect_instance first.", true);
    return *handle;
}

void DebugController::requireBreak(const std::string& operation) const
{
    const DebugState current = state_->load();
    if(current != DebugState::Break)
    {
        throw StateError("Operation '" + operation + "' requires the debugger to be paused (current mode: " + DebugStateName(current) + ")",
                         DebugStateName(current));
    }
}

void DebugController::resetSession(const char* reason)
{
    if(state_->load() != DebugState::Design || session_)
        LogInfoF("Debug session reset to Design: %s", reason);

    // notifications still in flight from the old instance are dropped
    sessionToken_->fetch_add(1);
    unsubscribe();
    state_->store(DebugState::Design);
    session_.reset();
}

void DebugController::subscribe(const InstanceHandle& handle)
{
    if(subscription_ && session_ && session_->generation == handle.generation && session_->processId == handle.processId)
        return;

    unsubscribe();

    SharedState state = state_;
    SharedToken current = sessionToken_;
    const uint64_t token = current->load();
    const int processId = handle.processId;
    subscription_ = handle.invoke("subscribe_debugger_events", options_.callTimeout, [state, current, token, processId](IAutomationRoot& root) {
        return root.debugger().subscribeModeChanges([state, current, token, processId](ForeignDebugMode mode) {
            if(current->load() != token)
            {
                LogDebugF("Ignoring debugger mode change from detached instance %d", processId);
                return;
            }
            const DebugState next = toDebugState(mode);
            state->store(next);
            LogDebugF("Instance %d reported debugger mode %s", processId, DebugStateName(next));
        });
    });
    session_ = handle;
}

void DebugController::unsubscribe()
{
    if(!subscription_)
        return;

    const uint64_t subscription = *subscription_;
    subscription_.reset();
    if(!session_ || !session_->reachable())
        return;

    try
    {
        session_->invoke("unsubscribe_debugger_events", options_.callTimeout, [subscription](IAutomationRoot& root) {
            root.debugger().unsubscribeModeChanges(subscription);
        });
    }
    catch(const ToolError& ex)
    {
        LogWarningF("Could not detach debugger mode notifications: %s", SanitizeMessage(ex.what()).c_str());
    }
}

ForeignDebugMode DebugController::readMode(const InstanceHandle& handle)
{
    return handle.invoke("get_debug_state", options_.callTimeout, [](IAutomationRoot& root) {
        return root.debugger().currentMode();
    });
}

DebugStateInfo DebugController::settle(const InstanceHandle& handle)
{
    const auto deadline = std::chrono::steady_clock::now() + options_.settleTimeout;

    while(true)
    {
        const ForeignDebugMode mode = readMode(handle);
        state_->store(toDebugState(mode));

        if(mode != ForeignDebugMode::Run || std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(options_.settlePoll);
    }

    if(state_->load() == DebugState::Design)
    {
        resetSession("debuggee exited");
        return DebugStateInfo{};
    }
    return describe(handle);
}

DebugStateInfo DebugController::describe(const InstanceHandle& handle)
{
    DebugStateInfo info;
    info.state = state_->load();

    if(info.state == DebugState::Break)
    {
        const auto frames = readFrames(handle);
        if(!frames.empty())
        {
            info.currentFile = frames.front().fileName;
            info.currentLine = frames.front().lineNumber;
        }
    }
    return info;
}

std::vector<ForeignStackFrame> DebugController::readFrames(const InstanceHandle& handle)
{
    return handle.invoke("get_call_stack", options_.callTimeout, [](IAutomationRoot& root) {
        return root.debugger().stackFrames();
    });
}
