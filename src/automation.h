#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Abstract view of an IDE's out-of-process automation model. Implementations
// may throw ForeignFault from any call; none of these objects is owned by the bridge.

enum class ForeignDebugMode
{
    Design,
    Run,
    Break
};

struct ForeignExpression
{
    std::string name;
    std::string value;
    std::string type;
    bool hasValue = true;
    std::vector<ForeignExpression> dataMembers;
};

struct ForeignStackFrame
{
    std::string functionName;
    std::string module;
    std::string fileName;
    int lineNumber = 0;
    std::vector<ForeignExpression> locals;
    std::vector<ForeignExpression> arguments;
};

struct ForeignBreakpoint
{
    std::string name;
    std::string file;
    int fileLine = 0;
    std::string condition;
    bool enabled = true;
};

struct ForeignProject
{
    std::string name;
    std::string uniqueName;
    std::string fullName;
    std::string kind;
    std::string targetFramework;
};

struct ForeignBuildDiagnostic
{
    std::string file;
    int line = 0;
    int column = 0;
    std::string code;
    std::string message;
    std::string project;
};

struct ForeignBuildInfo
{
    int failedProjects = 0;
    std::string output;
    std::vector<ForeignBuildDiagnostic> errors;
    std::vector<ForeignBuildDiagnostic> warnings;
};

enum class ForeignVariableScope
{
    Local,
    Argument
};

class IDebugger
{
public:
    using ModeListener = std::function<void(ForeignDebugMode)>;

    virtual ~IDebugger() = default;

    virtual ForeignDebugMode currentMode() = 0;
    virtual void go(bool waitForBreakOrEnd) = 0;
    virtual void stop(bool terminateDebuggee) = 0;
    virtual void stepInto() = 0;
    virtual void stepOver() = 0;
    virtual void stepOut() = 0;

    virtual std::vector<ForeignBreakpoint> breakpoints() = 0;
    virtual ForeignBreakpoint addBreakpoint(const std::string& file, int line) = 0;
    virtual bool removeBreakpoint(const std::string& name) = 0;

    // Frames of the current thread, top frame first.
    virtual std::vector<ForeignStackFrame> stackFrames() = 0;
    virtual void setVariableValue(size_t frameIndex, ForeignVariableScope scope, const std::string& name, const std::string& value) = 0;

    // Listeners may be invoked from any thread.
    virtual uint64_t subscribeModeChanges(ModeListener listener) = 0;
    virtual void unsubscribeModeChanges(uint64_t subscription) = 0;
};

class ISolution
{
public:
    virtual ~ISolution() = default;

    virtual bool isOpen() = 0;
    virtual std::string fullName() = 0;
    virtual void open(const std::string& path) = 0;
    virtual std::vector<ForeignProject> projects() = 0;
    virtual void setStartupProject(const std::string& uniqueName) = 0;
};

class IBuild
{
public:
    virtual ~IBuild() = default;

    virtual std::vector<std::string> configurations() = 0;
    virtual std::string activeConfiguration() = 0;
    virtual void activateConfiguration(const std::string& name) = 0;
    virtual ForeignBuildInfo build(bool waitForCompletion) = 0;
};

// One connected IDE instance.
class IAutomationRoot
{
public:
    virtual ~IAutomationRoot() = default;

    // Cheap liveness check. Returns false or throws when the instance is unreachable.
    virtual bool probe() = 0;
    virtual std::string version() = 0;

    virtual ISolution& solution() = 0;
    virtual IDebugger& debugger() = 0;
    virtual IBuild& build() = 0;
};

struct DiscoveredRoot
{
    int processId = 0;
    std::weak_ptr<IAutomationRoot> root;
};

// Enumerates connectable automation roots (the running object table on hosts that have one).
class IDiscoveryService
{
public:
    virtual ~IDiscoveryService() = default;

    virtual std::vector<DiscoveredRoot> enumerate() = 0;
    virtual std::weak_ptr<IAutomationRoot> acquire(int processId) = 0;
};

// Discovery for hosts without a native automation backend.
class UnavailableDiscovery : public IDiscoveryService
{
public:
    std::vector<DiscoveredRoot> enumerate() override { return {}; }
    std::weak_ptr<IAutomationRoot> acquire(int) override { return {}; }
};
