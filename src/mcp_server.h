#pragma once

#include <atomic>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "debug_controller.h"
#include "ide_service.h"
#include "input_validator.h"
#include "nlohmann/json.hpp"

class McpServer
{
public:
    McpServer(IdeService& ide, DebugController& debugger, InputValidator& validator);
    ~McpServer();

    // Serves newline-delimited requests from inputFd until EOF or stop().
    void run(int inputFd, std::ostream& output);
    // Safe to call from a signal handler.
    void stop();
    bool isRunning() const;

    // Returns the response for one raw line, or null when none is due.
    nlohmann::json processLine(const std::string& line);

    // response is null for notifications. Returns false when response carries an error.
    bool processRequest(const nlohmann::json& request, nlohmann::json& response);

private:
    using ToolHandler = std::function<nlohmann::json(const nlohmann::json&)>;

    struct ToolDefinition
    {
        std::string name;
        std::string description;
        std::vector<ParamSpec> params;
        ToolHandler handler;
    };

    void registerTools();
    void addTool(std::string name, std::string description, std::vector<ParamSpec> params, ToolHandler handler);
    const ToolDefinition* findTool(const std::string& name) const;

    void sendJson(std::ostream& output, const nlohmann::json& payload);

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleLoggingSetLevel(const nlohmann::json& params);
    nlohmann::json handleNotificationsInitialized(const nlohmann::json& params);
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& params);

    nlohmann::json handleListInstances(const nlohmann::json& args);
    nlohmann::json handleConnectInstance(const nlohmann::json& args);
    nlohmann::json handleOpenSolution(const nlohmann::json& args);
    nlohmann::json handleBuildSolution(const nlohmann::json& args);
    nlohmann::json handleGetProjects(const nlohmann::json& args);
    nlohmann::json handleStartDebugging(const nlohmann::json& args);
    nlohmann::json handleStopDebugging(const nlohmann::json& args);
    nlohmann::json handleGetDebugState(const nlohmann::json& args);
    nlohmann::json handleStepInto(const nlohmann::json& args);
    nlohmann::json handleStepOver(const nlohmann::json& args);
    nlohmann::json handleStepOut(const nlohmann::json& args);
    nlohmann::json handleSetBreakpoint(const nlohmann::json& args);
    nlohmann::json handleRemoveBreakpoint(const nlohmann::json& args);
    nlohmann::json handleGetBreakpoints(const nlohmann::json& args);
    nlohmann::json handleGetLocalVariables(const nlohmann::json& args);
    nlohmann::json handleGetCallStack(const nlohmann::json& args);
    nlohmann::json handleGetVariablesFromFrame(const nlohmann::json& args);
    nlohmann::json handleGetStackFrame(const nlohmann::json& args);
    nlohmann::json handleModifyVariable(const nlohmann::json& args);
    nlohmann::json handleInspectObject(const nlohmann::json& args);
    nlohmann::json handleEvaluateExpression(const nlohmann::json& args);

    static nlohmann::json makeError(const nlohmann::json& id, const std::string& code, const std::string& message, const nlohmann::json& data = nullptr);

private:
    IdeService& ide_;
    DebugController& debugger_;
    InputValidator& validator_;
    std::vector<ToolDefinition> tools_;
    std::atomic<bool> running_;
};
