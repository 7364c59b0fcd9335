#include "mcp_server.h"

#include <cerrno>
#include <climits>
#include <cstring>
#include <new>
#include <stdexcept>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include "bridge_error.h"
#include "bridge_types.h"
#include "logging.h"

using json = nlohmann::json;

namespace
{
    constexpr const char* kServerName = "ide-mcp-bridge";
    constexpr const char* kServerVersion = "0.1.0";
    constexpr const char* kDefaultProtocolVersion = "2024-11-05";
    constexpr int kPollTimeoutMs = 1000;
    constexpr long long kMaxFrameIndex = 10000;

    bool isNotificationMethod(const std::string& method)
    {
        return method.rfind("notifications/", 0) == 0;
    }

    json withTimestamp(json payload)
    {
        payload["timestamp"] = CurrentIsoTimestamp();
        return payload;
    }
}

McpServer::McpServer(IdeService& ide, DebugController& debugger, InputValidator& validator)
    : ide_(ide), debugger_(debugger), validator_(validator), running_(false)
{
    registerTools();
}

McpServer::~McpServer()
{
    stop();
}

void McpServer::run(int inputFd, std::ostream& output)
{
    running_ = true;
    LogInfoF("%s %s serving newline-delimited JSON-RPC on stdio (%zu tools)", kServerName, kServerVersion, tools_.size());

    std::string buffer;
    buffer.reserve(4096);

    char readBuffer[4096];
    while(running_)
    {
        pollfd descriptor{};
        descriptor.fd = inputFd;
        descriptor.events = POLLIN;

        const int ready = ::poll(&descriptor, 1, kPollTimeoutMs);
        if(ready < 0)
        {
            if(errno == EINTR)
                continue;
            LogErrorF("poll() failed: %s", std::strerror(errno));
            break;
        }

        if(ready == 0)
            continue;

        const ssize_t received = ::read(inputFd, readBuffer, sizeof(readBuffer));
        if(received == 0)
            break; // EOF
        if(received < 0)
        {
            if(errno == EINTR || errno == EAGAIN)
                continue;
            LogErrorF("read() failed: %s", std::strerror(errno));
            break;
        }

        buffer.append(readBuffer, static_cast<size_t>(received));
        size_t newlinePos = std::string::npos;
        while(running_ && (newlinePos = buffer.find('\n')) != std::string::npos)
        {
            std::string line = buffer.substr(0, newlinePos);
            buffer.erase(0, newlinePos + 1);

            const json response = processLine(line);
            if(!response.is_null())
                sendJson(output, response);
        }
    }

    if(running_ && !buffer.empty())
    {
        const json response = processLine(buffer);
        if(!response.is_null())
            sendJson(output, response);
    }

    running_ = false;
    LogInfo("Server stopped");
}

void McpServer::stop()
{
    running_.store(false);
}

bool McpServer::isRunning() const
{
    return running_.load();
}

json McpServer::processLine(const std::string& rawLine)
{
    std::string line = rawLine;
    if(!line.empty() && line.back() == '\r')
        line.pop_back();

    if(line.find_first_not_of(" \t") == std::string::npos)
        return json();

    json request;
    try
    {
        request = json::parse(line);
    }
    catch(const json::parse_error& ex)
    {
        LogWarningF("Received invalid JSON: %s", SanitizeMessage(ex.what()).c_str());
        return makeError(json(), "PARSE_ERROR", "Invalid JSON", SanitizeMessage(ex.what()));
    }

    json response;
    processRequest(request, response);
    return response;
}

void McpServer::sendJson(std::ostream& output, const json& payload)
{
    output << payload.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    output.flush();
}

json McpServer::makeError(const json& id, const std::string& code, const std::string& message, const json& data)
{
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", SanitizeMessage(message)},
            {"data", data}
        }}
    };
}

bool McpServer::processRequest(const json& request, json& response)
{
    if(!request.is_object())
    {
        LogWarning("Received request that is not a JSON object");
        response = makeError(json(), "INVALID_REQUEST", "Request must be a JSON object");
        return false;
    }

    json id = request.contains("id") ? request["id"] : json();

    if(request.contains("jsonrpc") && request["jsonrpc"] != "2.0")
    {
        LogWarning("Received request with invalid JSON-RPC envelope");
        response = makeError(id, "INVALID_REQUEST", "Invalid JSON-RPC envelope");
        return false;
    }

    if(!request.contains("method") || !request["method"].is_string())
    {
        LogWarning("Received request without method field");
        response = makeError(id, "INVALID_REQUEST", "Missing method");
        return false;
    }

    const std::string method = request["method"].get<std::string>();
    const json params = request.contains("params") && request["params"].is_object() ? request["params"] : json::object();
    const bool notification = isNotificationMethod(method);

    try
    {
        json result;
        if(method == "initialize")
        {
            LogInfo("Processing initialize request");
            result = handleInitialize(params);
        }
        else if(method == "notifications/initialized")
        {
            result = handleNotificationsInitialized(params);
        }
        else if(notification)
        {
            LogDebugF("Ignoring notification %s", method.c_str());
        }
        else if(method == "ping")
        {
            result = json::object();
        }
        else if(method == "logging/setLevel")
        {
            LogInfo("Processing logging/setLevel request");
            result = handleLoggingSetLevel(params);
        }
        else if(method == "tools/list")
        {
            LogInfo("Processing tools/list request");
            result = handleToolsList();
        }
        else if(method == "tools/call")
        {
            result = handleToolsCall(params);
        }
        else
        {
            LogWarningF("Unknown method requested: %s", method.c_str());
            throw ToolError("METHOD_NOT_FOUND", "Unknown method '" + method + "'", json::object({{"method", method}}));
        }

        if(notification)
        {
            LogDebugF("Notification %s processed, no response sent", method.c_str());
            response = json();
            return true;
        }

        response = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"result", result}
        };
        return true;
    }
    catch(const ToolError& ex)
    {
        LogWarningF("Request %s failed: [%s] %s", method.c_str(), ex.code().c_str(), SanitizeMessage(ex.what()).c_str());
        response = notification ? json() : json{{"jsonrpc", "2.0"}, {"id", id}, {"error", ex.toJson()}};
        return false;
    }
    catch(const std::bad_alloc&)
    {
        LogErrorF("Request %s ran out of memory; terminating", method.c_str());
        throw;
    }
    catch(const FatalError& ex)
    {
        LogErrorF("Request %s hit an unrecoverable fault: %s", method.c_str(), SanitizeMessage(ex.what()).c_str());
        throw;
    }
    catch(const std::exception& ex)
    {
        LogErrorF("Request %s failed: %s", method.c_str(), SanitizeMessage(ex.what()).c_str());
        response = notification ? json() : makeError(id, "INTERNAL_ERROR", "Internal error: " + std::string(ex.what()));
        return false;
    }
}

json McpServer::handleInitialize(const json& params)
{
    json client = params.contains("clientInfo") ? params.at("clientInfo") : json::object();
    std::string clientName = client.is_object() ? client.value("name", std::string("unknown")) : std::string("unknown");
    LogInfoF("Client '%s' requested initialize", clientName.c_str());

    std::string negotiatedProtocolVersion = kDefaultProtocolVersion;
    if(params.contains("protocolVersion") && params.at("protocolVersion").is_string() && !params.at("protocolVersion").get<std::string>().empty())
        negotiatedProtocolVersion = params.at("protocolVersion").get<std::string>();

    if(negotiatedProtocolVersion != kDefaultProtocolVersion)
        LogInfoF("Negotiated protocol version '%s' (default '%s')", negotiatedProtocolVersion.c_str(), kDefaultProtocolVersion);

    json capabilities = json::object({
        {"logging", json::object()},
        {"tools", json::object({
            {"listChanged", false}
        })}
    });

    return json::object({
        {"protocolVersion", negotiatedProtocolVersion},
        {"capabilities", capabilities},
        {"serverInfo", json::object({
            {"name", kServerName},
            {"version", kServerVersion}
        })}
    });
}

json McpServer::handleLoggingSetLevel(const json& params)
{
    if(!params.contains("level") || !params.at("level").is_string())
        throw ValidationError("INVALID_PARAMETER", "logging/setLevel requires a string 'level'");

    const std::string requested = params.at("level").get<std::string>();
    LogLevel level = LogLevel::Info;
    if(!ParseLogLevel(requested, level))
        throw ValidationError("INVALID_PARAMETER", "Unknown log level '" + requested + "'", "Expected debug, info, warning or error");

    SetLogLevel(level);
    LogInfoF("Log level set to %s", LogLevelName(level));
    return json::object();
}

json McpServer::handleNotificationsInitialized(const json&)
{
    LogInfo("Client finished initialization");
    return json::object();
}

json McpServer::handleToolsList()
{
    json tools = json::array();

    for(const auto& tool : tools_)
    {
        json properties = json::object();
        json required = json::array();
        for(const auto& param : tool.params)
        {
            properties[param.name] = param.schema();
            if(param.required)
                required.push_back(param.name);
        }

        json schema = json::object({
            {"type", "object"},
            {"properties", properties}
        });
        if(!required.empty())
            schema["required"] = required;

        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", schema}
        });
    }

    return json::object({{"tools", tools}});
}

json McpServer::handleToolsCall(const json& params)
{
    if(!params.contains("name") || !params.at("name").is_string())
        throw ToolError("INVALID_REQUEST", "tools/call requires a tool name");

    const std::string toolName = params.at("name").get<std::string>();
    const json arguments = params.contains("arguments") ? params.at("arguments") : json::object();

    const ToolDefinition* tool = findTool(toolName);
    if(!tool)
    {
        LogWarningF("Unknown tool requested: %s", toolName.c_str());
        throw ToolError("TOOL_NOT_FOUND", "Tool '" + toolName + "' not found", json::object({{"tool", toolName}}));
    }

    const ValidationResult validation = validator_.validateArguments(tool->params, arguments);
    if(!validation.valid)
    {
        LogWarningF("Tool %s rejected arguments: [%s] %s", toolName.c_str(), validation.code.c_str(), validation.message.c_str());
        throw ValidationError(validation.code, validation.message, validation.details);
    }

    LogInfoF("Processing tool %s", toolName.c_str());
    json payload = tool->handler(validation.value);
    LogInfoF("Tool %s completed successfully", toolName.c_str());
    return payload;
}

void McpServer::addTool(std::string name, std::string description, std::vector<ParamSpec> params, ToolHandler handler)
{
    tools_.push_back(ToolDefinition{std::move(name), std::move(description), std::move(params), std::move(handler)});
}

const McpServer::ToolDefinition* McpServer::findTool(const std::string& name) const
{
    for(const auto& tool : tools_)
    {
        if(tool.name == name)
            return &tool;
    }
    return nullptr;
}

void McpServer::registerTools()
{
    auto frameIndex = ParamSpec::integer("frameIndex", false, 0, kMaxFrameIndex, "Zero-based call stack frame index (0 is the current frame).");
    frameIndex.defaultValue = 0;

    addTool("vs_list_instances",
            "List running IDE instances that expose an automation interface.",
            {},
            [this](const json& args) { return handleListInstances(args); });

    addTool("vs_connect_instance",
            "Connect to an IDE instance by process id and make it the active instance.",
            {ParamSpec::processId("processId", "Process id of the IDE instance.")},
            [this](const json& args) { return handleConnectInstance(args); });

    addTool("vs_open_solution",
            "Open a solution file in the active IDE instance.",
            {ParamSpec::path("solutionPath", ".sln", "Absolute path to an existing .sln file.")},
            [this](const json& args) { return handleOpenSolution(args); });

    addTool("vs_build_solution",
            "Build the open solution and report errors and warnings.",
            {ParamSpec::configuration("configuration", "Build configuration (defaults to Debug).")},
            [this](const json& args) { return handleBuildSolution(args); });

    addTool("vs_get_projects",
            "List the projects of the open solution.",
            {},
            [this](const json& args) { return handleGetProjects(args); });

    addTool("vs_start_debugging",
            "Start debugging, optionally selecting the startup project first.",
            {ParamSpec::string("projectName", false, "Project to start (case-insensitive).")},
            [this](const json& args) { return handleStartDebugging(args); });

    addTool("vs_stop_debugging",
            "Stop the current debug session.",
            {},
            [this](const json& args) { return handleStopDebugging(args); });

    addTool("vs_get_debug_state",
            "Report whether the debugger is in design, running or break mode.",
            {},
            [this](const json& args) { return handleGetDebugState(args); });

    addTool("vs_step_into",
            "Step into the next call. Requires a paused debuggee.",
            {},
            [this](const json& args) { return handleStepInto(args); });

    addTool("vs_step_over",
            "Step over the current line. Requires a paused debuggee.",
            {},
            [this](const json& args) { return handleStepOver(args); });

    addTool("vs_step_out",
            "Step out of the current function. Requires a paused debuggee.",
            {},
            [this](const json& args) { return handleStepOut(args); });

    addTool("vs_set_breakpoint",
            "Set a breakpoint at a file and line. The condition is recorded but not applied.",
            {
                ParamSpec::string("file", true, "Source file path."),
                ParamSpec::integer("line", true, 1, INT_MAX, "One-based line number."),
                ParamSpec::string("condition", false, "Breakpoint condition (recorded only).")
            },
            [this](const json& args) { return handleSetBreakpoint(args); });

    addTool("vs_remove_breakpoint",
            "Remove a breakpoint by id.",
            {ParamSpec::string("id", true, "Breakpoint id as returned by vs_set_breakpoint.")},
            [this](const json& args) { return handleRemoveBreakpoint(args); });

    addTool("vs_get_breakpoints",
            "List all breakpoints.",
            {},
            [this](const json& args) { return handleGetBreakpoints(args); });

    addTool("vs_get_local_variables",
            "Locals and parameters of the current frame. Empty unless paused.",
            {},
            [this](const json& args) { return handleGetLocalVariables(args); });

    addTool("vs_get_call_stack",
            "Call stack of the current thread. Empty unless paused.",
            {},
            [this](const json& args) { return handleGetCallStack(args); });

    addTool("vs_get_variables_from_frame",
            "Locals and parameters of a specific frame. Empty unless paused.",
            {frameIndex},
            [this](const json& args) { return handleGetVariablesFromFrame(args); });

    addTool("vs_get_stack_frame",
            "Details of a specific frame, or null when unavailable.",
            {frameIndex},
            [this](const json& args) { return handleGetStackFrame(args); });

    addTool("vs_modify_variable",
            "Assign a new value to a local or parameter of the current frame. Requires a paused debuggee.",
            {
                ParamSpec::string("name", true, "Variable name (case-insensitive)."),
                ParamSpec::string("value", true, "New value as an expression string.")
            },
            [this](const json& args) { return handleModifyVariable(args); });

    addTool("vs_inspect_object",
            "Inspect a variable of the current frame and its members. Requires a paused debuggee.",
            {ParamSpec::string("name", true, "Variable name (case-insensitive).")},
            [this](const json& args) { return handleInspectObject(args); });

    addTool("vs_evaluate_expression",
            "Evaluate an expression in the current frame (not supported).",
            {ParamSpec::string("expression", true, "Expression to evaluate.")},
            [this](const json& args) { return handleEvaluateExpression(args); });
}

json McpServer::handleListInstances(const json&)
{
    const auto instances = ide_.listInstances();
    return withTimestamp(json::object({
        {"instances", instances},
        {"count", instances.size()}
    }));
}

json McpServer::handleConnectInstance(const json& args)
{
    const int processId = args.at("processId").get<int>();
    const IdeInstance instance = ide_.connectInstance(processId);
    return withTimestamp(json::object({
        {"instance", instance},
        {"connected", true}
    }));
}

json McpServer::handleOpenSolution(const json& args)
{
    const SolutionInfo solution = ide_.openSolution(args.at("solutionPath").get<std::string>());
    return withTimestamp(json::object({
        {"solution", solution},
        {"opened", true}
    }));
}

json McpServer::handleBuildSolution(const json& args)
{
    const BuildResult result = ide_.buildSolution(args.value("configuration", std::string("Debug")));
    return withTimestamp(json::object({{"buildResult", result}}));
}

json McpServer::handleGetProjects(const json&)
{
    const auto projects = ide_.getProjects();
    return withTimestamp(json::object({
        {"projects", projects},
        {"count", projects.size()}
    }));
}

json McpServer::handleStartDebugging(const json& args)
{
    std::optional<std::string> projectName;
    if(args.contains("projectName"))
        projectName = args.at("projectName").get<std::string>();
    return debugger_.start(projectName);
}

json McpServer::handleStopDebugging(const json&)
{
    return debugger_.stop();
}

json McpServer::handleGetDebugState(const json&)
{
    return debugger_.getDebugState();
}

json McpServer::handleStepInto(const json&)
{
    return debugger_.stepInto();
}

json McpServer::handleStepOver(const json&)
{
    return debugger_.stepOver();
}

json McpServer::handleStepOut(const json&)
{
    return debugger_.stepOut();
}

json McpServer::handleSetBreakpoint(const json& args)
{
    return debugger_.addBreakpoint(args.at("file").get<std::string>(),
                                   args.at("line").get<int>(),
                                   args.value("condition", std::string()));
}

json McpServer::handleRemoveBreakpoint(const json& args)
{
    const std::string id = args.at("id").get<std::string>();
    debugger_.removeBreakpoint(id);
    return json::object({
        {"id", id},
        {"removed", true}
    });
}

json McpServer::handleGetBreakpoints(const json&)
{
    return debugger_.listBreakpoints();
}

json McpServer::handleGetLocalVariables(const json&)
{
    return debugger_.getLocalVariables();
}

json McpServer::handleGetCallStack(const json&)
{
    return debugger_.getCallStack();
}

json McpServer::handleGetVariablesFromFrame(const json& args)
{
    return debugger_.getVariablesFromFrame(args.value("frameIndex", 0));
}

json McpServer::handleGetStackFrame(const json& args)
{
    const auto frame = debugger_.getStackFrame(args.value("frameIndex", 0));
    return frame ? json(*frame) : json();
}

json McpServer::handleModifyVariable(const json& args)
{
    const Variable variable = debugger_.modifyVariable(args.at("name").get<std::string>(), args.at("value").get<std::string>());
    json payload = variable;
    payload["modified"] = true;
    return payload;
}

json McpServer::handleInspectObject(const json& args)
{
    return debugger_.inspectObject(args.at("name").get<std::string>());
}

json McpServer::handleEvaluateExpression(const json& args)
{
    debugger_.evaluateExpression(args.at("expression").get<std::string>());
}
