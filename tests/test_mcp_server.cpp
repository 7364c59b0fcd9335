#include <doctest/doctest.h>

#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "bridge_error.h"
#include "logging.h"
#include "mcp_server.h"
#include "test_support.h"

using json = nlohmann::json;

namespace
{
    std::string errorCode(const json& response)
    {
        if(!response.contains("error"))
            return std::string();
        return response["error"]["code"].get<std::string>();
    }

    json request(int id, const std::string& method, json params = json::object())
    {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
    }

    std::vector<json> splitResponses(const std::string& output)
    {
        std::vector<json> responses;
        std::istringstream stream(output);
        std::string line;
        while(std::getline(stream, line))
        {
            if(!line.empty())
                responses.push_back(json::parse(line));
        }
        return responses;
    }
}

TEST_SUITE_BEGIN("server");

TEST_CASE("Protocol handshake")
{
    BridgeFixture fixture;

    SUBCASE("initialize")
    {
        json response;
        CHECK(fixture.server.processRequest(request(1, "initialize", {{"clientInfo", {{"name", "tests"}}}}), response));
        CHECK(response["id"] == 1);
        CHECK(response["result"]["protocolVersion"] == "2024-11-05");
        CHECK(response["result"]["serverInfo"]["name"] == "ide-mcp-bridge");
        CHECK(response["result"]["capabilities"].contains("tools"));
    }

    SUBCASE("client protocol version is echoed")
    {
        json response;
        fixture.server.processRequest(request(2, "initialize", {{"protocolVersion", "2025-03-26"}}), response);
        CHECK(response["result"]["protocolVersion"] == "2025-03-26");
    }

    SUBCASE("notifications get no response")
    {
        CHECK(fixture.server.processLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").is_null());
        CHECK(fixture.server.processLine(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":4}})").is_null());
    }

    SUBCASE("ping")
    {
        const json response = fixture.server.processLine(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
        CHECK(response["id"] == "p");
        CHECK(response["result"] == json::object());
    }

    SUBCASE("blank lines are skipped")
    {
        CHECK(fixture.server.processLine("").is_null());
        CHECK(fixture.server.processLine("  \r").is_null());
    }
}

TEST_CASE("Tool catalogue")
{
    BridgeFixture fixture;

    json response;
    REQUIRE(fixture.server.processRequest(request(1, "tools/list"), response));
    const json& tools = response["result"]["tools"];
    REQUIRE(tools.is_array());
    CHECK(tools.size() == 21);

    bool sawConnect = false;
    bool sawBuild = false;
    for(const auto& tool : tools)
    {
        CHECK(tool["name"].get<std::string>().rfind("vs_", 0) == 0);
        CHECK(tool["inputSchema"]["type"] == "object");

        if(tool["name"] == "vs_connect_instance")
        {
            sawConnect = true;
            CHECK(tool["inputSchema"]["required"] == json::array({"processId"}));
            CHECK(tool["inputSchema"]["properties"]["processId"]["maximum"] == 65535);
        }
        if(tool["name"] == "vs_build_solution")
        {
            sawBuild = true;
            CHECK_FALSE(tool["inputSchema"].contains("required"));
            CHECK(tool["inputSchema"]["properties"]["configuration"]["enum"].size() == 4);
        }
    }
    CHECK(sawConnect);
    CHECK(sawBuild);
}

TEST_CASE("Malformed traffic is reported, not fatal")
{
    BridgeFixture fixture;

    SUBCASE("invalid JSON")
    {
        const json response = fixture.server.processLine("{\"jsonrpc\": \"2.0\", \"id\": 1, \"method\"");
        CHECK(errorCode(response) == "PARSE_ERROR");
        CHECK(response["id"].is_null());
    }

    SUBCASE("not an object")
    {
        CHECK(errorCode(fixture.server.processLine("[1, 2, 3]")) == "INVALID_REQUEST");
    }

    SUBCASE("missing method")
    {
        const json response = fixture.server.processLine(R"({"jsonrpc":"2.0","id":9})");
        CHECK(errorCode(response) == "INVALID_REQUEST");
        CHECK(response["id"] == 9);
    }

    SUBCASE("wrong protocol version")
    {
        CHECK(errorCode(fixture.server.processLine(R"({"jsonrpc":"1.0","id":1,"method":"ping"})")) == "INVALID_REQUEST");
    }

    SUBCASE("unknown method")
    {
        json response;
        CHECK_FALSE(fixture.server.processRequest(request(3, "resources/list"), response));
        CHECK(errorCode(response) == "METHOD_NOT_FOUND");
    }

    SUBCASE("unknown tool")
    {
        const json response = fixture.call("vs_format_disk");
        CHECK(errorCode(response) == "TOOL_NOT_FOUND");
        CHECK(response["error"]["data"]["tool"] == "vs_format_disk");
    }

    SUBCASE("tools/call without a name")
    {
        json response;
        fixture.server.processRequest(request(4, "tools/call", {{"arguments", json::object()}}), response);
        CHECK(errorCode(response) == "INVALID_REQUEST");
    }
}

TEST_CASE("Arguments are validated before any IDE call")
{
    BridgeFixture fixture;

    CHECK(errorCode(fixture.call("vs_connect_instance", {{"processId", 0}})) == "INVALID_PROCESS_ID");
    CHECK(errorCode(fixture.call("vs_connect_instance", {{"processId", 70000}})) == "INVALID_PROCESS_ID");
    CHECK(errorCode(fixture.call("vs_connect_instance")) == "INVALID_PROCESS_ID");
    CHECK(errorCode(fixture.call("vs_connect_instance", {{"processId", 31337}})) == "PROCESS_NOT_FOUND");
    CHECK(errorCode(fixture.call("vs_connect_instance", {{"processId", 4242}})) == "INVALID_PROCESS_TYPE");
    CHECK(errorCode(fixture.call("vs_open_solution", {{"solutionPath", "Sample.sln"}})) == "RELATIVE_PATH_NOT_ALLOWED");
    CHECK(errorCode(fixture.call("vs_open_solution", {{"solutionPath", "/work/../Sample.sln"}})) == "PATH_TRAVERSAL_DETECTED");
    CHECK(errorCode(fixture.call("vs_build_solution", {{"configuration", "Profile"}})) == "INVALID_CONFIGURATION");
    CHECK(errorCode(fixture.call("vs_set_breakpoint", {{"file", "Program.cs"}, {"line", 0}})) == "INVALID_PARAMETER");
    CHECK(errorCode(fixture.call("vs_get_stack_frame", {{"frameIndex", -1}})) == "INVALID_PARAMETER");

    const json response = fixture.call("vs_connect_instance", {{"processId", 4242}});
    CHECK(response["error"]["data"].get<std::string>().find("bash") != std::string::npos);

    CHECK(fixture.ide->totalCalls() == 0);
    CHECK(fixture.environment.acquireCalls() == 0);
}

TEST_CASE("Connect and build")
{
    BridgeFixture fixture;

    const json connected = fixture.call("vs_connect_instance", {{"processId", kIdeProcessId}});
    REQUIRE(connected.contains("result"));
    CHECK(connected["result"]["connected"] == true);
    CHECK(connected["result"]["instance"]["processId"] == kIdeProcessId);
    CHECK(connected["result"]["instance"]["isConnected"] == true);
    CHECK(connected["result"].contains("timestamp"));

    const json built = fixture.call("vs_build_solution", {{"configuration", "release"}});
    REQUIRE(built.contains("result"));
    CHECK(built["result"]["buildResult"]["configuration"] == "Release");
    CHECK(built["result"]["buildResult"]["success"] == true);
    CHECK(built["result"]["buildResult"]["errorCount"] == 0);

    const json defaulted = fixture.call("vs_build_solution");
    CHECK(defaulted["result"]["buildResult"]["configuration"] == "Debug");

    const json listed = fixture.call("vs_list_instances");
    CHECK(listed["result"]["count"] == 1);
    CHECK(listed["result"]["instances"][0]["solutionName"] == "Sample");

    const json projects = fixture.call("vs_get_projects");
    CHECK(projects["result"]["count"] == 2);
}

TEST_CASE("Discovery errors are reported as bridge errors")
{
    BridgeFixture fixture;
    fixture.environment.setDiscoveryError("enumeration crashed");

    const json response = fixture.call("vs_list_instances");
    CHECK(errorCode(response) == "BRIDGE_ERROR");
    CHECK(response["error"]["data"]["operation"] == "list_instances");
}

TEST_CASE("Opening a validated solution path")
{
    BridgeFixture fixture;
    fixture.connect();

    const std::string path = std::string(IDE_MCP_BRIDGE_TEST_DATA_DIR) + "/Sample.sln";
    const json response = fixture.call("vs_open_solution", {{"solutionPath", path}});
    REQUIRE(response.contains("result"));
    CHECK(response["result"]["opened"] == true);
    CHECK(response["result"]["solution"]["name"] == "Sample");
    CHECK(response["result"]["solution"]["isOpen"] == true);
}

TEST_CASE("Breakpoints outside a debug session")
{
    BridgeFixture fixture;
    fixture.connect();

    const json added = fixture.call("vs_set_breakpoint", {{"file", "Program.cs"}, {"line", 10}, {"condition", "count > 1"}});
    REQUIRE(added.contains("result"));
    CHECK(added["result"]["id"] == "bp_Breakpoint1");
    CHECK(added["result"]["line"] == 10);
    CHECK(added["result"]["enabled"] == true);
    CHECK(added["result"]["condition"] == "count > 1");

    const json listed = fixture.call("vs_get_breakpoints");
    REQUIRE(listed["result"].is_array());
    REQUIRE(listed["result"].size() == 1);
    CHECK(listed["result"][0]["file"] == "Program.cs");

    CHECK(fixture.call("vs_get_local_variables")["result"] == json::array());
    CHECK(fixture.call("vs_get_call_stack")["result"] == json::array());
    CHECK(fixture.call("vs_get_stack_frame")["result"].is_null());
    CHECK(errorCode(fixture.call("vs_step_over")) == "INVALID_STATE");

    const json removed = fixture.call("vs_remove_breakpoint", {{"id", "bp_Breakpoint1"}});
    CHECK(removed["result"]["removed"] == true);
    CHECK(errorCode(fixture.call("vs_remove_breakpoint", {{"id", "bp_Breakpoint1"}})) == "NOT_FOUND");
}

TEST_CASE("A paused debug session over the wire")
{
    BridgeFixture fixture;
    fixture.ide->setBreakOnGo(true);
    fixture.connect();

    const json started = fixture.call("vs_start_debugging", {{"projectName", "Sample.App"}});
    REQUIRE(started.contains("result"));
    CHECK(started["result"]["mode"] == "Break");
    CHECK(started["result"]["isDebugging"] == true);
    CHECK(started["result"]["isPaused"] == true);
    CHECK(started["result"]["currentFile"] == "Program.cs");
    CHECK(started["result"]["currentLine"] == 12);

    CHECK(fixture.call("vs_get_debug_state")["result"]["mode"] == "Break");
    CHECK(fixture.call("vs_get_call_stack")["result"].size() == 2);
    CHECK(fixture.call("vs_get_variables_from_frame", {{"frameIndex", 0}})["result"].size() == 4);
    CHECK(fixture.call("vs_get_stack_frame", {{"frameIndex", 1}})["result"]["line"] == 1);
    CHECK(fixture.call("vs_get_stack_frame", {{"frameIndex", 5}})["result"].is_null());

    const json modified = fixture.call("vs_modify_variable", {{"name", "count"}, {"value", "10"}});
    CHECK(modified["result"]["modified"] == true);
    CHECK(modified["result"]["value"] == "10");
    CHECK(modified["result"]["scope"] == "Local");

    const json inspected = fixture.call("vs_inspect_object", {{"name", "order"}});
    CHECK(inspected["result"]["properties"].size() == 2);
    CHECK(inspected["result"]["address"] == "Unknown");

    CHECK(fixture.call("vs_step_over")["result"]["currentLine"] == 13);

    const json evaluated = fixture.call("vs_evaluate_expression", {{"expression", "count * 2"}});
    CHECK(errorCode(evaluated) == "UNIMPLEMENTED");

    const json stopped = fixture.call("vs_stop_debugging");
    CHECK(stopped["result"]["mode"] == "Design");
    CHECK(stopped["result"]["isDebugging"] == false);
    CHECK_FALSE(stopped["result"].contains("currentLine"));
}

TEST_CASE("Bridge failures carry their retry hint")
{
    BridgeFixture fixture;

    const json disconnected = fixture.call("vs_get_projects");
    CHECK(errorCode(disconnected) == "BRIDGE_ERROR");
    CHECK(disconnected["error"]["data"]["retryable"] == true);

    fixture.connect();
    fixture.ide->injectFault("solution.projects", ForeignStatus::ClassNotRegistered);
    const json failed = fixture.call("vs_get_projects");
    CHECK(errorCode(failed) == "BRIDGE_ERROR");
    CHECK(failed["error"]["data"]["retryable"] == false);
    CHECK(failed["error"]["data"]["operation"] == "get_projects");

    fixture.ide->clearFaults();
    fixture.ide->injectRuntimeError("solution.projects", "automation server\nwent away");
    const json odd = fixture.call("vs_get_projects");
    CHECK(errorCode(odd) == "BRIDGE_ERROR");
    CHECK(odd["error"]["message"].get<std::string>().find('\n') == std::string::npos);
}

TEST_CASE("Fatal faults escape the request boundary")
{
    BridgeFixture fixture;
    fixture.connect();
    fixture.ide->injectFatal("debugger.breakpoints");

    CHECK_THROWS_AS(fixture.call("vs_get_breakpoints"), FatalError);
}

TEST_CASE("Log level can be changed by the client")
{
    BridgeFixture fixture;
    const LogLevel previous = GetLogLevel();

    json response;
    CHECK(fixture.server.processRequest(request(1, "logging/setLevel", {{"level", "warning"}}), response));
    CHECK(GetLogLevel() == LogLevel::Warning);

    CHECK_FALSE(fixture.server.processRequest(request(2, "logging/setLevel", {{"level", "chatty"}}), response));
    CHECK(errorCode(response) == "INVALID_PARAMETER");
    CHECK(GetLogLevel() == LogLevel::Warning);

    SetLogLevel(previous);
}

TEST_CASE("Serving a stream of requests")
{
    BridgeFixture fixture;

    int fds[2] = {-1, -1};
    REQUIRE(::pipe(fds) == 0);

    const std::string input =
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\r\n"
        "not json at all\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"vs_get_debug_state\"}}";
    REQUIRE(::write(fds[1], input.data(), input.size()) == static_cast<ssize_t>(input.size()));
    ::close(fds[1]);

    std::ostringstream output;
    fixture.server.run(fds[0], output);
    ::close(fds[0]);

    CHECK_FALSE(fixture.server.isRunning());

    const auto responses = splitResponses(output.str());
    REQUIRE(responses.size() == 3);
    CHECK(responses[0]["id"] == 1);
    CHECK(errorCode(responses[1]) == "PARSE_ERROR");
    CHECK(responses[2]["id"] == 2);
    CHECK(responses[2]["result"]["mode"] == "Design");
}

TEST_CASE("Stopping from another thread ends an idle loop")
{
    BridgeFixture fixture;

    int fds[2] = {-1, -1};
    REQUIRE(::pipe(fds) == 0);

    // what the shutdown signal handler does
    std::thread stopper([&fixture]() {
        while(!fixture.server.isRunning())
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        fixture.server.stop();
    });

    std::ostringstream output;
    const auto started = std::chrono::steady_clock::now();
    fixture.server.run(fds[0], output);
    stopper.join();

    CHECK_FALSE(fixture.server.isRunning());
    CHECK(output.str().empty());
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_SUITE_END();
