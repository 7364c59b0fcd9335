#include <doctest/doctest.h>

#include <algorithm>
#include <string>

#include "bridge_error.h"
#include "debug_controller.h"
#include "test_support.h"

namespace
{
    const Variable* findVariable(const std::vector<Variable>& variables, const std::string& name)
    {
        auto it = std::find_if(variables.begin(), variables.end(), [&](const Variable& v) { return v.name == name; });
        return it == variables.end() ? nullptr : &*it;
    }
}

TEST_SUITE_BEGIN("debugger");

TEST_CASE("Paused-only operations fail in design mode without touching the IDE")
{
    BridgeFixture fixture;
    fixture.connect();
    const size_t calls = fixture.ide->totalCalls();

    SUBCASE("stepping and mutation are rejected")
    {
        try
        {
            fixture.controller.stepInto();
            FAIL("expected a state error");
        }
        catch(const StateError& ex)
        {
            CHECK(ex.code() == "INVALID_STATE");
            CHECK(ex.data()["state"] == "Design");
        }
        CHECK_THROWS_AS(fixture.controller.stepOver(), StateError);
        CHECK_THROWS_AS(fixture.controller.stepOut(), StateError);
        CHECK_THROWS_AS(fixture.controller.modifyVariable("count", "4"), StateError);
        CHECK_THROWS_AS(fixture.controller.inspectObject("order"), StateError);
    }

    SUBCASE("inspection returns nothing")
    {
        CHECK(fixture.controller.getLocalVariables().empty());
        CHECK(fixture.controller.getCallStack().empty());
        CHECK(fixture.controller.getVariablesFromFrame(0).empty());
        CHECK_FALSE(fixture.controller.getStackFrame(0).has_value());
    }

    CHECK(fixture.ide->totalCalls() == calls);
}

TEST_CASE("Paused-only operations fail while running without touching the IDE")
{
    BridgeFixture fixture;
    fixture.connect();
    REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Running);
    const size_t calls = fixture.ide->totalCalls();

    SUBCASE("stepping and mutation are rejected")
    {
        try
        {
            fixture.controller.stepOver();
            FAIL("expected a state error");
        }
        catch(const StateError& ex)
        {
            CHECK(ex.code() == "INVALID_STATE");
            CHECK(ex.data()["state"] == "Running");
        }
        CHECK_THROWS_AS(fixture.controller.stepInto(), StateError);
        CHECK_THROWS_AS(fixture.controller.stepOut(), StateError);
        CHECK_THROWS_AS(fixture.controller.modifyVariable("count", "4"), StateError);
        CHECK_THROWS_AS(fixture.controller.inspectObject("order"), StateError);
    }

    SUBCASE("inspection returns nothing")
    {
        CHECK(fixture.controller.getLocalVariables().empty());
        CHECK(fixture.controller.getCallStack().empty());
        CHECK(fixture.controller.getVariablesFromFrame(0).empty());
        CHECK_FALSE(fixture.controller.getStackFrame(0).has_value());
    }

    CHECK(fixture.ide->totalCalls() == calls);
    CHECK(fixture.controller.state() == DebugState::Running);
}

TEST_CASE("Without a connected instance")
{
    BridgeFixture fixture;

    try
    {
        fixture.controller.start(std::nullopt);
        FAIL("expected a bridge error");
    }
    catch(const BridgeError& ex)
    {
        CHECK(ex.retryable());
        CHECK(std::string(ex.what()).find("vs_connect_instance") != std::string::npos);
    }

    CHECK(fixture.controller.stop().state == DebugState::Design);
    CHECK(fixture.controller.getDebugState().state == DebugState::Design);
    CHECK(fixture.controller.listBreakpoints().empty());
    CHECK_THROWS_AS(fixture.controller.addBreakpoint("Program.cs", 10), BridgeError);
    CHECK(fixture.ide->totalCalls() == 0);
}

TEST_CASE("Breakpoints round-trip through the IDE")
{
    BridgeFixture fixture;
    fixture.connect();

    const Breakpoint added = fixture.controller.addBreakpoint("Program.cs", 10);
    CHECK(added.id == "bp_Breakpoint1");
    CHECK(added.file == "Program.cs");
    CHECK(added.line == 10);
    CHECK(added.enabled);

    const auto listed = fixture.controller.listBreakpoints();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].id == added.id);
    CHECK(listed[0].file == "Program.cs");
    CHECK(listed[0].line == 10);
    CHECK(listed[0].enabled);

    SUBCASE("conditions are echoed but not applied")
    {
        const Breakpoint conditional = fixture.controller.addBreakpoint("Program.cs", 20, "count > 2");
        CHECK(conditional.condition == "count > 2");
        CHECK(fixture.controller.listBreakpoints().back().condition.empty());
    }

    SUBCASE("removal")
    {
        fixture.controller.removeBreakpoint(added.id);
        CHECK(fixture.controller.listBreakpoints().empty());
        CHECK_THROWS_AS(fixture.controller.removeBreakpoint(added.id), NotFoundError);
        CHECK_THROWS_AS(fixture.controller.removeBreakpoint("Breakpoint1"), NotFoundError);
        CHECK_THROWS_AS(fixture.controller.removeBreakpoint("bp_"), NotFoundError);
    }

    SUBCASE("invalid locations")
    {
        CHECK_THROWS_AS(fixture.controller.addBreakpoint("  ", 10), ValidationError);
        CHECK_THROWS_AS(fixture.controller.addBreakpoint("Program.cs", 0), ValidationError);
    }
}

TEST_CASE("Start and stop a session")
{
    BridgeFixture fixture;
    fixture.connect();

    const DebugStateInfo started = fixture.controller.start(std::nullopt);
    CHECK(started.state == DebugState::Running);
    CHECK_FALSE(started.currentLine.has_value());
    CHECK(fixture.ide->mode() == ForeignDebugMode::Run);
    CHECK(fixture.ide->listenerCount() == 1);

    SUBCASE("starting again leaves the session alone")
    {
        CHECK(fixture.controller.start(std::nullopt).state == DebugState::Running);
        CHECK(fixture.ide->callCount("debugger.go") == 1);
        CHECK(fixture.ide->listenerCount() == 1);
    }

    SUBCASE("stop is idempotent")
    {
        CHECK(fixture.controller.stop().state == DebugState::Design);
        CHECK(fixture.controller.state() == DebugState::Design);
        CHECK(fixture.ide->mode() == ForeignDebugMode::Design);
        CHECK(fixture.ide->listenerCount() == 0);

        const size_t calls = fixture.ide->totalCalls();
        CHECK(fixture.controller.stop().state == DebugState::Design);
        CHECK(fixture.ide->totalCalls() == calls);
        CHECK(fixture.ide->callCount("debugger.stop") == 1);
    }
}

TEST_CASE("Pauses reported by the IDE move the session to break mode")
{
    BridgeFixture fixture;
    fixture.connect();

    REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Running);

    fixture.ide->enterBreak();
    CHECK(fixture.controller.state() == DebugState::Break);
    CHECK(fixture.controller.getLocalVariables().size() == 4);

    fixture.ide->finishExecution();
    CHECK(fixture.controller.state() == DebugState::Design);
    CHECK(fixture.controller.getLocalVariables().empty());
}

TEST_CASE("Sessions started from the IDE are picked up by the state query")
{
    BridgeFixture fixture;
    fixture.connect();

    fixture.ide->enterBreak();
    CHECK(fixture.controller.state() == DebugState::Design);

    const DebugStateInfo info = fixture.controller.getDebugState();
    CHECK(info.state == DebugState::Break);
    REQUIRE(info.currentFile.has_value());
    CHECK(*info.currentFile == "Program.cs");
    CHECK(info.currentLine == 12);
    CHECK(fixture.ide->listenerCount() == 1);
}

TEST_CASE("Inspecting a paused debuggee")
{
    BridgeFixture fixture;
    fixture.ide->setBreakOnGo(true);
    fixture.connect();

    const DebugStateInfo started = fixture.controller.start(std::nullopt);
    REQUIRE(started.state == DebugState::Break);
    CHECK(started.currentFile == std::string("Program.cs"));
    CHECK(started.currentLine == 12);

    SUBCASE("locals and parameters of the current frame")
    {
        const auto variables = fixture.controller.getLocalVariables();
        REQUIRE(variables.size() == 4);

        const Variable* count = findVariable(variables, "count");
        REQUIRE(count);
        CHECK(count->value == "3");
        CHECK(count->type == "int");
        CHECK(count->scope == VariableScope::Local);

        const Variable* message = findVariable(variables, "message");
        REQUIRE(message);
        CHECK(message->value == "<null>");
        CHECK(message->type == "string");

        const Variable* args = findVariable(variables, "args");
        REQUIRE(args);
        CHECK(args->scope == VariableScope::Parameter);
        CHECK(args->type == "string[]");
    }

    SUBCASE("call stack and frames")
    {
        const auto frames = fixture.controller.getCallStack();
        REQUIRE(frames.size() == 2);
        CHECK(frames[0].method == "Sample.App.Program.Main");
        CHECK(frames[0].module == "Sample.App.dll");
        CHECK(frames[0].line == 12);

        CHECK(fixture.controller.getVariablesFromFrame(1).empty());
        CHECK(fixture.controller.getVariablesFromFrame(5).empty());

        const auto caller = fixture.controller.getStackFrame(1);
        REQUIRE(caller.has_value());
        CHECK(caller->line == 1);
        CHECK_FALSE(fixture.controller.getStackFrame(9).has_value());
        CHECK_FALSE(fixture.controller.getStackFrame(-1).has_value());
    }

    SUBCASE("modify a variable by case-insensitive name")
    {
        const Variable modified = fixture.controller.modifyVariable("COUNT", "5");
        CHECK(modified.name == "count");
        CHECK(modified.value == "5");
        CHECK(modified.scope == VariableScope::Local);

        const auto after = fixture.controller.getLocalVariables();
        const Variable* count = findVariable(after, "count");
        REQUIRE(count);
        CHECK(count->value == "5");

        CHECK(fixture.controller.modifyVariable("args", "null").scope == VariableScope::Parameter);
        CHECK_THROWS_AS(fixture.controller.modifyVariable("missing", "1"), NotFoundError);
    }

    SUBCASE("inspect an object and its members")
    {
        const ObjectInfo order = fixture.controller.inspectObject("order");
        CHECK(order.type == "Sample.App.Order");
        CHECK(order.address == "Unknown");
        CHECK(order.size == 0);
        REQUIRE(order.properties.size() == 2);
        CHECK(order.properties[0].name == "Id");
        CHECK(order.properties[0].value == "42");
        CHECK(order.properties[0].type == "int");
        CHECK_FALSE(order.properties[0].isReadOnly);

        CHECK(fixture.controller.inspectObject("count").properties.empty());
        CHECK_THROWS_AS(fixture.controller.inspectObject("nope"), NotFoundError);
    }
}

TEST_CASE("Stepping moves through the simulated program")
{
    BridgeFixture fixture;
    fixture.ide->setBreakOnGo(true);
    fixture.connect();
    REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Break);

    DebugStateInfo info = fixture.controller.stepOver();
    CHECK(info.state == DebugState::Break);
    CHECK(info.currentLine == 13);

    info = fixture.controller.stepInto();
    CHECK(info.currentLine == 14);

    info = fixture.controller.stepOut();
    CHECK(info.state == DebugState::Break);
    CHECK(info.currentLine == 1);

    info = fixture.controller.stepOut();
    CHECK(info.state == DebugState::Design);
    CHECK(fixture.controller.state() == DebugState::Design);
    CHECK(fixture.ide->listenerCount() == 0);
}

TEST_CASE("Startup project selection")
{
    BridgeFixture fixture;
    fixture.connect();

    SUBCASE("known project, any casing")
    {
        CHECK(fixture.controller.start(std::string("sample.tests")).state == DebugState::Running);
        CHECK(fixture.ide->startupProject() == "Sample.Tests/Sample.Tests.csproj");
    }

    SUBCASE("unknown project")
    {
        try
        {
            fixture.controller.start(std::string("Nope"));
            FAIL("expected not found");
        }
        catch(const NotFoundError& ex)
        {
            CHECK(ex.data()["project"] == "Nope");
            CHECK(ex.data()["availableProjects"].size() == 2);
        }
        CHECK(fixture.ide->callCount("debugger.go") == 0);
        CHECK(fixture.controller.state() == DebugState::Design);
    }

    SUBCASE("blank project name starts the current startup project")
    {
        CHECK(fixture.controller.start(std::string("  ")).state == DebugState::Running);
        CHECK(fixture.ide->callCount("solution.projects") == 0);
    }
}

TEST_CASE("Losing the active instance resets the session")
{
    BridgeFixture fixture;
    fixture.ide->setBreakOnGo(true);
    fixture.connect();
    REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Break);

    SUBCASE("process exits")
    {
        fixture.environment.terminate(kIdeProcessId);
        fixture.registry.healthSweep();

        CHECK(fixture.controller.getDebugState().state == DebugState::Design);
        CHECK(fixture.controller.state() == DebugState::Design);
        CHECK(fixture.controller.getLocalVariables().empty());
        CHECK_THROWS_AS(fixture.controller.stepOver(), StateError);
    }

    SUBCASE("instance re-registered under a new generation")
    {
        fixture.registry.registerInstance(kIdeProcessId, fixture.ide);

        CHECK(fixture.controller.getCallStack().empty());
        CHECK(fixture.controller.state() == DebugState::Design);
    }
}

TEST_CASE("Switching the active instance leaves the old session behind")
{
    constexpr int kOtherProcessId = 16800;

    BridgeFixture fixture;
    const auto other = fixture.environment.addInstance(kOtherProcessId, "devenv", sampleSetup());
    fixture.connect();

    SUBCASE("a paused session does not carry over")
    {
        fixture.ide->setBreakOnGo(true);
        REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Break);

        fixture.service.connectInstance(kOtherProcessId);
        const size_t calls = other->totalCalls();

        CHECK_THROWS_AS(fixture.controller.stepOver(), StateError);
        CHECK_THROWS_AS(fixture.controller.modifyVariable("count", "4"), StateError);
        CHECK_THROWS_AS(fixture.controller.inspectObject("order"), StateError);
        CHECK(fixture.controller.state() == DebugState::Design);
        CHECK(other->totalCalls() == calls);
        CHECK(fixture.ide->listenerCount() == 0);
    }

    SUBCASE("pauses on the previous instance are ignored")
    {
        REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Running);

        fixture.service.connectInstance(kOtherProcessId);
        CHECK(fixture.controller.getDebugState().state == DebugState::Design);
        CHECK(fixture.ide->listenerCount() == 0);

        fixture.ide->enterBreak();
        CHECK(fixture.controller.state() == DebugState::Design);
        CHECK_THROWS_AS(fixture.controller.stepInto(), StateError);
        CHECK(other->callCount("debugger.stepInto") == 0);
    }

    SUBCASE("a listener that could not be detached stays silent")
    {
        REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Running);
        fixture.ide->injectFault("debugger.unsubscribeModeChanges", ForeignStatus::CallRejected);

        fixture.service.connectInstance(kOtherProcessId);
        CHECK(fixture.controller.getDebugState().state == DebugState::Design);
        CHECK(fixture.ide->listenerCount() == 1);

        fixture.ide->enterBreak();
        CHECK(fixture.controller.state() == DebugState::Design);
    }

    SUBCASE("returning to the previous instance picks its session up again")
    {
        REQUIRE(fixture.controller.start(std::nullopt).state == DebugState::Running);

        fixture.service.connectInstance(kOtherProcessId);
        CHECK(fixture.controller.getDebugState().state == DebugState::Design);

        fixture.service.connectInstance(kIdeProcessId);
        CHECK(fixture.controller.getDebugState().state == DebugState::Running);
        CHECK(fixture.ide->listenerCount() == 1);
        CHECK(fixture.controller.stop().state == DebugState::Design);
        CHECK(fixture.ide->mode() == ForeignDebugMode::Design);
    }
}

TEST_CASE("Foreign faults surface as bridge errors")
{
    BridgeFixture fixture;
    fixture.connect();
    fixture.ide->injectFault("debugger.go", ForeignStatus::CallRejected);

    try
    {
        fixture.controller.start(std::nullopt);
        FAIL("expected a bridge error");
    }
    catch(const BridgeError& ex)
    {
        CHECK(ex.retryable());
        CHECK(ex.operation() == "start_debugging");
    }
    CHECK(fixture.controller.state() == DebugState::Design);
}

TEST_CASE("Expression evaluation is unimplemented")
{
    BridgeFixture fixture;
    fixture.connect();
    const size_t calls = fixture.ide->totalCalls();

    try
    {
        fixture.controller.evaluateExpression("count + 1");
    }
    catch(const UnimplementedError& ex)
    {
        CHECK(ex.code() == "UNIMPLEMENTED");
    }
    CHECK(fixture.ide->totalCalls() == calls);
}

TEST_SUITE_END();
