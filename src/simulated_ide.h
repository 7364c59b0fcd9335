#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "automation.h"
#include "nlohmann/json.hpp"
#include "process_query.h"

struct SimulatedIdeSetup
{
    std::string version = "17.0.0";
    std::string solutionPath;
    bool solutionOpen = false;
    std::vector<ForeignProject> projects;
    std::vector<std::string> configurations{"Debug", "Release"};
    std::string activeConfiguration = "Debug";
    ForeignBuildInfo buildInfo;
    std::vector<ForeignStackFrame> frames;
    // go() lands in Break right away, as if a breakpoint had been hit
    bool breakOnGo = false;
};

// In-process automation root. Stands in for a real IDE on hosts without a
// native automation backend and in the test suite. Every interface call is
// counted; faults and delays can be injected per operation.
class SimulatedIde : public IAutomationRoot
{
public:
    explicit SimulatedIde(SimulatedIdeSetup setup = SimulatedIdeSetup());
    ~SimulatedIde() override;

    bool probe() override;
    std::string version() override;
    ISolution& solution() override;
    IDebugger& debugger() override;
    IBuild& build() override;

    // Test and fixture controls; none of these count as foreign calls.
    size_t totalCalls() const;
    size_t callCount(const std::string& operation) const;
    void setProbeResult(bool reachable);
    void injectFault(const std::string& operation, uint32_t status, bool once = false);
    void injectFatal(const std::string& operation);
    void injectRuntimeError(const std::string& operation, const std::string& message);
    void clearFaults();
    void setDelay(const std::string& operation, std::chrono::milliseconds delay);
    void setBreakOnGo(bool enabled);
    void enterBreak();
    void finishExecution();
    ForeignDebugMode mode() const;
    std::string startupProject() const;
    size_t listenerCount() const;

private:
    class Solution;
    class Debugger;
    class Build;

    struct Fault
    {
        enum class Kind
        {
            Foreign,
            Fatal,
            Runtime
        };

        Kind kind = Kind::Foreign;
        uint32_t status = 0;
        std::string message;
        bool once = false;
    };

    void enter(const std::string& operation);
    void changeMode(ForeignDebugMode mode);

    mutable std::mutex mutex_;
    SimulatedIdeSetup setup_;
    ForeignDebugMode mode_ = ForeignDebugMode::Design;
    std::vector<ForeignStackFrame> liveFrames_;
    std::vector<ForeignBreakpoint> breakpoints_;
    size_t nextBreakpoint_ = 1;
    std::string startupProject_;
    bool probeResult_ = true;
    std::map<uint64_t, IDebugger::ModeListener> listeners_;
    uint64_t nextListener_ = 1;

    size_t totalCalls_ = 0;
    std::map<std::string, size_t> calls_;
    std::map<std::string, Fault> faults_;
    std::map<std::string, std::chrono::milliseconds> delays_;

    std::unique_ptr<Solution> solution_;
    std::unique_ptr<Debugger> debugger_;
    std::unique_ptr<Build> build_;
};

// Process table plus discovery for simulated instances.
class SimulatedEnvironment : public IDiscoveryService, public IProcessQuery
{
public:
    SimulatedEnvironment() = default;

    // Throws std::runtime_error when the fixture cannot be read or parsed.
    static std::unique_ptr<SimulatedEnvironment> loadFixture(const std::string& path);
    static std::unique_ptr<SimulatedEnvironment> fromJson(const nlohmann::json& fixture);

    void addProcess(int processId, const std::string& name);
    std::shared_ptr<SimulatedIde> addInstance(int processId, const std::string& name, SimulatedIdeSetup setup = SimulatedIdeSetup());
    std::shared_ptr<SimulatedIde> instance(int processId) const;

    // The process exits and its automation root is released.
    void terminate(int processId);
    // Discovery stops returning the root; the process keeps running.
    void setAcquirable(int processId, bool acquirable);
    size_t acquireCalls() const;
    // enumerate() throws std::runtime_error with this message; empty clears it.
    void setDiscoveryError(const std::string& message);

    std::vector<DiscoveredRoot> enumerate() override;
    std::weak_ptr<IAutomationRoot> acquire(int processId) override;

    bool isAlive(int processId) override;
    std::optional<std::string> processName(int processId) override;
    std::optional<std::chrono::system_clock::time_point> startTime(int processId) override;

private:
    struct Process
    {
        std::string name;
        std::chrono::system_clock::time_point startedAt;
        bool alive = true;
        bool acquirable = true;
        std::shared_ptr<SimulatedIde> ide;
    };

    mutable std::mutex mutex_;
    std::map<int, Process> processes_;
    size_t acquireCalls_ = 0;
    std::string discoveryError_;
};
