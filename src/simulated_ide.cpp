#include "simulated_ide.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <thread>

#include "bridge_error.h"
#include "logging.h"

using json = nlohmann::json;

namespace
{
    bool equalsIgnoreCase(const std::string& left, const std::string& right)
    {
        return left.size() == right.size() &&
               std::equal(left.begin(), left.end(), right.begin(), [](unsigned char a, unsigned char b) {
                   return std::tolower(a) == std::tolower(b);
               });
    }

    ForeignExpression parseExpression(const json& j)
    {
        ForeignExpression expression;
        expression.name = j.value("name", std::string());
        expression.type = j.value("type", std::string());
        if(j.contains("value") && j.at("value").is_string())
            expression.value = j.at("value").get<std::string>();
        else if(j.contains("value") && !j.at("value").is_null())
            expression.value = j.at("value").dump();
        else
            expression.hasValue = false;

        if(j.contains("members") && j.at("members").is_array())
        {
            for(const auto& member : j.at("members"))
                expression.dataMembers.push_back(parseExpression(member));
        }
        return expression;
    }

    std::vector<ForeignExpression> parseExpressions(const json& j, const char* key)
    {
        std::vector<ForeignExpression> expressions;
        if(j.contains(key) && j.at(key).is_array())
        {
            for(const auto& entry : j.at(key))
                expressions.push_back(parseExpression(entry));
        }
        return expressions;
    }

    ForeignStackFrame parseFrame(const json& j)
    {
        ForeignStackFrame frame;
        frame.functionName = j.value("function", std::string());
        frame.module = j.value("module", std::string());
        frame.fileName = j.value("file", std::string());
        frame.lineNumber = j.value("line", 0);
        frame.locals = parseExpressions(j, "locals");
        frame.arguments = parseExpressions(j, "arguments");
        return frame;
    }

    ForeignProject parseProject(const json& j)
    {
        ForeignProject project;
        project.name = j.value("name", std::string());
        project.uniqueName = j.value("uniqueName", project.name);
        project.fullName = j.value("fullName", std::string());
        project.kind = j.value("kind", std::string());
        project.targetFramework = j.value("targetFramework", std::string());
        return project;
    }

    ForeignBuildDiagnostic parseDiagnostic(const json& j)
    {
        ForeignBuildDiagnostic diagnostic;
        diagnostic.file = j.value("file", std::string());
        diagnostic.line = j.value("line", 0);
        diagnostic.column = j.value("column", 0);
        diagnostic.code = j.value("code", std::string());
        diagnostic.message = j.value("message", std::string());
        diagnostic.project = j.value("project", std::string());
        return diagnostic;
    }

    SimulatedIdeSetup parseSetup(const json& j)
    {
        SimulatedIdeSetup setup;
        setup.version = j.value("version", setup.version);
        setup.breakOnGo = j.value("breakOnGo", false);

        if(j.contains("solution") && j.at("solution").is_object())
        {
            const json& solution = j.at("solution");
            setup.solutionPath = solution.value("path", std::string());
            setup.solutionOpen = solution.value("open", !setup.solutionPath.empty());
            if(solution.contains("projects") && solution.at("projects").is_array())
            {
                for(const auto& project : solution.at("projects"))
                    setup.projects.push_back(parseProject(project));
            }
        }

        if(j.contains("configurations") && j.at("configurations").is_array())
            setup.configurations = j.at("configurations").get<std::vector<std::string>>();
        setup.activeConfiguration = j.value("activeConfiguration",
                                            setup.configurations.empty() ? std::string() : setup.configurations.front());

        if(j.contains("build") && j.at("build").is_object())
        {
            const json& build = j.at("build");
            setup.buildInfo.output = build.value("output", std::string());
            if(build.contains("errors") && build.at("errors").is_array())
            {
                for(const auto& entry : build.at("errors"))
                    setup.buildInfo.errors.push_back(parseDiagnostic(entry));
            }
            if(build.contains("warnings") && build.at("warnings").is_array())
            {
                for(const auto& entry : build.at("warnings"))
                    setup.buildInfo.warnings.push_back(parseDiagnostic(entry));
            }
        }

        if(j.contains("stackFrames") && j.at("stackFrames").is_array())
        {
            for(const auto& frame : j.at("stackFrames"))
                setup.frames.push_back(parseFrame(frame));
        }

        return setup;
    }
}

class SimulatedIde::Solution : public ISolution
{
public:
    explicit Solution(SimulatedIde& owner) : owner_(owner) {}

    bool isOpen() override
    {
        owner_.enter("solution.isOpen");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        return owner_.setup_.solutionOpen;
    }

    std::string fullName() override
    {
        owner_.enter("solution.fullName");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        return owner_.setup_.solutionOpen ? owner_.setup_.solutionPath : std::string();
    }

    void open(const std::string& path) override
    {
        owner_.enter("solution.open");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        owner_.setup_.solutionPath = path;
        owner_.setup_.solutionOpen = true;
    }

    std::vector<ForeignProject> projects() override
    {
        owner_.enter("solution.projects");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        if(!owner_.setup_.solutionOpen)
            return {};
        return owner_.setup_.projects;
    }

    void setStartupProject(const std::string& uniqueName) override
    {
        owner_.enter("solution.setStartupProject");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        owner_.startupProject_ = uniqueName;
    }

private:
    SimulatedIde& owner_;
};

class SimulatedIde::Debugger : public IDebugger
{
public:
    explicit Debugger(SimulatedIde& owner) : owner_(owner) {}

    ForeignDebugMode currentMode() override
    {
        owner_.enter("debugger.currentMode");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        return owner_.mode_;
    }

    void go(bool) override
    {
        owner_.enter("debugger.go");
        bool breakNow = false;
        {
            std::lock_guard<std::mutex> guard(owner_.mutex_);
            if(owner_.mode_ == ForeignDebugMode::Design)
                owner_.liveFrames_ = owner_.setup_.frames;
            breakNow = owner_.setup_.breakOnGo && !owner_.liveFrames_.empty();
        }
        owner_.changeMode(breakNow ? ForeignDebugMode::Break : ForeignDebugMode::Run);
    }

    void stop(bool) override
    {
        owner_.enter("debugger.stop");
        {
            std::lock_guard<std::mutex> guard(owner_.mutex_);
            owner_.liveFrames_.clear();
        }
        owner_.changeMode(ForeignDebugMode::Design);
    }

    void stepInto() override
    {
        owner_.enter("debugger.stepInto");
        step(false);
    }

    void stepOver() override
    {
        owner_.enter("debugger.stepOver");
        step(false);
    }

    void stepOut() override
    {
        owner_.enter("debugger.stepOut");
        step(true);
    }

    std::vector<ForeignBreakpoint> breakpoints() override
    {
        owner_.enter("debugger.breakpoints");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        return owner_.breakpoints_;
    }

    ForeignBreakpoint addBreakpoint(const std::string& file, int line) override
    {
        owner_.enter("debugger.addBreakpoint");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        ForeignBreakpoint breakpoint;
        breakpoint.name = "Breakpoint" + std::to_string(owner_.nextBreakpoint_++);
        breakpoint.file = file;
        breakpoint.fileLine = line;
        breakpoint.enabled = true;
        owner_.breakpoints_.push_back(breakpoint);
        return breakpoint;
    }

    bool removeBreakpoint(const std::string& name) override
    {
        owner_.enter("debugger.removeBreakpoint");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        auto& breakpoints = owner_.breakpoints_;
        auto it = std::find_if(breakpoints.begin(), breakpoints.end(), [&](const ForeignBreakpoint& bp) { return bp.name == name; });
        if(it == breakpoints.end())
            return false;
        breakpoints.erase(it);
        return true;
    }

    std::vector<ForeignStackFrame> stackFrames() override
    {
        owner_.enter("debugger.stackFrames");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        if(owner_.mode_ != ForeignDebugMode::Break)
            return {};
        return owner_.liveFrames_;
    }

    void setVariableValue(size_t frameIndex, ForeignVariableScope scope, const std::string& name, const std::string& value) override
    {
        owner_.enter("debugger.setVariableValue");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        if(owner_.mode_ != ForeignDebugMode::Break || frameIndex >= owner_.liveFrames_.size())
            throw ForeignFault(ForeignStatus::GeneralFailure, "No stack frame available");

        auto& frame = owner_.liveFrames_[frameIndex];
        auto& expressions = scope == ForeignVariableScope::Local ? frame.locals : frame.arguments;
        for(auto& expression : expressions)
        {
            if(expression.name == name)
            {
                expression.value = value;
                expression.hasValue = true;
                return;
            }
        }
        throw ForeignFault(ForeignStatus::GeneralFailure, "Variable '" + name + "' does not exist in the frame");
    }

    uint64_t subscribeModeChanges(ModeListener listener) override
    {
        owner_.enter("debugger.subscribeModeChanges");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        const uint64_t id = owner_.nextListener_++;
        owner_.listeners_[id] = std::move(listener);
        return id;
    }

    void unsubscribeModeChanges(uint64_t subscription) override
    {
        owner_.enter("debugger.unsubscribeModeChanges");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        owner_.listeners_.erase(subscription);
    }

private:
    void step(bool leaveFrame)
    {
        ForeignDebugMode next = ForeignDebugMode::Break;
        {
            std::lock_guard<std::mutex> guard(owner_.mutex_);
            if(owner_.mode_ != ForeignDebugMode::Break)
                throw ForeignFault(ForeignStatus::GeneralFailure, "Stepping requires a paused debuggee");

            auto& frames = owner_.liveFrames_;
            if(leaveFrame)
            {
                if(frames.size() > 1)
                    frames.erase(frames.begin());
                else
                    frames.clear();
            }
            else if(!frames.empty())
            {
                frames.front().lineNumber += 1;
            }

            if(frames.empty())
                next = ForeignDebugMode::Design;
        }
        owner_.changeMode(next);
    }

    SimulatedIde& owner_;
};

class SimulatedIde::Build : public IBuild
{
public:
    explicit Build(SimulatedIde& owner) : owner_(owner) {}

    std::vector<std::string> configurations() override
    {
        owner_.enter("build.configurations");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        return owner_.setup_.configurations;
    }

    std::string activeConfiguration() override
    {
        owner_.enter("build.activeConfiguration");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        return owner_.setup_.activeConfiguration;
    }

    void activateConfiguration(const std::string& name) override
    {
        owner_.enter("build.activateConfiguration");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        const auto& configurations = owner_.setup_.configurations;
        auto it = std::find_if(configurations.begin(), configurations.end(), [&](const std::string& c) { return equalsIgnoreCase(c, name); });
        if(it == configurations.end())
            throw ForeignFault(ForeignStatus::GeneralFailure, "Configuration '" + name + "' does not exist");
        owner_.setup_.activeConfiguration = *it;
    }

    ForeignBuildInfo build(bool) override
    {
        owner_.enter("build.build");
        std::lock_guard<std::mutex> guard(owner_.mutex_);
        if(!owner_.setup_.solutionOpen)
            throw ForeignFault(ForeignStatus::GeneralFailure, "No solution is open");

        ForeignBuildInfo info = owner_.setup_.buildInfo;
        info.failedProjects = info.errors.empty() ? 0 : 1;
        if(info.output.empty())
            info.output = "Build " + std::string(info.failedProjects == 0 ? "succeeded" : "failed") + " (" + owner_.setup_.activeConfiguration + ")";
        return info;
    }

private:
    SimulatedIde& owner_;
};

SimulatedIde::SimulatedIde(SimulatedIdeSetup setup)
    : setup_(std::move(setup)),
      solution_(std::make_unique<Solution>(*this)),
      debugger_(std::make_unique<Debugger>(*this)),
      build_(std::make_unique<Build>(*this))
{
}

SimulatedIde::~SimulatedIde() = default;

bool SimulatedIde::probe()
{
    enter("probe");
    std::lock_guard<std::mutex> guard(mutex_);
    return probeResult_;
}

std::string SimulatedIde::version()
{
    enter("version");
    std::lock_guard<std::mutex> guard(mutex_);
    return setup_.version;
}

ISolution& SimulatedIde::solution()
{
    return *solution_;
}

IDebugger& SimulatedIde::debugger()
{
    return *debugger_;
}

IBuild& SimulatedIde::build()
{
    return *build_;
}

size_t SimulatedIde::totalCalls() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return totalCalls_;
}

size_t SimulatedIde::callCount(const std::string& operation) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = calls_.find(operation);
    return it == calls_.end() ? 0 : it->second;
}

void SimulatedIde::setProbeResult(bool reachable)
{
    std::lock_guard<std::mutex> guard(mutex_);
    probeResult_ = reachable;
}

void SimulatedIde::injectFault(const std::string& operation, uint32_t status, bool once)
{
    std::lock_guard<std::mutex> guard(mutex_);
    Fault fault;
    fault.kind = Fault::Kind::Foreign;
    fault.status = status;
    fault.message = "Simulated fault in " + operation;
    fault.once = once;
    faults_[operation] = fault;
}

void SimulatedIde::injectFatal(const std::string& operation)
{
    std::lock_guard<std::mutex> guard(mutex_);
    Fault fault;
    fault.kind = Fault::Kind::Fatal;
    fault.message = "Simulated unrecoverable fault in " + operation;
    faults_[operation] = fault;
}

void SimulatedIde::injectRuntimeError(const std::string& operation, const std::string& message)
{
    std::lock_guard<std::mutex> guard(mutex_);
    Fault fault;
    fault.kind = Fault::Kind::Runtime;
    fault.message = message;
    faults_[operation] = fault;
}

void SimulatedIde::clearFaults()
{
    std::lock_guard<std::mutex> guard(mutex_);
    faults_.clear();
}

void SimulatedIde::setDelay(const std::string& operation, std::chrono::milliseconds delay)
{
    std::lock_guard<std::mutex> guard(mutex_);
    delays_[operation] = delay;
}

void SimulatedIde::setBreakOnGo(bool enabled)
{
    std::lock_guard<std::mutex> guard(mutex_);
    setup_.breakOnGo = enabled;
}

void SimulatedIde::enterBreak()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if(liveFrames_.empty())
            liveFrames_ = setup_.frames;
    }
    changeMode(ForeignDebugMode::Break);
}

void SimulatedIde::finishExecution()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        liveFrames_.clear();
    }
    changeMode(ForeignDebugMode::Design);
}

ForeignDebugMode SimulatedIde::mode() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return mode_;
}

std::string SimulatedIde::startupProject() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return startupProject_;
}

size_t SimulatedIde::listenerCount() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return listeners_.size();
}

void SimulatedIde::enter(const std::string& operation)
{
    std::chrono::milliseconds delay{0};
    std::optional<Fault> fault;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        ++totalCalls_;
        ++calls_[operation];

        auto delayIt = delays_.find(operation);
        if(delayIt != delays_.end())
            delay = delayIt->second;

        auto faultIt = faults_.find(operation);
        if(faultIt != faults_.end())
        {
            fault = faultIt->second;
            if(fault->once)
                faults_.erase(faultIt);
        }
    }

    if(delay.count() > 0)
        std::this_thread::sleep_for(delay);

    if(!fault)
        return;

    switch(fault->kind)
    {
    case Fault::Kind::Foreign:
        throw ForeignFault(fault->status, fault->message);
    case Fault::Kind::Fatal:
        throw FatalError(fault->message);
    case Fault::Kind::Runtime:
        throw std::runtime_error(fault->message);
    }
}

void SimulatedIde::changeMode(ForeignDebugMode mode)
{
    std::vector<IDebugger::ModeListener> listeners;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if(mode_ == mode)
            return;
        mode_ = mode;
        for(const auto& entry : listeners_)
            listeners.push_back(entry.second);
    }

    for(const auto& listener : listeners)
        listener(mode);
}

std::unique_ptr<SimulatedEnvironment> SimulatedEnvironment::loadFixture(const std::string& path)
{
    std::ifstream file(path);
    if(!file)
        throw std::runtime_error("Cannot open simulation fixture '" + path + "'");

    json fixture;
    try
    {
        file >> fixture;
    }
    catch(const json::exception& ex)
    {
        throw std::runtime_error("Simulation fixture '" + path + "' is not valid JSON: " + ex.what());
    }

    auto environment = fromJson(fixture);
    LogInfoF("Loaded simulation fixture %s", path.c_str());
    return environment;
}

std::unique_ptr<SimulatedEnvironment> SimulatedEnvironment::fromJson(const json& fixture)
{
    if(!fixture.is_object())
        throw std::runtime_error("Simulation fixture must be a JSON object");

    auto environment = std::make_unique<SimulatedEnvironment>();

    if(fixture.contains("processes") && fixture.at("processes").is_array())
    {
        for(const auto& process : fixture.at("processes"))
            environment->addProcess(process.at("processId").get<int>(), process.value("name", std::string("process")));
    }

    if(fixture.contains("instances") && fixture.at("instances").is_array())
    {
        for(const auto& entry : fixture.at("instances"))
        {
            const int processId = entry.at("processId").get<int>();
            if(processId <= 0)
                throw std::runtime_error("Simulation fixture has an instance with a non-positive processId");
            environment->addInstance(processId, entry.value("processName", std::string("devenv")), parseSetup(entry));
        }
    }

    return environment;
}

void SimulatedEnvironment::addProcess(int processId, const std::string& name)
{
    std::lock_guard<std::mutex> guard(mutex_);
    Process process;
    process.name = name;
    process.startedAt = std::chrono::system_clock::now();
    processes_[processId] = process;
}

std::shared_ptr<SimulatedIde> SimulatedEnvironment::addInstance(int processId, const std::string& name, SimulatedIdeSetup setup)
{
    auto ide = std::make_shared<SimulatedIde>(std::move(setup));

    std::lock_guard<std::mutex> guard(mutex_);
    Process process;
    process.name = name;
    process.startedAt = std::chrono::system_clock::now();
    process.ide = ide;
    processes_[processId] = process;
    return ide;
}

std::shared_ptr<SimulatedIde> SimulatedEnvironment::instance(int processId) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = processes_.find(processId);
    return it == processes_.end() ? nullptr : it->second.ide;
}

void SimulatedEnvironment::terminate(int processId)
{
    std::shared_ptr<SimulatedIde> released;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = processes_.find(processId);
        if(it == processes_.end())
            return;
        it->second.alive = false;
        released = std::move(it->second.ide);
    }
}

void SimulatedEnvironment::setAcquirable(int processId, bool acquirable)
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = processes_.find(processId);
    if(it != processes_.end())
        it->second.acquirable = acquirable;
}

size_t SimulatedEnvironment::acquireCalls() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return acquireCalls_;
}

void SimulatedEnvironment::setDiscoveryError(const std::string& message)
{
    std::lock_guard<std::mutex> guard(mutex_);
    discoveryError_ = message;
}

std::vector<DiscoveredRoot> SimulatedEnvironment::enumerate()
{
    std::lock_guard<std::mutex> guard(mutex_);
    if(!discoveryError_.empty())
        throw std::runtime_error(discoveryError_);

    std::vector<DiscoveredRoot> roots;
    for(const auto& entry : processes_)
    {
        const Process& process = entry.second;
        if(process.alive && process.acquirable && process.ide)
            roots.push_back(DiscoveredRoot{entry.first, process.ide});
    }
    return roots;
}

std::weak_ptr<IAutomationRoot> SimulatedEnvironment::acquire(int processId)
{
    std::lock_guard<std::mutex> guard(mutex_);
    ++acquireCalls_;
    auto it = processes_.find(processId);
    if(it == processes_.end() || !it->second.alive || !it->second.acquirable || !it->second.ide)
        return {};
    return it->second.ide;
}

bool SimulatedEnvironment::isAlive(int processId)
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = processes_.find(processId);
    return it != processes_.end() && it->second.alive;
}

std::optional<std::string> SimulatedEnvironment::processName(int processId)
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = processes_.find(processId);
    if(it == processes_.end() || !it->second.alive)
        return std::nullopt;
    return it->second.name;
}

std::optional<std::chrono::system_clock::time_point> SimulatedEnvironment::startTime(int processId)
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = processes_.find(processId);
    if(it == processes_.end() || !it->second.alive)
        return std::nullopt;
    return it->second.startedAt;
}
