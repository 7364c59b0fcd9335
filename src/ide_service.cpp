#include "ide_service.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <tuple>
#include <utility>

#include "bridge_error.h"
#include "logging.h"

namespace
{
    bool equalsIgnoreCase(const std::string& left, const std::string& right)
    {
        return left.size() == right.size() &&
               std::equal(left.begin(), left.end(), right.begin(), [](unsigned char a, unsigned char b) {
                   return std::tolower(a) == std::tolower(b);
               });
    }

    bool sameRoot(const std::weak_ptr<IAutomationRoot>& left, const std::weak_ptr<IAutomationRoot>& right)
    {
        return !left.owner_before(right) && !right.owner_before(left);
    }

    std::string solutionName(const std::string& fullPath)
    {
        if(fullPath.empty())
            return {};
        return std::filesystem::path(fullPath).stem().string();
    }

    ProjectInfo toProject(const ForeignProject& foreign)
    {
        ProjectInfo project;
        project.name = foreign.name;
        project.uniqueName = foreign.uniqueName;
        project.fullPath = foreign.fullName;
        project.type = foreign.kind;
        project.targetFramework = foreign.targetFramework;
        return project;
    }

    BuildDiagnostic toDiagnostic(const ForeignBuildDiagnostic& foreign)
    {
        BuildDiagnostic diagnostic;
        diagnostic.file = foreign.file;
        diagnostic.line = foreign.line;
        diagnostic.column = foreign.column;
        diagnostic.code = foreign.code;
        diagnostic.message = foreign.message;
        diagnostic.project = foreign.project;
        return diagnostic;
    }
}

IdeService::IdeService(InstanceRegistry& registry, IDiscoveryService& discovery, IProcessQuery& processes, std::chrono::milliseconds callTimeout)
    : registry_(registry), discovery_(discovery), processes_(processes), callTimeout_(callTimeout), discoveryExecutor_("discovery")
{
}

std::vector<IdeInstance> IdeService::listInstances()
{
    IDiscoveryService& discovery = discovery_;
    const std::vector<DiscoveredRoot> discovered = discoveryExecutor_.call("list_instances", callTimeout_, [&discovery]() {
        return discovery.enumerate();
    });

    const auto active = registry_.activeProcessId();
    std::vector<IdeInstance> instances;

    for(const auto& entry : discovered)
    {
        if(entry.processId <= 0 || entry.root.expired())
            continue;

        auto handle = registry_.lookup(entry.processId);
        if(!handle || !sameRoot(handle->root, entry.root))
            handle = registry_.registerInstance(entry.processId, entry.root);

        try
        {
            instances.push_back(describeInstance(*handle, active && *active == entry.processId));
        }
        catch(const ToolError& ex)
        {
            LogWarningF("Skipping instance %d: %s", entry.processId, SanitizeMessage(ex.what()).c_str());
        }
    }

    LogInfoF("Found %zu IDE instance(s)", instances.size());
    return instances;
}

IdeInstance IdeService::connectInstance(int processId)
{
    const auto handle = registry_.resolve(processId);
    if(!handle)
    {
        throw NotFoundError("No IDE automation instance found for process " + std::to_string(processId),
                            nlohmann::json::object({{"processId", processId}}));
    }

    IdeInstance instance = describeInstance(*handle, true);
    registry_.setActive(processId);
    LogInfoF("Connected to IDE instance %d (version %s)", processId, instance.version.c_str());
    return instance;
}

SolutionInfo IdeService::openSolution(const std::string& solutionPath)
{
    const InstanceHandle handle = requireActive("open_solution");

    handle.invoke("open_solution", callTimeout_, [solutionPath](IAutomationRoot& root) {
        root.solution().open(solutionPath);
    });

    LogInfoF("Opened solution %s in instance %d", solutionPath.c_str(), handle.processId);
    return describeSolution(handle);
}

BuildResult IdeService::buildSolution(const std::string& configuration)
{
    const InstanceHandle handle = requireActive("build_solution");
    const auto started = std::chrono::steady_clock::now();

    auto outcome = handle.invoke("build_solution", callTimeout_, [configuration](IAutomationRoot& root) {
        IBuild& build = root.build();
        std::string used = configuration;

        const auto available = build.configurations();
        auto it = std::find_if(available.begin(), available.end(), [&](const std::string& name) {
            return equalsIgnoreCase(name, configuration);
        });
        if(it != available.end())
        {
            build.activateConfiguration(*it);
            used = *it;
        }
        else
        {
            used = build.activeConfiguration();
            LogWarningF("Configuration '%s' not found in solution; building active configuration '%s'",
                        configuration.c_str(),
                        used.c_str());
        }

        return std::make_pair(used, build.build(true));
    });

    BuildResult result;
    result.configuration = outcome.first;
    result.success = outcome.second.failedProjects == 0;
    result.output = outcome.second.output;
    for(const auto& error : outcome.second.errors)
        result.errors.push_back(toDiagnostic(error));
    for(const auto& warning : outcome.second.warnings)
        result.warnings.push_back(toDiagnostic(warning));
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    LogInfoF("Build %s (%s): %zu error(s), %zu warning(s)",
             result.success ? "succeeded" : "failed",
             result.configuration.c_str(),
             result.errors.size(),
             result.warnings.size());
    return result;
}

std::vector<ProjectInfo> IdeService::getProjects()
{
    const InstanceHandle handle = requireActive("get_projects");

    const auto foreign = handle.invoke("get_projects", callTimeout_, [](IAutomationRoot& root) {
        return root.solution().projects();
    });

    std::vector<ProjectInfo> projects;
    projects.reserve(foreign.size());
    for(const auto& project : foreign)
        projects.push_back(toProject(project));
    return projects;
}

InstanceHandle IdeService::requireActive(const std::string& operation)
{
    auto handle = registry_.activeInstance();
    if(!handle)
        throw BridgeError(operation, "No IDE instance connected. Call vs_connect_instance first.", true);
    return *handle;
}

IdeInstance IdeService::describeInstance(const InstanceHandle& handle, bool connected)
{
    const auto details = handle.invoke("describe_instance", callTimeout_, [](IAutomationRoot& root) {
        std::string solutionPath;
        if(root.solution().isOpen())
            solutionPath = root.solution().fullName();
        return std::make_pair(root.version(), solutionPath);
    });

    IdeInstance instance;
    instance.processId = handle.processId;
    instance.version = details.first;
    instance.solutionName = solutionName(details.second);
    instance.startTime = processes_.startTime(handle.processId);
    instance.isConnected = connected;
    return instance;
}

SolutionInfo IdeService::describeSolution(const InstanceHandle& handle)
{
    const auto details = handle.invoke("get_solution", callTimeout_, [](IAutomationRoot& root) {
        ISolution& solution = root.solution();
        const bool open = solution.isOpen();
        return std::make_tuple(open, open ? solution.fullName() : std::string(), open ? solution.projects() : std::vector<ForeignProject>());
    });

    SolutionInfo info;
    info.isOpen = std::get<0>(details);
    info.fullPath = std::get<1>(details);
    info.name = solutionName(info.fullPath);
    for(const auto& project : std::get<2>(details))
        info.projects.push_back(toProject(project));
    return info;
}
