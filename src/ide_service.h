#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "automation.h"
#include "bridge_types.h"
#include "foreign_executor.h"
#include "instance_registry.h"
#include "process_query.h"

// Instance-scoped operations: discovery, connection, solution and build.
class IdeService
{
public:
    IdeService(InstanceRegistry& registry, IDiscoveryService& discovery, IProcessQuery& processes, std::chrono::milliseconds callTimeout);

    std::vector<IdeInstance> listInstances();

    // Resolves the process through the registry and makes it the active instance.
    IdeInstance connectInstance(int processId);

    SolutionInfo openSolution(const std::string& solutionPath);
    BuildResult buildSolution(const std::string& configuration);
    std::vector<ProjectInfo> getProjects();

private:
    InstanceHandle requireActive(const std::string& operation);
    IdeInstance describeInstance(const InstanceHandle& handle, bool connected);
    SolutionInfo describeSolution(const InstanceHandle& handle);

    InstanceRegistry& registry_;
    IDiscoveryService& discovery_;
    IProcessQuery& processes_;
    std::chrono::milliseconds callTimeout_;
    // Discovery talks to the host's object table, never from the reading thread.
    ForeignExecutor discoveryExecutor_;
};
