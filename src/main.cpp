#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "bridge_config.h"
#include "debug_controller.h"
#include "ide_service.h"
#include "input_validator.h"
#include "instance_registry.h"
#include "logging.h"
#include "mcp_server.h"
#include "process_query.h"
#include "simulated_ide.h"

static std::atomic<McpServer*> g_mcpServer{nullptr};

namespace
{
    void handleShutdownSignal(int)
    {
        McpServer* server = g_mcpServer.load();
        if(server)
            server->stop();
    }

    void installSignalHandlers()
    {
        struct sigaction action{};
        action.sa_handler = handleShutdownSignal;
        sigemptyset(&action.sa_mask);
        // no SA_RESTART: poll() must return EINTR so the loop sees the stop
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        std::signal(SIGPIPE, SIG_IGN);
    }

    void restoreSignalHandlers()
    {
        struct sigaction action{};
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
    }
}

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    BridgeConfig config;
    std::string error;
    if(!LoadBridgeConfig(args, std::getenv(kConfigEnvironmentVariable), config, error))
    {
        std::fprintf(stderr, "%s\n\n%s", error.c_str(), BridgeUsage());
        return 2;
    }

    if(config.showHelp)
    {
        std::fprintf(stderr, "%s", BridgeUsage());
        return 0;
    }

    SetLogLevel(config.logLevel);

    ProcfsProcessQuery procfs;
    UnavailableDiscovery unavailable;
    std::unique_ptr<SimulatedEnvironment> simulation;

    IDiscoveryService* discovery = &unavailable;
    IProcessQuery* processes = &procfs;

    if(!config.simulationFixture.empty())
    {
        try
        {
            simulation = SimulatedEnvironment::loadFixture(config.simulationFixture);
        }
        catch(const std::runtime_error& ex)
        {
            LogErrorF("Cannot start simulated backend: %s", ex.what());
            return 1;
        }
        discovery = simulation.get();
        processes = simulation.get();
        LogInfo("Serving simulated IDE instances");
    }
    else
    {
        LogWarning("No native IDE automation backend on this host; discovery will find no instances (use --simulate <fixture>)");
    }

    RegistryOptions registryOptions;
    registryOptions.sweepInterval = config.sweepInterval;
    registryOptions.probeTimeout = config.probeTimeout;
    InstanceRegistry registry(*discovery, *processes, registryOptions);

    ControllerOptions controllerOptions;
    controllerOptions.callTimeout = config.callTimeout;
    controllerOptions.settleTimeout = config.debugSettle;
    DebugController controller(registry, controllerOptions);

    IdeService ide(registry, *discovery, *processes, config.callTimeout);
    InputValidator validator(*processes, config.hostProcessNames);
    McpServer server(ide, controller, validator);

    // published before the handlers exist and cleared only after they are gone
    g_mcpServer.store(&server);
    installSignalHandlers();

    server.run(STDIN_FILENO, std::cout);

    restoreSignalHandlers();
    g_mcpServer.store(nullptr);
    return 0;
}
