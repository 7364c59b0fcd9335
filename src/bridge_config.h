#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "logging.h"
#include "nlohmann/json.hpp"

constexpr const char* kConfigEnvironmentVariable = "IDE_MCP_BRIDGE_CONFIG";

struct BridgeConfig
{
    LogLevel logLevel = LogLevel::Info;
    // Zero disables the periodic health sweep.
    std::chrono::seconds sweepInterval{30};
    // Zero waits for foreign calls indefinitely.
    std::chrono::milliseconds callTimeout{30000};
    std::chrono::milliseconds probeTimeout{5000};
    std::chrono::milliseconds debugSettle{250};
    std::vector<std::string> hostProcessNames{"devenv", "visualstudio"};
    std::string simulationFixture;
    std::string configPath;
    bool showHelp = false;
};

// Applies recognised keys; invalid values are logged and leave the current value.
void ApplyConfigJson(const nlohmann::json& document, BridgeConfig& config);

// False when the file cannot be read or parsed; the config is left unchanged.
bool LoadConfigFile(const std::string& path, BridgeConfig& config);

// Defaults, then the config file (--config, else environmentPath), then flags.
// Returns false with a message in error on malformed command lines.
bool LoadBridgeConfig(const std::vector<std::string>& args, const char* environmentPath, BridgeConfig& config, std::string& error);

const char* BridgeUsage();
