#include "bridge_config.h"

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace
{
    constexpr long long kMaxSweepSeconds = 24 * 60 * 60;
    constexpr long long kMaxTimeoutMs = 60LL * 60 * 1000;

    bool parseInteger(const std::string& text, long long& value)
    {
        if(text.empty())
            return false;

        char* end = nullptr;
        const long long parsed = std::strtoll(text.c_str(), &end, 0);
        if(!end || *end != '\0')
            return false;

        value = parsed;
        return true;
    }

    bool readInteger(const json& document, const char* key, long long minimum, long long maximum, long long& value)
    {
        if(!document.contains(key))
            return false;

        const json& raw = document.at(key);
        if(!raw.is_number_integer() || raw.get<long long>() < minimum || raw.get<long long>() > maximum)
        {
            LogWarningF("Ignoring invalid config value for '%s': %s (expected %lld..%lld)", key, raw.dump().c_str(), minimum, maximum);
            return false;
        }

        value = raw.get<long long>();
        return true;
    }

    bool applySweepInterval(const std::string& text, BridgeConfig& config)
    {
        long long seconds = 0;
        if(!parseInteger(text, seconds) || seconds < 0 || seconds > kMaxSweepSeconds)
        {
            LogWarningF("Ignoring invalid sweep interval '%s'", text.c_str());
            return false;
        }
        config.sweepInterval = std::chrono::seconds(seconds);
        return true;
    }

    bool applyCallTimeout(const std::string& text, BridgeConfig& config)
    {
        long long millis = 0;
        if(!parseInteger(text, millis) || millis < 0 || millis > kMaxTimeoutMs)
        {
            LogWarningF("Ignoring invalid call timeout '%s'", text.c_str());
            return false;
        }
        config.callTimeout = std::chrono::milliseconds(millis);
        return true;
    }

    bool applyLogLevel(const std::string& text, BridgeConfig& config)
    {
        LogLevel level = LogLevel::Info;
        if(!ParseLogLevel(text, level))
        {
            LogWarningF("Ignoring invalid log level '%s'", text.c_str());
            return false;
        }
        config.logLevel = level;
        return true;
    }
}

void ApplyConfigJson(const json& document, BridgeConfig& config)
{
    if(!document.is_object())
    {
        LogWarning("Ignoring config document that is not a JSON object");
        return;
    }

    if(document.contains("logLevel"))
    {
        if(document.at("logLevel").is_string())
            applyLogLevel(document.at("logLevel").get<std::string>(), config);
        else
            LogWarning("Ignoring non-string config value for 'logLevel'");
    }

    long long value = 0;
    if(readInteger(document, "sweepIntervalSeconds", 0, kMaxSweepSeconds, value))
        config.sweepInterval = std::chrono::seconds(value);
    if(readInteger(document, "callTimeoutMs", 0, kMaxTimeoutMs, value))
        config.callTimeout = std::chrono::milliseconds(value);
    if(readInteger(document, "probeTimeoutMs", 1, kMaxTimeoutMs, value))
        config.probeTimeout = std::chrono::milliseconds(value);
    if(readInteger(document, "debugSettleMs", 0, kMaxTimeoutMs, value))
        config.debugSettle = std::chrono::milliseconds(value);

    if(document.contains("hostProcessNames"))
    {
        const json& names = document.at("hostProcessNames");
        bool valid = names.is_array() && !names.empty();
        if(valid)
        {
            for(const auto& name : names)
                valid = valid && name.is_string() && !name.get<std::string>().empty();
        }

        if(valid)
            config.hostProcessNames = names.get<std::vector<std::string>>();
        else
            LogWarning("Ignoring invalid 'hostProcessNames' (expected a non-empty array of names)");
    }

    if(document.contains("simulationFixture"))
    {
        if(document.at("simulationFixture").is_string())
            config.simulationFixture = document.at("simulationFixture").get<std::string>();
        else
            LogWarning("Ignoring non-string config value for 'simulationFixture'");
    }
}

bool LoadConfigFile(const std::string& path, BridgeConfig& config)
{
    std::ifstream file(path);
    if(!file)
    {
        LogWarningF("Config file %s could not be opened; using defaults", path.c_str());
        return false;
    }

    json document;
    try
    {
        file >> document;
    }
    catch(const json::exception& ex)
    {
        LogWarningF("Config file %s is not valid JSON (%s); using defaults", path.c_str(), ex.what());
        return false;
    }

    ApplyConfigJson(document, config);
    config.configPath = path;
    LogInfoF("Loaded configuration from %s", path.c_str());
    return true;
}

bool LoadBridgeConfig(const std::vector<std::string>& args, const char* environmentPath, BridgeConfig& config, std::string& error)
{
    std::string configPath = environmentPath ? environmentPath : "";
    for(size_t i = 0; i < args.size(); ++i)
    {
        if(args[i] == "--config")
        {
            if(i + 1 >= args.size())
            {
                error = "--config requires a file path";
                return false;
            }
            configPath = args[i + 1];
        }
    }

    if(!configPath.empty())
        LoadConfigFile(configPath, config);

    for(size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if(arg == "--help" || arg == "-h")
        {
            config.showHelp = true;
            continue;
        }

        const bool takesValue = arg == "--config" || arg == "--log-level" || arg == "--sweep-interval" ||
                                arg == "--call-timeout" || arg == "--simulate";
        if(!takesValue)
        {
            error = "Unknown option: " + arg;
            return false;
        }

        if(i + 1 >= args.size())
        {
            error = arg + " requires a value";
            return false;
        }

        const std::string& value = args[++i];
        if(arg == "--log-level")
            applyLogLevel(value, config);
        else if(arg == "--sweep-interval")
            applySweepInterval(value, config);
        else if(arg == "--call-timeout")
            applyCallTimeout(value, config);
        else if(arg == "--simulate")
            config.simulationFixture = value;
    }

    return true;
}

const char* BridgeUsage()
{
    return "Usage: ide_mcp_bridge [options]\n"
           "Speaks newline-delimited JSON-RPC 2.0 (MCP) on stdin/stdout; logs go to stderr.\n"
           "\n"
           "Options:\n"
           "  --config <file>          JSON configuration file (default: $IDE_MCP_BRIDGE_CONFIG)\n"
           "  --log-level <level>      debug, info, warning or error\n"
           "  --sweep-interval <s>     seconds between instance health sweeps (0 disables)\n"
           "  --call-timeout <ms>      per-call timeout for IDE automation calls (0 waits forever)\n"
           "  --simulate <fixture>     serve simulated IDE instances described by a JSON fixture\n"
           "  -h, --help               show this message\n";
}
