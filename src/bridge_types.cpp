#include "bridge_types.h"

#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

const char* DebugStateName(DebugState state)
{
    switch(state)
    {
    case DebugState::Design:
        return "Design";
    case DebugState::Running:
        return "Running";
    case DebugState::Break:
        return "Break";
    }
    return "Unknown";
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point time)
{
    const auto sinceEpoch = time.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch - seconds).count();

    const std::time_t raw = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string CurrentIsoTimestamp()
{
    return FormatIsoTimestamp(std::chrono::system_clock::now());
}

void to_json(json& j, const DebugStateInfo& info)
{
    j = json::object({
        {"isDebugging", info.state != DebugState::Design},
        {"isPaused", info.state == DebugState::Break},
        {"mode", DebugStateName(info.state)}
    });

    if(info.currentFile)
        j["currentFile"] = *info.currentFile;
    if(info.currentLine)
        j["currentLine"] = *info.currentLine;
}

void to_json(json& j, const Breakpoint& breakpoint)
{
    j = json::object({
        {"id", breakpoint.id},
        {"file", breakpoint.file},
        {"line", breakpoint.line},
        {"condition", breakpoint.condition},
        {"enabled", breakpoint.enabled}
    });
}

void to_json(json& j, const Variable& variable)
{
    j = json::object({
        {"name", variable.name},
        {"value", variable.value},
        {"type", variable.type},
        {"scope", variable.scope == VariableScope::Local ? "Local" : "Parameter"}
    });
}

void to_json(json& j, const CallStackFrame& frame)
{
    j = json::object({
        {"method", frame.method},
        {"file", frame.file},
        {"line", frame.line},
        {"module", frame.module}
    });
}

void to_json(json& j, const ObjectProperty& property)
{
    j = json::object({
        {"name", property.name},
        {"type", property.type},
        {"value", property.value},
        {"isReadOnly", property.isReadOnly}
    });
}

void to_json(json& j, const ObjectInfo& info)
{
    j = json::object({
        {"name", info.name},
        {"type", info.type},
        {"value", info.value},
        {"address", info.address},
        {"size", info.size},
        {"properties", info.properties}
    });
}

void to_json(json& j, const IdeInstance& instance)
{
    j = json::object({
        {"processId", instance.processId},
        {"version", instance.version},
        {"solutionName", instance.solutionName},
        {"startTime", instance.startTime ? json(FormatIsoTimestamp(*instance.startTime)) : json()},
        {"isConnected", instance.isConnected}
    });
}

void to_json(json& j, const ProjectInfo& project)
{
    j = json::object({
        {"name", project.name},
        {"uniqueName", project.uniqueName},
        {"fullPath", project.fullPath},
        {"type", project.type},
        {"targetFramework", project.targetFramework}
    });
}

void to_json(json& j, const SolutionInfo& solution)
{
    j = json::object({
        {"name", solution.name},
        {"fullPath", solution.fullPath},
        {"isOpen", solution.isOpen},
        {"projects", solution.projects}
    });
}

void to_json(json& j, const BuildDiagnostic& diagnostic)
{
    j = json::object({
        {"file", diagnostic.file},
        {"line", diagnostic.line},
        {"column", diagnostic.column},
        {"code", diagnostic.code},
        {"message", diagnostic.message},
        {"project", diagnostic.project}
    });
}

void to_json(json& j, const BuildResult& result)
{
    j = json::object({
        {"success", result.success},
        {"configuration", result.configuration},
        {"output", result.output},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"errorCount", result.errors.size()},
        {"warningCount", result.warnings.size()},
        {"durationMs", result.duration.count()}
    });
}
