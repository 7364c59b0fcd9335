#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

enum class DebugState
{
    Design,
    Running,
    Break
};

const char* DebugStateName(DebugState state);

struct DebugStateInfo
{
    DebugState state = DebugState::Design;
    std::optional<std::string> currentFile;
    std::optional<int> currentLine;
};

struct Breakpoint
{
    std::string id;
    std::string file;
    int line = 0;
    std::string condition;
    bool enabled = true;
};

enum class VariableScope
{
    Local,
    Parameter
};

struct Variable
{
    std::string name;
    std::string value;
    std::string type;
    VariableScope scope = VariableScope::Local;
};

struct CallStackFrame
{
    std::string method;
    std::string file;
    int line = 0;
    std::string module;
};

struct ObjectProperty
{
    std::string name;
    std::string type;
    std::string value;
    bool isReadOnly = false;
};

struct ObjectInfo
{
    std::string name;
    std::string type;
    std::string value;
    std::string address;
    long long size = 0;
    std::vector<ObjectProperty> properties;
};

struct IdeInstance
{
    int processId = 0;
    std::string version;
    std::string solutionName;
    std::optional<std::chrono::system_clock::time_point> startTime;
    bool isConnected = false;
};

struct ProjectInfo
{
    std::string name;
    std::string uniqueName;
    std::string fullPath;
    std::string type;
    std::string targetFramework;
};

struct SolutionInfo
{
    std::string name;
    std::string fullPath;
    bool isOpen = false;
    std::vector<ProjectInfo> projects;
};

struct BuildDiagnostic
{
    std::string file;
    int line = 0;
    int column = 0;
    std::string code;
    std::string message;
    std::string project;
};

struct BuildResult
{
    bool success = false;
    std::string configuration;
    std::string output;
    std::vector<BuildDiagnostic> errors;
    std::vector<BuildDiagnostic> warnings;
    std::chrono::milliseconds duration{0};
};

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point time);
std::string CurrentIsoTimestamp();

void to_json(nlohmann::json& j, const DebugStateInfo& info);
void to_json(nlohmann::json& j, const Breakpoint& breakpoint);
void to_json(nlohmann::json& j, const Variable& variable);
void to_json(nlohmann::json& j, const CallStackFrame& frame);
void to_json(nlohmann::json& j, const ObjectProperty& property);
void to_json(nlohmann::json& j, const ObjectInfo& info);
void to_json(nlohmann::json& j, const IdeInstance& instance);
void to_json(nlohmann::json& j, const ProjectInfo& project);
void to_json(nlohmann::json& j, const SolutionInfo& solution);
void to_json(nlohmann::json& j, const BuildDiagnostic& diagnostic);
void to_json(nlohmann::json& j, const BuildResult& result);
