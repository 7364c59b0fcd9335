#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "process_query.h"

struct ValidationResult
{
    bool valid = false;
    std::string code;
    std::string message;
    std::string details;
    nlohmann::json value;

    static ValidationResult success(nlohmann::json value = nullptr);
    static ValidationResult failure(std::string code, std::string message, std::string details = std::string());

    nlohmann::json toJson() const;
};

enum class ParamKind
{
    ProcessId,
    Path,
    Configuration,
    String,
    Integer
};

// Declared shape of one tool argument.
struct ParamSpec
{
    std::string name;
    ParamKind kind = ParamKind::String;
    bool required = false;
    std::string description;

    // Path
    std::string extension;
    // ProcessId
    bool requireHostProcess = true;
    // Integer
    long long minimum = 0;
    long long maximum = 0;
    std::optional<long long> defaultValue;

    static ParamSpec processId(std::string name, std::string description);
    static ParamSpec path(std::string name, std::string extension, std::string description);
    static ParamSpec configuration(std::string name, std::string description);
    static ParamSpec string(std::string name, bool required, std::string description);
    static ParamSpec integer(std::string name, bool required, long long minimum, long long maximum, std::string description);

    nlohmann::json schema() const;
};

extern const std::vector<std::string> kAllowedConfigurations;

// Checks request parameters before anything reaches the bridge.
class InputValidator
{
public:
    InputValidator(IProcessQuery& processes, std::vector<std::string> hostProcessNames);

    ValidationResult validateProcessId(const nlohmann::json& value, bool requireHostProcess = true) const;
    ValidationResult validatePath(const nlohmann::json& value, const std::string& expectedExtension = std::string()) const;
    ValidationResult validateConfiguration(const nlohmann::json& value) const;

    ValidationResult validateParameter(const ParamSpec& spec, const nlohmann::json& arguments) const;

    // On success the result value holds the normalized argument object.
    ValidationResult validateArguments(const std::vector<ParamSpec>& specs, const nlohmann::json& arguments) const;

    bool isHostProcessName(const std::string& processName) const;

private:
    IProcessQuery& processes_;
    std::vector<std::string> hostProcessNames_;
};
