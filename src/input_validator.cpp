#include "input_validator.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

const std::vector<std::string> kAllowedConfigurations = {"Debug", "Release", "DebugAnyCPU", "ReleaseAnyCPU"};

namespace
{
    constexpr long long kMaxProcessId = 65535;

    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    bool equalsIgnoreCase(const std::string& left, const std::string& right)
    {
        return left.size() == right.size() && toLower(left) == toLower(right);
    }

    bool isBlank(const std::string& text)
    {
        return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    }

    std::string joinConfigurations()
    {
        std::string joined;
        for(const auto& name : kAllowedConfigurations)
        {
            if(!joined.empty())
                joined += ", ";
            joined += name;
        }
        return joined;
    }

    std::string kindName(ParamKind kind)
    {
        switch(kind)
        {
        case ParamKind::ProcessId:
        case ParamKind::Integer:
            return "integer";
        case ParamKind::Path:
        case ParamKind::Configuration:
        case ParamKind::String:
            return "string";
        }
        return "string";
    }
}

ValidationResult ValidationResult::success(json value)
{
    ValidationResult result;
    result.valid = true;
    result.value = std::move(value);
    return result;
}

ValidationResult ValidationResult::failure(std::string code, std::string message, std::string details)
{
    ValidationResult result;
    result.valid = false;
    result.code = std::move(code);
    result.message = std::move(message);
    result.details = std::move(details);
    return result;
}

json ValidationResult::toJson() const
{
    return json::object({
        {"code", code},
        {"message", message},
        {"data", details.empty() ? json() : json(details)}
    });
}

ParamSpec ParamSpec::processId(std::string name, std::string description)
{
    ParamSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::ProcessId;
    spec.required = true;
    spec.description = std::move(description);
    return spec;
}

ParamSpec ParamSpec::path(std::string name, std::string extension, std::string description)
{
    ParamSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Path;
    spec.required = true;
    spec.extension = std::move(extension);
    spec.description = std::move(description);
    return spec;
}

ParamSpec ParamSpec::configuration(std::string name, std::string description)
{
    ParamSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Configuration;
    spec.required = false;
    spec.description = std::move(description);
    return spec;
}

ParamSpec ParamSpec::string(std::string name, bool required, std::string description)
{
    ParamSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::String;
    spec.required = required;
    spec.description = std::move(description);
    return spec;
}

ParamSpec ParamSpec::integer(std::string name, bool required, long long minimum, long long maximum, std::string description)
{
    ParamSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::Integer;
    spec.required = required;
    spec.minimum = minimum;
    spec.maximum = maximum;
    spec.description = std::move(description);
    return spec;
}

json ParamSpec::schema() const
{
    json property = json::object({
        {"type", kindName(kind)},
        {"description", description}
    });

    if(kind == ParamKind::Integer)
    {
        property["minimum"] = minimum;
        property["maximum"] = maximum;
    }
    else if(kind == ParamKind::ProcessId)
    {
        property["minimum"] = 1;
        property["maximum"] = kMaxProcessId;
    }
    else if(kind == ParamKind::Configuration)
    {
        property["enum"] = kAllowedConfigurations;
    }

    return property;
}

InputValidator::InputValidator(IProcessQuery& processes, std::vector<std::string> hostProcessNames)
    : processes_(processes), hostProcessNames_(std::move(hostProcessNames))
{
    for(auto& name : hostProcessNames_)
        name = toLower(name);
}

bool InputValidator::isHostProcessName(const std::string& processName) const
{
    const std::string lowered = toLower(processName);
    return std::any_of(hostProcessNames_.begin(), hostProcessNames_.end(), [&](const std::string& pattern) {
        return !pattern.empty() && lowered.find(pattern) != std::string::npos;
    });
}

ValidationResult InputValidator::validateProcessId(const json& value, bool requireHostProcess) const
{
    if(!value.is_number_integer())
        return ValidationResult::failure("INVALID_PROCESS_ID", "Process ID must be a positive integer", "processId must be an integer");

    const long long processId = value.is_number_unsigned()
        ? static_cast<long long>(std::min<unsigned long long>(value.get<unsigned long long>(), kMaxProcessId + 1))
        : value.get<long long>();

    if(processId <= 0)
        return ValidationResult::failure("INVALID_PROCESS_ID", "Process ID must be a positive integer", "processId must be greater than 0");

    if(processId > kMaxProcessId)
        return ValidationResult::failure("INVALID_PROCESS_ID", "Process ID exceeds maximum valid range", "process IDs must be <= 65535");

    const int pid = static_cast<int>(processId);
    if(!processes_.isAlive(pid))
    {
        return ValidationResult::failure("PROCESS_NOT_FOUND",
                                         "No process found with the specified process ID",
                                         "Process with ID " + std::to_string(pid) + " is not running");
    }

    if(requireHostProcess)
    {
        const auto name = processes_.processName(pid);
        if(!name)
        {
            return ValidationResult::failure("PROCESS_NOT_FOUND",
                                             "No process found with the specified process ID",
                                             "Process with ID " + std::to_string(pid) + " is not running");
        }

        if(!isHostProcessName(*name))
        {
            return ValidationResult::failure("INVALID_PROCESS_TYPE",
                                             "Specified process is not an IDE automation host",
                                             "Process '" + *name + "' (PID: " + std::to_string(pid) + ") is not an IDE instance");
        }
    }

    return ValidationResult::success(pid);
}

ValidationResult InputValidator::validatePath(const json& value, const std::string& expectedExtension) const
{
    if(!value.is_string() || isBlank(value.get<std::string>()))
        return ValidationResult::failure("INVALID_PATH", "Path cannot be null or empty", "A valid file path is required");

    const std::string raw = value.get<std::string>();

    if(raw.find("..") != std::string::npos || raw.find('~') != std::string::npos)
    {
        return ValidationResult::failure("PATH_TRAVERSAL_DETECTED",
                                         "Path contains potential traversal attempts",
                                         "Paths cannot contain '..' or '~' references");
    }

    const bool hasControl = std::any_of(raw.begin(), raw.end(), [](unsigned char c) { return c < 0x20 || c == 0x7F; });
    if(hasControl)
    {
        return ValidationResult::failure("INVALID_PATH_CHARACTERS",
                                         "Path contains invalid characters",
                                         "Path contains characters not allowed in file paths");
    }

    const std::filesystem::path fullPath = std::filesystem::path(raw).lexically_normal();
    if(!fullPath.is_absolute())
    {
        return ValidationResult::failure("RELATIVE_PATH_NOT_ALLOWED",
                                         "Relative paths are not allowed",
                                         "Only absolute paths are permitted");
    }

    if(!expectedExtension.empty())
    {
        const std::string actual = fullPath.extension().string();
        if(!equalsIgnoreCase(actual, expectedExtension))
        {
            return ValidationResult::failure("INVALID_FILE_EXTENSION",
                                             "File must have " + expectedExtension + " extension",
                                             "Expected " + expectedExtension + " but got " + (actual.empty() ? std::string("no extension") : actual));
        }
    }

    std::error_code ec;
    if(!std::filesystem::is_regular_file(fullPath, ec))
    {
        return ValidationResult::failure("FILE_NOT_FOUND",
                                         "Specified file does not exist",
                                         "File not found: " + fullPath.string());
    }

    return ValidationResult::success(fullPath.string());
}

ValidationResult InputValidator::validateConfiguration(const json& value) const
{
    if(value.is_null())
        return ValidationResult::success("Debug");

    if(!value.is_string())
        return ValidationResult::failure("INVALID_CONFIGURATION", "Build configuration is not valid", "Configuration must be a string");

    const std::string configuration = value.get<std::string>();
    if(isBlank(configuration))
        return ValidationResult::success("Debug");

    for(const auto& allowed : kAllowedConfigurations)
    {
        if(equalsIgnoreCase(allowed, configuration))
            return ValidationResult::success(allowed);
    }

    return ValidationResult::failure("INVALID_CONFIGURATION",
                                     "Build configuration is not valid",
                                     "Configuration '" + configuration + "' is not allowed. Valid options: " + joinConfigurations());
}

ValidationResult InputValidator::validateParameter(const ParamSpec& spec, const json& arguments) const
{
    const bool present = arguments.contains(spec.name) && !arguments.at(spec.name).is_null();
    const json value = present ? arguments.at(spec.name) : json();

    switch(spec.kind)
    {
    case ParamKind::ProcessId:
        return validateProcessId(value, spec.requireHostProcess);
    case ParamKind::Path:
        return validatePath(value, spec.extension);
    case ParamKind::Configuration:
        return validateConfiguration(value);
    case ParamKind::String:
        if(!present)
        {
            if(spec.required)
                return ValidationResult::failure("INVALID_PARAMETER", "Missing required parameter '" + spec.name + "'", spec.description);
            return ValidationResult::success();
        }
        if(!value.is_string())
            return ValidationResult::failure("INVALID_PARAMETER", "Parameter '" + spec.name + "' must be a string", spec.description);
        if(spec.required && isBlank(value.get<std::string>()))
            return ValidationResult::failure("INVALID_PARAMETER", "Parameter '" + spec.name + "' cannot be empty", spec.description);
        return ValidationResult::success(value);
    case ParamKind::Integer:
        if(!present)
        {
            if(spec.required)
                return ValidationResult::failure("INVALID_PARAMETER", "Missing required parameter '" + spec.name + "'", spec.description);
            return spec.defaultValue ? ValidationResult::success(*spec.defaultValue) : ValidationResult::success();
        }
        if(!value.is_number_integer())
            return ValidationResult::failure("INVALID_PARAMETER", "Parameter '" + spec.name + "' must be an integer", spec.description);
        if(value.is_number_unsigned() && value.get<unsigned long long>() > static_cast<unsigned long long>(spec.maximum))
        {
            return ValidationResult::failure("INVALID_PARAMETER",
                                             "Parameter '" + spec.name + "' is out of range",
                                             "Expected a value between " + std::to_string(spec.minimum) + " and " + std::to_string(spec.maximum));
        }
        if(value.get<long long>() < spec.minimum || value.get<long long>() > spec.maximum)
        {
            return ValidationResult::failure("INVALID_PARAMETER",
                                             "Parameter '" + spec.name + "' is out of range",
                                             "Expected a value between " + std::to_string(spec.minimum) + " and " + std::to_string(spec.maximum));
        }
        return ValidationResult::success(value);
    }

    return ValidationResult::failure("INVALID_PARAMETER", "Unsupported parameter kind for '" + spec.name + "'");
}

ValidationResult InputValidator::validateArguments(const std::vector<ParamSpec>& specs, const json& arguments) const
{
    if(!arguments.is_null() && !arguments.is_object())
        return ValidationResult::failure("INVALID_PARAMETER", "Tool arguments must be an object");

    const json source = arguments.is_object() ? arguments : json::object();
    json normalized = json::object();

    for(const auto& spec : specs)
    {
        ValidationResult result = validateParameter(spec, source);
        if(!result.valid)
            return result;
        if(!result.value.is_null())
            normalized[spec.name] = std::move(result.value);
    }

    return ValidationResult::success(std::move(normalized));
}
