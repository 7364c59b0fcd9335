#include "bridge_error.h"

#include <algorithm>
#include <cstdio>

using json = nlohmann::json;

ToolError::ToolError(std::string code, const std::string& message, json data)
    : std::runtime_error(message), code_(std::move(code)), data_(std::move(data))
{
}

json ToolError::toJson() const
{
    return json::object({
        {"code", code_},
        {"message", SanitizeMessage(what())},
        {"data", data_}
    });
}

ValidationError::ValidationError(std::string code, const std::string& message, const std::string& details)
    : ToolError(std::move(code), message, details.empty() ? json() : json(details))
{
}

NotFoundError::NotFoundError(const std::string& message, json data)
    : ToolError("NOT_FOUND", message, std::move(data))
{
}

StateError::StateError(const std::string& message, const std::string& state)
    : ToolError("INVALID_STATE", message, json::object({{"state", state}}))
{
}

BridgeError::BridgeError(const std::string& operation, const std::string& message, bool retryable)
    : ToolError("BRIDGE_ERROR", message, json::object({{"operation", operation}, {"retryable", retryable}})),
      operation_(operation),
      retryable_(retryable)
{
}

TimeoutError::TimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
    : ToolError("TIMEOUT",
                "Operation '" + operation + "' did not complete within " + std::to_string(timeout.count()) + " ms",
                json::object({{"operation", operation}, {"timeoutMs", timeout.count()}}))
{
}

UnimplementedError::UnimplementedError(const std::string& message)
    : ToolError("UNIMPLEMENTED", message)
{
}

ForeignFault::ForeignFault(uint32_t status, const std::string& message)
    : std::runtime_error(message), status_(status)
{
}

bool IsRetryableForeignStatus(uint32_t status)
{
    switch(status)
    {
    case ForeignStatus::Unavailable:
    case ForeignStatus::CallRejected:
    case ForeignStatus::RetryLater:
    case ForeignStatus::ServerCallRejected:
    case ForeignStatus::AccessDenied: // sometimes transient
    case ForeignStatus::GeneralFailure:
        return true;
    default:
        return false;
    }
}

std::string DescribeForeignStatus(uint32_t status)
{
    switch(status)
    {
    case ForeignStatus::Unavailable:
        return "IDE instance is temporarily unavailable";
    case ForeignStatus::CallRejected:
        return "IDE rejected the call (may be busy)";
    case ForeignStatus::RetryLater:
        return "IDE requested retry later";
    case ForeignStatus::ServerCallRejected:
        return "IDE server call was rejected";
    case ForeignStatus::AccessDenied:
        return "Access denied to IDE instance";
    case ForeignStatus::GeneralFailure:
        return "General automation failure";
    case ForeignStatus::ClassNotRegistered:
        return "IDE automation class not registered";
    case ForeignStatus::Disconnected:
        return "IDE instance disconnected";
    default:
        break;
    }

    char buffer[48] = {};
    std::snprintf(buffer, sizeof(buffer), "Automation error with status 0x%08X", status);
    return buffer;
}

std::string SanitizeMessage(const std::string& message)
{
    std::string result = message;
    std::replace(result.begin(), result.end(), '\r', ' ');
    std::replace(result.begin(), result.end(), '\n', ' ');
    return result;
}
