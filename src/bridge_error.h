#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

// Application-level failure reported to the client as {error:{code,message,data}}.
class ToolError : public std::runtime_error
{
public:
    ToolError(std::string code, const std::string& message, nlohmann::json data = nullptr);

    const std::string& code() const { return code_; }
    const nlohmann::json& data() const { return data_; }

    nlohmann::json toJson() const;

private:
    std::string code_;
    nlohmann::json data_;
};

class ValidationError : public ToolError
{
public:
    ValidationError(std::string code, const std::string& message, const std::string& details = std::string());
};

class NotFoundError : public ToolError
{
public:
    explicit NotFoundError(const std::string& message, nlohmann::json data = nullptr);
};

// Operation is illegal in the current debug state. Raised before any foreign call.
class StateError : public ToolError
{
public:
    StateError(const std::string& message, const std::string& state);
};

// The foreign call itself faulted. Wrapped once at the call site.
class BridgeError : public ToolError
{
public:
    BridgeError(const std::string& operation, const std::string& message, bool retryable);

    const std::string& operation() const { return operation_; }
    bool retryable() const { return retryable_; }

private:
    std::string operation_;
    bool retryable_;
};

class TimeoutError : public ToolError
{
public:
    TimeoutError(const std::string& operation, std::chrono::milliseconds timeout);
};

class UnimplementedError : public ToolError
{
public:
    explicit UnimplementedError(const std::string& message);
};

// Unrecoverable runtime fault. No boundary in this program catches it.
class FatalError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised by implementations of the foreign automation interface.
class ForeignFault : public std::runtime_error
{
public:
    ForeignFault(uint32_t status, const std::string& message);

    uint32_t status() const { return status_; }

private:
    uint32_t status_;
};

namespace ForeignStatus
{
    constexpr uint32_t Unavailable = 0x800401E3;
    constexpr uint32_t CallRejected = 0x80010001;
    constexpr uint32_t RetryLater = 0x80010105;
    constexpr uint32_t ServerCallRejected = 0x8001010A;
    constexpr uint32_t AccessDenied = 0x80070005;
    constexpr uint32_t GeneralFailure = 0x80004005;
    constexpr uint32_t ClassNotRegistered = 0x80040154;
    constexpr uint32_t Disconnected = 0x80010108;
}

bool IsRetryableForeignStatus(uint32_t status);
std::string DescribeForeignStatus(uint32_t status);

std::string SanitizeMessage(const std::string& message);
