#pragma once

#include <chrono>
#include <optional>
#include <string>

class IProcessQuery
{
public:
    virtual ~IProcessQuery() = default;

    virtual bool isAlive(int processId) = 0;
    virtual std::optional<std::string> processName(int processId) = 0;
    virtual std::optional<std::chrono::system_clock::time_point> startTime(int processId) = 0;
};

// Reads /proc on Linux.
class ProcfsProcessQuery : public IProcessQuery
{
public:
    bool isAlive(int processId) override;
    std::optional<std::string> processName(int processId) override;
    std::optional<std::chrono::system_clock::time_point> startTime(int processId) override;
};
