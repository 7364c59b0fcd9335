#include "process_query.h"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace
{
    std::string procPath(int processId, const char* leaf)
    {
        return "/proc/" + std::to_string(processId) + "/" + leaf;
    }

    std::optional<long long> bootTimeSeconds()
    {
        std::ifstream stat("/proc/stat");
        std::string key;
        while(stat >> key)
        {
            if(key == "btime")
            {
                long long value = 0;
                if(stat >> value)
                    return value;
                return std::nullopt;
            }
            stat.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
        return std::nullopt;
    }
}

bool ProcfsProcessQuery::isAlive(int processId)
{
    if(processId <= 0)
        return false;

    if(::kill(static_cast<pid_t>(processId), 0) == 0)
        return true;

    // EPERM: the process exists but belongs to someone else
    return errno == EPERM;
}

std::optional<std::string> ProcfsProcessQuery::processName(int processId)
{
    std::ifstream comm(procPath(processId, "comm"));
    if(!comm)
        return std::nullopt;

    std::string name;
    std::getline(comm, name);
    if(name.empty())
        return std::nullopt;
    return name;
}

std::optional<std::chrono::system_clock::time_point> ProcfsProcessQuery::startTime(int processId)
{
    std::ifstream statFile(procPath(processId, "stat"));
    if(!statFile)
        return std::nullopt;

    std::string content;
    std::getline(statFile, content);

    // comm (field 2) may contain spaces; the remaining fields follow the last ')'
    const size_t closing = content.rfind(')');
    if(closing == std::string::npos)
        return std::nullopt;

    std::istringstream rest(content.substr(closing + 1));
    std::vector<std::string> fields;
    std::string field;
    while(rest >> field)
        fields.push_back(field);

    // starttime is field 22 overall, i.e. index 19 after state (field 3)
    constexpr size_t kStartTimeIndex = 19;
    if(fields.size() <= kStartTimeIndex)
        return std::nullopt;

    const auto boot = bootTimeSeconds();
    const long ticksPerSecond = ::sysconf(_SC_CLK_TCK);
    if(!boot || ticksPerSecond <= 0)
        return std::nullopt;

    unsigned long long ticks = 0;
    try
    {
        ticks = std::stoull(fields[kStartTimeIndex]);
    }
    catch(const std::exception&)
    {
        return std::nullopt;
    }

    const auto sinceBoot = std::chrono::milliseconds(static_cast<long long>(ticks * 1000ull / static_cast<unsigned long long>(ticksPerSecond)));
    return std::chrono::system_clock::time_point(std::chrono::seconds(*boot)) + sinceBoot;
}
