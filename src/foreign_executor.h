#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "bridge_error.h"
#include "logging.h"

// Serialized execution context for one foreign automation root. The foreign
// API has single-threaded affinity, so every call against a given root runs
// on this executor's worker, one at a time, in submission order.
class ForeignExecutor
{
public:
    explicit ForeignExecutor(std::string name);
    ~ForeignExecutor();

    ForeignExecutor(const ForeignExecutor&) = delete;
    ForeignExecutor& operator=(const ForeignExecutor&) = delete;

    // Runs fn on the worker and waits up to timeout (zero waits forever).
    // ForeignFault and other foreign exceptions surface as BridgeError; a late
    // call surfaces as TimeoutError and keeps running in the background.
    template<typename Fn>
    std::invoke_result_t<Fn&> call(const std::string& operation, std::chrono::milliseconds timeout, Fn&& fn);

    const std::string& name() const { return name_; }
    bool busy() const;
    size_t pending() const;

private:
    struct State
    {
        std::mutex mutex;
        std::condition_variable wake;
        std::deque<std::function<void()>> queue;
        bool stopping = false;
        bool busy = false;
    };

    void post(std::function<void()> task);
    static void workerLoop(std::shared_ptr<State> state);

    template<typename Fn>
    static std::invoke_result_t<Fn&> guardForeignCall(const std::string& operation, Fn& fn);

    std::string name_;
    std::shared_ptr<State> state_;
    std::thread worker_;
};

template<typename Fn>
std::invoke_result_t<Fn&> ForeignExecutor::guardForeignCall(const std::string& operation, Fn& fn)
{
    try
    {
        return fn();
    }
    catch(const ToolError&)
    {
        throw;
    }
    catch(const FatalError&)
    {
        throw;
    }
    catch(const std::bad_alloc&)
    {
        throw;
    }
    catch(const ForeignFault& fault)
    {
        const std::string description = DescribeForeignStatus(fault.status());
        LogErrorF("Foreign call %s failed: status=0x%08X (%s): %s",
                  operation.c_str(),
                  fault.status(),
                  description.c_str(),
                  SanitizeMessage(fault.what()).c_str());
        throw BridgeError(operation, "Foreign call '" + operation + "' failed: " + description, IsRetryableForeignStatus(fault.status()));
    }
    catch(const std::exception& ex)
    {
        LogErrorF("Unexpected exception in foreign call %s: %s", operation.c_str(), SanitizeMessage(ex.what()).c_str());
        throw BridgeError(operation, "Foreign call '" + operation + "' failed: " + SanitizeMessage(ex.what()), false);
    }
}

template<typename Fn>
std::invoke_result_t<Fn&> ForeignExecutor::call(const std::string& operation, std::chrono::milliseconds timeout, Fn&& fn)
{
    using Result = std::invoke_result_t<Fn&>;

    auto task = std::make_shared<std::packaged_task<Result()>>(
        [operation, work = std::forward<Fn>(fn)]() mutable -> Result {
            return guardForeignCall(operation, work);
        });
    std::future<Result> result = task->get_future();

    LogDebugF("[%s] dispatching %s", name_.c_str(), operation.c_str());
    post([task]() { (*task)(); });

    if(timeout.count() > 0 && result.wait_for(timeout) == std::future_status::timeout)
    {
        LogWarningF("[%s] %s timed out after %lld ms; the call is left running",
                    name_.c_str(),
                    operation.c_str(),
                    static_cast<long long>(timeout.count()));
        throw TimeoutError(operation, timeout);
    }

    return result.get();
}
