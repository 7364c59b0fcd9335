#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "automation.h"
#include "bridge_error.h"
#include "foreign_executor.h"
#include "process_query.h"

// Borrowed view of a cached automation root. Never owns the root; every call
// locks the weak reference for its own duration and runs on the slot's executor.
struct InstanceHandle
{
    int processId = 0;
    uint64_t generation = 0;
    std::weak_ptr<IAutomationRoot> root;
    std::shared_ptr<ForeignExecutor> executor;
    std::chrono::system_clock::time_point lastVerifiedAt;

    bool reachable() const { return !root.expired(); }

    template<typename Fn>
    std::invoke_result_t<Fn&, IAutomationRoot&> invoke(const std::string& operation, std::chrono::milliseconds timeout, Fn&& fn) const;
};

template<typename Fn>
std::invoke_result_t<Fn&, IAutomationRoot&> InstanceHandle::invoke(const std::string& operation, std::chrono::milliseconds timeout, Fn&& fn) const
{
    std::shared_ptr<IAutomationRoot> strong = root.lock();
    if(!strong || !executor)
        throw BridgeError(operation, "IDE instance " + std::to_string(processId) + " is no longer reachable", true);

    return executor->call(operation, timeout, [strong, work = std::forward<Fn>(fn)]() mutable {
        return work(*strong);
    });
}

// Narrow view of the registry used by the debug controller and the IDE service.
class ActiveInstanceProvider
{
public:
    virtual ~ActiveInstanceProvider() = default;

    // Most recently connected instance, if its cached root is still reachable.
    // Makes no foreign call.
    virtual std::optional<InstanceHandle> activeInstance() = 0;
};

struct RegistryOptions
{
    // Zero disables the timer; healthSweep() can still be called directly.
    std::chrono::seconds sweepInterval{30};
    std::chrono::milliseconds probeTimeout{5000};
};

// Cache of process id -> automation root. The map is owned by a single worker
// thread: every public call and the periodic health sweep are messages that
// worker processes one at a time.
class InstanceRegistry : public ActiveInstanceProvider
{
public:
    InstanceRegistry(IDiscoveryService& discovery, IProcessQuery& processes, RegistryOptions options = RegistryOptions());
    ~InstanceRegistry() override;

    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    // Cached handle if it still verifies, otherwise one fresh acquisition
    // attempt through discovery. Never throws for absence.
    std::optional<InstanceHandle> resolve(int processId);

    // Throws std::invalid_argument for processId <= 0.
    InstanceHandle registerInstance(int processId, std::weak_ptr<IAutomationRoot> root);

    std::optional<InstanceHandle> lookup(int processId);

    // Returns the number of removed entries.
    size_t healthSweep();

    void setActive(int processId);
    std::optional<int> activeProcessId();
    std::optional<InstanceHandle> activeInstance() override;

    std::vector<int> cachedProcessIds();
    size_t acquisitionAttempts() const { return acquisitionAttempts_.load(); }

    void stop();

private:
    struct Slot
    {
        uint64_t generation = 0;
        std::weak_ptr<IAutomationRoot> root;
        std::shared_ptr<ForeignExecutor> executor;
        std::chrono::system_clock::time_point lastVerifiedAt;
    };

    enum class Verification
    {
        Verified,
        Unreachable,
        Busy
    };

    template<typename Fn>
    std::invoke_result_t<Fn&> ask(Fn&& fn);

    void ownerLoop();

    // Owner thread only.
    InstanceHandle storeSlot(int processId, std::weak_ptr<IAutomationRoot> root);
    InstanceHandle toHandle(int processId, const Slot& slot) const;
    Verification verifySlot(int processId, Slot& slot, std::string& reason);
    void removeSlot(int processId, const std::string& reason);
    std::optional<InstanceHandle> acquire(int processId);
    size_t sweepSlots();

    IDiscoveryService& discovery_;
    IProcessQuery& processes_;
    RegistryOptions options_;

    std::unordered_map<int, Slot> slots_;
    uint64_t nextGeneration_ = 1;
    std::optional<int> activeProcessId_;

    std::atomic<size_t> acquisitionAttempts_{0};

    std::mutex mailboxMutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> mailbox_;
    bool stopping_ = false;
    std::thread owner_;
};

template<typename Fn>
std::invoke_result_t<Fn&> InstanceRegistry::ask(Fn&& fn)
{
    using Result = std::invoke_result_t<Fn&>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> result = task->get_future();
    {
        std::lock_guard<std::mutex> guard(mailboxMutex_);
        if(stopping_)
            throw std::logic_error("Instance registry is stopped");
        mailbox_.push_back([task]() { (*task)(); });
    }
    wake_.notify_one();
    return result.get();
}
