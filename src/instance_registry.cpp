#include "instance_registry.h"

#include <algorithm>
#include <new>
#include <stdexcept>

#include "logging.h"

InstanceRegistry::InstanceRegistry(IDiscoveryService& discovery, IProcessQuery& processes, RegistryOptions options)
    : discovery_(discovery), processes_(processes), options_(options)
{
    owner_ = std::thread(&InstanceRegistry::ownerLoop, this);
    if(options_.sweepInterval.count() > 0)
        LogInfoF("Instance registry started (health sweep every %lld s)", static_cast<long long>(options_.sweepInterval.count()));
    else
        LogInfo("Instance registry started (periodic health sweep disabled)");
}

InstanceRegistry::~InstanceRegistry()
{
    stop();
}

void InstanceRegistry::stop()
{
    {
        std::lock_guard<std::mutex> guard(mailboxMutex_);
        if(stopping_)
            return;
        stopping_ = true;
    }
    wake_.notify_all();

    if(owner_.joinable())
        owner_.join();

    slots_.clear();
    LogInfo("Instance registry stopped");
}

std::optional<InstanceHandle> InstanceRegistry::resolve(int processId)
{
    return ask([this, processId]() -> std::optional<InstanceHandle> {
        auto it = slots_.find(processId);
        if(it != slots_.end())
        {
            std::string reason;
            switch(verifySlot(processId, it->second, reason))
            {
            case Verification::Verified:
                return toHandle(processId, it->second);
            case Verification::Busy:
                // still cached; the next sweep or resolve tries again
                LogWarningF("Instance %d did not answer its probe in time: %s", processId, reason.c_str());
                return std::nullopt;
            case Verification::Unreachable:
                removeSlot(processId, reason);
                break;
            }
        }

        return acquire(processId);
    });
}

InstanceHandle InstanceRegistry::registerInstance(int processId, std::weak_ptr<IAutomationRoot> root)
{
    if(processId <= 0)
        throw std::invalid_argument("registerInstance: process id must be positive, got " + std::to_string(processId));

    return ask([this, processId, root = std::move(root)]() mutable {
        return storeSlot(processId, std::move(root));
    });
}

std::optional<InstanceHandle> InstanceRegistry::lookup(int processId)
{
    return ask([this, processId]() -> std::optional<InstanceHandle> {
        auto it = slots_.find(processId);
        if(it == slots_.end())
            return std::nullopt;

        if(it->second.root.expired())
        {
            removeSlot(processId, "automation root released");
            return std::nullopt;
        }
        return toHandle(processId, it->second);
    });
}

size_t InstanceRegistry::healthSweep()
{
    return ask([this]() { return sweepSlots(); });
}

void InstanceRegistry::setActive(int processId)
{
    ask([this, processId]() {
        activeProcessId_ = processId;
        LogInfoF("Active IDE instance is now %d", processId);
    });
}

std::optional<int> InstanceRegistry::activeProcessId()
{
    return ask([this]() { return activeProcessId_; });
}

std::optional<InstanceHandle> InstanceRegistry::activeInstance()
{
    return ask([this]() -> std::optional<InstanceHandle> {
        if(!activeProcessId_)
            return std::nullopt;

        auto it = slots_.find(*activeProcessId_);
        if(it == slots_.end() || it->second.root.expired())
            return std::nullopt;
        return toHandle(*activeProcessId_, it->second);
    });
}

std::vector<int> InstanceRegistry::cachedProcessIds()
{
    return ask([this]() {
        std::vector<int> ids;
        ids.reserve(slots_.size());
        for(const auto& entry : slots_)
            ids.push_back(entry.first);
        std::sort(ids.begin(), ids.end());
        return ids;
    });
}

void InstanceRegistry::ownerLoop()
{
    const bool timerEnabled = options_.sweepInterval.count() > 0;
    auto nextSweep = std::chrono::steady_clock::now() + options_.sweepInterval;

    while(true)
    {
        std::function<void()> message;
        {
            std::unique_lock<std::mutex> lock(mailboxMutex_);
            auto ready = [this] { return stopping_ || !mailbox_.empty(); };
            if(timerEnabled)
                wake_.wait_until(lock, nextSweep, ready);
            else
                wake_.wait(lock, ready);

            if(stopping_ && mailbox_.empty())
                return;

            if(!mailbox_.empty())
            {
                message = std::move(mailbox_.front());
                mailbox_.pop_front();
            }
        }

        if(message)
            message();

        if(timerEnabled && std::chrono::steady_clock::now() >= nextSweep)
        {
            const size_t removed = sweepSlots();
            if(removed > 0)
                LogInfoF("Health sweep removed %zu stale instance(s)", removed);
            nextSweep = std::chrono::steady_clock::now() + options_.sweepInterval;
        }
    }
}

InstanceHandle InstanceRegistry::storeSlot(int processId, std::weak_ptr<IAutomationRoot> root)
{
    Slot slot;
    slot.generation = nextGeneration_++;
    slot.root = std::move(root);
    slot.executor = std::make_shared<ForeignExecutor>("ide-" + std::to_string(processId));
    slot.lastVerifiedAt = std::chrono::system_clock::now();

    auto existing = slots_.find(processId);
    if(existing != slots_.end())
        LogInfoF("Replacing cached instance %d (generation %llu)", processId, static_cast<unsigned long long>(existing->second.generation));

    slots_[processId] = slot;
    LogInfoF("Cached instance %d (generation %llu)", processId, static_cast<unsigned long long>(slot.generation));
    return toHandle(processId, slot);
}

InstanceHandle InstanceRegistry::toHandle(int processId, const Slot& slot) const
{
    InstanceHandle handle;
    handle.processId = processId;
    handle.generation = slot.generation;
    handle.root = slot.root;
    handle.executor = slot.executor;
    handle.lastVerifiedAt = slot.lastVerifiedAt;
    return handle;
}

InstanceRegistry::Verification InstanceRegistry::verifySlot(int processId, Slot& slot, std::string& reason)
{
    if(!processes_.isAlive(processId))
    {
        reason = "process exited";
        return Verification::Unreachable;
    }

    std::shared_ptr<IAutomationRoot> root = slot.root.lock();
    if(!root)
    {
        reason = "automation root released";
        return Verification::Unreachable;
    }

    try
    {
        const bool alive = slot.executor->call("probe", options_.probeTimeout, [root]() { return root->probe(); });
        if(!alive)
        {
            reason = "probe reported the instance unreachable";
            return Verification::Unreachable;
        }
    }
    catch(const TimeoutError& ex)
    {
        reason = ex.what();
        return Verification::Busy;
    }
    catch(const ToolError& ex)
    {
        reason = SanitizeMessage(ex.what());
        return Verification::Unreachable;
    }

    slot.lastVerifiedAt = std::chrono::system_clock::now();
    return Verification::Verified;
}

void InstanceRegistry::removeSlot(int processId, const std::string& reason)
{
    if(slots_.erase(processId) > 0)
        LogWarningF("Removed cached instance %d: %s", processId, reason.c_str());
}

std::optional<InstanceHandle> InstanceRegistry::acquire(int processId)
{
    acquisitionAttempts_.fetch_add(1);

    std::weak_ptr<IAutomationRoot> root;
    try
    {
        root = discovery_.acquire(processId);
    }
    catch(const std::bad_alloc&)
    {
        throw;
    }
    catch(const FatalError&)
    {
        throw;
    }
    catch(const std::exception& ex)
    {
        LogWarningF("Acquiring instance %d failed: %s", processId, SanitizeMessage(ex.what()).c_str());
        return std::nullopt;
    }

    if(root.expired())
    {
        LogInfoF("No automation root available for process %d", processId);
        return std::nullopt;
    }

    return storeSlot(processId, std::move(root));
}

size_t InstanceRegistry::sweepSlots()
{
    std::vector<std::pair<int, std::string>> doomed;

    for(auto& entry : slots_)
    {
        std::string reason;
        switch(verifySlot(entry.first, entry.second, reason))
        {
        case Verification::Verified:
            break;
        case Verification::Busy:
            LogWarningF("Instance %d probe timed out; keeping it until the next sweep", entry.first);
            break;
        case Verification::Unreachable:
            doomed.emplace_back(entry.first, reason);
            break;
        }
    }

    for(const auto& victim : doomed)
        removeSlot(victim.first, victim.second);

    return doomed.size();
}
