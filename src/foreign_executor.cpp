#include "foreign_executor.h"

#include <stdexcept>

ForeignExecutor::ForeignExecutor(std::string name)
    : name_(std::move(name)), state_(std::make_shared<State>())
{
    worker_ = std::thread(&ForeignExecutor::workerLoop, state_);
}

ForeignExecutor::~ForeignExecutor()
{
    bool stuck = false;
    {
        std::lock_guard<std::mutex> guard(state_->mutex);
        state_->stopping = true;
        stuck = state_->busy;
    }
    state_->wake.notify_all();

    if(!worker_.joinable())
        return;

    if(stuck)
    {
        // A hung foreign call cannot be interrupted from here; the worker
        // owns its state and exits once the call returns.
        LogWarningF("[%s] worker still inside a foreign call at shutdown; detaching", name_.c_str());
        worker_.detach();
    }
    else
    {
        worker_.join();
    }
}

bool ForeignExecutor::busy() const
{
    std::lock_guard<std::mutex> guard(state_->mutex);
    return state_->busy;
}

size_t ForeignExecutor::pending() const
{
    std::lock_guard<std::mutex> guard(state_->mutex);
    return state_->queue.size();
}

void ForeignExecutor::post(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> guard(state_->mutex);
        if(state_->stopping)
            throw std::logic_error("Executor '" + name_ + "' is shutting down");
        state_->queue.push_back(std::move(task));
    }
    state_->wake.notify_one();
}

void ForeignExecutor::workerLoop(std::shared_ptr<State> state)
{
    while(true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->wake.wait(lock, [&] { return state->stopping || !state->queue.empty(); });
            if(state->stopping)
            {
                // abandoned tasks break their promises when destroyed
                state->queue.clear();
                return;
            }
            task = std::move(state->queue.front());
            state->queue.pop_front();
            state->busy = true;
        }

        // packaged_task stores any exception in its future
        task();
        // drop captured roots before reporting idle
        task = nullptr;

        std::lock_guard<std::mutex> guard(state->mutex);
        state->busy = false;
    }
}
