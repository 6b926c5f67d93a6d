#include "worker_set.hpp"

#include <hotline/logger.hpp>

#include <chrono>
#include <system_error>

namespace hotline::agent
{

WorkerSet::Launcher WorkerSet::async_launcher()
{
    return [](Task task) { return std::async(std::launch::async, std::move(task)); };
}

WorkerSet::WorkerSet(Launcher launcher) : launcher_(std::move(launcher)) {}

bool WorkerSet::launch(Task task)
{
    std::future<void> done;
    try
    {
        done = launcher_(std::move(task));
    }
    catch (const std::system_error& e)
    {
        HOTLINE_LOG_ERROR("agent", "Could not start worker, dropping connection: {}", e.what());
        return false;
    }

    std::lock_guard lock(mutex_);
    workers_.push_back(std::move(done));
    return true;
}

size_t WorkerSet::reap()
{
    std::lock_guard lock(mutex_);
    workers_.remove_if(
        [](std::future<void>& f)
        { return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready; });
    return workers_.size();
}

void WorkerSet::wait_all()
{
    std::list<std::future<void>> pending;
    {
        std::lock_guard lock(mutex_);
        pending.swap(workers_);
    }
    for (auto& f : pending)
        f.wait();
}

size_t WorkerSet::size() const
{
    std::lock_guard lock(mutex_);
    return workers_.size();
}

}   // namespace hotline::agent
