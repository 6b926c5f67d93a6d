#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <utility>

namespace hotline::agent
{

// ─── WorkerSet ───────────────────────────────────────────────────────────────
// One asynchronous worker per accepted connection, tracked by its future.
// Finished workers are reaped on demand; wait_all() drains the rest.

class WorkerSet
{
   public:
    using Task     = std::packaged_task<void()>;
    using Launcher = std::function<std::future<void>(Task)>;

    // Runs each task on its own std::async thread.
    static Launcher async_launcher();

    explicit WorkerSet(Launcher launcher = async_launcher());

    WorkerSet(const WorkerSet&)            = delete;
    WorkerSet& operator=(const WorkerSet&) = delete;

    // Starts `fn` on a new worker. If no worker can be started the failure
    // is logged, `fn` is destroyed unrun and false is returned.
    template <typename Fn>
    bool spawn(Fn&& fn)
    {
        return launch(Task(std::forward<Fn>(fn)));
    }

    // Forgets workers that have finished. Returns how many are still running.
    size_t reap();

    // Blocks until every worker started so far has finished.
    void wait_all();

    size_t size() const;

   private:
    bool launch(Task task);

    Launcher                     launcher_;
    mutable std::mutex           mutex_;
    std::list<std::future<void>> workers_;
};

}   // namespace hotline::agent
