#pragma once

#include <hotline/config.hpp>
#include <hotline/host.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace hotline
{

// The in-process side of the control channel. Listens on the abstract local
// socket named by `config.app_id` and serves each accepted connection on its
// own worker, for as long as the hosting process lives.
//
// Once more than `config.max_auth_failures` tokens have been rejected, across
// all connections, the agent stops accepting for good.
class Agent
{
   public:
    // `host` and `resources` must outlive the agent. `resources` may be null,
    // which disables the path queries.
    Agent(AgentConfig config, HostSurfaceProvider& host, ResourceFileManager* resources = nullptr);
    ~Agent();

    Agent(const Agent&)            = delete;
    Agent& operator=(const Agent&) = delete;

    // Bind the socket and start the accept thread. False if binding failed
    // or the agent was already started.
    bool start();

    // Stop accepting, shut down the in-flight connections, then wait for the
    // accept thread and every worker to finish. Idempotent.
    void stop();

    // Block until the accept loop has exited (stop() or circuit breaker).
    void wait_until_stopped();

    bool     is_accepting() const;
    bool     breaker_tripped() const;
    uint64_t auth_failures() const;
    size_t   connections_served() const;

    const AgentConfig& config() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}   // namespace hotline
